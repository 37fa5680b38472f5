#pragma once
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QUdpSocket>
#include <memory>

#include "skeleton_transport.hpp"

namespace posecast {

// Fire-and-forget datagrams, one per frame, to a fixed host:port.
class UdpTransport : public SkeletonTransport {
    Q_OBJECT
public:
    explicit UdpTransport(Endpoint endpoint, QObject* parent=nullptr);
    ~UdpTransport() override;

    void open() override;
    bool send(const SkeletonFrame& frame) override;
    void close() override;
    bool isOpen() const override { return socket_ != nullptr; }


private:
    Endpoint endpoint_;
    QHostAddress target_;
    std::unique_ptr<QUdpSocket> socket_;
    uint64_t failure_streak_ = 0;
};

} // namespace posecast
