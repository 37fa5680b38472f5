#pragma once
// 传输层抽象：WebSocket 服务端 / UDP 发送端共用的接口

#include <QtCore/QObject>
#include <cstdint>
#include <memory>

#include "posecast/core/Config.h"
#include "posecast/core/Types.h"

namespace posecast {

/* Contract shared by every transport:
*  - open():  idempotent; throws ResourceError / ConfigurationError
*  - send():  best-effort, never throws; returns false when the frame was dropped
*  - close(): idempotent, releases sockets
*  Lives on the capture loop thread; not thread-safe.
*/
class SkeletonTransport : public QObject {
    Q_OBJECT
public:
    explicit SkeletonTransport(QObject* parent=nullptr) : QObject(parent) {}
    ~SkeletonTransport() override = default;

    virtual void open() = 0;
    virtual bool send(const SkeletonFrame& frame) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    uint64_t sentCount() const    { return sent_; }
    uint64_t droppedCount() const { return dropped_; }

protected:
    bool markSent()    { ++sent_; return true; }
    bool markDropped() { ++dropped_; return false; }

private:
    uint64_t sent_ = 0;
    uint64_t dropped_ = 0;
};

// Builds the transport named by cfg.transport for cfg.endpoint (not opened yet).
// Throws ConfigurationError on an unknown transport or a malformed endpoint.
std::unique_ptr<SkeletonTransport> makeTransport(const CaptureConfig& cfg);

} // namespace posecast
