#include <posecast/transport/udp_transport.hpp>
#include <posecast/core/Errors.h>
#include <posecast/logging.hpp>

#include <QtNetwork/QHostInfo>

namespace posecast {

UdpTransport::UdpTransport(Endpoint endpoint, QObject* parent)
    : SkeletonTransport(parent), endpoint_(std::move(endpoint)) {}

UdpTransport::~UdpTransport() {
    close();
}

void UdpTransport::open() {
    if (socket_) return;

    const QString host = QString::fromStdString(endpoint_.host);
    QHostAddress address;
    if (!address.setAddress(host)) {
        const QHostInfo info = QHostInfo::fromName(host);
        if (info.error() != QHostInfo::NoError || info.addresses().isEmpty()) {
            throw ConfigurationError("Cannot resolve UDP host '" + endpoint_.host + "'");
        }
        address = info.addresses().first();
        for (const auto& candidate : info.addresses()) {
            if (candidate.protocol() == QAbstractSocket::IPv4Protocol) { address = candidate; break; }
        }
    }

    auto socket = std::make_unique<QUdpSocket>();
    const QHostAddress any = address.protocol() == QAbstractSocket::IPv6Protocol
        ? QHostAddress(QHostAddress::AnyIPv6) : QHostAddress(QHostAddress::AnyIPv4);
    if (!socket->bind(any, 0)) {
        throw ResourceError("UDP socket open failed: " + socket->errorString().toStdString());
    }
    target_ = address;
    socket_ = std::move(socket);
    failure_streak_ = 0;
    qCInfo(lcTransport) << "[UDP] Sending to" << target_.toString() << ":" << endpoint_.port;
}

void UdpTransport::close() {
    if (!socket_) return;
    socket_->close();
    socket_.reset();
    qCInfo(lcTransport) << "[UDP] Socket closed; sent=" << sentCount() << "dropped=" << droppedCount();
}

bool UdpTransport::send(const SkeletonFrame& frame) {
    if (!socket_) return markDropped();

    const QByteArray payload = QByteArray::fromStdString(skeletonFrameToWire(frame));
    const qint64 written = socket_->writeDatagram(payload, target_, endpoint_.port);
    if (written != payload.size()) {
        // first failure of a streak is a warning, the rest only debug
        if (++failure_streak_ == 1) {
            qCWarning(lcTransport) << "[UDP] Datagram dropped:" << socket_->errorString();
        } else {
            qCDebug(lcTransport) << "[UDP] Datagram dropped (" << failure_streak_ << "in a row)";
        }
        return markDropped();
    }
    failure_streak_ = 0;
    qCDebug(lcTransport) << "[UDP] Sent frame" << frame.ts_ms << "(" << payload.size() << "bytes)";
    return markSent();
}

} // namespace posecast
