#include <posecast/transport/ws_transport.hpp>
#include <posecast/core/Errors.h>
#include <posecast/logging.hpp>

#include <QtNetwork/QHostAddress>
#include <QtCore/QUrl>

namespace posecast {

// WebSocket 服务端：只跟踪一个订阅者（最后连接者优先）

WsTransport::WsTransport(Endpoint endpoint, QObject* parent)
    : SkeletonTransport(parent),
    endpoint_(std::move(endpoint)),
    server_(QStringLiteral("PoseCast-WS"), QWebSocketServer::NonSecureMode, this)
{
    connect(&server_, &QWebSocketServer::newConnection, this, &WsTransport::onNewConnection);
}

WsTransport::~WsTransport() {
    close();
}

void WsTransport::open() {
    if (server_.isListening()) return;

    const QString host = QString::fromStdString(endpoint_.host);
    QHostAddress address;
    if (host == QLatin1String("localhost")) {
        address = QHostAddress::LocalHost;
    } else if (!address.setAddress(host)) {
        throw ConfigurationError("WebSocket host must be an IP address or localhost: " + endpoint_.host);
    }

    if (!server_.listen(address, endpoint_.port)) {
        throw ResourceError("WebSocket listen failed on " + endpoint_.host + ":"
                            + std::to_string(endpoint_.port) + ": "
                            + server_.errorString().toStdString());
    }
    qCInfo(lcTransport) << "[WS] Listening on" << host << ":" << server_.serverPort()
                        << "path" << (endpoint_.path.empty() ? QStringLiteral("<any>")
                                                             : QString::fromStdString(endpoint_.path));
}

void WsTransport::close() {
    const bool had_client = !client_.isNull();
    client_.clear();
    const auto sockets = sockets_;
    sockets_.clear();
    for (auto* socket : sockets) {
        socket->disconnect(this);
        socket->close(QWebSocketProtocol::CloseCodeGoingAway, QStringLiteral("server shutting down"));
        socket->deleteLater();
    }
    if (server_.isListening()) {
        server_.close();
        qCInfo(lcTransport) << "[WS] Server closed; sent=" << sentCount() << "dropped=" << droppedCount();
    }
    if (had_client) emit subscriberChanged(false);
}

void WsTransport::onNewConnection() {
    while (server_.hasPendingConnections()) {
        auto* socket = server_.nextPendingConnection();
        if (!socket) return;

        connect(socket, &QWebSocket::disconnected, this, [this, socket] {
            sockets_.remove(socket);
            if (client_ == socket) {
                client_.clear();
                qCInfo(lcTransport) << "[WS] Subscriber disconnected";
                emit subscriberChanged(false);
            }
            socket->deleteLater();
        });

        const QString path = QString::fromStdString(
            normalizePath(socket->requestUrl().path().toStdString()));
        const QString expected = QString::fromStdString(endpoint_.path);
        if (!expected.isEmpty() && path != expected) {
            qCWarning(lcTransport) << "[WS] Rejecting connection from" << socket->peerAddress().toString()
                                   << "for path" << path << "(expected" << expected << ")";
            socket->close(QWebSocketProtocol::CloseCodePolicyViolated,
                          QStringLiteral("unexpected path %1").arg(path.isEmpty() ? QStringLiteral("/") : path));
            continue;
        }

        connect(socket, &QWebSocket::errorOccurred, this, [this, socket](QAbstractSocket::SocketError) {
            qCWarning(lcTransport) << "[WS] Socket error:" << socket->errorString();
            if (client_ == socket) dropSubscriber("socket error");
        });

        sockets_ << socket;
        if (client_) {
            qCInfo(lcTransport) << "[WS] New subscriber replaces the previous one";
        }
        client_ = socket;   // last-connection-wins
        qCInfo(lcTransport) << "[WS] Subscriber connected from" << socket->peerAddress().toString() << path;
        emit subscriberChanged(true);
    }
}

bool WsTransport::send(const SkeletonFrame& frame) {
    if (!client_) return markDropped();

    if (client_->state() != QAbstractSocket::ConnectedState) {
        dropSubscriber("connection no longer open");
        return markDropped();
    }

    const QString payload = QString::fromStdString(skeletonFrameToWire(frame));
    const qint64 written = client_->sendTextMessage(payload);
    if (written <= 0) {
        dropSubscriber("send failed");
        return markDropped();
    }
    qCDebug(lcTransport) << "[WS] Sent frame" << frame.ts_ms << "(" << frame.joints.size() << "joints)";
    return markSent();
}

void WsTransport::dropSubscriber(const char* reason) {
    if (!client_) return;
    qCWarning(lcTransport) << "[WS] Dropping subscriber:" << reason;
    client_.clear();
    emit subscriberChanged(false);
}

} // namespace posecast
