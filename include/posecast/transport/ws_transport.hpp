#pragma once
#include <QtCore/QPointer>
#include <QtCore/QSet>
#include <QtWebSockets/QWebSocket>
#include <QtWebSockets/QWebSocketServer>

#include "skeleton_transport.hpp"

namespace posecast {

/* WebSocket server with a single tracked subscriber.
*
*  @note - connections whose normalized request path differs from the endpoint path
*          are closed with CloseCodePolicyViolated; an empty endpoint path accepts all
*  @note - last-connection-wins: a new client replaces the tracked handle, the older
*          socket stays open until its own disconnect
*  @note - a send without subscriber is a silent drop; a failed send clears the subscriber
*/
class WsTransport : public SkeletonTransport {
    Q_OBJECT
public:
    explicit WsTransport(Endpoint endpoint, QObject* parent=nullptr);
    ~WsTransport() override;

    void open() override;
    bool send(const SkeletonFrame& frame) override;
    void close() override;
    bool isOpen() const override { return server_.isListening(); }

    quint16 serverPort() const { return server_.serverPort(); }   // actual port when bound to 0
    bool hasSubscriber() const { return !client_.isNull(); }

signals:
    void subscriberChanged(bool attached);

private slots:
    void onNewConnection();

private:
    void dropSubscriber(const char* reason);

    Endpoint endpoint_;
    QWebSocketServer server_;
    QSet<QWebSocket*> sockets_;      // every accepted socket, closed on close()
    QPointer<QWebSocket> client_;    // current subscriber
};

} // namespace posecast
