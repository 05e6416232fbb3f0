#pragma once

#include <ssap/Transport/ITransport.hpp>
#include <ssap/Transport/Endpoint.hpp>
#include <ssap/Version.hpp>
#include <QElapsedTimer>
#include <QTimer>
#include <QSslError>
#include <QWebSocket>

namespace ssap {

class WebSocketTransport : public ITransport {
    Q_OBJECT
public:
    explicit WebSocketTransport(QObject* parent = nullptr);
    ~WebSocketTransport() override;

    void setEndpoint(const Endpoint& endpoint, TlsPolicy tlsPolicy = TlsPolicy::Verify);
    void setReconnectDelay(int ms) { reconnectDelayMs_ = ms; }
    int reconnectDelay() const { return reconnectDelayMs_; }

    Endpoint endpoint() const { return endpoint_; }
    TlsPolicy tlsPolicy() const { return tlsPolicy_; }

    /// Opens the socket and keeps it open (fixed-delay reconnect) until stop().
    void start() override;
    void stop() override;
    void sendText(const QString& message) override;
    bool isConnected() const override;

private:
    void open();
    void scheduleReconnect();
    void logConnectionLoss(const QString& reason);

    void onConnected();
    void onDisconnected();
    void onTextMessage(const QString& message);
    void onSocketError(QAbstractSocket::SocketError err);
    void onSslErrors(const QList<QSslError>& errors);

    QWebSocket socket_;
    Endpoint endpoint_;
    TlsPolicy tlsPolicy_ = TlsPolicy::Verify;
    QTimer reconnectTimer_;
    int reconnectDelayMs_ = DEFAULT_RECONNECT_DELAY_MS;
    bool running_ = false;

    // Last time a connection-loss line was written; suppresses log storms
    // while the device flaps.
    QElapsedTimer lastLossLog_;
};

} // namespace ssap
