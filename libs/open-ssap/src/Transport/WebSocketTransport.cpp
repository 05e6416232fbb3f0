#include <ssap/Transport/WebSocketTransport.hpp>
#include <QSslConfiguration>
#include <QSslSocket>
#include <QDebug>

namespace ssap {

WebSocketTransport::WebSocketTransport(QObject* parent)
    : ITransport(parent)
{
    reconnectTimer_.setSingleShot(true);
    connect(&reconnectTimer_, &QTimer::timeout, this, &WebSocketTransport::open);

    connect(&socket_, &QWebSocket::connected, this, &WebSocketTransport::onConnected);
    connect(&socket_, &QWebSocket::disconnected, this, &WebSocketTransport::onDisconnected);
    connect(&socket_, &QWebSocket::textMessageReceived,
            this, &WebSocketTransport::onTextMessage);
    connect(&socket_, &QWebSocket::errorOccurred, this, &WebSocketTransport::onSocketError);
    connect(&socket_, &QWebSocket::sslErrors, this, &WebSocketTransport::onSslErrors);
}

WebSocketTransport::~WebSocketTransport()
{
    running_ = false;
    reconnectTimer_.stop();
    disconnect(&socket_, nullptr, this, nullptr);
    socket_.abort();
}

void WebSocketTransport::setEndpoint(const Endpoint& endpoint, TlsPolicy tlsPolicy)
{
    endpoint_ = endpoint;
    tlsPolicy_ = tlsPolicy;

    if (endpoint_.isSecure()) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        if (tlsPolicy_ == TlsPolicy::AcceptSelfSigned) {
            ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        }
        socket_.setSslConfiguration(ssl);
    }
}

void WebSocketTransport::start()
{
    if (running_) return;
    if (!endpoint_.isValid()) {
        qWarning() << "[WebSocketTransport] start() without a valid endpoint";
        emit error(QStringLiteral("invalid endpoint"));
        return;
    }
    running_ = true;
    open();
}

void WebSocketTransport::stop()
{
    if (!running_) return;
    running_ = false;
    reconnectTimer_.stop();
    if (socket_.state() != QAbstractSocket::UnconnectedState) {
        socket_.close();
    }
}

void WebSocketTransport::sendText(const QString& message)
{
    if (socket_.state() == QAbstractSocket::ConnectedState) {
        socket_.sendTextMessage(message);
    } else {
        qWarning() << "[WebSocketTransport] send DROPPED:" << message.size()
                   << "chars (socket state:" << static_cast<int>(socket_.state()) << ")";
    }
}

bool WebSocketTransport::isConnected() const
{
    return socket_.state() == QAbstractSocket::ConnectedState;
}

void WebSocketTransport::open()
{
    if (!running_) return;
    if (socket_.state() != QAbstractSocket::UnconnectedState) return;

    qDebug() << "[WebSocketTransport] Connecting to" << endpoint_.url().toString();
    socket_.open(endpoint_.url());
}

void WebSocketTransport::scheduleReconnect()
{
    if (!running_ || reconnectTimer_.isActive()) return;
    reconnectTimer_.start(reconnectDelayMs_);
}

void WebSocketTransport::logConnectionLoss(const QString& reason)
{
    if (lastLossLog_.isValid() && lastLossLog_.elapsed() < CONNECTION_LOG_WINDOW_MS)
        return;
    lastLossLog_.start();
    qWarning() << "[WebSocketTransport] Connection to" << endpoint_.address
               << "lost:" << reason << "- retrying every" << reconnectDelayMs_ << "ms";
}

void WebSocketTransport::onConnected()
{
    qInfo() << "[WebSocketTransport] Connected to" << endpoint_.url().toString();
    emit opened();
}

void WebSocketTransport::onDisconnected()
{
    if (running_) {
        logConnectionLoss(socket_.closeReason().isEmpty()
                              ? QStringLiteral("closed")
                              : socket_.closeReason());
    }
    emit closed();
    scheduleReconnect();
}

void WebSocketTransport::onTextMessage(const QString& message)
{
    emit messageReceived(message);
}

void WebSocketTransport::onSocketError(QAbstractSocket::SocketError err)
{
    Q_UNUSED(err)
    const QString message = socket_.errorString();
    if (running_) {
        logConnectionLoss(message);
    }
    emit error(message);

    // A refused or timed-out connect never reaches disconnected()
    if (socket_.state() == QAbstractSocket::UnconnectedState) {
        scheduleReconnect();
    }
}

void WebSocketTransport::onSslErrors(const QList<QSslError>& errors)
{
    if (tlsPolicy_ == TlsPolicy::AcceptSelfSigned) {
        socket_.ignoreSslErrors();
        return;
    }
    for (const auto& e : errors) {
        qWarning() << "[WebSocketTransport] TLS error:" << e.errorString();
    }
}

} // namespace ssap
