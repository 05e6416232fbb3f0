#include <ssap/Session/Session.hpp>
#include <QDebug>

namespace ssap {

Session::Session(ITransport* transport, const SessionConfig& config, QObject* parent)
    : QObject(parent)
    , config_(config)
    , transport_(transport)
    , store_(config.keyDirectory)
    , messenger_(new Messenger(transport, this))
    , registration_(new Registration(messenger_, &store_, this))
    , correlator_(new RequestCorrelator(messenger_, this))
{
    qRegisterMetaType<ssap::ConnectionState>();
    qRegisterMetaType<ssap::RegistrationState>();
    qRegisterMetaType<ssap::ErrorCode>();
    qRegisterMetaType<ssap::InboundFrame>();
    qRegisterMetaType<ssap::OutboundFrame>();

    registration_->setDeviceAddress(config_.endpoint.address);
    registration_->setHandshakePayload(config_.handshakePayload.isEmpty()
                                           ? SessionConfig::defaultHandshakePayload()
                                           : config_.handshakePayload);
    correlator_->setRequestTimeout(config_.requestTimeout);
    correlator_->setReadyTimeout(config_.readyTimeout);

    connect(transport_, &ITransport::opened, this, &Session::onTransportOpened);
    connect(transport_, &ITransport::closed, this, &Session::onTransportClosed);
    connect(transport_, &ITransport::error, this, &Session::onTransportError);

    connect(messenger_, &Messenger::frameReceived, this, &Session::onFrame);

    connect(registration_, &Registration::registered, this, &Session::onRegistered);
    connect(registration_, &Registration::pairingPrompt, this, &Session::pairingPrompt);
    connect(registration_, &Registration::failed, this, &Session::onRegistrationFailed);

    registerRetry_.setSingleShot(true);
    connect(&registerRetry_, &QTimer::timeout, this, &Session::retryRegistration);
}

Session::~Session()
{
    stop();
}

void Session::start()
{
    if (started_) return;
    started_ = true;

    messenger_->start();
    transport_->start();

    if (transport_->isConnected()) {
        // Already connected - register immediately
        onTransportOpened();
    }
}

void Session::stop()
{
    if (!started_) return;
    started_ = false;

    registerRetry_.stop();
    transport_->stop();
    messenger_->stop();
    correlator_->setReady(false);
    registration_->reset();
    setState(ConnectionState::Disconnected);
}

RegistrationState Session::registrationState() const
{
    return registration_->state();
}

PendingReply* Session::request(const QString& path, const QJsonObject& payload,
                               const QString& prefix)
{
    return correlator_->send(OutboundType::Request, path, payload, prefix);
}

PendingReply* Session::send(OutboundType type, const QString& path,
                            const QJsonObject& payload, const QString& prefix)
{
    return correlator_->send(type, path, payload, prefix);
}

void Session::setState(ConnectionState state)
{
    if (state_ == state) return;
    state_ = state;
    qDebug() << "[Session] State:" << static_cast<int>(state);
    emit stateChanged(state);
}

void Session::onTransportOpened()
{
    if (!started_) return;
    registerRetry_.stop();
    setState(ConnectionState::Connected);
    registration_->begin();
}

void Session::onTransportClosed()
{
    const bool wasUp = state_ != ConnectionState::Disconnected;
    registerRetry_.stop();
    correlator_->setReady(false);
    registration_->reset();
    setState(ConnectionState::Disconnected);
    if (wasUp)
        emit disconnected();
}

void Session::onTransportError(const QString& message)
{
    // The transport reconnects on its own; nothing to surface here.
    qDebug() << "[Session] Transport error:" << message;
}

void Session::onFrame(const InboundFrame& frame)
{
    if (state_ == ConnectionState::Registered) {
        if (!correlator_->dispatch(frame)) {
            qDebug() << "[Session] Dropping unmatched" << inboundTypeName(frame.type)
                     << "frame id" << frame.id;
        }
        return;
    }

    if (!registration_->handleFrame(frame)) {
        qDebug() << "[Session] Dropping" << inboundTypeName(frame.type)
                 << "frame received before registration";
    }
}

void Session::onRegistered()
{
    if (state_ != ConnectionState::Connected) return;
    qInfo() << "[Session] Registered with" << config_.endpoint.address;
    setState(ConnectionState::Registered);
    correlator_->setReady(true);
    emit registered();
}

void Session::onRegistrationFailed(ErrorCode code, const QString& message)
{
    if (code == ErrorCode::PairingRejected && state_ == ConnectionState::Connected) {
        qInfo() << "[Session] Registering again in" << config_.registerRetryDelay << "ms";
        registerRetry_.start(config_.registerRetryDelay);
    }
    emit registrationFailed(code, message);
}

void Session::retryRegistration()
{
    if (!started_ || state_ != ConnectionState::Connected) return;
    registration_->begin();
}

} // namespace ssap
