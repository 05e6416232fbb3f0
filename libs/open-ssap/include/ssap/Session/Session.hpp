#pragma once

#include <QObject>
#include <QTimer>

#include <ssap/Error.hpp>
#include <ssap/Transport/ITransport.hpp>
#include <ssap/Messenger/Messenger.hpp>
#include <ssap/Session/CredentialStore.hpp>
#include <ssap/Session/PendingReply.hpp>
#include <ssap/Session/Registration.hpp>
#include <ssap/Session/RequestCorrelator.hpp>
#include <ssap/Session/SessionConfig.hpp>
#include <ssap/Session/SessionState.hpp>

namespace ssap {

/// Client session for one device. Owns the connection state, the pairing
/// handshake and the request correlator; every inbound frame passes through
/// onFrame() once and goes to exactly one consumer.
///
/// The transport is not owned and must outlive the session.
class Session : public QObject {
    Q_OBJECT
public:
    Session(ITransport* transport, const SessionConfig& config,
            QObject* parent = nullptr);
    ~Session() override;

    void start();
    void stop();

    ConnectionState state() const { return state_; }
    RegistrationState registrationState() const;
    bool isRegistered() const { return state_ == ConnectionState::Registered; }

    /// Shorthand for send(OutboundType::Request, ...).
    PendingReply* request(const QString& path, const QJsonObject& payload = {},
                          const QString& prefix = DEFAULT_URI_PREFIX);
    PendingReply* send(OutboundType type, const QString& path,
                       const QJsonObject& payload = {},
                       const QString& prefix = DEFAULT_URI_PREFIX);

    const SessionConfig& config() const { return config_; }
    QString deviceAddress() const { return config_.endpoint.address; }
    const CredentialStore& credentials() const { return store_; }
    Messenger* messenger() const { return messenger_; }
    RequestCorrelator* correlator() const { return correlator_; }
    Registration* registration() const { return registration_; }

signals:
    void stateChanged(ssap::ConnectionState state);
    void registered();
    void pairingPrompt();
    /// PairingRejected keeps the connection and registers again after
    /// SessionConfig::registerRetryDelay. Other codes leave the state unchanged.
    void registrationFailed(ssap::ErrorCode code, const QString& message);
    void disconnected();

private:
    void setState(ConnectionState state);

    void onTransportOpened();
    void onTransportClosed();
    void onTransportError(const QString& message);
    void onFrame(const ssap::InboundFrame& frame);
    void onRegistered();
    void onRegistrationFailed(ssap::ErrorCode code, const QString& message);
    void retryRegistration();

    SessionConfig config_;
    ITransport* transport_;
    CredentialStore store_;
    Messenger* messenger_;
    Registration* registration_;
    RequestCorrelator* correlator_;
    QTimer registerRetry_;
    ConnectionState state_ = ConnectionState::Disconnected;
    bool started_ = false;
};

} // namespace ssap
