#pragma once

#include <QObject>
#include <QJsonObject>

#include <ssap/Error.hpp>
#include <ssap/Messenger/Frame.hpp>
#include <ssap/Session/SessionState.hpp>

namespace ssap {

class Messenger;
class CredentialStore;

/// Pairing handshake for one connection:
/// Unregistered -> AwaitingConfirmation -> Registered, back to Unregistered
/// on reset(). A stored credential is sent as "client-key"; a credential
/// handed out by the device is persisted under the device address.
class Registration : public QObject {
    Q_OBJECT
public:
    static constexpr const char* CLIENT_KEY_FIELD = "client-key";

    Registration(Messenger* messenger, const CredentialStore* store,
                 QObject* parent = nullptr);

    void setDeviceAddress(const QString& address) { deviceAddress_ = address; }
    void setHandshakePayload(const QJsonObject& payload) { handshakePayload_ = payload; }

    /// Sends the register frame. Called when the transport opens.
    void begin();

    /// Back to Unregistered. Called when the transport closes.
    void reset();

    /// Returns true if the frame belonged to the handshake and was consumed.
    bool handleFrame(const ssap::InboundFrame& frame);

    RegistrationState state() const { return state_; }
    QString registerId() const { return registerId_; }
    QString credential() const { return credential_; }

signals:
    void stateChanged(ssap::RegistrationState state);
    void pairingPrompt();
    void registered();
    void failed(ssap::ErrorCode code, const QString& message);

private:
    void setState(RegistrationState state);
    void onRegistered(const InboundFrame& frame);

    Messenger* messenger_;
    const CredentialStore* store_;
    QString deviceAddress_;
    QJsonObject handshakePayload_;

    RegistrationState state_ = RegistrationState::Unregistered;
    QString registerId_;
    QString credential_;
};

} // namespace ssap
