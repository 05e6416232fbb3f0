#include <ssap/Session/Registration.hpp>
#include <ssap/Session/CredentialStore.hpp>
#include <ssap/Messenger/Messenger.hpp>
#include <QUuid>
#include <QDebug>

namespace ssap {

Registration::Registration(Messenger* messenger, const CredentialStore* store,
                           QObject* parent)
    : QObject(parent)
    , messenger_(messenger)
    , store_(store)
{
}

void Registration::begin()
{
    reset();

    credential_ = store_->load(deviceAddress_);

    OutboundFrame frame;
    frame.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    frame.type = OutboundType::Register;
    frame.payload = handshakePayload_;
    if (!credential_.isEmpty())
        frame.payload.insert(CLIENT_KEY_FIELD, credential_);

    registerId_ = frame.id;
    qDebug() << "[Registration] Sending register to" << deviceAddress_
             << (credential_.isEmpty() ? "(no stored key)" : "(with stored key)");
    messenger_->sendFrame(frame);
}

void Registration::reset()
{
    registerId_.clear();
    setState(RegistrationState::Unregistered);
}

bool Registration::handleFrame(const InboundFrame& frame)
{
    if (registerId_.isEmpty() || state_ == RegistrationState::Registered)
        return false;
    // Firmware always echoes the register id; frames without one are only
    // accepted when they are unambiguous handshake answers.
    if (frame.hasId() && frame.id != registerId_)
        return false;

    switch (frame.type) {
    case InboundType::Response:
        if (!frame.hasId())
            return false;
        if (state_ == RegistrationState::Unregistered) {
            qInfo() << "[Registration] Waiting for pairing confirmation on" << deviceAddress_;
            setState(RegistrationState::AwaitingConfirmation);
            emit pairingPrompt();
        }
        return true;

    case InboundType::Registered:
        onRegistered(frame);
        return true;

    case InboundType::Error:
        if (!frame.hasId())
            return false;
        qWarning() << "[Registration] Device rejected registration:" << frame.error;
        registerId_.clear();
        setState(RegistrationState::Unregistered);
        emit failed(ErrorCode::PairingRejected, frame.error);
        return true;
    }
    return false;
}

void Registration::onRegistered(const InboundFrame& frame)
{
    const QString key = frame.payload.value(CLIENT_KEY_FIELD).toString();

    if (!key.isEmpty() && key != credential_) {
        QString why;
        if (store_->save(deviceAddress_, key, &why)) {
            qInfo() << "[Registration] Stored new credential for" << deviceAddress_;
        } else {
            qWarning() << "[Registration] Cannot persist credential for" << deviceAddress_
                       << ":" << why;
            emit failed(ErrorCode::PersistenceError, why);
        }
        credential_ = key;
    }

    setState(RegistrationState::Registered);
    emit registered();
}

void Registration::setState(RegistrationState state)
{
    if (state_ == state) return;
    state_ = state;
    qDebug() << "[Registration] State:" << static_cast<int>(state);
    emit stateChanged(state);
}

} // namespace ssap
