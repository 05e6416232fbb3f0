#pragma once

#include <QMetaType>

namespace ssap {

/// Invariant: Registered implies the transport is connected.
enum class ConnectionState {
    Disconnected,
    Connected,
    Registered
};

enum class RegistrationState {
    Unregistered,
    AwaitingConfirmation,   // device shows the on-screen pairing prompt
    Registered
};

} // namespace ssap

Q_DECLARE_METATYPE(ssap::ConnectionState)
Q_DECLARE_METATYPE(ssap::RegistrationState)
