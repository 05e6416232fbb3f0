#pragma once

#include <QMetaType>

namespace ssap {

enum class ErrorCode {
    Timeout,          // no matching response inside the request timeout
    SocketNotReady,   // session did not reach Registered inside the ready timeout
    ParseError,       // inbound frame could not be decoded (never surfaced to callers)
    InvalidArgument,
    TransportError,
    PersistenceError, // credential directory / file I/O failure
    PairingRejected,  // device answered the register frame with an error
    Cancelled
};

const char* errorCodeName(ErrorCode code);

} // namespace ssap

Q_DECLARE_METATYPE(ssap::ErrorCode)
