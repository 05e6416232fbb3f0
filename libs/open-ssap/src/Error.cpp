#include <ssap/Error.hpp>

namespace ssap {

const char* errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Timeout: return "Timeout";
    case ErrorCode::SocketNotReady: return "SocketNotReady";
    case ErrorCode::ParseError: return "ParseError";
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::TransportError: return "TransportError";
    case ErrorCode::PersistenceError: return "PersistenceError";
    case ErrorCode::PairingRejected: return "PairingRejected";
    case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

} // namespace ssap
