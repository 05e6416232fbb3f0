#pragma once

#include <ssap/Transport/Endpoint.hpp>
#include <ssap/Version.hpp>
#include <QJsonObject>
#include <QString>

namespace ssap {

struct SessionConfig {
    Endpoint endpoint;
    TlsPolicy tlsPolicy = TlsPolicy::AcceptSelfSigned;

    // Directory holding one credential file per device address
    QString keyDirectory = "keys";

    // Registration payload without the credential. Empty means the built-in
    // client descriptor (see defaultHandshakePayload()).
    QJsonObject handshakePayload;

    // Timeouts (ms)
    int requestTimeout = DEFAULT_REQUEST_TIMEOUT_MS;
    int readyTimeout = DEFAULT_READY_TIMEOUT_MS;
    int reconnectDelay = DEFAULT_RECONNECT_DELAY_MS;
    // Pause before a rejected registration is sent again on the same connection
    int registerRetryDelay = DEFAULT_REGISTER_RETRY_DELAY_MS;

    static QJsonObject defaultHandshakePayload();
};

} // namespace ssap
