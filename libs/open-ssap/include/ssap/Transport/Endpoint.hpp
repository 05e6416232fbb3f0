#pragma once

#include <QString>
#include <QUrl>
#include <cstdint>

namespace ssap {

/// Certificate handling for wss:// endpoints. Devices ship self-signed
/// certificates, so accepting them has to be requested explicitly.
enum class TlsPolicy {
    Verify,
    AcceptSelfSigned
};

struct Endpoint {
    QString protocol = "wss";
    QString address;
    uint16_t port = 3001;

    QUrl url() const
    {
        QUrl u;
        u.setScheme(protocol);
        u.setHost(address);
        u.setPort(port);
        u.setPath("/");
        return u;
    }

    bool isSecure() const { return protocol == "wss"; }
    bool isValid() const { return !address.isEmpty() && (protocol == "ws" || protocol == "wss"); }
};

} // namespace ssap
