#pragma once

#include <QByteArray>
#include <QString>

namespace wr {

/// Magic-packet sender for powering a device on. A switched-off device has
/// no SSAP endpoint, so this is the only way to bring it up.
class WakeOnLan {
public:
    static constexpr quint16 DEFAULT_PORT = 9;
    static constexpr int PACKET_SIZE = 102;

    /// Accepts "aa:bb:cc:dd:ee:ff", "aa-bb-cc-dd-ee-ff" or "aabbccddeeff".
    /// Returns an empty array for anything else.
    static QByteArray parseMac(const QString& mac);

    /// 6 x 0xFF followed by the address repeated 16 times.
    static QByteArray magicPacket(const QByteArray& mac);

    static bool wake(const QString& mac, const QString& broadcast = "255.255.255.255",
                     quint16 port = DEFAULT_PORT, QString* errorString = nullptr);
};

} // namespace wr
