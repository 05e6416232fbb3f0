#include "core/services/WakeOnLan.hpp"
#include <QHostAddress>
#include <QRegularExpression>
#include <QUdpSocket>
#include <boost/log/trivial.hpp>

namespace wr {

QByteArray WakeOnLan::parseMac(const QString& mac)
{
    static const QRegularExpression pattern(
        QStringLiteral("^[0-9A-Fa-f]{2}([:-]?)([0-9A-Fa-f]{2}\\1){4}[0-9A-Fa-f]{2}$"));
    const QString trimmed = mac.trimmed();
    if (!pattern.match(trimmed).hasMatch())
        return {};

    QString hex = trimmed;
    hex.remove(':').remove('-');
    return QByteArray::fromHex(hex.toLatin1());
}

QByteArray WakeOnLan::magicPacket(const QByteArray& mac)
{
    if (mac.size() != 6)
        return {};

    QByteArray packet(6, char(0xFF));
    packet.reserve(PACKET_SIZE);
    for (int i = 0; i < 16; ++i)
        packet.append(mac);
    return packet;
}

bool WakeOnLan::wake(const QString& mac, const QString& broadcast, quint16 port,
                     QString* errorString)
{
    const QByteArray address = parseMac(mac);
    if (address.isEmpty()) {
        if (errorString) *errorString = QStringLiteral("invalid MAC address '%1'").arg(mac);
        return false;
    }

    QHostAddress target;
    if (!target.setAddress(broadcast)) {
        if (errorString) *errorString = QStringLiteral("invalid broadcast address '%1'").arg(broadcast);
        return false;
    }

    QUdpSocket socket;
    const QByteArray packet = magicPacket(address);
    const qint64 written = socket.writeDatagram(packet, target, port);
    if (written != packet.size()) {
        if (errorString) *errorString = socket.errorString();
        BOOST_LOG_TRIVIAL(warning) << "[WakeOnLan] send to " << broadcast.toStdString()
                                   << " failed: " << socket.errorString().toStdString();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[WakeOnLan] Magic packet for " << mac.toStdString()
                            << " sent to " << broadcast.toStdString() << ":" << port;
    return true;
}

} // namespace wr
