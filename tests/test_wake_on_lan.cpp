#include <QtTest>
#include <QUdpSocket>
#include "core/services/WakeOnLan.hpp"

class TestWakeOnLan : public QObject {
    Q_OBJECT
private slots:
    void testParseMac_data();
    void testParseMac();
    void testMagicPacketLayout();
    void testWakeSendsPacket();
    void testWakeRejectsBadInput();
};

void TestWakeOnLan::testParseMac_data()
{
    QTest::addColumn<QString>("input");
    QTest::addColumn<bool>("valid");

    QTest::newRow("colons") << "a8:23:fe:01:02:03" << true;
    QTest::newRow("dashes") << "A8-23-FE-01-02-03" << true;
    QTest::newRow("bare") << "a823fe010203" << true;
    QTest::newRow("mixed separators") << "a8:23-fe:01:02:03" << false;
    QTest::newRow("short") << "a8:23:fe:01:02" << false;
    QTest::newRow("not hex") << "zz:23:fe:01:02:03" << false;
    QTest::newRow("empty") << "" << false;
}

void TestWakeOnLan::testParseMac()
{
    QFETCH(QString, input);
    QFETCH(bool, valid);

    const QByteArray mac = wr::WakeOnLan::parseMac(input);
    QCOMPARE(!mac.isEmpty(), valid);
    if (valid)
        QCOMPARE(mac, QByteArray::fromHex("a823fe010203"));
}

void TestWakeOnLan::testMagicPacketLayout()
{
    const QByteArray mac = QByteArray::fromHex("a823fe010203");
    const QByteArray packet = wr::WakeOnLan::magicPacket(mac);

    QCOMPARE(packet.size(), wr::WakeOnLan::PACKET_SIZE);
    QCOMPARE(packet.left(6), QByteArray(6, char(0xFF)));
    for (int i = 0; i < 16; ++i)
        QCOMPARE(packet.mid(6 + i * 6, 6), mac);

    QVERIFY(wr::WakeOnLan::magicPacket(QByteArray(5, 'x')).isEmpty());
}

void TestWakeOnLan::testWakeSendsPacket()
{
    QUdpSocket receiver;
    QVERIFY(receiver.bind(QHostAddress::LocalHost, 0));

    QString why;
    QVERIFY2(wr::WakeOnLan::wake("a8:23:fe:01:02:03", "127.0.0.1", receiver.localPort(), &why),
             qPrintable(why));

    QTRY_VERIFY_WITH_TIMEOUT(receiver.hasPendingDatagrams(), 2000);
    QByteArray datagram(int(receiver.pendingDatagramSize()), 0);
    receiver.readDatagram(datagram.data(), datagram.size());
    QCOMPARE(datagram, wr::WakeOnLan::magicPacket(QByteArray::fromHex("a823fe010203")));
}

void TestWakeOnLan::testWakeRejectsBadInput()
{
    QString why;
    QVERIFY(!wr::WakeOnLan::wake("nonsense", "127.0.0.1", 9, &why));
    QVERIFY(why.contains("MAC"));
    QVERIFY(!wr::WakeOnLan::wake("a8:23:fe:01:02:03", "not-an-ip", 9, &why));
    QVERIFY(why.contains("broadcast"));
}

QTEST_MAIN(TestWakeOnLan)
#include "test_wake_on_lan.moc"
