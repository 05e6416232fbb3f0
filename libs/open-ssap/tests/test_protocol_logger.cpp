#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <ssap/Messenger/ProtocolLogger.hpp>
#include <ssap/Messenger/Messenger.hpp>
#include <ssap/Transport/ReplayTransport.hpp>

namespace {

QStringList readLines(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(f.readAll()).split('\n', Qt::SkipEmptyParts);
}

} // namespace

class TestProtocolLogger : public QObject {
    Q_OBJECT

private:
    QTemporaryDir dir_;

private slots:
    void testMasksClientKeyAtAnyDepth()
    {
        QJsonObject nested{{"client-key", "SECRET"}, {"forcePairing", false}};
        QJsonObject payload{{"client-key", "SECRET"},
                            {"manifest", nested},
                            {"list", QJsonArray{nested}}};

        const QJsonObject masked = ssap::ProtocolLogger::masked(payload);
        QCOMPARE(masked["client-key"].toString(), QString("***"));
        QCOMPARE(masked["manifest"].toObject()["client-key"].toString(), QString("***"));
        QCOMPARE(masked["manifest"].toObject()["forcePairing"].toBool(), false);
        QCOMPARE(masked["list"].toArray().first().toObject()["client-key"].toString(),
                 QString("***"));

        // Input left alone
        QCOMPARE(payload["client-key"].toString(), QString("SECRET"));
    }

    void testTsvOutput()
    {
        const QString path = dir_.filePath("protocol.tsv");

        ssap::ProtocolLogger logger;
        QVERIFY(logger.open(path));
        QVERIFY(logger.isOpen());

        logger.log("client->tv", "request", "7", "ssap://audio/setVolume",
                   QJsonObject{{"volume", 12}});
        logger.log("tv->client", "registered", QString(), QString(), QJsonObject());
        logger.close();
        QVERIFY(!logger.isOpen());

        const QStringList lines = readLines(path);
        QCOMPARE(lines.size(), 3);
        QCOMPARE(lines[0], QString("TIME\tDIR\tTYPE\tID\tURI\tPAYLOAD"));

        const QStringList first = lines[1].split('\t');
        QCOMPARE(first.size(), 6);
        QCOMPARE(first.mid(1), (QStringList{"client->tv", "request", "7",
                                            "ssap://audio/setVolume", "{\"volume\":12}"}));

        const QStringList second = lines[2].split('\t');
        QCOMPARE(second.mid(1), (QStringList{"tv->client", "registered", "-", "-", ""}));
    }

    void testJsonlOutput()
    {
        const QString path = dir_.filePath("protocol.jsonl");

        ssap::ProtocolLogger logger;
        logger.setFormat(ssap::ProtocolLogger::OutputFormat::Jsonl);
        QVERIFY(logger.open(path));
        logger.log("tv->client", "registered", "reg-1", QString(),
                   QJsonObject{{"client-key", "NEW"}});
        logger.close();

        const QStringList lines = readLines(path);
        QCOMPARE(lines.size(), 1);
        const QJsonObject obj = QJsonDocument::fromJson(lines[0].toUtf8()).object();
        QCOMPARE(obj["direction"].toString(), QString("tv->client"));
        QCOMPARE(obj["type"].toString(), QString("registered"));
        QCOMPARE(obj["id"].toString(), QString("reg-1"));
        QCOMPARE(obj["payload"].toObject()["client-key"].toString(), QString("***"));
        QVERIFY(obj.contains("ts_ms"));
    }

    void testOpenFailure()
    {
        ssap::ProtocolLogger logger;
        QVERIFY(!logger.open(dir_.filePath("missing/dir/log.tsv")));
        QVERIFY(!logger.isOpen());
        // Logging while closed is a no-op
        logger.log("client->tv", "request", "1", "ssap://x", QJsonObject());
    }

    void testAttachLogsBothDirections()
    {
        const QString path = dir_.filePath("attached.tsv");

        ssap::ReplayTransport transport;
        ssap::Messenger messenger(&transport);
        messenger.start();
        transport.start();
        transport.simulateConnect();

        ssap::ProtocolLogger logger;
        QVERIFY(logger.open(path));
        logger.attach(&messenger);

        ssap::OutboundFrame frame;
        frame.id = "reg-1";
        frame.type = ssap::OutboundType::Register;
        frame.payload["client-key"] = "SECRET";
        messenger.sendFrame(frame);
        transport.feedMessage(R"({"id":"reg-1","type":"registered","payload":{"client-key":"NEW"}})");

        logger.detach();
        transport.feedMessage(R"({"id":"x","type":"response","payload":{}})");
        logger.close();

        const QStringList lines = readLines(path);
        QCOMPARE(lines.size(), 3);
        QVERIFY(lines[1].contains("client->tv\tregister\treg-1\t-\t"));
        QVERIFY(lines[2].contains("tv->client\tregistered\treg-1"));
        QVERIFY(!lines[1].contains("SECRET"));
        QVERIFY(!lines[2].contains("NEW"));
    }
};

QTEST_MAIN(TestProtocolLogger)
#include "test_protocol_logger.moc"
