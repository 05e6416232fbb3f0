#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <ssap/Transport/ReplayTransport.hpp>
#include <ssap/Session/Session.hpp>
#include <ssap/Watchdog/SoundOutputWatchdog.hpp>

namespace {

const QString GET_URI = QStringLiteral("ssap://com.webos.service.apiadapter/audio/getSoundOutput");
const QString CHANGE_URI = QStringLiteral("ssap://com.webos.service.apiadapter/audio/changeSoundOutput");

QList<QJsonObject> sentFrames(const ssap::ReplayTransport& transport, const QString& uri) {
    QList<QJsonObject> frames;
    for (const auto& text : transport.sentMessages()) {
        QJsonObject obj = QJsonDocument::fromJson(text.toUtf8()).object();
        if (obj["uri"].toString() == uri)
            frames.append(obj);
    }
    return frames;
}

QString response(const QString& id, const QJsonObject& payload) {
    QJsonObject obj;
    obj["id"] = id;
    obj["type"] = "response";
    obj["payload"] = payload;
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QJsonObject outputPayload(const QString& output) {
    QJsonObject p;
    p["soundOutput"] = output;
    p["returnValue"] = true;
    return p;
}

QJsonObject returnValue(bool ok) {
    QJsonObject p;
    p["returnValue"] = ok;
    return p;
}

} // namespace

class TestSoundOutputWatchdog : public QObject {
    Q_OBJECT

private:
    QTemporaryDir keyDir_;

    ssap::SessionConfig makeConfig() {
        ssap::SessionConfig config;
        config.endpoint.address = "10.0.0.5";
        config.keyDirectory = keyDir_.path();
        config.requestTimeout = 200;
        return config;
    }

    static void registerSession(ssap::Session& session, ssap::ReplayTransport& transport) {
        session.start();
        transport.simulateConnect();
        const QString regId = QJsonDocument::fromJson(
            transport.sentMessages().first().toUtf8()).object()["id"].toString();
        transport.feedMessage(QString(R"({"id":"%1","type":"registered"})").arg(regId));
        transport.clearSent();
    }

private slots:
    void testRejectsUnknownOutput() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(20);

        QString why;
        QVERIFY(!watchdog.start("hdmi_magic", &why));
        QVERIFY(why.contains("hdmi_magic"));
        QVERIFY(why.contains("external_arc"));
        QVERIFY(!watchdog.isRunning());

        QTest::qWait(100);
        QCOMPARE(watchdog.pollCount(), 0);
        QVERIFY(transport.sentMessages().isEmpty());
    }

    void testInvalidStartKeepsRunningTask() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        QVERIFY(watchdog.start("external_arc"));
        QVERIFY(!watchdog.start("bogus"));
        QVERIFY(watchdog.isRunning());
        QCOMPARE(watchdog.desiredOutput(), QString("external_arc"));
    }

    void testCorrectsDrift() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(50);
        QSignalSpy correctedSpy(&watchdog, &ssap::SoundOutputWatchdog::corrected);

        QVERIFY(watchdog.start("external_arc"));

        // First poll goes out immediately
        auto polls = sentFrames(transport, GET_URI);
        QCOMPARE(polls.size(), 1);
        transport.feedMessage(response(polls[0]["id"].toString(), outputPayload("tv_speaker")));

        auto changes = sentFrames(transport, CHANGE_URI);
        QCOMPARE(changes.size(), 1);
        QCOMPARE(changes[0]["payload"].toObject()["output"].toString(), QString("external_arc"));
        transport.feedMessage(response(changes[0]["id"].toString(), returnValue(true)));
        QCOMPARE(correctedSpy.count(), 1);

        // Next poll reports the desired output - no further correction
        QTRY_COMPARE_WITH_TIMEOUT(sentFrames(transport, GET_URI).size(), 2, 1000);
        polls = sentFrames(transport, GET_URI);
        transport.feedMessage(response(polls[1]["id"].toString(), outputPayload("external_arc")));

        QTest::qWait(20);
        QCOMPARE(sentFrames(transport, CHANGE_URI).size(), 1);
        watchdog.stop();
    }

    void testPollErrorDoesNotStopWatchdog() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(50);
        QSignalSpy failSpy(&watchdog, &ssap::SoundOutputWatchdog::pollFailed);

        QVERIFY(watchdog.start("external_arc"));

        // Never answer the first poll: it times out after 200 ms
        QTRY_COMPARE_WITH_TIMEOUT(failSpy.count(), 1, 1000);
        QVERIFY(watchdog.isRunning());
        QTRY_VERIFY_WITH_TIMEOUT(sentFrames(transport, GET_URI).size() >= 2, 1000);
        watchdog.stop();
    }

    void testSkipsTicksWhileNotRegistered() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        session.start();

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(20);
        QVERIFY(watchdog.start("external_arc"));

        QTest::qWait(100);
        QCOMPARE(watchdog.pollCount(), 0);

        registerSession(session, transport);
        QTRY_VERIFY_WITH_TIMEOUT(watchdog.pollCount() > 0, 1000);
        watchdog.stop();
    }

    void testRestartKeepsSingleTask() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(40);

        QVERIFY(watchdog.start("external_arc"));
        const auto firstPoll = sentFrames(transport, GET_URI).first();
        QVERIFY(watchdog.start("soundbar"));
        QCOMPARE(watchdog.desiredOutput(), QString("soundbar"));

        // Answer to the cancelled task's poll must not trigger a correction
        transport.feedMessage(response(firstPoll["id"].toString(), outputPayload("tv_speaker")));
        QVERIFY(sentFrames(transport, CHANGE_URI).isEmpty());

        // Only one task: answering every poll promptly yields one poll per interval
        transport.clearSent();
        int answered = 0;
        QElapsedTimer elapsed;
        elapsed.start();
        while (elapsed.elapsed() < 400) {
            QTest::qWait(10);
            const auto polls = sentFrames(transport, GET_URI);
            for (int i = answered; i < polls.size(); ++i)
                transport.feedMessage(response(polls[i]["id"].toString(), outputPayload("soundbar")));
            answered = polls.size();
        }
        QVERIFY(answered >= 5);
        QVERIFY(answered <= 12);
        QVERIFY(sentFrames(transport, CHANGE_URI).isEmpty());
        watchdog.stop();
    }

    void testStopPreventsFurtherPolls() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(20);
        QVERIFY(watchdog.start("external_arc"));
        const auto poll = sentFrames(transport, GET_URI).first();

        watchdog.stop();
        watchdog.stop();   // idempotent
        QVERIFY(!watchdog.isRunning());
        const int polls = watchdog.pollCount();

        // A late answer showing drift must not cause a correction
        transport.feedMessage(response(poll["id"].toString(), outputPayload("tv_speaker")));
        QTest::qWait(100);
        QCOMPARE(watchdog.pollCount(), polls);
        QVERIFY(sentFrames(transport, CHANGE_URI).isEmpty());
    }

    void testQuirkModeTripleCorrection() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(1000);
        watchdog.setQuirkMode(true);
        QVERIFY(watchdog.start("external_arc"));

        auto polls = sentFrames(transport, GET_URI);
        transport.feedMessage(response(polls[0]["id"].toString(), outputPayload("tv_speaker")));

        auto changes = sentFrames(transport, CHANGE_URI);
        QCOMPARE(changes.size(), 1);
        transport.feedMessage(response(changes[0]["id"].toString(), returnValue(false)));

        changes = sentFrames(transport, CHANGE_URI);
        QCOMPARE(changes.size(), 2);
        QCOMPARE(changes[1]["payload"].toObject()["output"].toString(), QString("tv_speaker"));
        transport.feedMessage(response(changes[1]["id"].toString(), returnValue(true)));

        changes = sentFrames(transport, CHANGE_URI);
        QCOMPARE(changes.size(), 3);
        QCOMPARE(changes[2]["payload"].toObject()["output"].toString(), QString("external_arc"));
        transport.feedMessage(response(changes[2]["id"].toString(), returnValue(true)));

        QCOMPARE(sentFrames(transport, CHANGE_URI).size(), 3);
        watchdog.stop();
    }

    void testDefaultModeSingleCorrection() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::SoundOutputWatchdog watchdog(&session);
        watchdog.setInterval(1000);
        QVERIFY(watchdog.start("external_arc"));

        auto polls = sentFrames(transport, GET_URI);
        transport.feedMessage(response(polls[0]["id"].toString(), outputPayload("tv_speaker")));
        auto changes = sentFrames(transport, CHANGE_URI);
        transport.feedMessage(response(changes[0]["id"].toString(), returnValue(false)));

        QCOMPARE(sentFrames(transport, CHANGE_URI).size(), 1);
        watchdog.stop();
    }
};

QTEST_MAIN(TestSoundOutputWatchdog)
#include "test_sound_output_watchdog.moc"
