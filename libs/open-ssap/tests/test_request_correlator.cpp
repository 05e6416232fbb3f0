#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <ssap/Transport/ReplayTransport.hpp>
#include <ssap/Session/Session.hpp>

class TestRequestCorrelator : public QObject {
    Q_OBJECT

private:
    QTemporaryDir keyDir_;

    ssap::SessionConfig makeConfig(int requestTimeout = 5000, int readyTimeout = 5000) {
        ssap::SessionConfig config;
        config.endpoint.address = "10.0.0.5";
        config.keyDirectory = keyDir_.path();
        config.requestTimeout = requestTimeout;
        config.readyTimeout = readyTimeout;
        return config;
    }

    static QJsonObject sentAt(const ssap::ReplayTransport& transport, int index) {
        return QJsonDocument::fromJson(transport.sentMessages().at(index).toUtf8()).object();
    }

    static QString response(const QString& id, const QJsonObject& payload) {
        QJsonObject obj;
        obj["id"] = id;
        obj["type"] = "response";
        obj["payload"] = payload;
        return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
    }

    // Connects, answers the register frame and leaves the transport with an
    // empty sent list.
    static void registerSession(ssap::Session& session, ssap::ReplayTransport& transport) {
        session.start();
        transport.simulateConnect();
        const QString regId = sentAt(transport, 0)["id"].toString();
        transport.feedMessage(QString(R"({"id":"%1","type":"registered"})").arg(regId));
        QVERIFY(session.isRegistered());
        transport.clearSent();
    }

private slots:
    void testSetVolumeScenario() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        QJsonObject args;
        args["volume"] = 15;
        ssap::PendingReply* reply = session.request("audio/setVolume", args);
        QSignalSpy finishedSpy(reply, &ssap::PendingReply::finished);

        QCOMPARE(transport.sentMessages().size(), 1);
        QJsonObject out = sentAt(transport, 0);
        QCOMPARE(out["type"].toString(), QString("request"));
        QCOMPARE(out["uri"].toString(), QString("ssap://audio/setVolume"));
        QCOMPARE(out["payload"].toObject()["volume"].toInt(), 15);
        const QString id = out["id"].toString();
        QCOMPARE(id, reply->id());

        QJsonObject result;
        result["volume"] = 15;
        result["returnValue"] = true;
        transport.feedMessage(response(id, result));

        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY(!reply->hasError());
        QVERIFY(reply->succeeded());
        QCOMPARE(reply->payload(), result);
        QCOMPARE(session.correlator()->pendingCount(), 0);
    }

    void testCustomPrefix() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        session.request("com.webos.service.tvpower/power/reboot", {}, "luna://");
        QCOMPARE(sentAt(transport, 0)["uri"].toString(),
                 QString("luna://com.webos.service.tvpower/power/reboot"));
    }

    void testOutOfOrderResponses() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        QList<ssap::PendingReply*> replies;
        for (int i = 0; i < 5; ++i) {
            QJsonObject args;
            args["n"] = i;
            replies.append(session.request("test/echo", args));
        }
        QCOMPARE(session.correlator()->pendingCount(), 5);

        QSet<QString> ids;
        for (auto* r : replies) ids.insert(r->id());
        QCOMPARE(ids.size(), 5);

        // Answer in reverse order
        for (int i = 4; i >= 0; --i) {
            QJsonObject out = sentAt(transport, i);
            QJsonObject result;
            result["n"] = out["payload"].toObject()["n"].toInt();
            transport.feedMessage(response(out["id"].toString(), result));
        }

        for (int i = 0; i < 5; ++i) {
            QVERIFY(replies[i]->isFinished());
            QCOMPARE(replies[i]->payload()["n"].toInt(), i);
        }
        QCOMPARE(session.correlator()->pendingCount(), 0);
    }

    void testUnmatchedResponseIsDropped() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::PendingReply* reply = session.request("audio/getVolume");
        transport.feedMessage(response("unknown-id", {}));
        transport.feedMessage(R"({"type":"response","payload":{}})");
        transport.feedMessage("{garbage");

        QVERIFY(!reply->isFinished());
        QCOMPARE(session.correlator()->pendingCount(), 1);
    }

    void testDeviceErrorResolvesRequest() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::PendingReply* reply = session.request("no/such");
        const QString id = sentAt(transport, 0)["id"].toString();
        transport.feedMessage(QString(R"({"id":"%1","type":"error","error":"404 no such service or method"})").arg(id));

        QVERIFY(reply->isFinished());
        QVERIFY(!reply->hasError());
        QVERIFY(reply->isDeviceError());
        QVERIFY(!reply->succeeded());
        QCOMPARE(reply->deviceError(), QString("404 no such service or method"));
    }

    void testTimeout() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig(100));
        registerSession(session, transport);

        ssap::PendingReply* reply = session.request("audio/getVolume");
        QSignalSpy finishedSpy(reply, &ssap::PendingReply::finished);
        const QString id = reply->id();

        QTRY_VERIFY_WITH_TIMEOUT(reply->isFinished(), 1000);
        QVERIFY(reply->hasError());
        QCOMPARE(reply->errorCode(), ssap::ErrorCode::Timeout);
        QVERIFY(!session.correlator()->isPending(id));

        // A late response must not resolve it a second time
        transport.feedMessage(response(id, {}));
        QTest::qWait(200);
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(reply->errorCode(), ssap::ErrorCode::Timeout);
    }

    void testResponseBeatsTimeout() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig(100));
        registerSession(session, transport);

        ssap::PendingReply* reply = session.request("audio/getVolume");
        QSignalSpy finishedSpy(reply, &ssap::PendingReply::finished);
        transport.feedMessage(response(reply->id(), {}));

        QTest::qWait(250);
        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY(!reply->hasError());
    }

    void testRequestWaitsForRegistration() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig(5000, 1000));
        session.start();
        transport.simulateConnect();
        const QString regId = sentAt(transport, 0)["id"].toString();
        transport.clearSent();

        ssap::PendingReply* reply = session.request("audio/getVolume");
        QVERIFY(transport.sentMessages().isEmpty());
        QCOMPARE(session.correlator()->waitingCount(), 1);

        transport.feedMessage(QString(R"({"id":"%1","type":"registered"})").arg(regId));

        QCOMPARE(transport.sentMessages().size(), 1);
        QCOMPARE(sentAt(transport, 0)["id"].toString(), reply->id());
        QCOMPARE(session.correlator()->waitingCount(), 0);

        transport.feedMessage(response(reply->id(), {}));
        QVERIFY(reply->isFinished());
        QVERIFY(!reply->hasError());
    }

    void testSocketNotReady() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig(5000, 100));
        session.start();
        transport.simulateConnect();
        transport.clearSent();

        ssap::PendingReply* reply = session.request("audio/getVolume");
        QTRY_VERIFY_WITH_TIMEOUT(reply->isFinished(), 1000);
        QCOMPARE(reply->errorCode(), ssap::ErrorCode::SocketNotReady);
        QVERIFY(transport.sentMessages().isEmpty());
        QCOMPARE(session.correlator()->pendingCount(), 0);
    }

    void testCancel() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::PendingReply* reply = session.request("audio/getVolume");
        QVERIFY(session.correlator()->cancel(reply->id()));
        QCOMPARE(reply->errorCode(), ssap::ErrorCode::Cancelled);
        QVERIFY(!session.correlator()->cancel(reply->id()));

        transport.feedMessage(response(reply->id(), {}));
        QCOMPARE(reply->errorCode(), ssap::ErrorCode::Cancelled);
    }

    void testDeletingReplyDropsRequest() {
        ssap::ReplayTransport transport;
        ssap::Session session(&transport, makeConfig());
        registerSession(session, transport);

        ssap::PendingReply* reply = session.request("audio/getVolume");
        const QString id = reply->id();
        delete reply;

        QVERIFY(!session.correlator()->isPending(id));
        transport.feedMessage(response(id, {}));   // must not crash
    }
};

QTEST_MAIN(TestRequestCorrelator)
#include "test_request_correlator.moc"
