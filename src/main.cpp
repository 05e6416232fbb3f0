#include <signal.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QTextStream>
#include <QTimer>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <ssap/Messenger/ProtocolLogger.hpp>
#include <ssap/Session/Session.hpp>
#include <ssap/Transport/WebSocketTransport.hpp>
#include <ssap/Version.hpp>
#include <ssap/Watchdog/SoundOutputWatchdog.hpp>
#include "core/YamlConfig.hpp"
#include "core/commands/CommandCatalog.hpp"
#include "core/commands/TvCommands.hpp"
#include "core/services/WakeOnLan.hpp"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailed = 1,
    ExitUsage = 2
};

void applyLogLevel(const QString& level)
{
    namespace logging = boost::log;
    logging::trivial::severity_level severity = logging::trivial::info;
    if (level == "trace") severity = logging::trivial::trace;
    else if (level == "debug") severity = logging::trivial::debug;
    else if (level == "warning") severity = logging::trivial::warning;
    else if (level == "error") severity = logging::trivial::error;
    logging::core::get()->set_filter(logging::trivial::severity >= severity);
}

void printJson(const QJsonObject& object)
{
    QTextStream out(stdout);
    out << QJsonDocument(object).toJson(QJsonDocument::Indented);
}

// Prints the outcome of a finished reply and maps it to an exit code.
int report(const ssap::PendingReply* reply)
{
    if (reply->hasError()) {
        BOOST_LOG_TRIVIAL(error) << "[main] " << reply->uri().toStdString() << ": "
                                 << ssap::errorCodeName(reply->errorCode()) << " "
                                 << reply->errorString().toStdString();
        return ExitFailed;
    }
    if (reply->isDeviceError()) {
        printJson(QJsonObject{{"error", reply->deviceError()}});
        return ExitFailed;
    }
    printJson(reply->payload());
    return reply->succeeded() ? ExitOk : ExitFailed;
}

// Lets follow-up requests (the luna relay's closeAlert) reach the device before exiting.
void quitWhenIdle(ssap::Session* session, int code)
{
    auto* poll = new QTimer(session);
    poll->setInterval(20);
    const int deadline = session->config().requestTimeout;
    QObject::connect(poll, &QTimer::timeout, session,
                     [session, poll, deadline, code, waited = 0]() mutable {
        waited += poll->interval();
        if (session->correlator()->pendingCount() == 0 || waited >= deadline) {
            poll->stop();
            QCoreApplication::exit(code);
        }
    });
    poll->start();
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("webos-remote");
    app.setApplicationVersion(ssap::CLIENT_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Remote control for webOS televisions over SSAP.\n\nCommands:\n"
        + wr::CommandCatalog::usage());
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "file",
                                    wr::YamlConfig::defaultPath());
    QCommandLineOption watchOption({"w", "watch"},
                                   "Keep the sound output pinned to <output> until interrupted.",
                                   "output");
    parser.addOption(configOption);
    parser.addOption(watchOption);
    parser.addPositionalArgument("command", "Command to run (see list above).");
    parser.addPositionalArgument("args", "Command arguments as key=value.", "[key=value ...]");
    parser.process(app);

    // --- Configuration ---
    wr::YamlConfig config;
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath)) {
        QString why;
        if (!config.load(configPath, &why)) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitUsage;
        }
    } else if (parser.isSet(configOption)) {
        BOOST_LOG_TRIVIAL(error) << "[main] no such file " << configPath.toStdString();
        return ExitUsage;
    }
    applyLogLevel(config.logLevel());

    const QStringList positional = parser.positionalArguments();
    const QString watchOutput = parser.isSet(watchOption) ? parser.value(watchOption)
                                                          : config.watchdogOutput();
    if (positional.isEmpty() && watchOutput.isEmpty()) {
        parser.showHelp(ExitUsage);
    }

    const wr::Command* command = nullptr;
    QJsonObject args;
    if (!positional.isEmpty()) {
        command = wr::CommandCatalog::find(positional.first());
        QString why;
        if (!command) {
            BOOST_LOG_TRIVIAL(error) << "[main] unknown command '"
                                     << positional.first().toStdString() << "'";
            return ExitUsage;
        }
        if (!wr::CommandCatalog::parseArguments(*command, positional.mid(1), args, &why)) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitUsage;
        }
    }

    // --- Wake-on-LAN needs no session ---
    if (command && command->name == "power-on") {
        const QString mac = args.value("mac").toString(config.deviceMac());
        const QString broadcast = args.value("broadcast").toString(config.broadcastAddress());
        QString why;
        if (!wr::WakeOnLan::wake(mac, broadcast, wr::WakeOnLan::DEFAULT_PORT, &why)) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitFailed;
        }
        return ExitOk;
    }

    // --- Session ---
    ssap::SessionConfig sessionConfig;
    {
        QString why;
        if (!config.sessionConfig(sessionConfig, &why)) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitUsage;
        }
    }
    if (!sessionConfig.endpoint.isValid()) {
        BOOST_LOG_TRIVIAL(error)
            << "[main] device.address and device.protocol (ws|wss) must be configured";
        return ExitUsage;
    }

    ssap::WebSocketTransport transport;
    transport.setEndpoint(sessionConfig.endpoint, sessionConfig.tlsPolicy);
    transport.setReconnectDelay(sessionConfig.reconnectDelay);

    ssap::Session session(&transport, sessionConfig);
    wr::TvCommands commands(&session);

    ssap::ProtocolLogger protocolLogger;
    if (!config.protocolLog().isEmpty()) {
        ssap::ProtocolLogger::OutputFormat format = ssap::ProtocolLogger::OutputFormat::Tsv;
        QString why;
        if (!config.protocolLogFormat(format, &why)) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitUsage;
        }
        protocolLogger.setFormat(format);
        if (protocolLogger.open(config.protocolLog()))
            protocolLogger.attach(session.messenger());
        else
            BOOST_LOG_TRIVIAL(warning) << "[main] cannot open protocol log "
                                       << config.protocolLog().toStdString();
    }

    QObject::connect(&session, &ssap::Session::pairingPrompt, []() {
        BOOST_LOG_TRIVIAL(info) << "[main] Accept the pairing request on the TV";
    });
    QObject::connect(&session, &ssap::Session::registered, []() {
        BOOST_LOG_TRIVIAL(info) << "[main] Registered";
    });
    const bool watching = !watchOutput.isEmpty();
    QObject::connect(&session, &ssap::Session::registrationFailed,
                     [watching](ssap::ErrorCode code, const QString& message) {
        BOOST_LOG_TRIVIAL(error) << "[main] Registration failed: " << ssap::errorCodeName(code)
                                 << " " << message.toStdString();
        if (!watching)
            QCoreApplication::exit(ExitFailed);
    });

    // --- Command ---
    if (command) {
        ssap::PendingReply* reply = nullptr;
        QString why;
        if (command->name == "send") {
            const QString type = args.value("type").toString("request");
            if (type != "request" && type != "register") {
                BOOST_LOG_TRIVIAL(error) << "[main] send: type must be request or register";
                return ExitUsage;
            }
            if (!args.value("uri").isString() || args.value("uri").toString().isEmpty()) {
                BOOST_LOG_TRIVIAL(error) << "[main] send: missing argument 'uri'";
                return ExitUsage;
            }
            reply = commands.sendMessage(
                type == "register" ? ssap::OutboundType::Register : ssap::OutboundType::Request,
                args.value("uri").toString(), args.value("payload").toObject(),
                args.value("prefix").toString(ssap::DEFAULT_URI_PREFIX));
        } else {
            reply = commands.run(*command, args, &why);
        }
        if (!reply) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitUsage;
        }

        QObject::connect(reply, &ssap::PendingReply::finished, &session,
                         [&session, reply, watching]() {
            const int code = report(reply);
            reply->deleteLater();
            if (!watching)
                quitWhenIdle(&session, code);
        });
    }

    // --- Watchdog ---
    ssap::SoundOutputWatchdog watchdog(&session);
    if (watching) {
        watchdog.setInterval(config.watchdogIntervalMs());
        watchdog.setQuirkMode(config.watchdogQuirkMode());
        QString why;
        if (!watchdog.start(watchOutput, &why)) {
            BOOST_LOG_TRIVIAL(error) << "[main] " << why.toStdString();
            return ExitUsage;
        }
        QObject::connect(&watchdog, &ssap::SoundOutputWatchdog::driftDetected,
                         [](const QString& current, const QString& desired) {
            BOOST_LOG_TRIVIAL(info) << "[main] Sound output " << current.toStdString()
                                    << " -> " << desired.toStdString();
        });
    }

    // SIGINT/SIGTERM -> leave the event loop so sockets close cleanly
    auto quitHandler = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), []() {
            QCoreApplication::exit(ExitOk);
        }, Qt::QueuedConnection);
    };
    signal(SIGINT, quitHandler);
    signal(SIGTERM, quitHandler);

    session.start();
    const int ret = app.exec();

    watchdog.stop();
    protocolLogger.detach();
    session.stop();
    transport.stop();
    return ret;
}
