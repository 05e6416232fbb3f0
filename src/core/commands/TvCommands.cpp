#include "core/commands/TvCommands.hpp"
#include <QJsonArray>
#include <boost/log/trivial.hpp>

namespace wr {

TvCommands::TvCommands(ssap::Session* session, QObject* parent)
    : QObject(parent)
    , session_(session)
{
}

ssap::PendingReply* TvCommands::sendMessage(ssap::OutboundType type, const QString& path,
                                            const QJsonObject& payload, const QString& prefix)
{
    return session_->send(type, path, payload, prefix);
}

ssap::PendingReply* TvCommands::run(const QString& name, const QJsonObject& args,
                                    QString* errorString)
{
    const Command* command = CommandCatalog::find(name);
    if (!command) {
        if (errorString) *errorString = QStringLiteral("unknown command '%1'").arg(name);
        return nullptr;
    }
    return run(*command, args, errorString);
}

ssap::PendingReply* TvCommands::run(const Command& command, const QJsonObject& args,
                                    QString* errorString)
{
    if (command.kind == CommandKind::Local) {
        if (errorString)
            *errorString = QStringLiteral("%1 does not talk to the device session").arg(command.name);
        return nullptr;
    }

    QJsonObject payload;
    if (!CommandCatalog::buildPayload(command, args, payload, errorString))
        return nullptr;

    if (command.kind == CommandKind::LunaBridge)
        return lunaRequest(command.path, payload);
    return session_->request(command.path, payload);
}

ssap::PendingReply* TvCommands::invoke(const char* name, const QJsonObject& args)
{
    const Command* command = CommandCatalog::find(QString::fromLatin1(name));
    if (!command) {
        // The device answers an unknown path with an error frame on the reply
        BOOST_LOG_TRIVIAL(error) << "[TvCommands] no catalog entry for " << name;
        return session_->request(QString::fromLatin1(name), args);
    }

    QJsonObject payload = command->defaults;
    for (auto it = args.begin(); it != args.end(); ++it)
        payload.insert(it.key(), it.value());

    if (command->kind == CommandKind::LunaBridge)
        return lunaRequest(command->path, payload);
    return session_->request(command->path, payload);
}

ssap::PendingReply* TvCommands::lunaRequest(const QString& path, const QJsonObject& params)
{
    const QString uri = QLatin1String(ssap::LUNA_URI_PREFIX) + path;

    QJsonObject action;
    action["uri"] = uri;
    action["params"] = params;

    QJsonObject button;
    button["label"] = "";
    button["onClick"] = uri;
    button["params"] = params;

    QJsonObject payload;
    payload["message"] = " ";
    payload["buttons"] = QJsonArray{button};
    payload["onclose"] = action;
    payload["onfail"] = action;

    ssap::PendingReply* reply = session_->request(CREATE_ALERT_PATH, payload);
    connect(reply, &ssap::PendingReply::finished, this, [this, reply, path]() {
        if (!reply->succeeded()) {
            const QString message = reply->hasError() ? reply->errorString() : reply->deviceError();
            BOOST_LOG_TRIVIAL(warning) << "[TvCommands] luna call " << path.toStdString()
                                       << " not dispatched: " << message.toStdString();
            emit lunaCallFailed(path, message);
            return;
        }

        // Closing the alert fires its onclose action
        const QString alertId = reply->payload().value("alertId").toString();
        ssap::PendingReply* close = closeAlert(alertId);
        connect(close, &ssap::PendingReply::finished, this, [this, close, path]() {
            close->deleteLater();
            if (!close->succeeded()) {
                const QString message = close->hasError() ? close->errorString() : close->deviceError();
                BOOST_LOG_TRIVIAL(warning) << "[TvCommands] closing relay alert for "
                                           << path.toStdString() << " failed: " << message.toStdString();
                emit lunaCallFailed(path, message);
            }
        });
    });
    return reply;
}

ssap::PendingReply* TvCommands::getServices() { return invoke("services"); }

// --- Audio ---

ssap::PendingReply* TvCommands::getAudioStatus() { return invoke("audio-status"); }
ssap::PendingReply* TvCommands::getVolume() { return invoke("get-volume"); }

ssap::PendingReply* TvCommands::setVolume(int volume)
{
    return invoke("set-volume", {{"volume", volume}});
}

ssap::PendingReply* TvCommands::volumeUp() { return invoke("volume-up"); }
ssap::PendingReply* TvCommands::volumeDown() { return invoke("volume-down"); }

ssap::PendingReply* TvCommands::setMute(bool mute)
{
    return invoke("set-mute", {{"mute", mute}});
}

ssap::PendingReply* TvCommands::getSoundOutput() { return invoke("get-sound-output"); }

ssap::PendingReply* TvCommands::setSoundOutput(const QString& output)
{
    return invoke("set-sound-output", {{"output", output}});
}

// --- Applications ---

ssap::PendingReply* TvCommands::getCurrentAppInfo() { return invoke("current-app"); }
ssap::PendingReply* TvCommands::getApps() { return invoke("list-apps"); }

ssap::PendingReply* TvCommands::launchApp(const QString& appId, const QJsonObject& params)
{
    QJsonObject args{{"id", appId}};
    if (!params.isEmpty())
        args["params"] = params;
    return invoke("launch-app", args);
}

ssap::PendingReply* TvCommands::getAppState(const QString& appId)
{
    return invoke("app-state", {{"id", appId}});
}

ssap::PendingReply* TvCommands::closeLauncher() { return invoke("close-launcher"); }
ssap::PendingReply* TvCommands::closeWebApp() { return invoke("close-web-app"); }

// --- Text input ---

ssap::PendingReply* TvCommands::sendEnter() { return invoke("enter"); }

ssap::PendingReply* TvCommands::sendDelete(int count)
{
    return invoke("delete", {{"count", count}});
}

ssap::PendingReply* TvCommands::insertText(const QString& text)
{
    return invoke("insert-text", {{"text", text}});
}

// --- Display and system ---

ssap::PendingReply* TvCommands::set3DOn() { return invoke("3d-on"); }
ssap::PendingReply* TvCommands::set3DOff() { return invoke("3d-off"); }
ssap::PendingReply* TvCommands::turnOffScreen() { return invoke("screen-off"); }
ssap::PendingReply* TvCommands::turnOnScreen() { return invoke("screen-on"); }
ssap::PendingReply* TvCommands::takeScreenshot() { return invoke("screenshot"); }
ssap::PendingReply* TvCommands::getSoftwareInfo() { return invoke("software-info"); }
ssap::PendingReply* TvCommands::getSystemInfo() { return invoke("system-info"); }

ssap::PendingReply* TvCommands::getSystemSettings(const QJsonObject& query)
{
    return invoke("system-settings", query);
}

ssap::PendingReply* TvCommands::getConfigs(const QJsonObject& query)
{
    return invoke("configs", query);
}

ssap::PendingReply* TvCommands::listDevices() { return invoke("devices"); }

// --- Media ---

ssap::PendingReply* TvCommands::mediaPlay() { return invoke("play"); }
ssap::PendingReply* TvCommands::mediaStop() { return invoke("stop"); }
ssap::PendingReply* TvCommands::mediaPause() { return invoke("pause"); }
ssap::PendingReply* TvCommands::mediaRewind() { return invoke("rewind"); }
ssap::PendingReply* TvCommands::mediaFastForward() { return invoke("fast-forward"); }
ssap::PendingReply* TvCommands::mediaClose() { return invoke("media-close"); }

// --- Power ---

ssap::PendingReply* TvCommands::togglePower() { return invoke("power-off"); }
ssap::PendingReply* TvCommands::getPowerState() { return invoke("power-state"); }
ssap::PendingReply* TvCommands::activateScreensaver() { return invoke("screensaver"); }
ssap::PendingReply* TvCommands::reboot() { return invoke("reboot"); }

// --- Notifications ---

ssap::PendingReply* TvCommands::showToast(const QString& message)
{
    return invoke("toast", {{"message", message}});
}

ssap::PendingReply* TvCommands::closeToast(const QString& toastId)
{
    return invoke("close-toast", {{"toastId", toastId}});
}

ssap::PendingReply* TvCommands::showAlert(const QString& message)
{
    return invoke("alert", {{"message", message}});
}

ssap::PendingReply* TvCommands::closeAlert(const QString& alertId)
{
    return invoke("close-alert", {{"alertId", alertId}});
}

// --- Channels and inputs ---

ssap::PendingReply* TvCommands::channelUp() { return invoke("channel-up"); }
ssap::PendingReply* TvCommands::channelDown() { return invoke("channel-down"); }
ssap::PendingReply* TvCommands::getChannels() { return invoke("channels"); }

ssap::PendingReply* TvCommands::getChannelInfo(const QString& channelId)
{
    QJsonObject args;
    if (!channelId.isEmpty())
        args["channelId"] = channelId;
    return invoke("channel-info", args);
}

ssap::PendingReply* TvCommands::getCurrentChannel() { return invoke("current-channel"); }

ssap::PendingReply* TvCommands::setChannel(const QString& channelId)
{
    return invoke("set-channel", {{"channelId", channelId}});
}

ssap::PendingReply* TvCommands::getInputs() { return invoke("inputs"); }

ssap::PendingReply* TvCommands::setInput(const QString& inputId)
{
    return invoke("set-input", {{"inputId", inputId}});
}

ssap::PendingReply* TvCommands::showInputPicker() { return invoke("input-picker"); }

// --- Misc ---

ssap::PendingReply* TvCommands::getInputSocket() { return invoke("input-socket"); }
ssap::PendingReply* TvCommands::getCalibration() { return invoke("get-calibration"); }

ssap::PendingReply* TvCommands::setCalibration(const QJsonObject& calibration)
{
    return invoke("set-calibration", calibration);
}

} // namespace wr
