#include "core/commands/CommandCatalog.hpp"
#include <ssap/Watchdog/SoundOutput.hpp>
#include <QJsonArray>
#include <QJsonDocument>

namespace wr {

namespace {

Command request(const char* name, const char* path, const char* summary,
                QStringList required = {}, QStringList optional = {},
                QJsonObject defaults = {})
{
    Command c;
    c.name = QString::fromLatin1(name);
    c.kind = CommandKind::Request;
    c.path = QString::fromLatin1(path);
    c.required = required;
    c.optional = optional;
    c.defaults = defaults;
    c.summary = QString::fromLatin1(summary);
    return c;
}

Command luna(const char* name, const char* path, const char* summary)
{
    Command c = request(name, path, summary);
    c.kind = CommandKind::LunaBridge;
    c.passthrough = true;
    return c;
}

Command local(const char* name, const char* summary, QStringList optional = {})
{
    Command c;
    c.name = QString::fromLatin1(name);
    c.kind = CommandKind::Local;
    c.optional = optional;
    c.summary = QString::fromLatin1(summary);
    return c;
}

QList<Command> buildCatalog()
{
    QJsonArray okButton;
    okButton.append(QJsonObject{{"label", "OK"}});

    QList<Command> c;

    c << request("services", "api/getServiceList", "List the services the device exposes");

    // Audio
    c << request("audio-status", "audio/getStatus", "Volume, mute and output in one call");
    c << request("get-volume", "audio/getVolume", "Current volume");
    c << request("set-volume", "audio/setVolume", "Set the volume", {"volume"});
    c << request("volume-up", "audio/volumeUp", "Raise the volume one step");
    c << request("volume-down", "audio/volumeDown", "Lower the volume one step");
    c << request("set-mute", "audio/setMute", "Mute or unmute", {}, {"mute"},
                 QJsonObject{{"mute", true}});
    c << request("get-sound-output", ssap::soundoutput::GET_PATH, "Current sound output");
    c << request("set-sound-output", ssap::soundoutput::CHANGE_PATH, "Switch the sound output",
                 {"output"});

    // Applications
    c << request("current-app", "com.webos.applicationManager/getForegroundAppInfo",
                 "Foreground application");
    c << request("list-apps", "com.webos.applicationManager/listLaunchPoints",
                 "Installed launch points");
    c << request("launch-app", "com.webos.applicationManager/launch", "Launch an application",
                 {"id"}, {"params"});
    c << request("app-state", "system.launcher/getAppState", "State of an application", {"id"});
    c << request("close-launcher", "system.launcher/close", "Close the launcher", {}, {"id"});
    c << request("close-web-app", "webapp/closeWebApp", "Close a web application", {}, {"webAppId"});

    // Text input
    c << request("enter", "com.webos.service.ime/sendEnterKey", "Send the enter key");
    c << request("delete", "com.webos.service.ime/deleteCharacters", "Delete characters",
                 {}, {"count"}, QJsonObject{{"count", 1}});
    c << request("insert-text", "com.webos.service.ime/insertText", "Type text",
                 {"text"}, {"replace"}, QJsonObject{{"replace", 0}});

    // Display
    c << request("3d-on", "com.webos.service.tv.display/set3DOn", "Enable 3D");
    c << request("3d-off", "com.webos.service.tv.display/set3DOff", "Disable 3D");
    c << request("screen-off", "com.webos.service.tvpower/power/turnOffScreen", "Blank the screen");
    c << request("screen-on", "com.webos.service.tvpower/power/turnOnScreen", "Unblank the screen");
    c << request("screenshot", "tv/executeOneShot", "Capture the screen");

    c << request("software-info", "com.webos.service.update/getCurrentSWInformation",
                 "Firmware version");
    c << request("system-info", "system/getSystemInfo", "Model and hardware details");
    c << request("system-settings", "settings/getSystemSettings", "Read system settings",
                 {}, {"category", "keys"});
    c << request("configs", "config/getConfigs", "Read device configuration keys", {}, {"configNames"});
    c << request("devices", "com.webos.service.attachedstoragemanager/listDevices",
                 "Attached storage devices");

    // Media
    c << request("play", "media.controls/play", "Resume playback");
    c << request("stop", "media.controls/stop", "Stop playback");
    c << request("pause", "media.controls/pause", "Pause playback");
    c << request("rewind", "media.controls/rewind", "Rewind");
    c << request("fast-forward", "media.controls/fastForward", "Fast forward");
    c << request("media-close", "media.viewer/close", "Close the media viewer");

    // Power
    c << request("power-off", "system/turnOff", "Switch the device off");
    c << request("power-state", "com.webos.service.tvpower/power/getPowerState", "Power state");
    c << luna("screensaver", "com.webos.service.tvpower/power/turnOnScreenSaver",
              "Start the screensaver");
    c << luna("reboot", "com.webos.service.tvpower/power/reboot", "Reboot the device");
    c << local("power-on", "Wake the device over the LAN", {"mac", "broadcast"});

    // Notifications
    c << request("toast", "system.notifications/createToast", "Show a toast", {"message"});
    c << request("close-toast", "system.notifications/closeToast", "Close a toast", {"toastId"});
    c << request("alert", "system.notifications/createAlert", "Show an alert",
                 {"message"}, {"buttons"}, QJsonObject{{"buttons", okButton}});
    c << request("close-alert", "system.notifications/closeAlert", "Close an alert", {"alertId"});

    // Channels and inputs
    c << request("channel-up", "tv/channelUp", "Next channel");
    c << request("channel-down", "tv/channelDown", "Previous channel");
    c << request("channels", "tv/getChannelList", "Channel list");
    c << request("channel-info", "tv/getChannelProgramInfo", "Programme info", {}, {"channelId"});
    c << request("current-channel", "tv/getCurrentChannel", "Current channel");
    c << request("set-channel", "tv/openChannel", "Tune a channel", {"channelId"});
    c << request("inputs", "tv/getExternalInputList", "External inputs");
    c << request("set-input", "tv/switchInput", "Switch the external input", {"inputId"});
    c << luna("input-picker", "com.webos.surfacemanager/showInputPicker", "Show the input picker");

    c << request("input-socket", "com.webos.service.networkinput/getPointerInputSocket",
                 "Address of the pointer input socket");

    // Picture calibration
    c << request("get-calibration", "externalpq/getExternalPqData", "Read calibration data");
    Command setCalibration = request("set-calibration", "externalpq/setExternalPqData",
                                     "Write calibration data");
    setCalibration.passthrough = true;
    c << setCalibration;

    Command send = local("send", "Send a raw message", {"type", "uri", "prefix", "payload"});
    c << send;

    // Identifiers and free text the device only accepts as strings
    static const QStringList textKeys = {
        "id", "webAppId", "text", "message", "toastId", "alertId", "channelId", "inputId",
        "output", "category", "type", "uri", "prefix", "mac", "broadcast"};
    for (auto& command : c) {
        for (const auto& key : command.required + command.optional) {
            if (textKeys.contains(key))
                command.stringKeys << key;
        }
    }

    return c;
}

} // namespace

const QList<Command>& CommandCatalog::all()
{
    static const QList<Command> catalog = buildCatalog();
    return catalog;
}

const Command* CommandCatalog::find(const QString& name)
{
    for (const auto& command : all()) {
        if (command.name == name)
            return &command;
    }
    return nullptr;
}

bool CommandCatalog::parseArguments(const QStringList& words, QJsonObject& out,
                                    QString* errorString)
{
    return parseArguments(Command(), words, out, errorString);
}

bool CommandCatalog::parseArguments(const Command& command, const QStringList& words,
                                    QJsonObject& out, QString* errorString)
{
    out = QJsonObject();
    for (const auto& word : words) {
        const int eq = word.indexOf('=');
        if (eq <= 0) {
            if (errorString) *errorString = QStringLiteral("expected key=value, got '%1'").arg(word);
            return false;
        }
        const QString key = word.left(eq);
        const QString raw = word.mid(eq + 1);
        if (command.stringKeys.contains(key)) {
            out.insert(key, raw);
            continue;
        }

        // Wrapping in an array lets scalars go through the JSON parser too
        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson("[" + raw.toUtf8() + "]", &error);
        if (error.error == QJsonParseError::NoError && doc.array().size() == 1)
            out.insert(key, doc.array().first());
        else
            out.insert(key, raw);
    }
    return true;
}

bool CommandCatalog::buildPayload(const Command& command, const QJsonObject& args,
                                  QJsonObject& payload, QString* errorString)
{
    for (const auto& key : command.required) {
        if (!args.contains(key)) {
            if (errorString)
                *errorString = QStringLiteral("%1: missing argument '%2'").arg(command.name, key);
            return false;
        }
    }

    if (!command.passthrough) {
        for (auto it = args.begin(); it != args.end(); ++it) {
            if (!command.required.contains(it.key()) && !command.optional.contains(it.key())) {
                if (errorString)
                    *errorString = QStringLiteral("%1: unknown argument '%2'").arg(command.name, it.key());
                return false;
            }
        }
    }

    if (command.path == QLatin1String(ssap::soundoutput::CHANGE_PATH)
        && !ssap::soundoutput::fromString(args.value("output").toString())) {
        if (errorString)
            *errorString = QStringLiteral("%1: unknown sound output '%2' (expected one of: %3)")
                               .arg(command.name, args.value("output").toString(),
                                    ssap::soundoutput::knownNames().join(", "));
        return false;
    }

    payload = command.defaults;
    for (auto it = args.begin(); it != args.end(); ++it)
        payload.insert(it.key(), it.value());
    return true;
}

QString CommandCatalog::usage()
{
    QString text;
    for (const auto& command : all()) {
        QStringList words;
        for (const auto& key : command.required)
            words << key + "=...";
        for (const auto& key : command.optional)
            words << "[" + key + "=...]";
        if (command.passthrough)
            words << "[key=value ...]";
        text += QStringLiteral("  %1 %2\n      %3\n")
                    .arg(command.name, words.join(' '), command.summary);
    }
    return text;
}

} // namespace wr
