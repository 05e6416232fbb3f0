#include <ssap/Session/SessionConfig.hpp>
#include <QJsonArray>

namespace ssap {

QJsonObject SessionConfig::defaultHandshakePayload()
{
    static const char* const permissions[] = {
        "LAUNCH", "LAUNCH_WEBAPP", "APP_TO_APP", "CLOSE",
        "CONTROL_AUDIO", "CONTROL_DISPLAY", "CONTROL_INPUT_JOYSTICK",
        "CONTROL_INPUT_MEDIA_PLAYBACK", "CONTROL_INPUT_MEDIA_RECORDING",
        "CONTROL_INPUT_TEXT", "CONTROL_INPUT_TV", "CONTROL_MOUSE_AND_KEYBOARD",
        "CONTROL_POWER", "CONTROL_TV_SCREEN", "CONTROL_TV_STANBY",
        "READ_APP_STATUS", "READ_CURRENT_CHANNEL", "READ_INPUT_DEVICE_LIST",
        "READ_INSTALLED_APPS", "READ_NETWORK_STATE", "READ_POWER_STATE",
        "READ_RUNNING_APPS", "READ_SETTINGS", "READ_STORAGE_DEVICE_LIST",
        "READ_TV_CHANNEL_LIST", "READ_TV_PROGRAM_INFO", "READ_UPDATE_INFO",
        "READ_LGE_SDX", "READ_NOTIFICATIONS", "SEARCH", "WRITE_SETTINGS",
        "WRITE_NOTIFICATION_ALERT", "WRITE_NOTIFICATION_TOAST",
        "UPDATE_FROM_REMOTE_APP",
    };

    QJsonArray perms;
    for (const char* p : permissions)
        perms.append(QString::fromLatin1(p));

    QJsonObject manifest;
    manifest["manifestVersion"] = 1;
    manifest["appVersion"] = QStringLiteral("1.1");
    manifest["permissions"] = perms;

    QJsonObject payload;
    payload["forcePairing"] = false;
    payload["pairingType"] = QStringLiteral("PROMPT");
    payload["manifest"] = manifest;
    return payload;
}

} // namespace ssap
