#pragma once

#include <QObject>
#include <QJsonObject>
#include <QString>

#include <ssap/Session/Session.hpp>
#include "core/commands/CommandCatalog.hpp"

namespace wr {

/// Typed front for the command catalog. Every method returns the reply of
/// the request it issued (never null for the typed methods); callers
/// deleteLater() it after finished().
class TvCommands : public QObject {
    Q_OBJECT
public:
    static constexpr const char* CREATE_ALERT_PATH = "system.notifications/createAlert";
    static constexpr const char* CLOSE_ALERT_PATH = "system.notifications/closeAlert";

    explicit TvCommands(ssap::Session* session, QObject* parent = nullptr);

    ssap::Session* session() const { return session_; }

    /// Raw request with caller-chosen type, path and prefix.
    ssap::PendingReply* sendMessage(ssap::OutboundType type, const QString& path,
                                    const QJsonObject& payload = {},
                                    const QString& prefix = ssap::DEFAULT_URI_PREFIX);

    /// Runs a catalog command. Returns nullptr (with errorString set) when the
    /// name is unknown, the arguments do not fit or the command is Local.
    ssap::PendingReply* run(const QString& name, const QJsonObject& args = {},
                            QString* errorString = nullptr);
    ssap::PendingReply* run(const Command& command, const QJsonObject& args,
                            QString* errorString = nullptr);

    /// Calls a luna:// service by showing an alert whose close action is the
    /// call, then closing the alert straight away. The returned reply is the
    /// alert creation.
    ssap::PendingReply* lunaRequest(const QString& path, const QJsonObject& params = {});

    ssap::PendingReply* getServices();

    ssap::PendingReply* getAudioStatus();
    ssap::PendingReply* getVolume();
    ssap::PendingReply* setVolume(int volume);
    ssap::PendingReply* volumeUp();
    ssap::PendingReply* volumeDown();
    ssap::PendingReply* setMute(bool mute);
    ssap::PendingReply* getSoundOutput();
    ssap::PendingReply* setSoundOutput(const QString& output);

    ssap::PendingReply* getCurrentAppInfo();
    ssap::PendingReply* getApps();
    ssap::PendingReply* launchApp(const QString& appId, const QJsonObject& params = {});
    ssap::PendingReply* getAppState(const QString& appId);
    ssap::PendingReply* closeLauncher();
    ssap::PendingReply* closeWebApp();

    ssap::PendingReply* sendEnter();
    ssap::PendingReply* sendDelete(int count = 1);
    ssap::PendingReply* insertText(const QString& text);

    ssap::PendingReply* set3DOn();
    ssap::PendingReply* set3DOff();
    ssap::PendingReply* turnOffScreen();
    ssap::PendingReply* turnOnScreen();
    ssap::PendingReply* takeScreenshot();

    ssap::PendingReply* getSoftwareInfo();
    ssap::PendingReply* getSystemInfo();
    ssap::PendingReply* getSystemSettings(const QJsonObject& query = {});
    ssap::PendingReply* getConfigs(const QJsonObject& query = {});
    ssap::PendingReply* listDevices();

    ssap::PendingReply* mediaPlay();
    ssap::PendingReply* mediaStop();
    ssap::PendingReply* mediaPause();
    ssap::PendingReply* mediaRewind();
    ssap::PendingReply* mediaFastForward();
    ssap::PendingReply* mediaClose();

    /// The device only accepts "off"; a switched-off device is woken by WakeOnLan.
    ssap::PendingReply* togglePower();
    ssap::PendingReply* getPowerState();
    ssap::PendingReply* activateScreensaver();
    ssap::PendingReply* reboot();

    ssap::PendingReply* showToast(const QString& message);
    ssap::PendingReply* closeToast(const QString& toastId);
    ssap::PendingReply* showAlert(const QString& message);
    ssap::PendingReply* closeAlert(const QString& alertId);

    ssap::PendingReply* channelUp();
    ssap::PendingReply* channelDown();
    ssap::PendingReply* getChannels();
    ssap::PendingReply* getChannelInfo(const QString& channelId = {});
    ssap::PendingReply* getCurrentChannel();
    ssap::PendingReply* setChannel(const QString& channelId);
    ssap::PendingReply* getInputs();
    ssap::PendingReply* setInput(const QString& inputId);
    ssap::PendingReply* showInputPicker();

    ssap::PendingReply* getInputSocket();
    ssap::PendingReply* getCalibration();
    ssap::PendingReply* setCalibration(const QJsonObject& calibration);

signals:
    void lunaCallFailed(const QString& path, const QString& message);

private:
    ssap::PendingReply* invoke(const char* name, const QJsonObject& args = {});

    ssap::Session* session_;
};

} // namespace wr
