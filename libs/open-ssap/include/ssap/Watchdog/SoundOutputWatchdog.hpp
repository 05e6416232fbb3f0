#pragma once

#include <QObject>
#include <QTimer>

#include <ssap/Watchdog/SoundOutput.hpp>

namespace ssap {

class Session;
class PendingReply;

/// Keeps the device's sound output pinned to one value. The device does not
/// reliably notify output changes (HDMI-ARC renegotiation silently falls back
/// to the TV speaker), so the watchdog polls and re-asserts.
///
/// One instance per session: start() replaces the running task.
class SoundOutputWatchdog : public QObject {
    Q_OBJECT
public:
    static constexpr int DEFAULT_INTERVAL_MS = 2000;

    explicit SoundOutputWatchdog(Session* session, QObject* parent = nullptr);
    ~SoundOutputWatchdog() override;

    /// Validates the output name and (re)starts polling. On an unknown name
    /// nothing is scheduled, any running task is left alone and false is
    /// returned with a description in errorString.
    bool start(const QString& desiredOutput, QString* errorString = nullptr);
    void stop();

    bool isRunning() const { return timer_.isActive(); }
    QString desiredOutput() const;

    void setInterval(int ms);
    int interval() const { return timer_.interval(); }

    /// Failed corrections are retried as desired -> fallback -> desired.
    void setQuirkMode(bool enabled) { quirkMode_ = enabled; }
    bool quirkMode() const { return quirkMode_; }

    int pollCount() const { return pollCount_; }
    int correctionCount() const { return correctionCount_; }

signals:
    void driftDetected(const QString& current, const QString& desired);
    void corrected(const QString& output);
    void pollFailed(const QString& message);

private:
    void tick();
    void onPollFinished(PendingReply* reply, quint64 generation);
    void requestOutput(const QString& output, const QStringList& rest,
                       bool escalateOnFailure, quint64 generation);

    Session* session_;
    QTimer timer_;
    SoundOutput desired_ = SoundOutput::TvSpeaker;
    bool quirkMode_ = false;
    bool busy_ = false;     // a poll or correction is in flight

    // Bumped on every start()/stop(); replies from an older generation are ignored.
    quint64 generation_ = 0;

    int pollCount_ = 0;
    int correctionCount_ = 0;
};

} // namespace ssap
