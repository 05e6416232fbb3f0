#include <ssap/Watchdog/SoundOutputWatchdog.hpp>
#include <ssap/Session/Session.hpp>
#include <QDebug>

namespace ssap {

SoundOutputWatchdog::SoundOutputWatchdog(Session* session, QObject* parent)
    : QObject(parent)
    , session_(session)
{
    timer_.setInterval(DEFAULT_INTERVAL_MS);
    connect(&timer_, &QTimer::timeout, this, &SoundOutputWatchdog::tick);
}

SoundOutputWatchdog::~SoundOutputWatchdog()
{
    stop();
}

bool SoundOutputWatchdog::start(const QString& desiredOutput, QString* errorString)
{
    const auto output = soundoutput::fromString(desiredOutput);
    if (!output) {
        const QString message = QStringLiteral("unknown sound output '%1' (expected one of: %2)")
                                    .arg(desiredOutput, soundoutput::knownNames().join(", "));
        qWarning() << "[SoundOutputWatchdog]" << message;
        if (errorString) *errorString = message;
        return false;
    }

    stop();

    desired_ = *output;
    ++generation_;
    busy_ = false;

    qInfo() << "[SoundOutputWatchdog] Pinning sound output to" << desiredOutput
            << "every" << timer_.interval() << "ms";
    timer_.start();
    tick();  // Initial check
    return true;
}

void SoundOutputWatchdog::stop()
{
    if (!timer_.isActive()) return;
    timer_.stop();
    ++generation_;
    busy_ = false;
    qInfo() << "[SoundOutputWatchdog] Stopped";
}

QString SoundOutputWatchdog::desiredOutput() const
{
    return isRunning() ? soundoutput::toString(desired_) : QString();
}

void SoundOutputWatchdog::setInterval(int ms)
{
    timer_.setInterval(ms);
}

void SoundOutputWatchdog::tick()
{
    if (!timer_.isActive() || busy_) return;
    if (!session_->isRegistered()) return;

    busy_ = true;
    ++pollCount_;
    const quint64 gen = generation_;
    PendingReply* reply = session_->request(soundoutput::GET_PATH);
    connect(reply, &PendingReply::finished, this, [this, reply, gen]() {
        onPollFinished(reply, gen);
    });
}

void SoundOutputWatchdog::onPollFinished(PendingReply* reply, quint64 generation)
{
    reply->deleteLater();
    if (generation != generation_) return;

    if (reply->hasError() || !reply->succeeded()) {
        busy_ = false;
        const QString message = reply->hasError() ? reply->errorString()
                                                  : reply->deviceError();
        qWarning() << "[SoundOutputWatchdog] Poll failed:" << message;
        emit pollFailed(message);
        return;
    }

    const QString current = reply->payload().value("soundOutput").toString();
    const QString desired = soundoutput::toString(desired_);
    if (current == desired) {
        busy_ = false;
        return;
    }

    qInfo() << "[SoundOutputWatchdog] Output drifted to" << current << "- restoring" << desired;
    emit driftDetected(current, desired);
    requestOutput(desired, {}, quirkMode_, generation);
}

void SoundOutputWatchdog::requestOutput(const QString& output, const QStringList& rest,
                                        bool escalateOnFailure, quint64 generation)
{
    ++correctionCount_;
    QJsonObject payload;
    payload["output"] = output;

    PendingReply* reply = session_->request(soundoutput::CHANGE_PATH, payload);
    connect(reply, &PendingReply::finished, this,
            [this, reply, output, rest, escalateOnFailure, generation]() {
        reply->deleteLater();
        if (generation != generation_) return;

        const bool ok = reply->succeeded();
        if (!ok) {
            qWarning() << "[SoundOutputWatchdog] changeSoundOutput" << output << "failed:"
                       << (reply->hasError() ? reply->errorString() : reply->deviceError());
        }

        if (!rest.isEmpty()) {
            requestOutput(rest.first(), rest.mid(1), false, generation);
            return;
        }
        if (!ok && escalateOnFailure) {
            const QString desired = soundoutput::toString(desired_);
            requestOutput(soundoutput::toString(soundoutput::FALLBACK), {desired}, false, generation);
            return;
        }

        busy_ = false;
        if (ok && output == soundoutput::toString(desired_))
            emit corrected(output);
    });
}

} // namespace ssap
