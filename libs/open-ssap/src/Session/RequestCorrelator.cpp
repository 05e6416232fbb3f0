#include <ssap/Session/RequestCorrelator.hpp>
#include <ssap/Messenger/FrameCodec.hpp>
#include <ssap/Messenger/Messenger.hpp>
#include <QTimer>
#include <QUuid>
#include <QDebug>

namespace ssap {

RequestCorrelator::RequestCorrelator(Messenger* messenger, QObject* parent)
    : QObject(parent)
    , messenger_(messenger)
{
}

RequestCorrelator::~RequestCorrelator()
{
    for (auto& entry : pending_) {
        if (entry.reply)
            disconnect(entry.reply, nullptr, this, nullptr);
    }
    pending_.clear();
    waiting_.clear();
}

QString RequestCorrelator::nextId() const
{
    QString id;
    do {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    } while (pending_.contains(id));
    return id;
}

PendingReply* RequestCorrelator::send(OutboundType type, const QString& path,
                                      const QJsonObject& payload, const QString& prefix)
{
    OutboundFrame frame;
    frame.id = nextId();
    frame.type = type;
    if (!path.isEmpty())
        frame.uri = FrameCodec::composeUri(prefix, path);
    frame.payload = payload;

    auto* reply = new PendingReply(frame.id, frame.uri, this);
    const QString id = frame.id;

    // Timer lives with the reply; deleting the reply drops the request.
    auto* timer = new QTimer(reply);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, id]() { onTimeout(id); });
    connect(reply, &QObject::destroyed, this, [this, id]() { forget(id); });

    Entry entry;
    entry.reply = reply;
    entry.frame = frame;
    entry.timer = timer;
    auto it = pending_.insert(id, entry);

    if (type == OutboundType::Request && !ready_) {
        qDebug() << "[RequestCorrelator] Holding" << frame.uri << "until registered";
        waiting_.append(id);
        timer->start(readyTimeoutMs_);
    } else {
        transmit(it.value());
    }
    return reply;
}

void RequestCorrelator::transmit(Entry& entry)
{
    entry.sent = true;
    entry.timer->start(requestTimeoutMs_);
    messenger_->sendFrame(entry.frame);
}

bool RequestCorrelator::dispatch(const InboundFrame& frame)
{
    if (!frame.hasId())
        return false;

    auto it = pending_.find(frame.id);
    if (it == pending_.end() || !it->sent)
        return false;

    Entry entry = it.value();
    pending_.erase(it);
    if (entry.reply) {
        entry.timer->stop();
        entry.reply->resolve(frame);
    }
    return true;
}

bool RequestCorrelator::cancel(const QString& id)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
        return false;

    Entry entry = it.value();
    pending_.erase(it);
    waiting_.removeAll(id);
    if (entry.reply) {
        entry.timer->stop();
        entry.reply->fail(ErrorCode::Cancelled, QStringLiteral("request cancelled"));
    }
    return true;
}

void RequestCorrelator::setReady(bool ready)
{
    if (ready_ == ready) return;
    ready_ = ready;
    if (!ready_) return;

    const QStringList held = waiting_;
    waiting_.clear();
    for (const QString& id : held) {
        auto it = pending_.find(id);
        if (it == pending_.end() || !it->reply)
            continue;
        transmit(it.value());
    }
}

void RequestCorrelator::onTimeout(const QString& id)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
        return;

    Entry entry = it.value();
    pending_.erase(it);
    if (!entry.reply)
        return;

    if (entry.sent) {
        qWarning() << "[RequestCorrelator] Timeout waiting for" << entry.frame.uri
                   << "id" << id;
        entry.reply->fail(ErrorCode::Timeout,
                          QStringLiteral("no response within %1 ms").arg(requestTimeoutMs_));
    } else {
        waiting_.removeAll(id);
        qWarning() << "[RequestCorrelator] Session not registered, dropping" << entry.frame.uri;
        entry.reply->fail(ErrorCode::SocketNotReady,
                          QStringLiteral("not registered within %1 ms").arg(readyTimeoutMs_));
    }
}

void RequestCorrelator::forget(const QString& id)
{
    pending_.remove(id);
    waiting_.removeAll(id);
}

} // namespace ssap
