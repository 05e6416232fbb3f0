#pragma once

#include <QObject>
#include <QHash>
#include <QJsonObject>
#include <QPointer>
#include <QStringList>

#include <ssap/Messenger/Frame.hpp>
#include <ssap/Session/PendingReply.hpp>
#include <ssap/Version.hpp>

class QTimer;

namespace ssap {

class Messenger;

/// Matches inbound frames to outbound commands by id over the one shared
/// connection. Any number of requests may be pending; each has its own
/// timeout and exactly one outcome.
class RequestCorrelator : public QObject {
    Q_OBJECT
public:
    explicit RequestCorrelator(Messenger* messenger, QObject* parent = nullptr);
    ~RequestCorrelator() override;

    void setRequestTimeout(int ms) { requestTimeoutMs_ = ms; }
    void setReadyTimeout(int ms) { readyTimeoutMs_ = ms; }
    int requestTimeout() const { return requestTimeoutMs_; }
    int readyTimeout() const { return readyTimeoutMs_; }

    /// Request frames are held until setReady(true) and fail with
    /// SocketNotReady if that does not happen inside the ready timeout.
    PendingReply* send(OutboundType type, const QString& path,
                       const QJsonObject& payload = {},
                       const QString& prefix = DEFAULT_URI_PREFIX);

    /// Routes an inbound frame to its pending request. Returns false when no
    /// request with that id is in flight (the frame is then dropped).
    bool dispatch(const ssap::InboundFrame& frame);

    /// Removes a pending request; its reply finishes with Cancelled.
    bool cancel(const QString& id);

    void setReady(bool ready);
    bool isReady() const { return ready_; }

    int pendingCount() const { return pending_.size(); }
    int waitingCount() const { return waiting_.size(); }
    bool isPending(const QString& id) const { return pending_.contains(id); }

private:
    struct Entry {
        QPointer<PendingReply> reply;
        OutboundFrame frame;
        QTimer* timer = nullptr;
        bool sent = false;
    };

    QString nextId() const;
    void transmit(Entry& entry);
    void onTimeout(const QString& id);
    void forget(const QString& id);

    Messenger* messenger_;
    QHash<QString, Entry> pending_;
    QStringList waiting_;   // ids held back until ready, in issue order
    bool ready_ = false;
    int requestTimeoutMs_ = DEFAULT_REQUEST_TIMEOUT_MS;
    int readyTimeoutMs_ = DEFAULT_READY_TIMEOUT_MS;
};

} // namespace ssap
