#pragma once

#include <QObject>
#include <QJsonObject>
#include <QString>

#include <ssap/Error.hpp>
#include <ssap/Messenger/Frame.hpp>

namespace ssap {

class RequestCorrelator;

/// One outstanding request. finished() is emitted exactly once, either with
/// the matching inbound frame or with an error (Timeout, SocketNotReady,
/// Cancelled). The reply stays owned by the correlator; callers that keep
/// issuing requests should deleteLater() it after finished(). Deleting an
/// unfinished reply cancels the request.
class PendingReply : public QObject {
    Q_OBJECT
public:
    QString id() const { return id_; }
    QString uri() const { return uri_; }

    bool isFinished() const { return finished_; }
    bool hasError() const { return hasError_; }
    ErrorCode errorCode() const { return errorCode_; }
    QString errorString() const { return errorString_; }

    const InboundFrame& frame() const { return frame_; }
    QJsonObject payload() const { return frame_.payload; }

    /// The device answered with an "error" frame (e.g. "404 no such service").
    bool isDeviceError() const { return finished_ && !hasError_ && frame_.type == InboundType::Error; }
    QString deviceError() const { return frame_.error; }

    /// Device-level success: a response frame whose returnValue is not false.
    bool succeeded() const;

signals:
    void finished();

private:
    friend class RequestCorrelator;

    PendingReply(const QString& id, const QString& uri, QObject* parent);

    void resolve(const InboundFrame& frame);
    void fail(ErrorCode code, const QString& message);

    QString id_;
    QString uri_;
    bool finished_ = false;
    bool hasError_ = false;
    ErrorCode errorCode_ = ErrorCode::Timeout;
    QString errorString_;
    InboundFrame frame_;
};

} // namespace ssap
