#include <ssap/Session/PendingReply.hpp>

namespace ssap {

PendingReply::PendingReply(const QString& id, const QString& uri, QObject* parent)
    : QObject(parent)
    , id_(id)
    , uri_(uri)
{
}

bool PendingReply::succeeded() const
{
    return finished_ && !hasError_
        && frame_.type == InboundType::Response
        && frame_.payload.value("returnValue").toBool(true);
}

void PendingReply::resolve(const InboundFrame& frame)
{
    if (finished_) return;
    finished_ = true;
    frame_ = frame;
    emit finished();
}

void PendingReply::fail(ErrorCode code, const QString& message)
{
    if (finished_) return;
    finished_ = true;
    hasError_ = true;
    errorCode_ = code;
    errorString_ = message;
    emit finished();
}

} // namespace ssap
