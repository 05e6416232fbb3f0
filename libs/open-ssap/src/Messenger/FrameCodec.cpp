#include <ssap/Messenger/FrameCodec.hpp>
#include <QJsonDocument>
#include <QJsonParseError>

namespace ssap {

const char* outboundTypeName(OutboundType type)
{
    switch (type) {
    case OutboundType::Register: return "register";
    case OutboundType::Request: return "request";
    }
    return "request";
}

const char* inboundTypeName(InboundType type)
{
    switch (type) {
    case InboundType::Response: return "response";
    case InboundType::Registered: return "registered";
    case InboundType::Error: return "error";
    }
    return "response";
}

QString FrameCodec::encode(const OutboundFrame& frame)
{
    QJsonObject msg;
    msg["id"] = frame.id;
    msg["type"] = QString::fromLatin1(outboundTypeName(frame.type));
    if (!frame.uri.isEmpty())
        msg["uri"] = frame.uri;
    if (!frame.payload.isEmpty())
        msg["payload"] = frame.payload;

    return QString::fromUtf8(QJsonDocument(msg).toJson(QJsonDocument::Compact));
}

std::optional<InboundFrame> FrameCodec::decode(const QString& text, QString* errorString)
{
    auto fail = [errorString](const QString& why) -> std::optional<InboundFrame> {
        if (errorString) *errorString = why;
        return std::nullopt;
    };

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError)
        return fail(err.errorString());
    if (!doc.isObject())
        return fail(QStringLiteral("frame is not a JSON object"));

    const QJsonObject obj = doc.object();
    const QString type = obj.value("type").toString();

    InboundFrame frame;
    if (type == "response") {
        frame.type = InboundType::Response;
    } else if (type == "registered") {
        frame.type = InboundType::Registered;
    } else if (type == "error") {
        frame.type = InboundType::Error;
        frame.error = obj.value("error").toString();
    } else {
        return fail(QStringLiteral("unknown frame type '%1'").arg(type));
    }

    const QJsonValue id = obj.value("id");
    if (id.isString()) {
        frame.id = id.toString();
    } else if (id.isDouble()) {
        // Some firmware echoes numeric ids back as numbers
        frame.id = QString::number(id.toInteger());
    }

    const QJsonValue payload = obj.value("payload");
    if (payload.isObject()) {
        frame.payload = payload.toObject();
    } else if (!payload.isUndefined() && !payload.isNull()) {
        return fail(QStringLiteral("payload is not an object"));
    }

    return frame;
}

QString FrameCodec::composeUri(const QString& prefix, const QString& path)
{
    return prefix + path;
}

} // namespace ssap
