#include <ssap/Messenger/ProtocolLogger.hpp>
#include <ssap/Messenger/Messenger.hpp>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QDebug>

namespace ssap {

namespace {

constexpr const char* CLIENT_KEY_FIELD = "client-key";

QJsonValue maskValue(const QJsonValue& value);

QJsonObject maskObject(const QJsonObject& in)
{
    QJsonObject out = in;
    for (auto it = out.begin(); it != out.end(); ++it) {
        if (it.key() == QLatin1String(CLIENT_KEY_FIELD))
            it.value() = QStringLiteral("***");
        else
            it.value() = maskValue(it.value());
    }
    return out;
}

QJsonValue maskValue(const QJsonValue& value)
{
    if (value.isObject())
        return maskObject(value.toObject());
    if (value.isArray()) {
        QJsonArray items;
        for (const auto& item : value.toArray())
            items.append(maskValue(item));
        return items;
    }
    return value;
}

QString orDash(const QString& s)
{
    return s.isEmpty() ? QStringLiteral("-") : s;
}

} // namespace

ProtocolLogger::ProtocolLogger(QObject* parent)
    : QObject(parent)
{
}

ProtocolLogger::~ProtocolLogger()
{
    detach();
    close();
}

bool ProtocolLogger::open(const QString& path)
{
    QMutexLocker lock(&mutex_);
    if (file_.isOpen())
        file_.close();

    file_.setFileName(path);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "[ProtocolLogger] cannot open" << path << ":" << file_.errorString();
        return false;
    }

    clock_.start();
    if (format_ == OutputFormat::Tsv) {
        file_.write("TIME\tDIR\tTYPE\tID\tURI\tPAYLOAD\n");
        file_.flush();
    }
    return true;
}

void ProtocolLogger::close()
{
    QMutexLocker lock(&mutex_);
    if (file_.isOpen())
        file_.close();
}

bool ProtocolLogger::isOpen() const
{
    QMutexLocker lock(&mutex_);
    return file_.isOpen();
}

void ProtocolLogger::attach(Messenger* messenger)
{
    detach();
    messenger_ = messenger;
    if (!messenger) return;

    connect(messenger, &Messenger::frameSent, this, [this](const OutboundFrame& frame) {
        log(CLIENT_TO_DEVICE, outboundTypeName(frame.type), frame.id, frame.uri, frame.payload);
    });
    connect(messenger, &Messenger::frameReceived, this, [this](const InboundFrame& frame) {
        QJsonObject payload = frame.payload;
        if (frame.type == InboundType::Error)
            payload.insert("error", frame.error);
        log(DEVICE_TO_CLIENT, inboundTypeName(frame.type), frame.id, QString(), payload);
    });
}

void ProtocolLogger::detach()
{
    if (messenger_)
        disconnect(messenger_, nullptr, this, nullptr);
    messenger_ = nullptr;
}

void ProtocolLogger::log(const QString& direction, const QString& type, const QString& id,
                         const QString& uri, const QJsonObject& payload)
{
    QMutexLocker lock(&mutex_);
    if (!file_.isOpen()) return;

    const qint64 elapsed = clock_.elapsed();
    file_.write(format_ == OutputFormat::Jsonl
                    ? jsonLine(elapsed, direction, type, id, uri, payload)
                    : tsvLine(elapsed, direction, type, id, uri, payload));
    file_.flush();
}

QByteArray ProtocolLogger::tsvLine(qint64 elapsedMs, const QString& direction,
                                   const QString& type, const QString& id,
                                   const QString& uri, const QJsonObject& payload) const
{
    const QByteArray body = payload.isEmpty()
        ? QByteArray()
        : QJsonDocument(masked(payload)).toJson(QJsonDocument::Compact);

    QByteArray line = QByteArray::number(elapsedMs / 1000.0, 'f', 3);
    for (const QString& field : {direction, type, orDash(id), orDash(uri)}) {
        line += '\t';
        line += field.toUtf8();
    }
    line += '\t';
    line += body;
    line += '\n';
    return line;
}

QByteArray ProtocolLogger::jsonLine(qint64 elapsedMs, const QString& direction,
                                    const QString& type, const QString& id,
                                    const QString& uri, const QJsonObject& payload) const
{
    QJsonObject entry;
    entry["ts_ms"] = elapsedMs;
    entry["direction"] = direction;
    entry["type"] = type;
    entry["id"] = id;
    entry["uri"] = uri;
    entry["payload"] = masked(payload);
    return QJsonDocument(entry).toJson(QJsonDocument::Compact) + '\n';
}

QJsonObject ProtocolLogger::masked(const QJsonObject& payload)
{
    return maskObject(payload);
}

} // namespace ssap
