#pragma once

#include <ssap/Messenger/Frame.hpp>
#include <QElapsedTimer>
#include <QFile>
#include <QMutex>
#include <QObject>
#include <QPointer>

namespace ssap {

class Messenger;

/// Appends every frame passing through a Messenger to a file, one line per
/// frame, either tab-separated or as JSON lines. Pairing credentials never
/// reach the file.
class ProtocolLogger : public QObject {
    Q_OBJECT

public:
    enum class OutputFormat {
        Tsv,
        Jsonl
    };

    static constexpr const char* CLIENT_TO_DEVICE = "client->tv";
    static constexpr const char* DEVICE_TO_CLIENT = "tv->client";

    explicit ProtocolLogger(QObject* parent = nullptr);
    ~ProtocolLogger() override;

    /// Appends to path; a TSV file gets a header line on every open.
    bool open(const QString& path);
    void close();
    bool isOpen() const;

    void setFormat(OutputFormat format) { format_ = format; }
    OutputFormat format() const { return format_; }

    void attach(Messenger* messenger);
    void detach();

    void log(const QString& direction, const QString& type, const QString& id,
             const QString& uri, const QJsonObject& payload);

    /// Copy of payload with every "client-key" value (at any depth) replaced by "***".
    static QJsonObject masked(const QJsonObject& payload);

private:
    QByteArray tsvLine(qint64 elapsedMs, const QString& direction, const QString& type,
                       const QString& id, const QString& uri, const QJsonObject& payload) const;
    QByteArray jsonLine(qint64 elapsedMs, const QString& direction, const QString& type,
                        const QString& id, const QString& uri, const QJsonObject& payload) const;

    QFile file_;
    mutable QMutex mutex_;
    QElapsedTimer clock_;
    OutputFormat format_ = OutputFormat::Tsv;
    QPointer<Messenger> messenger_;
};

} // namespace ssap
