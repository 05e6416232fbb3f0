#pragma once

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace wr {

enum class CommandKind {
    Request,     // plain request on the ssap:// service tree
    LunaBridge,  // luna:// call relayed through an alert's close action
    Local        // handled without a device session
};

struct Command {
    QString name;        // CLI verb, e.g. "set-volume"
    CommandKind kind = CommandKind::Request;
    QString path;        // service path relative to the URI prefix
    QStringList required;
    QStringList optional;
    QJsonObject defaults;  // payload entries the caller may override
    bool passthrough = false;  // any key=value goes into the payload
    QStringList stringKeys;    // arguments sent as strings even when they look like JSON
    QString summary;
};

/// Static table of every command the CLI and TvCommands know about.
class CommandCatalog {
public:
    static const QList<Command>& all();
    static const Command* find(const QString& name);

    /// Turns "key=value" words into a payload. Values that parse as JSON
    /// (numbers, booleans, objects, arrays, quoted strings) keep their type;
    /// anything else is taken as a plain string.
    static bool parseArguments(const QStringList& words, QJsonObject& out,
                               QString* errorString = nullptr);
    /// Same, but the command's stringKeys keep their raw text ("channelId=7" stays "7").
    static bool parseArguments(const Command& command, const QStringList& words,
                               QJsonObject& out, QString* errorString = nullptr);

    /// Checks required and unknown keys and merges the defaults under args.
    static bool buildPayload(const Command& command, const QJsonObject& args,
                             QJsonObject& payload, QString* errorString = nullptr);

    static QString usage();
};

} // namespace wr
