#pragma once

#include <QJsonObject>
#include <QMetaType>
#include <QString>

namespace ssap {

enum class OutboundType {
    Register,
    Request
};

enum class InboundType {
    Response,
    Registered,
    Error
};

struct OutboundFrame {
    QString id;
    OutboundType type = OutboundType::Request;
    QString uri;          // prefix + relative path; empty for register frames
    QJsonObject payload;
};

struct InboundFrame {
    QString id;           // may be empty
    InboundType type = InboundType::Response;
    QJsonObject payload;
    QString error;        // only set on error frames

    bool hasId() const { return !id.isEmpty(); }
};

const char* outboundTypeName(OutboundType type);
const char* inboundTypeName(InboundType type);

} // namespace ssap

Q_DECLARE_METATYPE(ssap::OutboundFrame)
Q_DECLARE_METATYPE(ssap::InboundFrame)
