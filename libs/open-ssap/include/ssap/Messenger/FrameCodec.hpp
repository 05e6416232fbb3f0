#pragma once

#include <ssap/Messenger/Frame.hpp>
#include <QString>
#include <optional>

namespace ssap {

class FrameCodec {
public:
    static QString encode(const OutboundFrame& frame);

    /// Decodes one inbound text frame. Returns nullopt (and fills
    /// errorString when given) for anything that is not a JSON object with
    /// a known "type".
    static std::optional<InboundFrame> decode(const QString& text,
                                              QString* errorString = nullptr);

    static QString composeUri(const QString& prefix, const QString& path);
};

} // namespace ssap
