#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace ssap {

enum class SoundOutput {
    TvSpeaker,
    Optical,
    HdmiArc,
    LineOut,
    Headphone,
    ExternalSpeaker,
    TvAndOptical,
    TvAndHeadphone,
    BluetoothSoundbar,
    Soundbar
};

namespace soundoutput {

constexpr const char* GET_PATH = "com.webos.service.apiadapter/audio/getSoundOutput";
constexpr const char* CHANGE_PATH = "com.webos.service.apiadapter/audio/changeSoundOutput";

// Output the quirk-mode correction bounces through before re-asserting.
constexpr SoundOutput FALLBACK = SoundOutput::TvSpeaker;

/// Wire name, e.g. "external_arc".
QString toString(SoundOutput output);
std::optional<SoundOutput> fromString(const QString& name);
QStringList knownNames();

} // namespace soundoutput

} // namespace ssap
