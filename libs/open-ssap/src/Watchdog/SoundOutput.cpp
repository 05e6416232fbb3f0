#include <ssap/Watchdog/SoundOutput.hpp>

namespace ssap {
namespace soundoutput {

namespace {

struct NameEntry {
    SoundOutput output;
    const char* name;
};

constexpr NameEntry NAMES[] = {
    { SoundOutput::TvSpeaker,         "tv_speaker" },
    { SoundOutput::Optical,           "external_optical" },
    { SoundOutput::HdmiArc,           "external_arc" },
    { SoundOutput::LineOut,           "lineout" },
    { SoundOutput::Headphone,         "headphone" },
    { SoundOutput::ExternalSpeaker,   "external_speaker" },
    { SoundOutput::TvAndOptical,      "tv_external_speaker" },
    { SoundOutput::TvAndHeadphone,    "tv_speaker_headphone" },
    { SoundOutput::BluetoothSoundbar, "bt_soundbar" },
    { SoundOutput::Soundbar,          "soundbar" },
};

} // namespace

QString toString(SoundOutput output)
{
    for (const auto& entry : NAMES) {
        if (entry.output == output)
            return QString::fromLatin1(entry.name);
    }
    return {};
}

std::optional<SoundOutput> fromString(const QString& name)
{
    for (const auto& entry : NAMES) {
        if (name == QLatin1String(entry.name))
            return entry.output;
    }
    return std::nullopt;
}

QStringList knownNames()
{
    QStringList names;
    for (const auto& entry : NAMES)
        names.append(QString::fromLatin1(entry.name));
    return names;
}

} // namespace soundoutput
} // namespace ssap
