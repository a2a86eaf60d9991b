#include <audiopipe/sdk/audio_format.hh>
#include <ostream>

namespace audiopipe {

namespace {
    struct format_name {
        audio_format fmt;
        const char* name;
    };

    constexpr format_name k_format_names[] = {
        {audio_format::u8, "u8"},
        {audio_format::s8, "s8"},
        {audio_format::s16le, "s16le"},
        {audio_format::s16be, "s16be"},
        {audio_format::s32le, "s32le"},
        {audio_format::s32be, "s32be"},
        {audio_format::f32le, "f32le"},
        {audio_format::f32be, "f32be"},
    };
}

audio_format audio_format_from_string(const std::string& name) {
    for (const auto& entry : k_format_names) {
        if (name == entry.name) {
            return entry.fmt;
        }
    }
    return audio_format::unknown;
}

std::ostream& operator<<(std::ostream& os, audio_format fmt) {
    for (const auto& entry : k_format_names) {
        if (entry.fmt == fmt) {
            return os << entry.name;
        }
    }
    if (fmt == audio_format::unknown) {
        return os << "unknown";
    }
    return os << "audio_format(" << static_cast<int>(fmt) << ")";
}

} // namespace audiopipe
