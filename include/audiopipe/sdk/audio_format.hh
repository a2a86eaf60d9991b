/**
 * @file audio_format.hh
 * @brief Device sample format definitions
 * @ingroup sdk_audio_format
 */

#ifndef AUDIOPIPE_SDK_AUDIO_FORMAT_H
#define AUDIOPIPE_SDK_AUDIO_FORMAT_H

#include <audiopipe/sdk/types.hh>
#include <audiopipe/sdk/export_audiopipe_sdk.h>
#include <iosfwd>
#include <string>

namespace audiopipe {

/**
 * @defgroup sdk_audio_format Audio Formats
 * @ingroup sdk
 * @brief Sample formats a device may ask for
 *
 * The pipeline always works on 32-bit float frames. The format only
 * matters at the very end, when the device sink converts the ring buffer
 * contents into the byte layout the device was opened with.
 * @{
 */

/**
 * @enum audio_format
 * @brief Sample format with encoded properties
 *
 * - Bits 0-7: bit size (8, 16, 32)
 * - Bit 8: float flag
 * - Bit 12: big-endian flag
 * - Bit 15: signed flag
 */
enum class audio_format : uint16_t {
    unknown = 0,
    u8 = 0x0008,
    s8 = 0x8008,
    s16le = 0x8010,
    s16be = 0x9010,
    s32le = 0x8020,
    s32be = 0x9020,
    f32le = 0x8120,
    f32be = 0x9120
};

inline constexpr uint8_t audio_format_bit_size(audio_format fmt) {
    return static_cast<uint8_t>(static_cast<uint16_t>(fmt) & 0xFF);
}

inline constexpr uint8_t audio_format_byte_size(audio_format fmt) {
    return audio_format_bit_size(fmt) / 8;
}

inline constexpr bool audio_format_is_signed(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x8000) != 0;
}

inline constexpr bool audio_format_is_big_endian(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x1000) != 0;
}

inline constexpr bool audio_format_is_float(audio_format fmt) {
    return (static_cast<uint16_t>(fmt) & 0x0100) != 0;
}

/**
 * @struct audio_spec
 * @brief Format, channel count and rate of a device or stream
 */
struct audio_spec {
    audio_format format;
    uint8_t channels;
    uint32_t freq;
};

/**
 * @brief Parse a format name as printed by operator<<
 * @param name One of "u8", "s8", "s16le", "s16be", "s32le", "s32be", "f32le", "f32be"
 * @return Parsed format, or audio_format::unknown
 */
AUDIOPIPE_SDK_EXPORT audio_format audio_format_from_string(const std::string& name);

/**
 * @brief Prints the short format name (e.g. "s16le")
 */
AUDIOPIPE_SDK_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);

/** @} */ // end of sdk_audio_format group

} // namespace audiopipe

#endif // AUDIOPIPE_SDK_AUDIO_FORMAT_H
