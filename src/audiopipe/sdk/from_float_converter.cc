//
// Float to device format conversion.
//

#include <cstring>
#include <limits>
#include <algorithm>
#include <audiopipe/sdk/from_float_converter.hh>
#include <audiopipe/sdk/endian.hh>

namespace audiopipe {
    namespace {
        float clamp_unit(const float f) noexcept {
            return (f >= 1.f) ? 1.f : (f < -1.f ? -1.f : f);
        }

        template<typename T>
        T float_to_int(const float f) noexcept {
            return static_cast<T>(static_cast<double>(clamp_unit(f)) * static_cast<double>(std::numeric_limits<T>::max()));
        }

        // Writes the converted samples and returns how many bytes were used
        template<typename T, typename Encode>
        size_t convert_samples(uint8_t* dst, size_t dst_bytes, const float* src, size_t src_samples, Encode encode) noexcept {
            const size_t count = std::min(src_samples, dst_bytes / sizeof(T));
            for (size_t i = 0; i < count; ++i) {
                const T v = encode(src[i]);
                std::memcpy(dst + i * sizeof(T), &v, sizeof(T));
            }
            return count * sizeof(T);
        }

        void pad(uint8_t* dst, size_t dst_bytes, size_t used, int silence) noexcept {
            if (used < dst_bytes) {
                std::memset(dst + used, silence, dst_bytes - used);
            }
        }
    }

    static void float_to_s8(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        pad(dst, dst_bytes, convert_samples<int8_t>(dst, dst_bytes, src, n, float_to_int<int8_t>), 0);
    }

    static void float_to_u8(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        auto used = convert_samples<uint8_t>(dst, dst_bytes, src, n, [](float f) {
            return static_cast<uint8_t>((clamp_unit(f) * 0.5f + 0.5f) * std::numeric_limits<uint8_t>::max());
        });
        pad(dst, dst_bytes, used, 0x80);
    }

    static void float_to_s16le(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        auto used = convert_samples<uint16_t>(dst, dst_bytes, src, n, [](float f) {
            return swap16le(static_cast<uint16_t>(float_to_int<int16_t>(f)));
        });
        pad(dst, dst_bytes, used, 0);
    }

    static void float_to_s16be(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        auto used = convert_samples<uint16_t>(dst, dst_bytes, src, n, [](float f) {
            return swap16be(static_cast<uint16_t>(float_to_int<int16_t>(f)));
        });
        pad(dst, dst_bytes, used, 0);
    }

    static void float_to_s32le(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        auto used = convert_samples<uint32_t>(dst, dst_bytes, src, n, [](float f) {
            return swap32le(static_cast<uint32_t>(float_to_int<int32_t>(f)));
        });
        pad(dst, dst_bytes, used, 0);
    }

    static void float_to_s32be(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        auto used = convert_samples<uint32_t>(dst, dst_bytes, src, n, [](float f) {
            return swap32be(static_cast<uint32_t>(float_to_int<int32_t>(f)));
        });
        pad(dst, dst_bytes, used, 0);
    }

    static void float_to_f32le(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        pad(dst, dst_bytes, convert_samples<float>(dst, dst_bytes, src, n, swap_float_le), 0);
    }

    static void float_to_f32be(uint8_t* dst, size_t dst_bytes, const float* src, size_t n) noexcept {
        pad(dst, dst_bytes, convert_samples<float>(dst, dst_bytes, src, n, swap_float_be), 0);
    }

    from_float_converter_func_t get_from_float_converter(audio_format fmt) {
        switch (fmt) {
            case audio_format::s8:     return float_to_s8;
            case audio_format::u8:     return float_to_u8;
            case audio_format::s16le:  return float_to_s16le;
            case audio_format::s16be:  return float_to_s16be;
            case audio_format::s32le:  return float_to_s32le;
            case audio_format::s32be:  return float_to_s32be;
            case audio_format::f32le:  return float_to_f32le;
            case audio_format::f32be:  return float_to_f32be;
            default:                   return nullptr;
        }
    }
}
