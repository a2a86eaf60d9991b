#ifndef AUDIOPIPE_SDK_ENDIAN_H
#define AUDIOPIPE_SDK_ENDIAN_H

#include <audiopipe/sdk/types.hh>
#include <cstring>

// AUDIOPIPE_BIG_ENDIAN is defined by the build from CMAKE_CXX_BYTE_ORDER
#ifndef AUDIOPIPE_BIG_ENDIAN
#define AUDIOPIPE_BIG_ENDIAN 0
#endif

namespace audiopipe {

#if AUDIOPIPE_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif
    constexpr bool is_little_endian = !is_big_endian;

inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

inline float swap_float(float x) {
    uint32_t u;
    std::memcpy(&u, &x, sizeof(u));
    u = swap32(u);
    std::memcpy(&x, &u, sizeof(u));
    return x;
}

inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint16_t swap16be(uint16_t x) {
    return is_big_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

inline uint32_t swap32be(uint32_t x) {
    return is_big_endian ? x : swap32(x);
}

inline float swap_float_le(float x) {
    return is_little_endian ? x : swap_float(x);
}

inline float swap_float_be(float x) {
    return is_big_endian ? x : swap_float(x);
}

} // namespace audiopipe

#endif // AUDIOPIPE_SDK_ENDIAN_H
