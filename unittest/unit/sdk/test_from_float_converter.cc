#include <doctest/doctest.h>
#include <audiopipe/sdk/from_float_converter.hh>

#include <cstdint>
#include <cstring>
#include <vector>

using namespace audiopipe;

TEST_SUITE("SDK::FromFloatConverter") {
    TEST_CASE("every known device format has a converter") {
        for (auto fmt : {audio_format::u8, audio_format::s8, audio_format::s16le, audio_format::s16be,
                         audio_format::s32le, audio_format::s32be, audio_format::f32le, audio_format::f32be}) {
            CHECK(get_from_float_converter(fmt) != nullptr);
        }
        CHECK(get_from_float_converter(audio_format::unknown) == nullptr);
    }

    TEST_CASE("s16le full scale and clipping") {
        auto conv = get_from_float_converter(audio_format::s16le);
        const float src[] = {0.0f, 1.0f, -1.0f, 2.0f, -3.0f};
        uint8_t dst[10];
        conv(dst, sizeof(dst), src, 5);

        auto at = [&dst](int i) {
            return static_cast<int16_t>(dst[2 * i] | (dst[2 * i + 1] << 8));
        };
        CHECK(at(0) == 0);
        CHECK(at(1) == 32767);
        CHECK(at(2) == -32767);
        CHECK(at(3) == 32767);
        CHECK(at(4) == -32767);
    }

    TEST_CASE("s16be writes the high byte first") {
        auto conv = get_from_float_converter(audio_format::s16be);
        const float src[] = {1.0f};
        uint8_t dst[2];
        conv(dst, sizeof(dst), src, 1);
        CHECK(dst[0] == 0x7F);
        CHECK(dst[1] == 0xFF);
    }

    TEST_CASE("u8 is centred on 0x80") {
        auto conv = get_from_float_converter(audio_format::u8);
        const float src[] = {-1.0f, 1.0f};
        uint8_t dst[2];
        conv(dst, sizeof(dst), src, 2);
        CHECK(dst[0] == 0);
        CHECK(dst[1] == 255);
    }

    TEST_CASE("f32le keeps the value") {
        auto conv = get_from_float_converter(audio_format::f32le);
        const float src[] = {0.25f, -0.75f};
        uint8_t dst[8];
        conv(dst, sizeof(dst), src, 2);
        float out[2];
        std::memcpy(out, dst, sizeof(out));
        CHECK(out[0] == 0.25f);
        CHECK(out[1] == -0.75f);
    }

    TEST_CASE("short input is padded with silence") {
        const float src[] = {0.5f};

        SUBCASE("signed formats pad with zero") {
            std::vector<uint8_t> dst(8, 0xAB);
            get_from_float_converter(audio_format::s16le)(dst.data(), dst.size(), src, 1);
            for (std::size_t i = 2; i < dst.size(); i++) {
                CHECK(dst[i] == 0);
            }
        }

        SUBCASE("u8 pads with the midpoint") {
            std::vector<uint8_t> dst(4, 0xAB);
            get_from_float_converter(audio_format::u8)(dst.data(), dst.size(), src, 1);
            CHECK(dst[1] == 0x80);
            CHECK(dst[3] == 0x80);
        }
    }

    TEST_CASE("output never exceeds the destination") {
        const float src[] = {0.1f, 0.2f, 0.3f, 0.4f};
        uint8_t dst[6] = {0, 0, 0, 0, 0, 0x5A};
        get_from_float_converter(audio_format::s16le)(dst, 5, src, 4);
        CHECK(dst[5] == 0x5A);
    }
}
