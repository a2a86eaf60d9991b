#include <doctest/doctest.h>
#include <audiopipe/codecs/decoder_drwav.hh>
#include <audiopipe/error.hh>
#include <audiopipe/sdk/io_stream.hh>

#include "../../mock_components.hh"

#include <chrono>
#include <cmath>
#include <vector>

using namespace audiopipe;

namespace {
    // Minimal silent PCM WAV of any bit depth
    std::vector<uint8_t> make_silent_wav(uint16_t channels, uint16_t bits, uint32_t rate, uint32_t frames) {
        std::vector<uint8_t> data;
        auto put32 = [&data](uint32_t v) {
            for (int i = 0; i < 4; i++) data.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        };
        auto put16 = [&data](uint16_t v) {
            data.push_back(static_cast<uint8_t>(v & 0xFF));
            data.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        };

        const uint32_t data_bytes = frames * channels * (bits / 8);
        data.insert(data.end(), {'R', 'I', 'F', 'F'});
        put32(36 + data_bytes);
        data.insert(data.end(), {'W', 'A', 'V', 'E'});
        data.insert(data.end(), {'f', 'm', 't', ' '});
        put32(16);
        put16(1);
        put16(channels);
        put32(rate);
        put32(rate * channels * (bits / 8));
        put16(static_cast<uint16_t>(channels * (bits / 8)));
        put16(bits);
        data.insert(data.end(), {'d', 'a', 't', 'a'});
        put32(data_bytes);
        // 8-bit PCM is unsigned
        data.resize(data.size() + data_bytes, bits == 8 ? 0x80 : 0x00);
        return data;
    }

    int16_t saw(frame_index_t f, channels_t c) {
        return static_cast<int16_t>((static_cast<int>(f % 200) - 100) * 100 * (c == 0 ? 1 : -1));
    }
}

TEST_SUITE("Codecs::DecoderWAV") {
    TEST_CASE("opens and reports the format") {
        auto wav = make_silent_wav(2, 16, 44100, 1000);
        auto io = io_from_memory(wav.data(), wav.size());
        decoder_drwav dec;

        CHECK(decoder_drwav::accept(io.get()));
        CHECK(io->tell() == 0);
        REQUIRE_NOTHROW(dec.open(io.get()));
        CHECK(dec.is_open());
        CHECK(dec.get_channels() == 2);
        CHECK(dec.get_rate() == 44100);
        REQUIRE(dec.total_frames().has_value());
        CHECK(*dec.total_frames() == 1000);
    }

    TEST_CASE("other bit depths") {
        SUBCASE("8-bit mono") {
            auto wav = make_silent_wav(1, 8, 22050, 50);
            auto io = io_from_memory(wav.data(), wav.size());
            decoder_drwav dec;
            REQUIRE_NOTHROW(dec.open(io.get()));
            CHECK(dec.get_channels() == 1);
            CHECK(dec.get_rate() == 22050);

            float buf[50];
            CHECK(dec.decode(buf, 50, 1) == 50);
            CHECK(std::abs(buf[10]) < 0.01f);
        }

        SUBCASE("24-bit stereo") {
            auto wav = make_silent_wav(2, 24, 48000, 50);
            auto io = io_from_memory(wav.data(), wav.size());
            decoder_drwav dec;
            REQUIRE_NOTHROW(dec.open(io.get()));
            CHECK(dec.get_channels() == 2);
            CHECK(dec.get_rate() == 48000);
        }
    }

    TEST_CASE("decodes sample values") {
        auto wav = test::make_wav_pcm16(400, 2, 44100, saw);
        auto io = io_from_memory(wav.data(), wav.size());
        decoder_drwav dec;
        REQUIRE_NOTHROW(dec.open(io.get()));

        std::vector<float> all;
        float buf[128];
        for (;;) {
            const auto n = dec.decode(buf, 128, 2);
            if (n == 0) {
                break;
            }
            all.insert(all.end(), buf, buf + n);
        }
        REQUIRE(all.size() == 800);
        CHECK(all[0] == doctest::Approx(-10000.0f / 32768.0f));
        CHECK(all[1] == doctest::Approx(10000.0f / 32768.0f));
        CHECK(all[2 * 150] == doctest::Approx(5000.0f / 32768.0f));
    }

    TEST_CASE("stereo folds down to mono on request") {
        auto wav = test::make_wav_pcm16(10, 2, 44100, [](frame_index_t, channels_t c) {
            return static_cast<int16_t>(c == 0 ? 16384 : 0);
        });
        auto io = io_from_memory(wav.data(), wav.size());
        decoder_drwav dec;
        REQUIRE_NOTHROW(dec.open(io.get()));

        float buf[10];
        REQUIRE(dec.decode(buf, 10, 1) == 10);
        CHECK(buf[0] == doctest::Approx(0.25f));
    }

    TEST_CASE("rejects data that is not WAV") {
        SUBCASE("AIFF header") {
            uint8_t bad[] = {'F', 'O', 'R', 'M', 0, 0, 0, 0, 'A', 'I', 'F', 'F'};
            auto io = io_from_memory(bad, sizeof(bad));
            CHECK_FALSE(decoder_drwav::accept(io.get()));
            decoder_drwav dec;
            CHECK_THROWS_AS(dec.open(io.get()), decoder_error);
        }

        SUBCASE("truncated header") {
            auto wav = make_silent_wav(1, 16, 44100, 100);
            wav.resize(20);
            auto io = io_from_memory(wav.data(), wav.size());
            decoder_drwav dec;
            CHECK_THROWS_AS(dec.open(io.get()), decoder_error);
        }
    }

    TEST_CASE("seek and rewind return the same samples") {
        auto wav = test::make_wav_pcm16(1000, 1, 44100, saw);
        auto io = io_from_memory(wav.data(), wav.size());
        decoder_drwav dec;
        REQUIRE_NOTHROW(dec.open(io.get()));

        float first[100];
        REQUIRE(dec.decode(first, 100, 1) == 100);
        CHECK(dec.rewind());
        float again[100];
        REQUIRE(dec.decode(again, 100, 1) == 100);
        for (int i = 0; i < 100; i++) {
            CHECK(first[i] == again[i]);
        }

        CHECK(dec.seek_to_frame(250));
        float at[1];
        REQUIRE(dec.decode(at, 1, 1) == 1);
        CHECK(at[0] == doctest::Approx(saw(250, 0) / 32768.0f));

        CHECK_FALSE(dec.seek_to_frame(5000));
    }

    TEST_CASE("duration") {
        SUBCASE("1 second mono") {
            auto wav = make_silent_wav(1, 16, 44100, 44100);
            auto io = io_from_memory(wav.data(), wav.size());
            decoder_drwav dec;
            REQUIRE_NOTHROW(dec.open(io.get()));
            CHECK(dec.duration() == std::chrono::seconds(1));
        }

        SUBCASE("500ms stereo") {
            auto wav = make_silent_wav(2, 16, 48000, 24000);
            auto io = io_from_memory(wav.data(), wav.size());
            decoder_drwav dec;
            REQUIRE_NOTHROW(dec.open(io.get()));
            CHECK(dec.duration() == std::chrono::milliseconds(500));
        }
    }
}
