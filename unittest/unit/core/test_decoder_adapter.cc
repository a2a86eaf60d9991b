#include <doctest/doctest.h>
#include <audiopipe/decoder_adapter.hh>
#include <audiopipe/codecs/register_codecs.hh>
#include <audiopipe/sdk/decoders_registry.hh>
#include <audiopipe/error.hh>

#include "../../mock_components.hh"

#include <cmath>
#include <string>

using namespace audiopipe;
using namespace audiopipe::test;

namespace {
    std::size_t drain(decoder_adapter& adapter, pcm_block& block) {
        std::size_t frames = 0;
        while (adapter.next_block(block) == block_status::ok) {
            frames += block.frames();
        }
        return frames;
    }
}

TEST_SUITE("Core::DecoderAdapter") {
    TEST_CASE("track reports the codec format") {
        auto trk = make_test_track("t", 1000, test_decoder::pattern::ramp, 1, 22050);
        CHECK(trk->id() == "t");
        CHECK(trk->rate() == 22050);
        CHECK(trk->channels() == 1);
        REQUIRE(trk->total_frames().has_value());
        CHECK(*trk->total_frames() == 1000);
        CHECK(std::string(trk->codec_name()) == "Test Decoder");
    }

    TEST_CASE("open failure is a decoder error") {
        auto dec = std::make_unique<test_decoder>(100);
        dec->set_fail_open(true);
        CHECK_THROWS_AS(make_test_track("bad", std::move(dec)), decoder_error);
    }

    TEST_CASE("missing decoder is rejected") {
        CHECK_THROWS_AS(track("none", std::make_unique<memory_io_stream>(), std::unique_ptr<decoder>()),
                        decoder_error);
    }

    TEST_CASE("blocks are full until the tail and carry positions") {
        decoder_adapter adapter(make_test_track("t", 2500), 44100, 2, 1024);
        pcm_block block(1024, 2, 44100);

        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.frames() == 1024);
        CHECK(block.source_position() == 0);
        CHECK(ramp_frame(block.sample(0, 0)) == 0);
        CHECK(ramp_frame(block.sample(1023, 1)) == 1023);

        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.source_position() == 1024);
        CHECK(ramp_frame(block.sample(0, 0)) == 1024);

        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.frames() == 452);
        CHECK(adapter.position() == 2500);

        CHECK(adapter.next_block(block) == block_status::end_of_stream);
        CHECK(block.frames() == 0);
        CHECK(adapter.next_block(block) == block_status::end_of_stream);
    }

    TEST_CASE("mono sources are widened to the pipeline layout") {
        decoder_adapter adapter(make_test_track("mono", 512, test_decoder::pattern::ramp, 1), 44100, 2, 256);
        pcm_block block(256, 2, 44100);
        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.sample(100, 0) == block.sample(100, 1));
        CHECK(ramp_frame(block.sample(100, 1)) == 100);
    }

    TEST_CASE("seek repositions the next block") {
        decoder_adapter adapter(make_test_track("t", 10000), 44100, 2, 512);
        pcm_block block(512, 2, 44100);
        adapter.next_block(block);

        CHECK(adapter.seek(7000) == 7000);
        CHECK(adapter.position() == 7000);
        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.source_position() == 7000);
        CHECK(ramp_frame(block.sample(0, 0)) == 7000);
    }

    TEST_CASE("seek past the end clamps to the end") {
        decoder_adapter adapter(make_test_track("t", 1000), 44100, 2, 512);
        pcm_block block(512, 2, 44100);
        CHECK(adapter.seek(50000) == 1000);
        CHECK(adapter.next_block(block) == block_status::end_of_stream);

        CHECK(adapter.seek(0) == 0);
        CHECK(adapter.next_block(block) == block_status::ok);
    }

    TEST_CASE("unseekable codec reports a decoder error") {
        auto dec = std::make_unique<test_decoder>(1000);
        dec->set_seekable(false);
        decoder_adapter adapter(make_test_track("t", std::move(dec)), 44100, 2, 512);
        CHECK_THROWS_AS(adapter.seek(10), decoder_error);
    }

    TEST_CASE("mid-stream failure surfaces from next_block") {
        auto dec = std::make_unique<test_decoder>(10000, test_decoder::pattern::ramp);
        dec->fail_at_frame(1500);
        decoder_adapter adapter(make_test_track("t", std::move(dec)), 44100, 2, 1024);
        pcm_block block(1024, 2, 44100);

        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK_THROWS_AS(adapter.next_block(block), decoder_error);
    }

    TEST_CASE("unknown length stays unknown") {
        auto dec = std::make_unique<test_decoder>(1000);
        dec->set_unknown_length(true);
        decoder_adapter adapter(make_test_track("t", std::move(dec)), 44100, 2, 512);
        CHECK_FALSE(adapter.total_frames().has_value());
    }

    TEST_CASE("different source rate is resampled to the pipeline rate") {
        decoder_adapter adapter(make_test_track("hi", 48000, test_decoder::pattern::sine_440hz, 2, 48000),
                                44100, 2, 1024);
        REQUIRE(adapter.total_frames().has_value());
        CHECK(*adapter.total_frames() == 44100);

        pcm_block block(1024, 2, 44100);
        const auto frames = drain(adapter, block);
        CHECK(frames > 43000);
        CHECK(frames <= 44200);
    }

    TEST_CASE("seek position is expressed at the pipeline rate") {
        decoder_adapter adapter(make_test_track("hi", 96000, test_decoder::pattern::silence, 2, 48000),
                                44100, 2, 1024);
        CHECK(adapter.seek(44100) == 44100);
    }

    TEST_CASE("WAV data is decoded through the codec registry") {
        auto registry = create_registry_with_all_codecs();
        auto wav = make_wav_pcm16(4410, 2, 44100, [](frame_index_t f, channels_t c) {
            return static_cast<int16_t>(c == 0 ? 16384 : -16384 + static_cast<int>(f % 2));
        });
        auto trk = std::make_unique<track>("wav", std::make_unique<memory_io_stream>(wav), *registry);
        CHECK(trk->rate() == 44100);
        CHECK(trk->channels() == 2);
        REQUIRE(trk->total_frames().has_value());
        CHECK(*trk->total_frames() == 4410);

        decoder_adapter adapter(std::move(trk), 44100, 2, 1024);
        pcm_block block(1024, 2, 44100);
        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.sample(0, 0) == doctest::Approx(0.5f).epsilon(0.001));
        CHECK(block.sample(0, 1) == doctest::Approx(-0.5f).epsilon(0.001));

        const std::size_t first = block.frames();
        CHECK(first + drain(adapter, block) == 4410);
    }

    TEST_CASE("seeking a WAV track onto or past its end reports end of stream") {
        auto registry = create_registry_with_all_codecs();
        auto wav = make_wav_pcm16(4410, 2, 44100, [](frame_index_t f, channels_t) {
            return static_cast<int16_t>(f);
        });
        decoder_adapter adapter(std::make_unique<track>("wav", std::make_unique<memory_io_stream>(wav), *registry),
                                44100, 2, 1024);
        pcm_block block(1024, 2, 44100);

        CHECK(adapter.seek(4410) == 4410);
        CHECK(adapter.position() == 4410);
        CHECK(adapter.next_block(block) == block_status::end_of_stream);

        CHECK(adapter.seek(100000) == 4410);
        CHECK(adapter.next_block(block) == block_status::end_of_stream);

        // Leaving the end behind decodes again
        CHECK(adapter.seek(4000) == 4000);
        REQUIRE(adapter.next_block(block) == block_status::ok);
        CHECK(block.frames() == 410);
        CHECK(block.sample(0, 0) == doctest::Approx(4000.0f / 32768.0f).epsilon(0.001));
    }

    TEST_CASE("a closed source is an I/O error") {
        auto registry = create_registry_with_all_codecs();
        auto io = std::make_unique<memory_io_stream>(std::vector<uint8_t>(64, 0));
        io->close();
        CHECK_THROWS_AS(track("closed", std::move(io), *registry), io_error);

        auto closed = std::make_unique<memory_io_stream>();
        closed->close();
        CHECK_THROWS_AS(track("closed", std::move(closed), std::make_unique<test_decoder>(100)), io_error);
        CHECK_THROWS_AS(track("none", nullptr, *registry), io_error);
    }

    TEST_CASE("data no codec understands is rejected") {
        auto registry = create_registry_with_all_codecs();
        const std::string text = "this is plain text and certainly not audio data. ";
        std::vector<uint8_t> bytes;
        for (int i = 0; i < 64; i++) {
            bytes.insert(bytes.end(), text.begin(), text.end());
        }
        CHECK_THROWS_AS(track("txt", std::make_unique<memory_io_stream>(bytes), *registry), decoder_error);
    }
}
