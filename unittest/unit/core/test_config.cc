#include <doctest/doctest.h>
#include <audiopipe/config.hh>
#include <audiopipe/error.hh>

#include <cstdlib>

using namespace audiopipe;

namespace {
    // Sets an environment variable for the lifetime of the guard
    struct env_guard {
        const char* name;

        env_guard(const char* n, const char* value)
            : name(n) {
            setenv(name, value, 1);
        }

        ~env_guard() {
            unsetenv(name);
        }
    };
}

TEST_SUITE("Core::Config") {
    TEST_CASE("defaults are valid") {
        pipeline_config cfg;
        CHECK_NOTHROW(cfg.validate());
        CHECK(cfg.effective_band_centres().size() == 10);
        CHECK(cfg.device_spec().format == audio_format::f32le);
        CHECK(cfg.device_spec().channels == 2);
        CHECK(cfg.device_spec().freq == 44100);
    }

    TEST_CASE("validate rejects unusable settings") {
        pipeline_config cfg;

        SUBCASE("sample rate") { cfg.sample_rate = 1000; }
        SUBCASE("no channels") { cfg.channels = 0; }
        SUBCASE("too many channels") { cfg.channels = 9; }
        SUBCASE("empty block") { cfg.block_frames = 0; }
        SUBCASE("zero latency") { cfg.ring_latency = std::chrono::milliseconds(0); }
        SUBCASE("zero write timeout") { cfg.write_timeout = std::chrono::milliseconds(0); }
        SUBCASE("no visualization slots") { cfg.visualization_blocks = 0; }
        SUBCASE("bad Q") { cfg.eq_q = 0.0; }
        SUBCASE("bad band centre") { cfg.band_centres_hz = {100.0f, -1.0f}; }
        SUBCASE("resampler quality") { cfg.resampler_quality = 11; }
        SUBCASE("device format") { cfg.device_format = audio_format::unknown; }
        SUBCASE("skip step") { cfg.skip_step = std::chrono::milliseconds(0); }

        CHECK_THROWS_AS(cfg.validate(), config_error);
    }

    TEST_CASE("ring capacity follows latency but holds two stretched blocks") {
        pipeline_config cfg;
        cfg.sample_rate = 48000;
        cfg.ring_latency = std::chrono::milliseconds(500);
        CHECK(cfg.ring_capacity_frames() == 24000);

        cfg.ring_latency = std::chrono::milliseconds(1);
        cfg.block_frames = 256;
        CHECK(cfg.ring_capacity_frames() == 2 * (256 * 4 + 2));
    }

    TEST_CASE("time settings convert to frames") {
        pipeline_config cfg;
        cfg.sample_rate = 44100;
        cfg.fade_duration = std::chrono::milliseconds(2000);
        cfg.skip_step = std::chrono::milliseconds(15000);
        CHECK(cfg.fade_frames() == 88200);
        CHECK(cfg.skip_frames() == 661500);
    }

    TEST_CASE("custom band layout replaces the default") {
        pipeline_config cfg;
        cfg.band_centres_hz = {100.0f, 1000.0f, 10000.0f};
        CHECK(cfg.effective_band_centres().size() == 3);
    }

    TEST_CASE("end policy names") {
        CHECK(track_end_policy_from_string("stop") == track_end_policy::stop);
        CHECK(track_end_policy_from_string("repeat") == track_end_policy::repeat);
        CHECK(track_end_policy_from_string("advance") == track_end_policy::advance);
        CHECK_THROWS_AS(track_end_policy_from_string("shuffle"), config_error);
    }

    TEST_CASE("environment overrides") {
        SUBCASE("valid values are applied") {
            env_guard rate("AUDIOPIPE_SAMPLE_RATE", "48000");
            env_guard block("AUDIOPIPE_BLOCK_FRAMES", "512");
            env_guard latency("AUDIOPIPE_LATENCY_MS", "100");
            env_guard format("AUDIOPIPE_DEVICE_FORMAT", "s16le");
            env_guard policy("AUDIOPIPE_END_POLICY", "repeat");
            env_guard device("AUDIOPIPE_DEVICE", "hw:1");

            auto cfg = config_from_environment();
            CHECK(cfg.sample_rate == 48000);
            CHECK(cfg.block_frames == 512);
            CHECK(cfg.ring_latency.count() == 100);
            CHECK(cfg.device_format == audio_format::s16le);
            CHECK(cfg.end_policy == track_end_policy::repeat);
            CHECK(cfg.device_id == "hw:1");
            CHECK(cfg.channels == 2);
        }

        SUBCASE("base values survive when unset") {
            pipeline_config base;
            base.channels = 1;
            base.skip_step = std::chrono::milliseconds(5000);
            auto cfg = config_from_environment(base);
            CHECK(cfg.channels == 1);
            CHECK(cfg.skip_step.count() == 5000);
        }

        SUBCASE("malformed numbers") {
            env_guard rate("AUDIOPIPE_SAMPLE_RATE", "44.1k");
            CHECK_THROWS_AS(config_from_environment(), config_error);
        }

        SUBCASE("out of range numbers") {
            env_guard ch("AUDIOPIPE_CHANNELS", "64");
            CHECK_THROWS_AS(config_from_environment(), config_error);
        }

        SUBCASE("unknown format") {
            env_guard format("AUDIOPIPE_DEVICE_FORMAT", "f64le");
            CHECK_THROWS_AS(config_from_environment(), config_error);
        }
    }
}
