#include <doctest/doctest.h>
#include <audiopipe/pipeline.hh>
#include <audiopipe/error.hh>

#include "../../mock_components.hh"

#include <chrono>
#include <thread>
#include <vector>

using namespace audiopipe;
using namespace audiopipe::test;

namespace {
    constexpr auto k_deadline = std::chrono::seconds(10);

    pipeline_config rig_config() {
        pipeline_config cfg;
        cfg.sample_rate = 44100;
        cfg.channels = 2;
        cfg.block_frames = 256;
        cfg.ring_latency = std::chrono::milliseconds(50);
        cfg.write_timeout = std::chrono::milliseconds(5);
        return cfg;
    }

    effect_params neutral(const pipeline_config& cfg) {
        effect_params p;
        p.band_gains_db.assign(cfg.effective_band_centres().size(), 0.0f);
        return p;
    }

    // Everything a pipeline needs, with the test thread playing the device
    struct rig {
        pipeline_config config = rig_config();
        parameter_bus bus{neutral(config)};
        output_ring_buffer ring{config.ring_capacity_frames(), config.channels};
        visualization_tap tap{4, 2048, config.channels};
        processing_pipeline pipeline{config, bus, ring, tap};
        std::vector<pipeline_event> events;

        std::unique_ptr<decoder_adapter> adapter(std::unique_ptr<track> trk) {
            return std::make_unique<decoder_adapter>(std::move(trk), config.sample_rate, config.channels,
                                                     config.block_frames);
        }

        void load(std::unique_ptr<track> trk) {
            pipeline.set_source(adapter(std::move(trk)));
        }

        // Reads up to @p frames real frames into @p out (left channel only)
        std::size_t consume(std::vector<float>& out, std::size_t frames) {
            std::vector<float> buf(frames * config.channels);
            const auto res = ring.read(buf.data(), frames);
            for (std::size_t i = 0; i < res.frames_read; i++) {
                out.push_back(buf[i * config.channels]);
            }
            return res.frames_read;
        }

        bool has_event(pipeline_event::kind k) {
            for (auto& e : pipeline.drain_events()) {
                events.push_back(std::move(e));
            }
            for (const auto& e : events) {
                if (e.type == k) {
                    return true;
                }
            }
            return false;
        }

        // Plays like a device until @p k is reported or the deadline passes
        bool play_until(pipeline_event::kind k, std::vector<float>& out) {
            const auto until = std::chrono::steady_clock::now() + k_deadline;
            while (std::chrono::steady_clock::now() < until) {
                consume(out, 128);
                if (has_event(k)) {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
            return false;
        }

        bool wait_for_ring(std::size_t frames) {
            const auto until = std::chrono::steady_clock::now() + k_deadline;
            while (ring.size() < frames) {
                if (std::chrono::steady_clock::now() >= until) {
                    return false;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return true;
        }
    };

    bool is_contiguous_ramp(const std::vector<float>& out, frame_index_t first) {
        for (std::size_t i = 0; i < out.size(); i++) {
            if (ramp_frame(out[i]) != first + i) {
                return false;
            }
        }
        return true;
    }
}

TEST_SUITE("Integration::Pipeline") {
    TEST_CASE("start needs a source") {
        rig r;
        CHECK_FALSE(r.pipeline.has_source());
        CHECK_THROWS_AS(r.pipeline.start(), state_error);
        CHECK(r.pipeline.state() == pipeline_state::idle);
    }

    TEST_CASE("every frame reaches the ring in order, then the track completes") {
        rig r;
        r.load(make_test_track("ramp", 5000));
        r.pipeline.start();
        CHECK_THROWS_AS(r.pipeline.start(), state_error);

        std::vector<float> out;
        REQUIRE(r.play_until(pipeline_event::kind::track_complete, out));
        CHECK(out.size() == 5000);
        CHECK(is_contiguous_ramp(out, 0));
        CHECK(r.pipeline.position() == 5000);
        CHECK(r.pipeline.blocks_processed() == 20);
        CHECK(r.pipeline.state() == pipeline_state::idle);
        CHECK(r.pipeline.is_running());
    }

    TEST_CASE("replacing the source of a running pipeline is refused") {
        rig r;
        r.load(make_test_track("a", 100000));
        r.pipeline.start();
        CHECK_THROWS_AS(r.load(make_test_track("b", 100)), state_error);
        r.pipeline.stop();
        CHECK_NOTHROW(r.load(make_test_track("b", 100)));
    }

    TEST_CASE("a parameter change applies from a block boundary on") {
        rig r;
        auto dec = std::make_unique<test_decoder>(20000, test_decoder::pattern::constant);
        dec->set_constant(0.5f);
        r.load(make_test_track("c", std::move(dec)));
        r.pipeline.start();

        REQUIRE(r.wait_for_ring(r.ring.capacity()));
        r.bus.set_volume(0.5f);

        std::vector<float> out;
        REQUIRE(r.play_until(pipeline_event::kind::track_complete, out));
        REQUIRE(out.size() == 20000);

        std::size_t first_changed = out.size();
        for (std::size_t i = 0; i < out.size(); i++) {
            if (out[i] != 0.5f) {
                first_changed = i;
                break;
            }
        }
        REQUIRE(first_changed < out.size());
        CHECK(first_changed % r.config.block_frames == 0);
        for (std::size_t i = first_changed; i < out.size(); i++) {
            REQUIRE(out[i] == 0.25f);
        }
    }

    TEST_CASE("seek drops queued audio and continues at the target") {
        rig r;
        r.load(make_test_track("ramp", 100000));
        r.pipeline.start();
        REQUIRE(r.wait_for_ring(r.ring.capacity()));

        r.pipeline.quiesce();
        CHECK(r.pipeline.is_quiesced());
        CHECK(r.pipeline.seek(60000) == 60000);
        CHECK(r.pipeline.position() == 60000);
        r.pipeline.release();

        std::vector<float> out;
        const auto until = std::chrono::steady_clock::now() + k_deadline;
        while (out.size() < 4000 && std::chrono::steady_clock::now() < until) {
            r.consume(out, 128);
        }
        REQUIRE(out.size() >= 4000);
        CHECK(is_contiguous_ramp(out, 60000));
    }

    TEST_CASE("seek is refused while the producer runs") {
        rig r;
        r.load(make_test_track("ramp", 100000));
        r.pipeline.start();
        CHECK_THROWS_AS(r.pipeline.seek(10), state_error);
    }

    TEST_CASE("seek after completion restarts decoding") {
        rig r;
        r.load(make_test_track("ramp", 3000));
        r.pipeline.start();
        std::vector<float> out;
        REQUIRE(r.play_until(pipeline_event::kind::track_complete, out));

        r.events.clear();
        r.pipeline.quiesce();
        r.pipeline.seek(1000);
        r.pipeline.release();

        out.clear();
        REQUIRE(r.play_until(pipeline_event::kind::track_complete, out));
        CHECK(out.size() == 2000);
        CHECK(is_contiguous_ramp(out, 1000));
    }

    TEST_CASE("pause keeps the queued audio and resume continues seamlessly") {
        rig r;
        r.load(make_test_track("ramp", 100000));
        r.pipeline.start();
        REQUIRE(r.wait_for_ring(r.ring.capacity()));

        r.pipeline.pause();
        CHECK(r.pipeline.state() == pipeline_state::paused);
        // Let a write waiting on the full ring time out and park the producer
        std::this_thread::sleep_for(r.config.write_timeout * 4);
        const auto queued = r.ring.size();
        const auto pos = r.pipeline.position();

        std::vector<float> out;
        r.consume(out, queued);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        CHECK(r.ring.empty());
        CHECK(r.pipeline.position() == pos);

        r.pipeline.resume();
        CHECK(r.pipeline.state() == pipeline_state::decoding);
        const auto until = std::chrono::steady_clock::now() + k_deadline;
        while (out.size() < queued + 3000 && std::chrono::steady_clock::now() < until) {
            r.consume(out, 128);
        }
        CHECK(is_contiguous_ramp(out, 0));
    }

    TEST_CASE("decoder failure stops the producer with an event") {
        rig r;
        auto dec = std::make_unique<test_decoder>(100000, test_decoder::pattern::ramp);
        dec->fail_at_frame(3000);
        r.load(make_test_track("broken", std::move(dec)));
        r.pipeline.start();

        std::vector<float> out;
        REQUIRE(r.play_until(pipeline_event::kind::decode_error, out));
        CHECK(r.pipeline.state() == pipeline_state::idle);
        CHECK_FALSE(r.has_event(pipeline_event::kind::track_complete));

        std::string message;
        for (const auto& e : r.events) {
            if (e.type == pipeline_event::kind::decode_error) {
                message = e.message;
            }
        }
        CHECK(message.find("3000") != std::string::npos);
    }

    TEST_CASE("double speed halves the output but not the source position") {
        rig r;
        r.bus.set_speed(2.0f);
        r.load(make_test_track("ramp", 8192));
        r.pipeline.start();

        std::vector<float> out;
        REQUIRE(r.play_until(pipeline_event::kind::track_complete, out));
        CHECK(out.size() >= 4096 - 64);
        CHECK(out.size() <= 4096 + 64);
        CHECK(r.pipeline.position() == 8192);
    }

    TEST_CASE("visualization sees processed blocks") {
        rig r;
        r.load(make_test_track("sine", 20000, test_decoder::pattern::sine_440hz));
        r.pipeline.start();
        REQUIRE(r.wait_for_ring(r.ring.capacity()));

        auto snap = r.tap.snapshot();
        CHECK(snap.blocks == 4);
        CHECK(snap.channels == 2);
        const auto levels = compute_levels(snap);
        REQUIRE(levels.size() == 2);
        CHECK(levels[0].peak == doctest::Approx(0.5f).epsilon(0.01));
    }

    TEST_CASE("stop discards the source and the queued audio") {
        rig r;
        r.load(make_test_track("ramp", 100000));
        r.pipeline.start();
        REQUIRE(r.wait_for_ring(r.ring.capacity()));

        r.pipeline.stop();
        CHECK_FALSE(r.pipeline.is_running());
        CHECK_FALSE(r.pipeline.has_source());
        CHECK(r.ring.empty());
        CHECK(r.pipeline.position() == 0);
        CHECK(r.tap.snapshot().empty());
    }
}
