#include <doctest/doctest.h>
#include <audiopipe/transport.hh>
#include <audiopipe/error.hh>
#include <audiopipe/codecs/register_codecs.hh>
#include <audiopipe/sdk/decoders_registry.hh>

#include "../../mock_backends.hh"
#include "../../mock_components.hh"

#include <chrono>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

using namespace audiopipe;
using namespace audiopipe::test;

namespace {
    constexpr auto k_deadline = std::chrono::seconds(10);

    pipeline_config session_config(track_end_policy policy = track_end_policy::stop) {
        pipeline_config cfg;
        cfg.sample_rate = 44100;
        cfg.channels = 2;
        cfg.block_frames = 256;
        cfg.ring_latency = std::chrono::milliseconds(50);
        cfg.write_timeout = std::chrono::milliseconds(5);
        cfg.fade_duration = std::chrono::milliseconds(100);
        cfg.skip_step = std::chrono::milliseconds(1000);
        cfg.end_policy = policy;
        return cfg;
    }

    // Non-silent samples decoded as ramp frames, in the order heard
    std::vector<frame_index_t> heard_frames(const std::vector<float>& heard) {
        std::vector<frame_index_t> frames;
        for (float v : heard) {
            if (v != 0.0f) {
                frames.push_back(ramp_frame(v));
            }
        }
        return frames;
    }

    struct session {
        std::shared_ptr<mock_backend> backend = std::make_shared<mock_backend>();
        transport player;
        std::vector<transport_event> events;
        std::vector<float> heard;   ///< left channel of everything pumped

        explicit session(const pipeline_config& cfg = session_config())
            : player(cfg, backend) {
        }

        mock_stream& stream() {
            return *backend->last_stream();
        }

        // A paused stream hands back its untouched buffer, which is not audio
        void pump(std::size_t frames) {
            if (stream().is_paused()) {
                return;
            }
            const auto out = stream().pump_frames(frames);
            for (std::size_t i = 0; i < frames; i++) {
                heard.push_back(out[i * 2]);
            }
        }

        bool seen(transport_event::kind k) const {
            for (const auto& e : events) {
                if (e.type == k) {
                    return true;
                }
            }
            return false;
        }

        // Runs the device and the event loop until @p k shows up
        bool run_until(transport_event::kind k) {
            const auto until = std::chrono::steady_clock::now() + k_deadline;
            while (std::chrono::steady_clock::now() < until) {
                pump(128);
                for (auto& e : player.process_events()) {
                    events.push_back(std::move(e));
                }
                if (seen(k)) {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
            return false;
        }

        void settle() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
        }

        // Plays until @p last has been heard and the producer has gone idle,
        // without handing its completion to the transport
        bool play_out_quietly(frame_index_t last) {
            const auto until = std::chrono::steady_clock::now() + k_deadline;
            while (std::chrono::steady_clock::now() < until) {
                pump(128);
                const auto frames = heard_frames(heard);
                if (!frames.empty() && frames.back() == last) {
                    pump(128);
                    settle();
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
            return false;
        }
    };

    bool strictly_consecutive(const std::vector<frame_index_t>& frames) {
        for (std::size_t i = 1; i < frames.size(); i++) {
            if (frames[i] != frames[i - 1] + 1) {
                return false;
            }
        }
        return true;
    }
}

TEST_SUITE("Integration::Transport") {
    TEST_CASE("construction") {
        SUBCASE("invalid configuration") {
            auto cfg = session_config();
            cfg.block_frames = 0;
            CHECK_THROWS_AS(transport(cfg, std::make_shared<mock_backend>()), config_error);
        }
        SUBCASE("unusable device") {
            auto backend = std::make_shared<mock_backend>();
            backend->fail_open_device = true;
            CHECK_THROWS_AS(transport(session_config(), backend), device_error);
        }
        SUBCASE("fresh session is stopped") {
            session s;
            CHECK(s.player.state() == transport_state::stopped);
            CHECK_FALSE(s.player.current_track().has_value());
            CHECK_FALSE(s.player.duration_frames().has_value());
            CHECK(s.player.position() == 0);
            CHECK(s.player.last_error().empty());
            CHECK(s.player.stats().ring_capacity == session_config().ring_capacity_frames());
        }
    }

    TEST_CASE("commands that do not fit the state are refused") {
        session s;
        CHECK_THROWS_AS(s.player.play(), state_error);
        CHECK_THROWS_AS(s.player.pause(), state_error);
        CHECK_THROWS_AS(s.player.resume(), state_error);
        CHECK_THROWS_AS(s.player.seek(0), state_error);
        CHECK_NOTHROW(s.player.stop());

        s.player.load(make_test_track("a", 100000));
        CHECK_THROWS_AS(s.player.resume(), state_error);
        s.player.play();
        CHECK_THROWS_AS(s.player.play(), state_error);
        CHECK_THROWS_AS(s.player.resume(), state_error);
        s.player.pause();
        CHECK_THROWS_AS(s.player.pause(), state_error);
        CHECK(s.player.state() == transport_state::paused);
    }

    TEST_CASE("a track plays to its end and stops with the track still loaded") {
        session s;
        s.player.load(make_test_track("a", 5000));
        CHECK(s.player.current_track() == std::optional<std::string>("a"));
        REQUIRE(s.player.duration_frames().has_value());
        CHECK(*s.player.duration_frames() == 5000);

        s.player.play();
        CHECK(s.player.state() == transport_state::playing);
        CHECK_FALSE(s.stream().is_paused());

        REQUIRE(s.run_until(transport_event::kind::track_ended));
        CHECK(s.player.state() == transport_state::stopped);
        CHECK(s.stream().is_paused());
        CHECK(s.player.position() == 5000);
        CHECK(s.player.current_track() == std::optional<std::string>("a"));

        const auto frames = heard_frames(s.heard);
        REQUIRE_FALSE(frames.empty());
        CHECK(frames.front() == 1);
        CHECK(frames.back() == 4999);
        CHECK(strictly_consecutive(frames));
    }

    TEST_CASE("play after the end restarts the track") {
        session s;
        s.player.load(make_test_track("a", 3000));
        s.player.play();
        REQUIRE(s.run_until(transport_event::kind::track_ended));

        REQUIRE(s.player.state() == transport_state::stopped);
        s.events.clear();
        s.heard.clear();
        s.player.play();
        CHECK(s.player.state() == transport_state::playing);

        REQUIRE(s.run_until(transport_event::kind::track_ended));
        const auto frames = heard_frames(s.heard);
        REQUIRE_FALSE(frames.empty());
        CHECK(frames.front() == 1);
        CHECK(frames.back() == 2999);
        CHECK(strictly_consecutive(frames));
    }

    TEST_CASE("a finished track is stopped until played again or released") {
        session s;
        s.player.load(make_test_track("a", 3000));
        s.player.play();
        REQUIRE(s.run_until(transport_event::kind::track_ended));

        CHECK_THROWS_AS(s.player.seek(2000), state_error);
        CHECK_THROWS_AS(s.player.resume(), state_error);
        CHECK(s.player.state() == transport_state::stopped);

        s.player.stop();
        CHECK_FALSE(s.player.current_track().has_value());
        CHECK_THROWS_AS(s.player.play(), state_error);
    }

    TEST_CASE("a track that finishes while paused ends on resume") {
        session s;
        s.player.load(make_test_track("a", 1000));
        s.player.play();
        REQUIRE(s.play_out_quietly(999));

        s.player.pause();
        CHECK(s.player.process_events().empty());
        CHECK(s.player.state() == transport_state::paused);

        s.player.resume();
        CHECK(s.player.state() == transport_state::stopped);
        CHECK(s.stream().is_paused());
        const auto events = s.player.process_events();
        REQUIRE(events.size() == 1);
        CHECK(events[0].type == transport_event::kind::track_ended);
        CHECK(events[0].message == "a");

        s.heard.clear();
        s.events.clear();
        s.player.play();
        REQUIRE(s.run_until(transport_event::kind::track_ended));
        CHECK(heard_frames(s.heard).back() == 999);
    }

    TEST_CASE("a track that finishes while paused repeats on resume") {
        session s(session_config(track_end_policy::repeat));
        s.player.load(make_test_track("loop", 1000));
        s.player.play();
        REQUIRE(s.play_out_quietly(999));

        s.player.pause();
        CHECK(s.player.process_events().empty());
        s.player.resume();
        CHECK(s.player.state() == transport_state::playing);
        CHECK_FALSE(s.stream().is_paused());

        s.heard.clear();
        s.events.clear();
        REQUIRE(s.run_until(transport_event::kind::track_repeated));
        CHECK(s.seen(transport_event::kind::track_ended));
    }

    TEST_CASE("a device that refuses to start leaves the track ready to play") {
        session s;
        s.player.load(make_test_track("a", 3000));
        s.stream().fail_resume = true;
        CHECK_THROWS_AS(s.player.play(), device_error);
        CHECK(s.player.state() == transport_state::stopped);
        CHECK(s.player.current_track() == std::optional<std::string>("a"));

        s.stream().fail_resume = false;
        CHECK_NOTHROW(s.player.play());
        CHECK(s.player.state() == transport_state::playing);
        REQUIRE(s.run_until(transport_event::kind::track_ended));
        const auto frames = heard_frames(s.heard);
        REQUIRE_FALSE(frames.empty());
        CHECK(frames.front() == 1);
        CHECK(frames.back() == 2999);
        CHECK(strictly_consecutive(frames));
    }

    TEST_CASE("a device that refuses to resume stays paused") {
        session s;
        s.player.load(make_test_track("a", 100000));
        s.player.play();
        s.pump(512);
        s.player.pause();

        s.stream().fail_resume = true;
        CHECK_THROWS_AS(s.player.resume(), device_error);
        CHECK(s.player.state() == transport_state::paused);

        s.stream().fail_resume = false;
        CHECK_NOTHROW(s.player.resume());
        CHECK(s.player.state() == transport_state::playing);
        CHECK_FALSE(s.stream().is_paused());
    }

    TEST_CASE("pause holds the position and resume continues") {
        session s;
        s.player.load(make_test_track("a", 200000));
        s.player.play();
        s.pump(1000);

        s.player.pause();
        CHECK(s.stream().is_paused());
        s.settle();
        const auto pos = s.player.position();
        s.pump(1000);
        s.settle();
        CHECK(s.player.position() == pos);

        s.player.resume();
        CHECK(s.player.state() == transport_state::playing);
        for (int i = 0; i < 40; i++) {
            s.pump(256);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        const auto frames = heard_frames(s.heard);
        CHECK(strictly_consecutive(frames));
        CHECK(frames.back() > 1000);
    }

    TEST_CASE("stop releases the track") {
        session s;
        s.player.load(make_test_track("a", 100000));
        s.player.play();
        s.pump(512);

        s.player.stop();
        CHECK(s.player.state() == transport_state::stopped);
        CHECK_FALSE(s.player.current_track().has_value());
        CHECK(s.player.position() == 0);
        CHECK(s.stream().is_paused());
        CHECK_THROWS_AS(s.player.play(), state_error);

        s.player.load(make_test_track("b", 1000));
        CHECK_NOTHROW(s.player.play());
    }

    TEST_CASE("loading while playing replaces the track") {
        session s;
        s.player.load(make_test_track("a", 100000));
        s.player.play();
        s.player.load(make_test_track("b", 1000));
        CHECK(s.player.state() == transport_state::stopped);
        CHECK(s.player.current_track() == std::optional<std::string>("b"));
        CHECK(*s.player.duration_frames() == 1000);
    }

    TEST_CASE("seek while playing never plays stale audio") {
        session s;
        s.player.load(make_test_track("a", 500000));
        s.player.play();
        s.pump(512);

        CHECK(s.player.seek(300000) == 300000);
        CHECK(s.player.position() == 300000);
        CHECK(s.player.state() == transport_state::playing);

        s.heard.clear();
        for (int i = 0; i < 40; i++) {
            s.pump(256);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        const auto frames = heard_frames(s.heard);
        REQUIRE_FALSE(frames.empty());
        CHECK(frames.front() == 300000);
        CHECK(strictly_consecutive(frames));
    }

    TEST_CASE("seek targets are clamped") {
        session s;
        s.player.load(make_test_track("a", 100000));
        s.player.play();
        s.player.pause();
        s.settle();

        CHECK(s.player.seek(10000000) == 100000);
        CHECK(s.player.seek_time(std::chrono::milliseconds(500)) == 22050);
        CHECK(s.player.position_time().count() == 500);
        CHECK(s.player.seek_time(std::chrono::milliseconds(-5)) == 0);
        CHECK(s.player.state() == transport_state::paused);
    }

    TEST_CASE("skip moves relative to the current position") {
        session s;
        s.player.load(make_test_track("a", 441000));
        s.player.play();
        s.player.pause();
        s.settle();

        s.player.seek(88200);
        CHECK(s.player.skip(std::chrono::milliseconds(1000)) == 132300);
        CHECK(s.player.skip(std::chrono::milliseconds(-2000)) == 44100);
        CHECK(s.player.skip(std::chrono::milliseconds(-60000)) == 0);
        CHECK(s.player.skip(std::chrono::milliseconds(60000000)) == 441000);
    }

    TEST_CASE("seeking or skipping to the end of a WAV track finishes it") {
        auto registry = create_registry_with_all_codecs();
        auto wav = make_wav_pcm16(44100, 2, 44100, [](frame_index_t, channels_t) {
            return static_cast<int16_t>(8192);
        });
        session s;
        s.player.load(std::make_unique<track>("wav", std::make_unique<memory_io_stream>(wav), *registry));
        REQUIRE(s.player.duration_frames() == std::optional<frame_index_t>(44100));
        s.player.play();
        s.player.pause();
        s.settle();

        CHECK(s.player.seek(44100) == 44100);
        CHECK(s.player.seek(20000) == 20000);
        CHECK(s.player.skip(std::chrono::milliseconds(15000)) == 44100);
        CHECK(s.player.position() == 44100);
        CHECK(s.player.state() == transport_state::paused);

        s.player.resume();
        REQUIRE(s.run_until(transport_event::kind::track_ended));
        CHECK(s.player.state() == transport_state::stopped);
        CHECK_FALSE(s.seen(transport_event::kind::error));
    }

    TEST_CASE("repeat policy starts the track over") {
        session s(session_config(track_end_policy::repeat));
        s.player.load(make_test_track("loop", 3000));
        s.player.play();

        REQUIRE(s.run_until(transport_event::kind::track_repeated));
        CHECK(s.seen(transport_event::kind::track_ended));
        CHECK(s.player.state() == transport_state::playing);
        CHECK(s.player.current_track() == std::optional<std::string>("loop"));

        s.heard.clear();
        s.events.clear();
        REQUIRE(s.run_until(transport_event::kind::track_repeated));
        const auto frames = heard_frames(s.heard);
        CHECK(frames.front() == 1);
        CHECK(frames.back() == 2999);
    }

    TEST_CASE("advance policy asks for the next track") {
        session s(session_config(track_end_policy::advance));
        int asked = 0;
        s.player.set_next_track_provider([&asked]() -> std::unique_ptr<track> {
            if (asked++ == 0) {
                return make_test_track("second", 2000);
            }
            return nullptr;
        });
        s.player.load(make_test_track("first", 2000));
        s.player.play();

        REQUIRE(s.run_until(transport_event::kind::track_changed));
        CHECK(s.player.current_track() == std::optional<std::string>("second"));
        CHECK(s.player.state() == transport_state::playing);

        REQUIRE(s.run_until(transport_event::kind::stopped));
        CHECK(s.player.state() == transport_state::stopped);
        CHECK_FALSE(s.player.current_track().has_value());
        CHECK(asked == 2);
    }

    TEST_CASE("advance without a provider stops") {
        session s(session_config(track_end_policy::advance));
        s.player.load(make_test_track("only", 1000));
        s.player.play();
        REQUIRE(s.run_until(transport_event::kind::stopped));
        CHECK(s.player.state() == transport_state::stopped);
    }

    TEST_CASE("decoder failure stops playback with an error") {
        session s;
        auto dec = std::make_unique<test_decoder>(100000, test_decoder::pattern::ramp);
        dec->fail_at_frame(2000);
        s.player.load(make_test_track("broken", std::move(dec)));
        s.player.play();

        REQUIRE(s.run_until(transport_event::kind::error));
        CHECK(s.player.state() == transport_state::stopped);
        CHECK(s.player.last_error().find("broken") != std::string::npos);
        CHECK(s.stream().is_paused());

        s.player.load(make_test_track("good", 1000));
        CHECK(s.player.last_error().empty());
    }

    TEST_CASE("losing the device stops playback") {
        session s;
        s.player.load(make_test_track("a", 100000));
        s.player.play();
        s.backend->device_lost = true;

        const auto events = s.player.process_events();
        REQUIRE(events.size() == 1);
        CHECK(events[0].type == transport_event::kind::error);
        CHECK(s.player.state() == transport_state::stopped);
        CHECK(s.player.last_error() == "output device lost");
    }

    TEST_CASE("parameter commands publish clamped snapshots") {
        session s;
        const auto v0 = s.player.parameters()->version;

        s.player.set_volume(2.0f);
        CHECK(s.player.parameters()->volume == 1.0f);
        s.player.set_muted(true);
        CHECK(s.player.parameters()->muted);
        s.player.set_speed(0.1f);
        CHECK(s.player.parameters()->speed == k_min_speed);

        s.player.set_band_gain(0, 30.0f);
        CHECK(s.player.parameters()->band_gains_db[0] == k_max_band_gain_db);
        CHECK_THROWS_AS(s.player.set_band_gain(10, 1.0f), std::out_of_range);
        CHECK_THROWS_AS(s.player.set_band_gains({1.0f}), std::invalid_argument);

        s.player.set_equalizer_preset(eq_preset::bass_boost);
        CHECK(s.player.parameters()->band_gains_db[0] > 0.0f);
        CHECK(s.player.parameters()->band_gains_db[9] == 0.0f);

        CHECK(s.player.parameters()->version > v0);
        CHECK(s.player.stats().params_version == s.player.parameters()->version);
    }

    TEST_CASE("fades use the configured duration unless told otherwise") {
        session s;
        s.player.fade(fade_direction::out);
        auto p = s.player.parameters();
        CHECK(p->fade.direction == fade_direction::out);
        CHECK(p->fade.duration_frames == 4410);

        s.player.fade(fade_direction::in, std::chrono::milliseconds(1000), fade_curve::cubic);
        p = s.player.parameters();
        CHECK(p->fade.direction == fade_direction::in);
        CHECK(p->fade.duration_frames == 44100);
        CHECK(p->fade.curve == fade_curve::cubic);

        s.player.load(make_test_track("a", 100000));
        s.player.play(true);
        p = s.player.parameters();
        CHECK(p->fade.direction == fade_direction::in);
        CHECK(p->fade.duration_frames == 4410);
    }

    TEST_CASE("visualization can be switched off") {
        session s;
        s.player.load(make_test_track("a", 100000, test_decoder::pattern::sine_440hz));
        s.player.play();
        for (int i = 0; i < 20; i++) {
            s.pump(256);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        CHECK(s.player.is_visualization_enabled());
        CHECK_FALSE(s.player.visualization().empty());
        CHECK(s.player.levels().size() == 2);

        s.player.pause();
        s.settle();
        s.player.set_visualization_enabled(false);
        CHECK_FALSE(s.player.is_visualization_enabled());
        CHECK(s.player.visualization().empty());
        CHECK(s.player.levels().empty());
    }
}
