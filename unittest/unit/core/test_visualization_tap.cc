#include <doctest/doctest.h>
#include <audiopipe/visualization_tap.hh>

#include <cmath>

using namespace audiopipe;

namespace {
    pcm_block filled(std::size_t frames, channels_t ch, float value, frame_index_t pos) {
        pcm_block b(frames, ch, 48000);
        b.set_frames(frames);
        for (std::size_t i = 0; i < b.samples(); i++) {
            b.data()[i] = value;
        }
        b.set_source_position(pos);
        return b;
    }
}

TEST_SUITE("Core::VisualizationTap") {
    TEST_CASE("rejects empty geometry") {
        CHECK_THROWS_AS(visualization_tap(0, 16, 2), std::invalid_argument);
        CHECK_THROWS_AS(visualization_tap(4, 0, 2), std::invalid_argument);
        CHECK_THROWS_AS(visualization_tap(4, 16, 0), std::invalid_argument);
    }

    TEST_CASE("empty tap gives an empty snapshot") {
        visualization_tap tap(4, 16, 2);
        auto snap = tap.snapshot();
        CHECK(snap.empty());
        CHECK(snap.blocks == 0);
        CHECK(snap.channels == 2);
        CHECK(compute_levels(snap).empty());
    }

    TEST_CASE("keeps the newest blocks, oldest first") {
        visualization_tap tap(3, 4, 1);
        for (int i = 1; i <= 5; i++) {
            CHECK(tap.push(filled(4, 1, static_cast<float>(i), static_cast<frame_index_t>(i * 4))));
        }
        auto snap = tap.snapshot();
        REQUIRE(snap.blocks == 3);
        REQUIRE(snap.frames() == 12);
        CHECK(snap.samples[0] == 3.0f);
        CHECK(snap.samples[4] == 4.0f);
        CHECK(snap.samples[8] == 5.0f);
        CHECK(snap.position == 20);
        CHECK(snap.rate == 48000);
        CHECK(tap.dropped_blocks() == 0);
    }

    TEST_CASE("oversized blocks are truncated to the slot size") {
        visualization_tap tap(2, 8, 2);
        tap.push(filled(32, 2, 0.5f, 0));
        CHECK(tap.snapshot().frames() == 8);
    }

    TEST_CASE("disabled tap ignores blocks") {
        visualization_tap tap(2, 8, 1);
        tap.set_enabled(false);
        CHECK_FALSE(tap.is_enabled());
        CHECK_FALSE(tap.push(filled(8, 1, 1.0f, 0)));
        CHECK(tap.snapshot().empty());

        tap.set_enabled(true);
        CHECK(tap.push(filled(8, 1, 1.0f, 0)));
        CHECK(tap.snapshot().blocks == 1);
    }

    TEST_CASE("clear empties every slot") {
        visualization_tap tap(2, 8, 1);
        tap.push(filled(8, 1, 1.0f, 0));
        tap.clear();
        CHECK(tap.snapshot().empty());
    }

    TEST_CASE("levels report peak and RMS per channel") {
        visualization_snapshot snap;
        snap.channels = 2;
        // Left: square wave of 0.5, right: silence with one spike
        for (int f = 0; f < 100; f++) {
            snap.samples.push_back(f % 2 ? 0.5f : -0.5f);
            snap.samples.push_back(f == 10 ? 0.8f : 0.0f);
        }
        auto lv = compute_levels(snap);
        REQUIRE(lv.size() == 2);
        CHECK(lv[0].peak == doctest::Approx(0.5f));
        CHECK(lv[0].rms == doctest::Approx(0.5f));
        CHECK(lv[1].peak == doctest::Approx(0.8f));
        CHECK(lv[1].rms == doctest::Approx(0.8f / std::sqrt(100.0f)));
    }
}
