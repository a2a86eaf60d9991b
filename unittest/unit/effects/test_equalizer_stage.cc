#include <doctest/doctest.h>
#include <audiopipe/effects/equalizer_stage.hh>
#include <audiopipe/error.hh>

#include <cmath>
#include <vector>

using namespace audiopipe;

namespace {
    constexpr double k_two_pi = 6.283185307179586;

    std::vector<float> sine(double hz, sample_rate_t rate, std::size_t frames, channels_t ch) {
        std::vector<float> v(frames * ch);
        for (std::size_t f = 0; f < frames; f++) {
            const auto s = static_cast<float>(0.25 * std::sin(k_two_pi * hz * static_cast<double>(f) / rate));
            for (channels_t c = 0; c < ch; c++) {
                v[f * ch + c] = s;
            }
        }
        return v;
    }

    // Feeds @p input through @p eq in blocks of @p block frames
    std::vector<float> run(equalizer_stage& eq, const std::vector<float>& input, channels_t ch,
                           std::size_t block, const effect_params& p, bool reset_each_block = false) {
        std::vector<float> out;
        pcm_block b(block, ch, 44100);
        const std::size_t total = input.size() / ch;
        for (std::size_t pos = 0; pos < total; pos += block) {
            const auto n = std::min(block, total - pos);
            b.set_frames(n);
            std::copy_n(input.data() + pos * ch, n * ch, b.data());
            if (reset_each_block) {
                eq.reset();
            }
            eq.process(b, p);
            out.insert(out.end(), b.data(), b.data() + n * ch);
        }
        return out;
    }

    effect_params boosted(std::size_t band, float db) {
        effect_params p;
        p.band_gains_db.assign(default_band_centres().size(), 0.0f);
        p.band_gains_db[band] = db;
        return p;
    }

    float peak(const std::vector<float>& v, std::size_t from) {
        float m = 0.0f;
        for (std::size_t i = from; i < v.size(); i++) {
            m = std::max(m, std::fabs(v[i]));
        }
        return m;
    }
}

TEST_SUITE("Effects::Equalizer") {
    TEST_CASE("default layout is ten octave bands") {
        const auto& c = default_band_centres();
        REQUIRE(c.size() == 10);
        CHECK(c.front() == 31.25f);
        CHECK(c.back() == 16000.0f);
        equalizer_stage eq(44100, 2);
        CHECK(eq.bands() == 10);
    }

    TEST_CASE("invalid construction is a config error") {
        CHECK_THROWS_AS(equalizer_stage(0, 2), config_error);
        CHECK_THROWS_AS(equalizer_stage(44100, 0), config_error);
        CHECK_THROWS_AS(equalizer_stage(44100, 2, {100.0f, -1.0f}), config_error);
        CHECK_THROWS_AS(equalizer_stage(44100, 2, default_band_centres(), 0.0), config_error);
    }

    TEST_CASE("flat gains pass audio through unchanged") {
        equalizer_stage eq(44100, 2);
        const auto in = sine(440.0, 44100, 2048, 2);
        const auto out = run(eq, in, 2, 256, boosted(0, 0.0f));
        REQUIRE(out.size() == in.size());
        for (std::size_t i = 0; i < in.size(); i++) {
            CHECK(out[i] == in[i]);
        }
    }

    TEST_CASE("filter state carries across block boundaries") {
        const auto in = sine(1000.0, 44100, 8192, 2);
        const auto p = boosted(5, 9.0f);

        equalizer_stage whole(44100, 2);
        equalizer_stage blocked(44100, 2);
        const auto ref = run(whole, in, 2, 8192, p);
        const auto out = run(blocked, in, 2, 333, p);

        REQUIRE(ref.size() == out.size());
        for (std::size_t i = 0; i < ref.size(); i++) {
            CHECK(out[i] == doctest::Approx(ref[i]).epsilon(1e-6));
        }
    }

    TEST_CASE("resetting every block produces a different signal") {
        const auto in = sine(1000.0, 44100, 4096, 1);
        const auto p = boosted(5, 9.0f);
        equalizer_stage a(44100, 1);
        equalizer_stage b(44100, 1);
        const auto good = run(a, in, 1, 512, p);
        const auto bad = run(b, in, 1, 512, p, true);

        float max_diff = 0.0f;
        for (std::size_t i = 0; i < good.size(); i++) {
            max_diff = std::max(max_diff, std::fabs(good[i] - bad[i]));
        }
        CHECK(max_diff > 1e-3f);
    }

    TEST_CASE("boost at the centre frequency matches the requested gain") {
        equalizer_stage eq(44100, 1);
        const auto in = sine(1000.0, 44100, 44100, 1);
        const auto out = run(eq, in, 1, 1024, boosted(5, 6.0f));

        // Skip the attack, measure the steady state
        const float ratio = peak(out, 22050) / peak(in, 22050);
        CHECK(ratio == doctest::Approx(std::pow(10.0, 6.0 / 20.0)).epsilon(0.03));
    }

    TEST_CASE("gain change lands on the next block and keeps the history") {
        equalizer_stage eq(44100, 1);
        const auto in = sine(1000.0, 44100, 2048, 1);
        run(eq, in, 1, 1024, boosted(5, 3.0f));
        CHECK(eq.applied_gains()[5] == 3.0f);

        const auto next = run(eq, in, 1, 1024, boosted(5, -3.0f));
        CHECK(eq.applied_gains()[5] == -3.0f);

        // No reset: the new block starts from the carried delay line, so it
        // differs from a fresh filter with the same settings
        equalizer_stage fresh(44100, 1);
        const auto cold = run(fresh, in, 1, 1024, boosted(5, -3.0f));
        CHECK(next[0] != cold[0]);
        for (float v : next) {
            CHECK(std::isfinite(v));
        }
    }

    TEST_CASE("bands at or above Nyquist are bypassed") {
        equalizer_stage eq(22050, 1);
        const auto in = sine(440.0, 22050, 1024, 1);
        const auto out = run(eq, in, 1, 256, boosted(9, 12.0f));
        for (std::size_t i = 0; i < in.size(); i++) {
            CHECK(out[i] == in[i]);
        }
    }
}
