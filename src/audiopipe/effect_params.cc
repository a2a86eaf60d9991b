#include <audiopipe/effect_params.hh>
#include <audiopipe/error.hh>

#include <algorithm>
#include <cmath>

namespace audiopipe {

    namespace {
        constexpr float k_preset_boost_db = 6.0f;
        constexpr float k_bass_limit_hz = 250.0f;
        constexpr float k_treble_limit_hz = 4000.0f;

        float clamp_finite(float v, float lo, float hi, float fallback) {
            if (!std::isfinite(v)) {
                return fallback;
            }
            return std::clamp(v, lo, hi);
        }
    }

    std::vector<float> preset_band_gains(eq_preset preset, const std::vector<float>& centres_hz) {
        std::vector<float> gains(centres_hz.size(), 0.0f);
        for (std::size_t i = 0; i < centres_hz.size(); ++i) {
            switch (preset) {
                case eq_preset::flat:
                    break;
                case eq_preset::bass_boost:
                    if (centres_hz[i] < k_bass_limit_hz) {
                        gains[i] = k_preset_boost_db;
                    }
                    break;
                case eq_preset::treble_boost:
                    if (centres_hz[i] >= k_treble_limit_hz) {
                        gains[i] = k_preset_boost_db;
                    }
                    break;
            }
        }
        return gains;
    }

    eq_preset eq_preset_from_string(const std::string& name) {
        if (name == "normal" || name == "flat") {
            return eq_preset::flat;
        }
        if (name == "bass_boost") {
            return eq_preset::bass_boost;
        }
        if (name == "treble_boost") {
            return eq_preset::treble_boost;
        }
        throw config_error("unknown equalizer preset: " + name);
    }

    effect_params clamp_params(effect_params params) {
        params.volume = clamp_finite(params.volume, k_min_volume, k_max_volume, 1.0f);
        for (auto& g : params.band_gains_db) {
            g = clamp_finite(g, k_min_band_gain_db, k_max_band_gain_db, 0.0f);
        }
        params.speed = clamp_finite(params.speed, k_min_speed, k_max_speed, 1.0f);
        params.fade.progress = clamp_finite(params.fade.progress, 0.0f, 1.0f, 0.0f);
        return params;
    }

} // namespace audiopipe
