/**
 * @file effect_params.hh
 * @brief Snapshot of every user-controlled effect parameter
 */

#ifndef AUDIOPIPE_EFFECT_PARAMS_HH
#define AUDIOPIPE_EFFECT_PARAMS_HH

#include <audiopipe/sdk/types.hh>
#include <audiopipe/export_audiopipe.h>

#include <cstdint>
#include <string>
#include <vector>

namespace audiopipe {

    enum class fade_direction {
        none,   ///< no envelope, multiplier 1
        in,     ///< 0 to 1
        out     ///< 1 to 0, then silent until re-armed
    };

    enum class fade_curve {
        linear,
        cubic
    };

    /**
     * @brief Fade request carried inside a snapshot
     *
     * The fade stage arms a new envelope only when @ref serial differs from
     * the serial it last applied. Republishing a snapshot for an unrelated
     * change (volume, EQ) therefore never restarts a running fade.
     */
    struct fade_command {
        fade_direction direction = fade_direction::none;
        float progress = 0.0f;              ///< starting point in [0,1]
        frame_index_t duration_frames = 0;
        fade_curve curve = fade_curve::linear;
        uint32_t serial = 0;
    };

    /// Limits enforced when a snapshot is published
    inline constexpr float k_min_volume = 0.0f;
    inline constexpr float k_max_volume = 1.0f;
    inline constexpr float k_min_band_gain_db = -24.0f;
    inline constexpr float k_max_band_gain_db = 24.0f;
    inline constexpr float k_min_speed = 0.25f;
    inline constexpr float k_max_speed = 4.0f;

    /**
     * @struct effect_params
     * @brief Immutable parameter set observed by the pipeline once per block
     *
     * Instances are published through the parameter_bus and never modified
     * afterwards. @ref version increases with every publish.
     */
    struct effect_params {
        uint64_t version = 0;
        float volume = 1.0f;
        bool muted = false;
        std::vector<float> band_gains_db;
        float speed = 1.0f;
        fade_command fade;
    };

    /**
     * @brief Equalizer presets of the desktop player
     */
    enum class eq_preset {
        flat,           ///< "Normal"
        bass_boost,
        treble_boost
    };

    /**
     * @brief Band gains for @p preset on the given band centres
     *
     * Bass boost raises bands below 250 Hz by 6 dB, treble boost raises
     * bands from 4 kHz up by 6 dB.
     */
    AUDIOPIPE_EXPORT std::vector<float> preset_band_gains(eq_preset preset, const std::vector<float>& centres_hz);

    /**
     * @brief Parse "normal"/"flat", "bass_boost" or "treble_boost"
     * @throws config_error for unknown names
     */
    AUDIOPIPE_EXPORT eq_preset eq_preset_from_string(const std::string& name);

    /**
     * @brief Copy of @p params with every value forced into its legal range
     *
     * Non-finite values fall back to the neutral setting.
     */
    AUDIOPIPE_EXPORT effect_params clamp_params(effect_params params);

} // namespace audiopipe

#endif // AUDIOPIPE_EFFECT_PARAMS_HH
