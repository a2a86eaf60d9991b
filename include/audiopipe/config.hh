/**
 * @file config.hh
 * @brief Static configuration of a playback session
 */

#ifndef AUDIOPIPE_CONFIG_HH
#define AUDIOPIPE_CONFIG_HH

#include <audiopipe/sdk/audio_format.hh>
#include <audiopipe/sdk/types.hh>
#include <audiopipe/export_audiopipe.h>

#include <chrono>
#include <string>
#include <vector>

namespace audiopipe {

    /**
     * @brief What the transport does when a track plays to its end
     */
    enum class track_end_policy {
        stop,       ///< stop and stay on the finished track
        repeat,     ///< seek to the start and keep playing
        advance     ///< load the next track from the next_track_provider
    };

    /**
     * @brief Parse "stop", "repeat" or "advance"
     * @throws config_error for unknown names
     */
    AUDIOPIPE_EXPORT track_end_policy track_end_policy_from_string(const std::string& name);

    /**
     * @struct pipeline_config
     * @brief Everything fixed for the lifetime of a transport
     *
     * The defaults match the desktop player: CD rate stereo float output,
     * ten octave bands, two second fades and fifteen second skips.
     *
     * @code
     * pipeline_config cfg;
     * cfg.ring_latency = std::chrono::milliseconds(100);
     * cfg = config_from_environment(cfg);
     * cfg.validate();
     * @endcode
     */
    struct AUDIOPIPE_EXPORT pipeline_config {
        sample_rate_t sample_rate = 44100;
        channels_t channels = 2;
        std::size_t block_frames = 1024;

        /// Output ring buffer size expressed as playback time
        std::chrono::milliseconds ring_latency{200};
        /// Longest single wait of the producer on a full ring buffer
        std::chrono::milliseconds write_timeout{50};

        std::size_t visualization_blocks = 8;

        std::vector<float> band_centres_hz;     ///< empty selects the ISO octave bands
        double eq_q = 1.41;

        int resampler_quality = 5;

        /// Backend device identifier, empty for the default device
        std::string device_id;
        audio_format device_format = audio_format::f32le;

        std::chrono::milliseconds fade_duration{2000};
        std::chrono::milliseconds skip_step{15000};

        track_end_policy end_policy = track_end_policy::stop;

        /**
         * @throws config_error on any out-of-range value
         */
        void validate() const;

        /// Ring buffer capacity in frames, never less than two blocks
        [[nodiscard]] std::size_t ring_capacity_frames() const;

        [[nodiscard]] frame_index_t fade_frames() const;
        [[nodiscard]] frame_index_t skip_frames() const;

        /// Band centres with the default layout filled in
        [[nodiscard]] std::vector<float> effective_band_centres() const;

        /// Format requested from the output device
        [[nodiscard]] audio_spec device_spec() const;
    };

    /**
     * @brief Apply AUDIOPIPE_* environment overrides to @p base
     *
     * Recognised variables: AUDIOPIPE_SAMPLE_RATE, AUDIOPIPE_CHANNELS,
     * AUDIOPIPE_BLOCK_FRAMES, AUDIOPIPE_LATENCY_MS, AUDIOPIPE_WRITE_TIMEOUT_MS,
     * AUDIOPIPE_VIS_BLOCKS, AUDIOPIPE_RESAMPLER_QUALITY, AUDIOPIPE_DEVICE,
     * AUDIOPIPE_DEVICE_FORMAT, AUDIOPIPE_FADE_MS, AUDIOPIPE_SKIP_MS and
     * AUDIOPIPE_END_POLICY.
     *
     * @throws config_error if a variable is set but cannot be parsed
     */
    AUDIOPIPE_EXPORT pipeline_config config_from_environment(pipeline_config base = {});

} // namespace audiopipe

#endif // AUDIOPIPE_CONFIG_HH
