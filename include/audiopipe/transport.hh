/**
 * @file transport.hh
 * @brief Playback session: transport state machine and UI-facing handle
 */

#ifndef AUDIOPIPE_TRANSPORT_HH
#define AUDIOPIPE_TRANSPORT_HH

#include <audiopipe/config.hh>
#include <audiopipe/decoder_adapter.hh>
#include <audiopipe/device_sink.hh>
#include <audiopipe/effect_params.hh>
#include <audiopipe/visualization_tap.hh>
#include <audiopipe/sdk/audio_backend.hh>
#include <audiopipe/export_audiopipe.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace audiopipe {

    enum class transport_state {
        stopped,
        playing,
        paused,
        seeking,
        track_ended
    };

    AUDIOPIPE_EXPORT const char* to_string(transport_state s) noexcept;

    /**
     * @struct transport_event
     * @brief Outcome of process_events() for display
     */
    struct transport_event {
        enum class kind {
            track_ended,    ///< the current track played to its end
            track_repeated, ///< restarted by the repeat policy
            track_changed,  ///< the next track was loaded and started
            stopped,        ///< playback stopped at the end of the list
            error           ///< decode or device failure, playback stopped
        };

        kind type;
        std::string message;
    };

    /**
     * @struct transport_stats
     * @brief Counters gathered from every component of the session
     */
    struct transport_stats {
        std::size_t ring_frames = 0;
        std::size_t ring_capacity = 0;
        uint64_t underruns = 0;
        uint64_t blocks_processed = 0;
        uint64_t visualization_dropped = 0;
        uint64_t params_version = 0;
        sink_stats sink;
    };

    /**
     * @brief Supplies the next track for the advance policy; nullptr ends playback
     */
    using next_track_provider = std::function<std::unique_ptr<track>()>;

    /**
     * @class transport
     * @brief Owns one playback session
     *
     * A transport owns its parameter bus, output ring buffer, visualization
     * tap, processing pipeline and device sink. There is no global player
     * state; several transports may coexist on different devices.
     *
     * ## States
     *
     * | from                | command / event   | to                  |
     * |---------------------|-------------------|---------------------|
     * | stopped             | play              | playing             |
     * | playing             | pause             | paused              |
     * | paused              | resume            | playing             |
     * | playing, paused     | seek              | seeking, then back  |
     * | playing             | track ends        | track_ended         |
     * | track_ended         | end policy        | stopped or playing  |
     * | track_ended         | play, seek        | playing             |
     * | any                 | stop              | stopped             |
     *
     * track_ended is passed through while process_events() applies the
     * track_end_policy. With the stop policy the finished track stays loaded
     * and play() starts it again from the top. A track that finishes while
     * paused ends when resume() is called.
     *
     * Commands that do not apply to the current state throw state_error.
     * load() is accepted in every state and leaves the transport stopped.
     * When the device refuses to start, play() and resume() throw
     * device_error and leave the transport stopped or paused with the track
     * still loaded.
     *
     * ## Threading
     *
     * Every method is called from one control (UI) thread. The producer
     * thread and the device callback never call back into the transport;
     * they report through queued events which process_events() turns into
     * transitions.
     *
     * @code
     * transport t(config, create_sdl3_backend());
     * t.load(std::make_unique<track>("song", std::move(stream), registry));
     * t.play(true);
     * while (running) {
     *     for (const auto& ev : t.process_events()) { ... }
     *     draw(t.position_time(), t.levels());
     * }
     * @endcode
     */
    class AUDIOPIPE_EXPORT transport {
        public:
            /**
             * @throws config_error if @p config does not validate
             * @throws device_error if the output device cannot be opened
             */
            transport(const pipeline_config& config, std::shared_ptr<audio_backend> backend);
            ~transport();

            transport(const transport&) = delete;
            transport& operator=(const transport&) = delete;

            /**
             * @brief Stop whatever plays and install @p trk as the current track
             * @throws decoder_error if the track cannot be adapted to the pipeline format
             */
            void load(std::unique_ptr<track> trk);

            /**
             * @brief Start the loaded track, or restart a finished one from the top
             * @param fade_in Ramp up over the configured fade duration
             * @throws state_error when nothing is loaded or already playing/paused
             * @throws device_error if the output device does not start
             */
            void play(bool fade_in = false);

            void pause();
            void resume();

            /**
             * @brief Stop playback and release the current track
             *
             * Calling stop() while stopped does nothing.
             */
            void stop();

            /**
             * @brief Jump to @p frame (pipeline rate), clamped to the track length
             * @return Frame reached
             * @throws state_error unless playing, paused or track_ended
             */
            frame_index_t seek(frame_index_t frame);

            frame_index_t seek_time(std::chrono::milliseconds t);

            /**
             * @brief Relative seek, clamped to [0, duration]
             *
             * The desktop player binds this to +/- the configured skip step.
             */
            frame_index_t skip(std::chrono::milliseconds delta);

            void set_volume(float volume);
            void set_muted(bool muted);
            void set_band_gain(std::size_t band, float gain_db);
            void set_band_gains(const std::vector<float>& gains_db);
            void set_equalizer_preset(eq_preset preset);
            void set_speed(float speed);

            /**
             * @brief Start a fade envelope at the next block boundary
             * @param duration Envelope length; the configured default when empty
             */
            void fade(fade_direction direction,
                      std::optional<std::chrono::milliseconds> duration = std::nullopt,
                      fade_curve curve = fade_curve::linear);

            void set_visualization_enabled(bool enabled);
            [[nodiscard]] bool is_visualization_enabled() const;

            void set_next_track_provider(next_track_provider provider);

            /**
             * @brief Apply queued pipeline events and device health
             *
             * Must be called periodically from the control thread. Track ends
             * are resolved through the configured track_end_policy.
             */
            std::vector<transport_event> process_events();

            [[nodiscard]] transport_state state() const noexcept;
            [[nodiscard]] frame_index_t position() const noexcept;
            [[nodiscard]] std::chrono::milliseconds position_time() const noexcept;
            [[nodiscard]] std::optional<frame_index_t> duration_frames() const;
            [[nodiscard]] std::optional<std::string> current_track() const;

            [[nodiscard]] visualization_snapshot visualization() const;
            [[nodiscard]] std::vector<channel_levels> levels() const;

            [[nodiscard]] std::shared_ptr<const effect_params> parameters() const;
            [[nodiscard]] transport_stats stats() const;

            /// Description of the last decode or device failure, empty if none
            [[nodiscard]] const std::string& last_error() const noexcept;

            [[nodiscard]] const pipeline_config& config() const noexcept;

        private:
            struct impl;
            const std::unique_ptr<impl> m_pimpl;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_TRANSPORT_HH
