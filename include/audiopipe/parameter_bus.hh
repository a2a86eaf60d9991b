/**
 * @file parameter_bus.hh
 * @brief Publication of effect parameter snapshots to the producer thread
 */

#ifndef AUDIOPIPE_PARAMETER_BUS_HH
#define AUDIOPIPE_PARAMETER_BUS_HH

#include <audiopipe/effect_params.hh>
#include <audiopipe/export_audiopipe.h>

#include <functional>
#include <memory>

namespace audiopipe {

    /**
     * @class parameter_bus
     * @brief Latest-value channel for effect_params
     *
     * The UI thread publishes complete snapshots, the producer thread reads
     * the latest one once per block. Readers always observe a whole snapshot,
     * never a mix of two: a snapshot is built and clamped off-line, then the
     * shared pointer is swapped under a mutex held only for the swap. No
     * sample processing ever happens under that mutex.
     *
     * The editing helpers (set_volume() and friends) perform a
     * read-modify-publish cycle serialised by a separate editor mutex, so two
     * UI callers changing different fields never lose each other's edit.
     *
     * @code
     * parameter_bus bus(initial);
     * bus.set_volume(0.5f);               // UI thread
     * auto params = bus.current();        // producer thread, once per block
     * @endcode
     */
    class AUDIOPIPE_EXPORT parameter_bus {
        public:
            using snapshot_ptr = std::shared_ptr<const effect_params>;
            using editor_t = std::function<void(effect_params&)>;

            explicit parameter_bus(effect_params initial = {});
            ~parameter_bus();

            parameter_bus(const parameter_bus&) = delete;
            parameter_bus& operator=(const parameter_bus&) = delete;

            /**
             * @brief Latest published snapshot; never null
             */
            [[nodiscard]] snapshot_ptr current() const;

            /**
             * @brief Version of the latest snapshot
             */
            [[nodiscard]] uint64_t version() const;

            /**
             * @brief Replace the whole parameter set
             *
             * Values are clamped (see clamp_params()) and a new version is
             * assigned; the version field of @p params is ignored.
             * @return Version of the published snapshot
             */
            uint64_t publish(effect_params params);

            /**
             * @brief Copy the current snapshot, apply @p edit, publish the result
             * @return Version of the published snapshot
             */
            uint64_t update(const editor_t& edit);

            uint64_t set_volume(float volume);
            uint64_t set_muted(bool muted);

            /**
             * @throws std::out_of_range if @p band is not a configured band
             */
            uint64_t set_band_gain(std::size_t band, float gain_db);

            /**
             * @brief Replace all band gains
             * @throws std::invalid_argument if the band count differs
             */
            uint64_t set_band_gains(const std::vector<float>& gains_db);

            uint64_t set_speed(float speed);

            /**
             * @brief Arm a new fade envelope
             *
             * Each call allocates a new trigger serial, so even an identical
             * request restarts the envelope.
             */
            uint64_t trigger_fade(fade_direction direction, frame_index_t duration_frames,
                                  fade_curve curve = fade_curve::linear, float start_progress = 0.0f);

        private:
            struct impl;
            const std::unique_ptr<impl> m_pimpl;
    };

} // namespace audiopipe

#endif // AUDIOPIPE_PARAMETER_BUS_HH
