#pragma once

#include <audiopipe/effects/effect_stage.hh>

namespace audiopipe {

    /**
     * @class fade_stage
     * @brief Sample-accurate fade envelope driven by a frame counter
     * @ingroup effects
     *
     * The envelope is armed when a snapshot carries a fade serial the stage
     * has not applied yet. From then on the phase advances by one step per
     * frame, starting at the snapshot's progress:
     *
     *     phase(k) = min(1, progress + k / duration)
     *
     * A fade in ends at exactly 1.0 and a fade out at exactly 0.0 once the
     * phase reaches 1. After that the stage is inert: a finished fade in
     * passes audio through, a finished fade out keeps the block silent until
     * a new fade is armed.
     *
     * The cubic curve reproduces the shape of the older time-based
     * envelope (phase cubed).
     */
    class AUDIOPIPE_EXPORT fade_stage : public effect_stage {
        public:
            [[nodiscard]] const char* get_name() const override { return "fade"; }
            void process(pcm_block& block, const effect_params& params) override;

            /**
             * @brief Return to the pass-through state
             *
             * The last applied serial is kept, so the snapshot that armed the
             * previous envelope does not arm it again.
             */
            void reset() override;

            /// Current phase in [0,1]; 1 when no envelope is running
            [[nodiscard]] float progress() const noexcept;

            /// Gain the next frame would receive
            [[nodiscard]] float multiplier() const noexcept;

            [[nodiscard]] fade_direction direction() const noexcept { return m_direction; }

            /// True while the phase is below 1
            [[nodiscard]] bool is_active() const noexcept;

        private:
            void arm(const fade_command& cmd) noexcept;
            [[nodiscard]] float phase_at(frame_index_t k) const noexcept;
            [[nodiscard]] float gain_for_phase(float phase) const noexcept;

            fade_direction m_direction = fade_direction::none;
            fade_curve m_curve = fade_curve::linear;
            frame_index_t m_duration = 0;
            float m_start = 0.0f;
            frame_index_t m_counter = 0;
            uint32_t m_serial = 0;
    };

} // namespace audiopipe
