#pragma once

#include <audiopipe/effects/effect_stage.hh>
#include <audiopipe/sdk/buffer.hh>

namespace audiopipe {

    /**
     * @class time_stretch_stage
     * @brief Playback speed change by linear interpolation
     * @ingroup effects
     *
     * Speed and pitch change together (naive resampling). The stage keeps the
     * last input frame and a fractional read position across blocks, so the
     * interpolation is continuous over block boundaries. For n input frames
     * at speed s the block comes out with ceil(n / s) frames, give or take
     * one. The block's source frame count is left untouched: playback
     * position advances by the input consumed.
     *
     * At speed 1 with an integral read position the block passes through
     * unchanged.
     */
    class AUDIOPIPE_EXPORT time_stretch_stage : public effect_stage {
        public:
            /**
             * @param channels Pipeline channel count
             * @param max_input_frames Largest block handed to process()
             */
            time_stretch_stage(channels_t channels, std::size_t max_input_frames);

            [[nodiscard]] const char* get_name() const override { return "time_stretch"; }
            void process(pcm_block& block, const effect_params& params) override;
            void reset() override;

            /**
             * @brief Output capacity a pcm_block needs for @p input_frames at the slowest speed
             */
            [[nodiscard]] static std::size_t max_output_frames(std::size_t input_frames) noexcept;

            /// Read position relative to the start of the next block, history frame at 0
            [[nodiscard]] double position() const noexcept { return m_position; }

        private:
            channels_t m_channels;
            std::size_t m_max_input;
            buffer<float> m_ext;            ///< history frame followed by the input block
            double m_position = 1.0;
    };

} // namespace audiopipe
