#pragma once

#include <audiopipe/effects/effect_stage.hh>

namespace audiopipe {

    /**
     * @class gain_stage
     * @brief Multiplies every sample by the snapshot volume, or by 0 when muted
     * @ingroup effects
     *
     * The volume is already clamped to [0,1] by the parameter bus, so
     * |out| <= |in| for every sample.
     */
    class AUDIOPIPE_EXPORT gain_stage : public effect_stage {
        public:
            [[nodiscard]] const char* get_name() const override { return "gain"; }
            void process(pcm_block& block, const effect_params& params) override;
            void reset() override {}
    };

} // namespace audiopipe
