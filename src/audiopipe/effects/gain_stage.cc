#include <audiopipe/effects/gain_stage.hh>

namespace audiopipe {

    void gain_stage::process(pcm_block& block, const effect_params& params) {
        const float gain = params.muted ? 0.0f : params.volume;
        if (gain == 1.0f) {
            return;
        }
        float* data = block.data();
        const std::size_t n = block.samples();
        for (std::size_t i = 0; i < n; i++) {
            data[i] *= gain;
        }
    }

} // namespace audiopipe
