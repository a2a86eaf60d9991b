#ifndef AUDIOPIPE_BENCHMARK_HELPERS_HH
#define AUDIOPIPE_BENCHMARK_HELPERS_HH

#include <audiopipe/config.hh>
#include <audiopipe/effect_params.hh>
#include <audiopipe/pcm_block.hh>

#include <cmath>

namespace audiopipe::benchmark {

// Parameters with every stage doing real work
inline effect_params busy_params(const pipeline_config& config) {
    effect_params p;
    p.volume = 0.8f;
    p.band_gains_db.assign(config.effective_band_centres().size(), 0.0f);
    for (std::size_t i = 0; i < p.band_gains_db.size(); i++) {
        p.band_gains_db[i] = (i % 2) ? 3.0f : -3.0f;
    }
    p.speed = 1.25f;
    return p;
}

inline void fill_sine(pcm_block& block, std::size_t frames) {
    block.set_frames(frames);
    for (std::size_t f = 0; f < block.frames(); f++) {
        const auto v = static_cast<float>(std::sin(2.0 * M_PI * 440.0 * static_cast<double>(f) / block.rate()) * 0.5);
        for (channels_t c = 0; c < block.channels(); c++) {
            block.sample(f, c) = v;
        }
    }
    block.set_source_frames(block.frames());
}

} // namespace audiopipe::benchmark

#endif // AUDIOPIPE_BENCHMARK_HELPERS_HH
