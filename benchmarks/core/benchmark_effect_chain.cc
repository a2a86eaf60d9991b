// Per-block cost of each effect stage and of the whole chain
#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <audiopipe/effects/equalizer_stage.hh>
#include <audiopipe/effects/fade_stage.hh>
#include <audiopipe/effects/gain_stage.hh>
#include <audiopipe/effects/time_stretch_stage.hh>

#include <array>

namespace audiopipe::benchmark {

void register_effect_chain_benchmarks(ankerl::nanobench::Bench& bench) {
    pipeline_config config;
    const auto params = busy_params(config);
    const std::size_t frames = config.block_frames;
    pcm_block block(time_stretch_stage::max_output_frames(frames), config.channels, config.sample_rate);

    time_stretch_stage stretch(config.channels, frames);
    equalizer_stage eq(config.sample_rate, config.channels, config.effective_band_centres(), config.eq_q);
    fade_stage fade;
    gain_stage gain;

    bench.batch(frames).unit("frame");

    bench.run("gain", [&] {
        fill_sine(block, frames);
        gain.process(block, params);
    });

    bench.run("equalizer 10 bands", [&] {
        fill_sine(block, frames);
        eq.process(block, params);
    });

    bench.run("time stretch 1.25x", [&] {
        fill_sine(block, frames);
        stretch.process(block, params);
    });

    auto fading = params;
    fading.fade.direction = fade_direction::in;
    fading.fade.duration_frames = frame_index_t{1} << 40;
    fading.fade.serial = 1;
    bench.run("fade", [&] {
        fill_sine(block, frames);
        fade.process(block, fading);
    });

    const std::array<effect_stage*, 4> chain{&stretch, &eq, &fade, &gain};
    bench.run("full chain", [&] {
        fill_sine(block, frames);
        for (auto* stage : chain) {
            stage->process(block, fading);
        }
        ankerl::nanobench::doNotOptimizeAway(block.frames());
    });
}

} // namespace audiopipe::benchmark
