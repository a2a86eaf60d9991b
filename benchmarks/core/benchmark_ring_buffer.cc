// Ring buffer cost per device callback
#include <nanobench.h>
#include <audiopipe/ring_buffer.hh>

#include <vector>

namespace audiopipe::benchmark {

void register_ring_buffer_benchmarks(ankerl::nanobench::Bench& bench) {
    constexpr std::size_t callback_frames = 512;
    output_ring_buffer ring(8192, 2);
    std::vector<float> in(callback_frames * 2, 0.5f);
    std::vector<float> out(callback_frames * 2);

    bench.batch(callback_frames).unit("frame");

    bench.run("ring write+read 512 frames", [&] {
        ring.try_write(in.data(), callback_frames);
        auto res = ring.read(out.data(), callback_frames);
        ankerl::nanobench::doNotOptimizeAway(res.frames_read);
    });

    ring.reset();
    bench.run("ring read on underrun", [&] {
        auto res = ring.read(out.data(), callback_frames);
        ankerl::nanobench::doNotOptimizeAway(res.underrun);
    });

    bench.run("ring flush+write+read", [&] {
        ring.try_write(in.data(), callback_frames);
        ring.request_flush();
        ring.try_write(in.data(), callback_frames);
        auto res = ring.read(out.data(), callback_frames);
        ankerl::nanobench::doNotOptimizeAway(res.frames_read);
    });
}

} // namespace audiopipe::benchmark
