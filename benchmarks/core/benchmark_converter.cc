// Float to device format conversion inside the device callback
#include <nanobench.h>
#include <audiopipe/sdk/from_float_converter.hh>

#include <cstdint>
#include <sstream>
#include <vector>

namespace audiopipe::benchmark {

void register_converter_benchmarks(ankerl::nanobench::Bench& bench) {
    constexpr std::size_t samples = 1024 * 2;
    std::vector<float> src(samples, 0.3f);
    std::vector<uint8_t> dst(samples * 4);

    bench.batch(samples).unit("sample");
    for (auto fmt : {audio_format::u8, audio_format::s16le, audio_format::s32le, audio_format::f32le}) {
        const auto conv = get_from_float_converter(fmt);
        const auto bytes = samples * audio_format_byte_size(fmt);
        std::ostringstream name;
        name << "convert to " << fmt;
        bench.run(name.str(), [&] {
            conv(dst.data(), bytes, src.data(), samples);
            ankerl::nanobench::doNotOptimizeAway(dst[0]);
        });
    }
}

} // namespace audiopipe::benchmark
