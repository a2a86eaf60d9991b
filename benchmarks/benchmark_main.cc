#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <iostream>

// Declare benchmark suites
namespace audiopipe::benchmark {
    void register_ring_buffer_benchmarks(ankerl::nanobench::Bench& bench);
    void register_effect_chain_benchmarks(ankerl::nanobench::Bench& bench);
    void register_converter_benchmarks(ankerl::nanobench::Bench& bench);
}

int main() {
    std::cout << "Running audiopipe benchmarks...\n\n";

    ankerl::nanobench::Bench bench;
    bench.title("audiopipe real-time path");
    bench.relative(true);
    bench.performanceCounters(true);

    audiopipe::benchmark::register_ring_buffer_benchmarks(bench);
    audiopipe::benchmark::register_effect_chain_benchmarks(bench);
    audiopipe::benchmark::register_converter_benchmarks(bench);
    return 0;
}
