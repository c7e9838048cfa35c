// Built with VIGIL_ASSERT_LEVEL="Error": Warning sites are discarded and Error sites are checked.
#include <vigil/support/Assert.hh>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <vector>

namespace {

std::vector<std::uint32_t> make_values(std::int64_t count) {
    std::vector<std::uint32_t> values(static_cast<std::size_t>(count));
    std::iota(values.begin(), values.end(), 0U);
    return values;
}

void sum_unchecked(benchmark::State &state) {
    const auto values = make_values(state.range());
    for (auto _ : state) {
        std::uint64_t sum = 0;
        for (auto value : values) {
            sum += value;
        }
        benchmark::DoNotOptimize(sum);
    }
}

void sum_discarded_assertion(benchmark::State &state) {
    const auto values = make_values(state.range());
    for (auto _ : state) {
        std::uint64_t sum = 0;
        for (auto value : values) {
            VIGIL_ASSERT(Warning, value < values.size(), "value {} out of range", value);
            sum += value;
        }
        benchmark::DoNotOptimize(sum);
    }
}

void sum_checked_assertion(benchmark::State &state) {
    const auto values = make_values(state.range());
    for (auto _ : state) {
        std::uint64_t sum = 0;
        for (auto value : values) {
            VIGIL_ASSERT(Error, value < values.size(), "value {} out of range", value);
            sum += value;
        }
        benchmark::DoNotOptimize(sum);
    }
}

BENCHMARK(sum_unchecked)->Arg(100000)->Arg(1000000)->Arg(10000000)->Unit(benchmark::TimeUnit::kMicrosecond);
BENCHMARK(sum_discarded_assertion)->Arg(100000)->Arg(1000000)->Arg(10000000)->Unit(benchmark::TimeUnit::kMicrosecond);
BENCHMARK(sum_checked_assertion)->Arg(100000)->Arg(1000000)->Arg(10000000)->Unit(benchmark::TimeUnit::kMicrosecond);

} // namespace
