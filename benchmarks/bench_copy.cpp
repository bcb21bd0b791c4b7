#include <cstdint>
#include <vector>

#include <benchmark/benchmark.h>

#include "ndcopy/copy.hpp"

namespace {

using Shape2 = ndcopy::StaticShapeU32<100, 100>;
using Shape3 = ndcopy::StaticShapeU32<100, 100, 100>;

void set_counters(benchmark::State& state, size_t cells) {
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * cells));
    state.counters["cells"] = static_cast<double>(cells);
}

void bench_copy2(benchmark::State& state) {
    auto width = static_cast<size_t>(state.range(0));
    std::vector<uint8_t> src(Shape2::total_size(), 1);
    std::vector<uint8_t> dst(Shape2::total_size(), 0);

    for (auto _ : state) {
        ndcopy::copy2(
            ndcopy::Size(width, width),
            src.data(),
            Shape2 {},
            ndcopy::Index(1, 2),
            dst.data(),
            Shape2 {},
            ndcopy::Index(3, 4));
        benchmark::DoNotOptimize(dst.data());
        benchmark::ClobberMemory();
    }

    set_counters(state, width * width);
}

void bench_copy3(benchmark::State& state) {
    auto width = static_cast<size_t>(state.range(0));
    std::vector<uint8_t> src(Shape3::total_size(), 1);
    std::vector<uint8_t> dst(Shape3::total_size(), 0);

    for (auto _ : state) {
        ndcopy::copy3(
            ndcopy::Size(width, width, width),
            src.data(),
            Shape3 {},
            ndcopy::Index(1, 2, 3),
            dst.data(),
            Shape3 {},
            ndcopy::Index(3, 4, 5));
        benchmark::DoNotOptimize(dst.data());
        benchmark::ClobberMemory();
    }

    set_counters(state, width * width * width);
}

// Same copies as `bench_copy3`, but through the runtime-rank descriptor path.
void bench_copy3_runtime_rank(benchmark::State& state) {
    auto width = static_cast<size_t>(state.range(0));
    ndcopy::RuntimeShape shape = Shape3 {};
    std::vector<uint8_t> src(shape.total_size(), 1);
    std::vector<uint8_t> dst(shape.total_size(), 0);

    for (auto _ : state) {
        ndcopy::copy_n(
            {width, width, width},
            src.data(),
            shape,
            {1, 2, 3},
            dst.data(),
            shape,
            {3, 4, 5});
        benchmark::DoNotOptimize(dst.data());
        benchmark::ClobberMemory();
    }

    set_counters(state, width * width * width);
}

}  // namespace

BENCHMARK(bench_copy2)->RangeMultiplier(2)->Range(8, 64);
BENCHMARK(bench_copy3)->RangeMultiplier(2)->Range(8, 64);
BENCHMARK(bench_copy3_runtime_rank)->RangeMultiplier(2)->Range(8, 64);
