#include <benchmark/benchmark.h>
#include <random>
#include <vector>
#include <cmath>
#include "FrequencySketch.hpp"

using Key = int;

static constexpr size_t kSize  = 2 << 14;
static constexpr size_t kMask  = kSize - 1;
static constexpr size_t kItems = kSize / 3;

static std::discrete_distribution<Key> make_zipf(size_t key_space, double s) {
    std::vector<double> w(key_space);
    for (size_t i=0;i<key_space;++i) w[i] = 1.0/std::pow(double(i+1), s);
    return std::discrete_distribution<Key>(w.begin(), w.end());
}

// Keys are drawn up front so the timed loop only touches the sketch.
static std::vector<Key> make_keys() {
    std::mt19937 rng(123);
    auto zipf = make_zipf(kItems, 0.99);
    std::vector<Key> keys(kSize);
    for (auto& k : keys) k = zipf(rng);
    return keys;
}

static FrequencySketch<Key> make_sketch(bool conservative) {
    FrequencySketchOptions opt;
    opt.conservative = conservative;
    opt.seed = 123;
    FrequencySketch<Key> sketch(opt);
    sketch.ensure_capacity(kItems);
    for (size_t i = 0; i < kSize; ++i) sketch.increment(Key(i));
    return sketch;
}

static void BM_Increment(benchmark::State& st) {
    const auto keys = make_keys();
    auto sketch = make_sketch(st.range(0) != 0);
    size_t index = 0;
    for (auto _ : st) {
        sketch.increment(keys[index++ & kMask]);
    }
    st.counters["size"] = sketch.size();
}
BENCHMARK(BM_Increment)->Arg(0)->Arg(1)->ArgName("conservative")->Unit(benchmark::kNanosecond);

static void BM_Frequency(benchmark::State& st) {
    const auto keys = make_keys();
    auto sketch = make_sketch(st.range(0) != 0);
    size_t index = 0;
    for (auto _ : st) {
        benchmark::DoNotOptimize(sketch.frequency(keys[index++ & kMask]));
    }
}
BENCHMARK(BM_Frequency)->Arg(0)->Arg(1)->ArgName("conservative")->Unit(benchmark::kNanosecond);

static void BM_EnsureCapacity(benchmark::State& st) {
    for (auto _ : st) {
        FrequencySketch<Key> sketch;
        sketch.ensure_capacity(st.range(0));
        benchmark::DoNotOptimize(sketch.table_length());
    }
}
BENCHMARK(BM_EnsureCapacity)->Arg(1 << 10)->Arg(1 << 20)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
