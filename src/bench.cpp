#include <iostream>
#include <random>
#include <chrono>
#include <vector>
#include <string>
#include <cmath> // std::pow
#include <algorithm>
#include <stdexcept>

#include "FrequencySketch.hpp"

// Streams ops keys into the sketch, then checks how often the sketch orders a
// random pair of keys the same way their exact counts do.
template <typename Sketch, typename NextKeyFn>
double run_benchmark(Sketch& sketch, size_t key_space, size_t ops, NextKeyFn&& next_key) {
    using Clock = std::chrono::high_resolution_clock;

    std::vector<uint64_t> exact(key_space, 0);

    auto t0 = Clock::now();
    for (size_t i = 0; i < ops; ++i) {
        auto k = next_key();
        sketch.increment(k);
        ++exact[k];
    }
    auto t1 = Clock::now();
    std::chrono::duration<double> dt = t1 - t0;

    std::mt19937 pick(7);
    std::uniform_int_distribution<int> any(0, int(key_space) - 1);
    size_t agree = 0, compared = 0;
    for (size_t i = 0; i < 100'000; ++i) {
        const int a = any(pick), b = any(pick);
        // only pairs whose true counts are clearly apart
        if (exact[a] < 2 * exact[b] + 1) continue;
        ++compared;
        if (sketch.frequency(a) >= sketch.frequency(b)) ++agree;
    }

    double agreement = compared ? double(agree) / double(compared) : 0.0;
    std::cout << "ops=" << ops
              << " conservative=" << sketch.conservative()
              << " size=" << sketch.size()
              << " compared=" << compared
              << " order_agreement=" << agreement
              << " time=" << dt.count() << "s"
              << " throughput=" << (ops / std::max(1e-9, dt.count())) << " ops/s\n";
    return agreement;
}

int main() {
    using Key = int;

    // --- knobs ---
    const size_t key_space = 10'000;
    const size_t capacity  = 1'000;   // 10% of key_space
    const size_t ops       = 1'000'000;

    std::mt19937 rng(123);

    auto make_sketch = [&](bool conservative) {
        FrequencySketchOptions opt;
        opt.conservative = conservative;
        opt.seed = 123;
        FrequencySketch<Key> sketch(opt);
        sketch.ensure_capacity(capacity);
        return sketch;
    };

    try {
        // ===== Uniform workload =====
        std::uniform_int_distribution<Key> uni(0, (Key)key_space - 1);
        auto uniform = [&]() { return uni(rng); };

        std::cout << "=== Uniform workload ===\n";
        for (bool conservative : {false, true}) {
            auto sketch = make_sketch(conservative);
            run_benchmark(sketch, key_space, ops, uniform);
        }

        // ===== Zipf workload =====
        std::vector<double> weights(key_space);
        const double s = 1.2;
        for (size_t i = 0; i < key_space; ++i) weights[i] = 1.0 / std::pow(double(i + 1), s);
        std::discrete_distribution<Key> zipf(weights.begin(), weights.end());
        auto zipf_gen = [&]() { return zipf(rng); };

        std::cout << "=== Zipf(s=1.2) workload ===\n";
        for (bool conservative : {false, true}) {
            auto sketch = make_sketch(conservative);
            run_benchmark(sketch, key_space, ops, zipf_gen);
        }

        // ===== Hot set: 1% of keys get 90% of the traffic =====
        std::uniform_int_distribution<Key> hot(0, (Key)key_space / 100 - 1);
        std::bernoulli_distribution is_hot(0.9);
        auto hot_gen = [&]() { return is_hot(rng) ? hot(rng) : uni(rng); };

        std::cout << "=== Hot set workload ===\n";
        for (bool conservative : {false, true}) {
            auto sketch = make_sketch(conservative);
            run_benchmark(sketch, key_space, ops, hot_gen);
        }
    } catch (const std::exception& e) {
        std::cerr << "bench failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
