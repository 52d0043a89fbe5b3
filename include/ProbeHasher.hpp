#pragma once
#include <cstdint>
#include <cstddef>
#include <random>

// Derives the four (word, nibble) probes of a key from a single spread hash.
// Multipliers are randomized per instance so that collisions cannot be
// engineered against a fixed constant (hash flooding).
class ProbeHasher {
public:
    struct Probe {
        size_t word;
        uint32_t nibble;
    };

    // Murmur3 finalizer constants.
    static constexpr uint64_t C1 = 0x87c37b91114253d5ULL;
    static constexpr uint64_t C2 = 0x4cf5ad432745937fULL;
    // Leaves the low byte alone, so perturbed multipliers stay odd.
    static constexpr uint64_t kMultiplierMask = 0xf0f0f0f0f0f0ff00ULL;

    ProbeHasher() : ProbeHasher(random_seed()) {}

    explicit ProbeHasher(uint64_t seed) {
        std::mt19937_64 rng(seed);
        multiplier1_ = C1 ^ (rng() & kMultiplierMask);
        multiplier2_ = C2 ^ (rng() & kMultiplierMask);
    }

    uint64_t spread(uint64_t x) const {
        x *= multiplier1_;
        // arithmetic shifts: the sign bit is smeared into the mixed-in copies
        const int64_t s = static_cast<int64_t>(x);
        x ^= static_cast<uint64_t>(s >> 23) ^ static_cast<uint64_t>(s >> 43);
        x *= multiplier2_;
        return x;
    }

    // Each probe consumes less than half of the word; rotating exposes the other half.
    static uint64_t respread1(uint64_t h) { return rotl32(h); }
    static uint64_t respread2(uint64_t h) { return C1 * h; }
    static uint64_t respread3(uint64_t h) { return rotl32(h); }

    // table_length must be a power of two >= 2
    static uint32_t shift_for(size_t table_length) {
        uint32_t log2 = 0;
        while ((size_t(1) << log2) < table_length) ++log2;
        return 64 - log2;
    }

    // Word index from the high bits, nibble from the low four.
    static Probe probe(uint64_t h, uint32_t shift) {
        return Probe{static_cast<size_t>(h >> shift), static_cast<uint32_t>(h & 15)};
    }

    // Fills out[0..3] with the probes of an already spread hash.
    static void probes(uint64_t h, uint32_t shift, Probe (&out)[4]) {
        out[0] = probe(h, shift);
        h = respread1(h);
        out[1] = probe(h, shift);
        h = respread2(h);
        out[2] = probe(h, shift);
        h = respread3(h);
        out[3] = probe(h, shift);
    }

    uint64_t multiplier1() const { return multiplier1_; }
    uint64_t multiplier2() const { return multiplier2_; }

private:
    // random_device yields 32 bits per call; two draws fill the 64-bit seed.
    static uint64_t random_seed() {
        std::random_device rd;
        const uint64_t high = rd();
        return (high << 32) | rd();
    }

    static uint64_t rotl32(uint64_t h) { return (h << 32) | (h >> 32); }

    uint64_t multiplier1_;
    uint64_t multiplier2_;
};
