#pragma once
#include <vector>
#include <bitset>
#include <cstdint>
#include <cstddef>
#include <algorithm>

// Array of 64-bit words, each packing sixteen 4-bit saturating counters.
// A counter is addressed by (word, nibble) with nibble in [0, 15].
class PackedCounterTable {
public:
    static constexpr uint32_t kMaxCount = 15;
    static constexpr size_t kCountersPerWord = 16;

    PackedCounterTable() = default;
    explicit PackedCounterTable(size_t words) : words_(words, 0) {}

    uint32_t get(size_t word, uint32_t nibble) const {
        return static_cast<uint32_t>((words_[word] >> offset(nibble)) & 0xfULL);
    }

    // Bumps the counter by one unless it is saturated. Returns true if it changed.
    bool try_increment(size_t word, uint32_t nibble) {
        return add_saturating(word, nibble, 1);
    }

    // Adds delta, clamped to kMaxCount. Returns true if the counter changed.
    bool add_saturating(size_t word, uint32_t nibble, uint32_t delta) {
        const uint32_t old = get(word, nibble);
        if (old == kMaxCount || delta == 0) return false;
        const uint32_t next = std::min<uint32_t>(old + std::min(delta, kMaxCount), kMaxCount);
        store(word, nibble, next);
        return true;
    }

    // Raises the counter to value if it is currently lower; never lowers it.
    bool raise_to(size_t word, uint32_t nibble, uint32_t value) {
        value = std::min(value, kMaxCount);
        if (get(word, nibble) >= value) return false;
        store(word, nibble, value);
        return true;
    }

    // Halves every counter in place and returns how many of them were odd.
    uint64_t halve() {
        uint64_t odd = 0;
        for (auto& w : words_) {
            odd += std::bitset<64>(w & kOneMask).count();
            // the shift drags each counter's low bit into the neighbour's top bit
            w = (w >> 1) & kResetMask;
        }
        return odd;
    }

    size_t size() const { return words_.size(); }
    size_t counters() const { return words_.size() * kCountersPerWord; }
    bool empty() const { return words_.empty(); }

    uint64_t word(size_t i) const { return words_[i]; }

private:
    static constexpr uint64_t kResetMask = 0x7777777777777777ULL;
    static constexpr uint64_t kOneMask   = 0x1111111111111111ULL;

    static uint32_t offset(uint32_t nibble) { return (nibble & 15u) << 2; }

    void store(size_t word, uint32_t nibble, uint32_t value) {
        const uint32_t off = offset(nibble);
        words_[word] = (words_[word] & ~(0xfULL << off)) | (uint64_t(value) << off);
    }

    std::vector<uint64_t> words_;
};
