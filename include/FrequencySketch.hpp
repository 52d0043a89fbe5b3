#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>
#include "PackedCounterTable.hpp"
#include "ProbeHasher.hpp"

struct FrequencySketchOptions {
    bool conservative = false;            // conservative update instead of bumping all four probes
    std::optional<uint64_t> seed;         // fixes the hash multipliers; random_device otherwise
};

// 4-bit Count-Min Sketch with periodic aging, used to estimate the popularity
// of keys for TinyLFU style admission. Estimates are capped at 15.
//
// The counter matrix is a single table of 64-bit words; each key maps to four
// counters derived from one spread hash. Every sample_size() effective
// increments all counters are halved so old history fades away.
//
// Lazily initialized: ensure_capacity() must be called before it counts
// anything. NOT thread-safe.
template <typename Key, typename Hash = std::hash<Key>>
class FrequencySketch {
public:
    enum class UpdatePolicy { Regular, Conservative };

    // Table geometry derived from a cache size, computed without allocating.
    struct Sizing {
        int64_t target;
        size_t length;
        uint32_t sample_size;
    };

    FrequencySketch() : FrequencySketch(FrequencySketchOptions{}) {}

    explicit FrequencySketch(const FrequencySketchOptions& opt)
        : hasher_(opt.seed ? ProbeHasher(*opt.seed) : ProbeHasher()),
          policy_(opt.conservative ? UpdatePolicy::Conservative : UpdatePolicy::Regular) {}

    // Grows the table to fit max_entries. Forgets all counts when it grows;
    // no-op if the table is already large enough.
    void ensure_capacity(int64_t max_entries) {
        const Sizing sizing = sizing_for(max_entries);
        if (!table_.empty() && table_.size() >= sizing.length) {
            return;
        }

        table_ = PackedCounterTable(sizing.length);
        shift_ = ProbeHasher::shift_for(sizing.length);
        sample_size_ = sizing.sample_size;
        size_ = 0;
    }

    // Target is clamped to INT32_MAX >> 1 and the sample size to INT32_MAX.
    static Sizing sizing_for(int64_t max_entries) {
        if (max_entries < 0) {
            throw std::invalid_argument("max_entries must be >= 0");
        }
        const int64_t target = std::min<int64_t>(max_entries, std::numeric_limits<int32_t>::max() >> 1);
        const size_t length = (target <= 2) ? 2 : ceiling_power_of_two(static_cast<uint64_t>(target));
        const int64_t sample = (max_entries == 0) ? 10 : 10 * target;
        return Sizing{target, length,
                      static_cast<uint32_t>(std::min<int64_t>(sample, std::numeric_limits<int32_t>::max()))};
    }

    // size after an aging pass that found odd counters; each increment touched
    // four counters, so every four odd ones account for one lost increment.
    static uint32_t size_after_aging(uint32_t size, uint64_t odd) {
        const int64_t next = int64_t(size >> 1) - int64_t(odd >> 2);
        return static_cast<uint32_t>(std::max<int64_t>(next, 0));
    }

    bool is_initialized() const { return !table_.empty(); }

    // READ-ONLY: min of the four probed counters, 0 before ensure_capacity()
    uint32_t frequency(const Key& key) const {
        if (!is_initialized()) return 0;
        ProbeHasher::Probe p[4];
        ProbeHasher::probes(hasher_.spread(hash_of(key)), shift_, p);
        return estimate(p);
    }

    void increment(const Key& key) { increment(key, 1); }

    void increment(const Key& key, uint32_t count) {
        if (!is_initialized()) return;
        ProbeHasher::Probe p[4];
        ProbeHasher::probes(hasher_.spread(hash_of(key)), shift_, p);

        const bool added = (policy_ == UpdatePolicy::Conservative)
            ? conservative_increment(p, count)
            : regular_increment(p, count);

        if (added && (++size_ == sample_size_)) {
            reset();
        }
    }

    bool conservative() const { return policy_ == UpdatePolicy::Conservative; }
    UpdatePolicy policy() const { return policy_; }
    size_t table_length() const { return table_.size(); }
    uint32_t sample_size() const { return sample_size_; }
    uint32_t size() const { return size_; }
    const PackedCounterTable& table() const { return table_; }

private:
    uint64_t hash_of(const Key& key) const { return static_cast<uint64_t>(hash_(key)); }

    uint32_t estimate(const ProbeHasher::Probe (&p)[4]) const {
        uint32_t result = PackedCounterTable::kMaxCount;
        for (const auto& probe : p) {
            result = std::min(result, table_.get(probe.word, probe.nibble));
        }
        return result;
    }

    bool regular_increment(const ProbeHasher::Probe (&p)[4], uint32_t count) {
        bool added = false;
        for (const auto& probe : p) {
            added |= table_.add_saturating(probe.word, probe.nibble, count);
        }
        return added;
    }

    // Only the counters below the new estimate are raised.
    bool conservative_increment(const ProbeHasher::Probe (&p)[4], uint32_t count) {
        const uint32_t old = estimate(p);
        if (old == PackedCounterTable::kMaxCount || count == 0) return false;
        const uint32_t value = std::min(old + std::min(count, PackedCounterTable::kMaxCount),
                                        PackedCounterTable::kMaxCount);
        bool added = false;
        for (const auto& probe : p) {
            added |= table_.raise_to(probe.word, probe.nibble, value);
        }
        return added;
    }

    // Halves every counter, then corrects size_ for the halves lost to odd counters.
    void reset() {
        size_ = size_after_aging(size_, table_.halve());
    }

    // From Hacker's Delight, Chapter 3. x must be > 1.
    static size_t ceiling_power_of_two(uint64_t x) {
        --x;
        x |= x >> 1;
        x |= x >> 2;
        x |= x >> 4;
        x |= x >> 8;
        x |= x >> 16;
        x |= x >> 32;
        return static_cast<size_t>(x + 1);
    }

    ProbeHasher hasher_;
    UpdatePolicy policy_;
    Hash hash_;
    PackedCounterTable table_;
    uint32_t shift_ = 64;
    uint32_t sample_size_ = 0;
    uint32_t size_ = 0;
};
