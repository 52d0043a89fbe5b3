#pragma once
#include <cstdint>
#include <functional>
#include "FrequencySketch.hpp"

// TinyLFU admission: a candidate replaces the eviction victim only if the
// sketch considers it more popular.
template <typename Key, typename Hash = std::hash<Key>>
class TinyLfuAdmittor {
    public:
        explicit TinyLfuAdmittor(int64_t maximum_size, const FrequencySketchOptions& opt = FrequencySketchOptions())
            : sketch_(opt) {
            sketch_.ensure_capacity(maximum_size);
        }

        // Call on every access, hit or miss.
        void record(const Key& key) {
            sketch_.increment(key);
        }

        bool admit(const Key& candidate, const Key& victim) {
            const uint32_t candidate_freq = sketch_.frequency(candidate);
            const uint32_t victim_freq = sketch_.frequency(victim);
            if (candidate_freq > victim_freq) {
                ++admitted_;
                return true;
            }
            ++rejected_;
            return false;
        }

        // Cache grew; the sketch starts over if it has to reallocate.
        void ensure_capacity(int64_t maximum_size) {
            sketch_.ensure_capacity(maximum_size);
        }

        uint32_t frequency(const Key& key) const {
            return sketch_.frequency(key);
        }

        uint64_t admitted() const { return admitted_; }
        uint64_t rejected() const { return rejected_; }

        const FrequencySketch<Key, Hash>& sketch() const { return sketch_; }

    private:
        FrequencySketch<Key, Hash> sketch_;
        uint64_t admitted_ = 0;
        uint64_t rejected_ = 0;
};
