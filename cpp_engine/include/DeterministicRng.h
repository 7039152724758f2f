#pragma once

#include <cstddef>
#include <cstdint>

namespace cuf {

// Deterministic, fast, portable random source (xorshift32).
// The full state is a single u32, so snapshots can restore the exact draw sequence.
// Do not use std::rand() or std::random_device anywhere on the simulation path.
class DeterministicRng {
public:
    DeterministicRng() = default;
    explicit DeterministicRng(std::uint32_t seed) { reseed(seed); }

    // Stretch the user seed with ten rounds of modular squaring mod 2^32-1.
    static std::uint32_t stretchSeed(std::uint32_t seed);

    void reseed(std::uint32_t seed);

    std::uint32_t nextU32();

    // [0,1)
    double uniform01();

    // [lo,hi)
    double uniform(double lo, double hi);

    // [0,n); n must be > 0 (returns 0 for n == 0).
    std::size_t uniformIndex(std::size_t n);

    // Box-Muller, consumes exactly two u32 draws per call.
    double normal(double mean, double stddev);

    std::uint32_t state() const noexcept { return s_; }
    // Restore a previously captured state (zero is mapped to the non-zero fallback).
    void setState(std::uint32_t s);

private:
    static constexpr std::uint32_t kZeroStateFallback = 0x9E3779B9u;
    std::uint32_t s_ = kZeroStateFallback;
};

} // namespace cuf
