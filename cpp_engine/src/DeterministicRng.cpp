#include "DeterministicRng.h"

#include <cmath>

namespace cuf {

namespace {
constexpr double kTwoPi = 6.283185307179586476925;
constexpr std::uint64_t kSquaringModulus = 4294967295ull; // 2^32 - 1
} // namespace

std::uint32_t DeterministicRng::stretchSeed(std::uint32_t seed) {
    std::uint64_t s = seed;
    for (int i = 0; i < 10; ++i) {
        s = (s * s) % kSquaringModulus;
    }
    return static_cast<std::uint32_t>(s);
}

void DeterministicRng::reseed(std::uint32_t seed) {
    setState(stretchSeed(seed));
}

void DeterministicRng::setState(std::uint32_t s) {
    s_ = (s == 0u) ? kZeroStateFallback : s;
}

std::uint32_t DeterministicRng::nextU32() {
    s_ ^= (s_ << 13);
    s_ ^= (s_ >> 17);
    s_ ^= (s_ << 5);
    return s_;
}

double DeterministicRng::uniform01() {
    return static_cast<double>(nextU32()) / 4294967296.0; // 2^32
}

double DeterministicRng::uniform(double lo, double hi) {
    return lo + (hi - lo) * uniform01();
}

std::size_t DeterministicRng::uniformIndex(std::size_t n) {
    if (n == 0) return 0;
    const std::size_t idx = static_cast<std::size_t>(uniform01() * static_cast<double>(n));
    return (idx < n) ? idx : (n - 1);
}

double DeterministicRng::normal(double mean, double stddev) {
    // u1 in (0,1] so log() stays finite.
    const double u1 = 1.0 - uniform01();
    const double u2 = uniform01();
    const double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
    return mean + stddev * z;
}

} // namespace cuf
