#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "EngineConfig.h"
#include "SpectralTransform.h"

namespace cuf {

class DeterministicRng;

// Read-mostly view of the engine handed to kernels and backends for one cycle.
// The RNG is the engine's own stream: every draw advances the run's sequence.
struct SimContext {
    std::uint64_t cycle = 0;
    std::size_t node_count = 0;
    double void_entropy = 0.0;
    DeterministicRng& rng;
};

// ============================================================
// State-propagation strategy
//
// Contract (enforced by propagate()):
// - output length == input length
// - deterministic for the same RNG draw sequence
// - every value finite; otherwise NumericDivergence is thrown
// ============================================================
class EvolutionBackend {
public:
    virtual ~EvolutionBackend() = default;

    EvolutionBackend(const EvolutionBackend&) = delete;
    EvolutionBackend& operator=(const EvolutionBackend&) = delete;

    std::vector<double> propagate(const std::vector<double>& state, SimContext& ctx);

    virtual BackendKind kind() const = 0;
    const char* name() const { return backendName(kind()); }

protected:
    EvolutionBackend() = default;

    virtual std::vector<double> computeField(const std::vector<double>& state, SimContext& ctx) = 0;
};

// Periodic 3-point moving average, no randomness.
class LocalAverageBackend final : public EvolutionBackend {
public:
    explicit LocalAverageBackend(std::uint32_t passes);
    BackendKind kind() const override { return BackendKind::LocalAverage; }

protected:
    std::vector<double> computeField(const std::vector<double>& state, SimContext& ctx) override;

private:
    std::uint32_t passes_ = 1;
};

// Repeated random-partner mixing followed by a cyclic roll of (cycle mod N).
class RandomMixingBackend final : public EvolutionBackend {
public:
    explicit RandomMixingBackend(std::uint32_t passes);
    BackendKind kind() const override { return BackendKind::RandomMixing; }

protected:
    std::vector<double> computeField(const std::vector<double>& state, SimContext& ctx) override;

private:
    std::uint32_t passes_ = 4;
};

// FFT low-pass with exponential attenuation by normalized frequency.
class SpectralLowPassBackend final : public EvolutionBackend {
public:
    explicit SpectralLowPassBackend(double decay);
    BackendKind kind() const override { return BackendKind::SpectralLowPass; }

protected:
    std::vector<double> computeField(const std::vector<double>& state, SimContext& ctx) override;

private:
    double decay_ = 10.0;
    SpectralTransform spectral_;
};

// Selected once per run; cfg is expected to be sanitized.
std::unique_ptr<EvolutionBackend> makeEvolutionBackend(const EngineConfigV1& cfg);

} // namespace cuf
