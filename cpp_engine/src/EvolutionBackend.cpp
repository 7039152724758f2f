#include "EvolutionBackend.h"

#include "DeterministicRng.h"
#include "EngineErrors.h"

#include <cmath>
#include <string>

namespace cuf {

std::vector<double> EvolutionBackend::propagate(const std::vector<double>& state, SimContext& ctx) {
    std::vector<double> field = computeField(state, ctx);
    if (field.size() != state.size()) {
        throw NumericDivergence(std::string(name()) + ": field length " + std::to_string(field.size()) +
                                " != state length " + std::to_string(state.size()));
    }
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (!std::isfinite(field[i])) {
            throw NumericDivergence(std::string(name()) + ": non-finite field value at node " + std::to_string(i));
        }
    }
    return field;
}

// ---- LocalAverage ----

LocalAverageBackend::LocalAverageBackend(std::uint32_t passes)
    : passes_(passes == 0u ? 1u : passes) {}

std::vector<double> LocalAverageBackend::computeField(const std::vector<double>& state, SimContext&) {
    const std::size_t n = state.size();
    std::vector<double> cur = state;
    if (n < 3) return cur;

    std::vector<double> next(n, 0.0);
    for (std::uint32_t p = 0; p < passes_; ++p) {
        for (std::size_t i = 0; i < n; ++i) {
            const double left = cur[(i + n - 1) % n];
            const double right = cur[(i + 1) % n];
            next[i] = (left + cur[i] + right) / 3.0;
        }
        cur.swap(next);
    }
    return cur;
}

// ---- RandomMixing ----

RandomMixingBackend::RandomMixingBackend(std::uint32_t passes)
    : passes_(passes == 0u ? 1u : passes) {}

std::vector<double> RandomMixingBackend::computeField(const std::vector<double>& state, SimContext& ctx) {
    const std::size_t n = state.size();
    if (n == 0) return {};

    std::vector<double> v = state;
    std::vector<double> mixed(n, 0.0);
    for (std::uint32_t p = 0; p < passes_; ++p) {
        // Partners are read from the previous pass, so the sweep order does not matter.
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t partner = ctx.rng.uniformIndex(n);
            mixed[i] = 0.5 * (v[i] + v[partner]);
        }
        v.swap(mixed);
    }

    // Cyclic roll: out[(i + shift) % n] = v[i]
    const std::size_t shift = static_cast<std::size_t>(ctx.cycle % n);
    std::vector<double> out(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        out[(i + shift) % n] = v[i];
    }
    return out;
}

// ---- SpectralLowPass ----

SpectralLowPassBackend::SpectralLowPassBackend(double decay)
    : decay_((std::isfinite(decay) && decay >= 0.0) ? decay : 0.0) {}

std::vector<double> SpectralLowPassBackend::computeField(const std::vector<double>& state, SimContext&) {
    return spectral_.lowPass(state, decay_);
}

std::unique_ptr<EvolutionBackend> makeEvolutionBackend(const EngineConfigV1& cfg) {
    switch (cfg.backend) {
    case BackendKind::RandomMixing:
        return std::make_unique<RandomMixingBackend>(cfg.mixing_passes_u32);
    case BackendKind::SpectralLowPass:
        return std::make_unique<SpectralLowPassBackend>(cfg.spectral_decay);
    case BackendKind::LocalAverage:
        break;
    }
    return std::make_unique<LocalAverageBackend>(cfg.smoothing_passes_u32);
}

} // namespace cuf
