#include "NumericKernels.h"

#include "DeterministicRng.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace cuf {

NumericKernel coherencePullKernel(double rate, int max_shift) {
    const double r = std::isfinite(rate) ? rate : 0.0;
    const std::size_t span = static_cast<std::size_t>(std::max(1, max_shift));
    return [r, span](const std::vector<double>& state, SimContext& ctx) {
        const std::size_t n = state.size();
        std::vector<double> delta(n, 0.0);
        if (n < 2) return delta;
        const std::size_t shift = (1u + ctx.rng.uniformIndex(span)) % n;
        for (std::size_t i = 0; i < n; ++i) {
            const double neighbor = state[(i + n - shift) % n];
            delta[i] = r * (neighbor - state[i]);
        }
        return delta;
    };
}

NumericKernel entropicResonanceKernel(double sigma) {
    const double s = (std::isfinite(sigma) && sigma > 0.0) ? sigma : 0.0;
    return [s](const std::vector<double>& state, SimContext& ctx) {
        std::vector<double> delta(state.size(), 0.0);
        for (double& d : delta) {
            d = ctx.rng.normal(0.0, s);
        }
        return delta;
    };
}

NumericKernel voidEntropyKernel(double gain) {
    const double g = std::isfinite(gain) ? gain : 0.0;
    return [g](const std::vector<double>& state, SimContext& ctx) {
        std::vector<double> delta(state.size(), 0.0);
        const double drive = g * ctx.void_entropy;
        for (std::size_t i = 0; i < state.size(); ++i) {
            delta[i] = drive * (1.0 - state[i]);
        }
        return delta;
    };
}

NumericKernel constantKernel(double value) {
    return [value](const std::vector<double>& state, SimContext&) {
        return std::vector<double>(state.size(), value);
    };
}

std::vector<NumericKernel> referenceKernels() {
    std::vector<NumericKernel> ks;
    ks.push_back(coherencePullKernel());
    ks.push_back(entropicResonanceKernel());
    ks.push_back(voidEntropyKernel());
    return ks;
}

} // namespace cuf
