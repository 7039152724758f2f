#pragma once

#include <functional>
#include <vector>

#include "EvolutionBackend.h"

namespace cuf {

// Per-cycle delta rule: same length as the state, finite values.
// The engine sums every registered kernel before the sparsity gate.
using NumericKernel = std::function<std::vector<double>(const std::vector<double>&, SimContext&)>;

// Pulls each node toward a neighbor at a random cyclic offset in [1, max_shift]:
//   delta_i = rate * (state[(i - shift) mod N] - state_i)
NumericKernel coherencePullKernel(double rate = 0.1, int max_shift = 5);

// Independent N(0, sigma) noise per node.
NumericKernel entropicResonanceKernel(double sigma = 0.002);

// Couples the void-entropy scalar into every node: delta_i = gain * void_entropy * (1 - state_i).
NumericKernel voidEntropyKernel(double gain = 0.01);

// Same delta for every node; no RNG draws.
NumericKernel constantKernel(double value);

// coherencePull + entropicResonance + voidEntropy with their default tunables.
std::vector<NumericKernel> referenceKernels();

} // namespace cuf
