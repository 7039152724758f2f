#pragma once

#include <cstdint>
#include <vector>

#include "EngineConfig.h"

namespace cuf {

// Serializable projection of the full engine state.
// Everything except node_state is restored bit-exactly; node_state goes through
// the truncated spectral transform in SnapshotCodec and is only bounded-error.
struct EngineSnapshot {
    std::uint32_t format_u32 = 1;

    std::uint64_t cycle = 0;
    bool halted = false;
    HaltReason halt_reason = HaltReason::None;

    double ledger_value = 0.0;
    double leakage = 0.0;
    double ledger_consumed = 0.0;

    std::uint32_t node_count_u32 = 0;
    std::uint32_t seed_u32 = 0;
    std::uint32_t rng_state_u32 = 0;
    std::uint32_t param_hash_u32 = 0;
    std::uint32_t state_digest_u32 = 0;
    double void_entropy = 0.0;

    std::vector<std::uint32_t> unionfind_parents;
    std::vector<std::uint8_t> unionfind_charge_a;
    std::vector<std::uint8_t> unionfind_charge_b;

    std::vector<double> node_state;

    // Oldest first, at most trend_history_length entries each.
    std::vector<double> trend_mean_state;
    std::vector<double> trend_void_entropy;
};

} // namespace cuf
