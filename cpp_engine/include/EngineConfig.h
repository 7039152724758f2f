#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cuf {

// ============================================================
// Run configuration contract
//
// Rules:
// - Immutable once handed to an Engine; there is no process-wide config object.
// - Versioned + hashable (FNV-1a32 over every field in fixed order).
// - Out-of-range tunables are clamped by sanitizeConfig(), never rejected.
// ============================================================

enum class BackendKind : std::int32_t {
    LocalAverage    = 0, // reference smoothing pass (no randomness)
    RandomMixing    = 1, // repeated random-partner mixing + cyclic roll
    SpectralLowPass = 2, // FFT low-pass filter
};

const char* backendName(BackendKind k);
// Accepts "local", "mixing", "spectral" (and the enum names). Returns false if unknown.
bool parseBackendKind(const std::string& name, BackendKind* out);

struct EngineConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(EngineConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    // Population
    std::uint32_t node_count_u32 = 128;
    std::uint32_t seed_u32 = 2025;
    double initial_state_min = 0.4;
    double initial_state_max = 0.7;

    // Thermodynamic ledger
    double initial_budget = 1000.0;

    // Cycle rules
    double entanglement_probability = 0.05; // per node, per cycle
    double mixing_weight = 0.2;             // w in state' = (1-w)*state + w*field
    double sparsity_epsilon = 1e-5;         // |delta| below this is skipped

    // Evolution backend (selected once at construction)
    BackendKind backend = BackendKind::LocalAverage;
    std::uint32_t smoothing_passes_u32 = 1; // LocalAverage
    std::uint32_t mixing_passes_u32 = 4;    // RandomMixing ("bond dimension")
    double spectral_decay = 10.0;           // SpectralLowPass

    // Observability
    std::uint32_t trend_history_length_u32 = 50;
    std::uint32_t event_log_capacity_u32 = 20;
    std::uint32_t log_level_u32 = 0; // 0 = ring buffer only, >0 = also echo to std::clog

    // Agent/collaborator seam
    double max_agent_adjustment = 0.01;

    // Quiescence skip scheduler (off by default; skipped steps do not advance the cycle)
    std::uint32_t quiescence_skip_enabled_u32 = 0;
    std::uint32_t quiescence_buckets_u32 = 4;
    double quiescence_std_threshold = 0.005;
};

// Clamp every tunable into its safe range. Idempotent.
EngineConfigV1 sanitizeConfig(const EngineConfigV1& in);

// FNV-1a32 over all fields except fnv_hash_u32 itself.
std::uint32_t configParamHash(const EngineConfigV1& cfg);

// ============================================================
// Run outcome + observability records
// ============================================================

enum class HaltReason : std::int32_t {
    None             = 0,
    BudgetExhausted  = 1,
    NumericDivergence = 2,
};

const char* haltReasonName(HaltReason r);

enum class StepOutcome : std::int32_t {
    Advanced = 0, // cycle completed and counter advanced
    Skipped  = 1, // quiescence scheduler skipped the cycle
    Halted   = 2, // engine is (now) halted; nothing was advanced
};

struct RunSignatures {
    std::uint32_t run_param_hash_u32 = 0; // FNV-1a32 over effective config
    std::uint32_t state_digest_u32   = 0; // FNV-1a32 folded over state after every advanced cycle
};

enum class CycleStage : std::uint32_t {
    KernelDeltas = 0,
    SparseApply,
    Entanglement,
    Backend,
    Ledger,
    Count
};

// Deterministic work counters for the most recent step (observational only, never hashed).
struct CycleStats {
    std::uint64_t cycle = 0;
    std::uint32_t applied_deltas_u32 = 0;
    std::uint32_t skipped_deltas_u32 = 0;
    std::uint32_t merge_attempts_u32 = 0;
    std::uint32_t merges_u32 = 0;
    double cost = 0.0;
    // Population std of (state - backend field) after the blend; 0 when the blend did not run.
    double blend_residual_std = 0.0;
    std::array<std::uint64_t, static_cast<std::size_t>(CycleStage::Count)> stage_work{{0}};
};

enum class EventKind : std::int32_t {
    System = 0,
    Scheduler,
    Entanglement,
    Ledger,
    Agent,
    Snapshot,
    Fatal,
};

const char* eventKindName(EventKind k);

struct EventRecord {
    std::uint64_t cycle = 0;
    EventKind kind = EventKind::System;
    std::string text; // formatted "[C%04d] Kind: message"
};

} // namespace cuf
