#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ChargeUnionFind.h"
#include "DeterministicRng.h"
#include "EnergyLedger.h"
#include "EngineConfig.h"
#include "EngineSnapshot.h"
#include "EvolutionBackend.h"
#include "NumericKernels.h"

namespace cuf {

// ============================================================
// Deterministic evolution engine
//
// One cycle, in fixed order:
//   kernel deltas -> sparse apply -> clamp -> entanglement merges
//   -> backend blend + clamp -> ledger charge -> advance -> void entropy + trends
//
// Rules:
// - Single mutator. Observers use the copy-returning accessors between steps.
// - Same config (seed included) => identical trajectory and state digest.
// - Halted is terminal until reset() or restoreSnapshot().
// ============================================================
class Engine {
public:
    explicit Engine(const EngineConfigV1& cfg);
    Engine(const EngineConfigV1& cfg, std::vector<NumericKernel> kernels);
    // Caller-supplied backend in place of the one cfg.backend names.
    // Throws std::invalid_argument for a null backend.
    Engine(const EngineConfigV1& cfg, std::vector<NumericKernel> kernels,
           std::unique_ptr<EvolutionBackend> backend);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    ~Engine();

    void addKernel(NumericKernel kernel);
    std::size_t kernelCount() const noexcept { return kernels_.size(); }

    // Reinitialize every owned field from the seed. Kernels stay registered.
    void reset();

    // Throws NumericDivergence (after halting) if a kernel or the backend misbehaves.
    StepOutcome step();

    // Bounded external nudge: |delta| is clamped to max_agent_adjustment and the node to [0,1].
    // Non-finite deltas are ignored. Returns the delta actually applied.
    // Throws InvalidState when halted, IndexOutOfRange for a bad index.
    double applyNodeAdjustment(std::size_t index, double delta);

    // ---- observers ----
    std::uint64_t cycle() const noexcept { return cycle_; }
    bool isHalted() const noexcept { return halted_; }
    HaltReason haltReason() const noexcept { return halt_reason_; }
    std::size_t nodeCount() const noexcept { return state_.size(); }

    double ledgerValue() const noexcept { return ledger_.available(); }
    double leakage() const noexcept { return ledger_.leakage(); }
    double ledgerConsumed() const noexcept { return ledger_.consumed(); }

    double voidEntropy() const noexcept { return void_entropy_; }
    std::uint64_t quiescentSkips() const noexcept { return quiescent_skips_; }

    std::vector<double> nodeState() const { return state_; }
    double meanState() const;
    // Oldest first.
    std::vector<double> meanStateTrend() const;
    std::vector<double> voidEntropyTrend() const;

    const ChargeUnionFind& unionFind() const noexcept { return uf_; }
    const EngineConfigV1& config() const noexcept { return cfg_; }
    const EvolutionBackend& backend() const noexcept { return *backend_; }

    // Oldest first; returns the number written.
    int getEventLog(EventRecord* out_ptr, int cap) const;
    int eventCount() const noexcept { return event_count_; }

    RunSignatures getRunSignatures() const { return run_signatures_; }
    CycleStats lastCycleStats() const { return last_stats_; }

    // Deterministic key=value listing of the effective config plus hashes.
    int exportConfigText(char* buf, int cap) const;

    // ---- persistence ----
    EngineSnapshot captureSnapshot() const;

    // All-or-nothing: on SnapshotCorrupt the engine is left exactly as it was.
    void restoreSnapshot(const EngineSnapshot& snap);

private:
    std::uint32_t nodeCountU32() const { return static_cast<std::uint32_t>(state_.size()); }

    bool isQuiescent() const;
    void halt(HaltReason reason, const std::string& detail);
    void updateVoidEntropy(double mean);
    void pushTrends(double mean);
    void foldStateDigest();
    void logEvent(EventKind kind, const std::string& message);

    EngineConfigV1 cfg_{};
    std::uint32_t param_hash_u32_ = 0;

    std::vector<NumericKernel> kernels_;
    std::unique_ptr<EvolutionBackend> backend_;

    DeterministicRng rng_;
    std::vector<double> state_;
    ChargeUnionFind uf_;
    EnergyLedger ledger_;

    std::uint64_t cycle_ = 0;
    bool halted_ = false;
    HaltReason halt_reason_ = HaltReason::None;
    double void_entropy_ = 0.0;
    std::uint64_t quiescent_skips_ = 0;

    // Trend ring buffers (capacity = trend_history_length_u32)
    std::vector<double> trend_mean_rb_;
    std::vector<double> trend_void_rb_;
    int trend_head_ = 0;  // next write
    int trend_count_ = 0; // number valid

    // Event log ring buffer (capacity = event_log_capacity_u32)
    std::vector<EventRecord> event_rb_;
    int event_head_ = 0;
    int event_count_ = 0;

    RunSignatures run_signatures_{};
    CycleStats last_stats_{};
};

} // namespace cuf
