#include "Engine.h"

#include "EngineErrors.h"
#include "Signatures.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cuf {

namespace {

constexpr double kVoidEntropyMin = -0.5;
constexpr double kVoidEntropyMax = 0.5;
constexpr double kVoidEntropyDrift = 0.01;
constexpr double kVoidEntropyNoise = 0.001;
constexpr std::uint64_t kQuiescenceLogEvery = 20;

template <typename... Args>
std::string formatText(const char* fmt, Args... args) {
    char buf[256];
    const int w = std::snprintf(buf, sizeof(buf), fmt, args...);
    if (w <= 0) return std::string();
    return std::string(buf, std::min<std::size_t>(static_cast<std::size_t>(w), sizeof(buf) - 1));
}

static inline double clamp01(double x) {
    return std::clamp(x, 0.0, 1.0);
}

static inline std::uint32_t fnv_hash_text_u32(const char* s) {
    if (!s) return 0;
    return fnv1a32_update(fnv1a32_begin(), s, std::strlen(s));
}

// Kernel output gets the same contract as backend output.
static void checkKernelOutput(const std::vector<double>& d, std::size_t n, std::size_t kernel_index) {
    if (d.size() != n) {
        throw NumericDivergence(formatText("kernel %zu: delta length %zu != node count %zu",
                                           kernel_index, d.size(), n));
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(d[i])) {
            throw NumericDivergence(formatText("kernel %zu: non-finite delta at node %zu", kernel_index, i));
        }
    }
}

} // namespace

Engine::Engine(const EngineConfigV1& cfg) : Engine(cfg, {}) {}

Engine::Engine(const EngineConfigV1& cfg, std::vector<NumericKernel> kernels)
    : Engine(cfg, std::move(kernels), makeEvolutionBackend(sanitizeConfig(cfg))) {}

Engine::Engine(const EngineConfigV1& cfg, std::vector<NumericKernel> kernels,
               std::unique_ptr<EvolutionBackend> backend)
    : cfg_(sanitizeConfig(cfg)), kernels_(std::move(kernels)), backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("Engine: null evolution backend");
    }
    param_hash_u32_ = cfg_.fnv_hash_u32;
    // Empty slots would throw std::bad_function_call mid-cycle.
    kernels_.erase(std::remove_if(kernels_.begin(), kernels_.end(),
                                  [](const NumericKernel& k) { return !k; }),
                   kernels_.end());
    reset();
}

Engine::~Engine() = default;

void Engine::addKernel(NumericKernel kernel) {
    if (!kernel) return;
    kernels_.push_back(std::move(kernel));
}

void Engine::reset() {
    const std::size_t n = static_cast<std::size_t>(cfg_.node_count_u32);

    rng_.reseed(cfg_.seed_u32);

    state_.assign(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        state_[i] = rng_.uniform(cfg_.initial_state_min, cfg_.initial_state_max);
    }

    uf_ = ChargeUnionFind();
    for (std::size_t i = 0; i < n; ++i) {
        uf_.addNode(rng_);
    }

    void_entropy_ = rng_.uniform(kVoidEntropyMin, kVoidEntropyMax);
    ledger_.reset(cfg_.initial_budget);

    cycle_ = 0;
    halted_ = false;
    halt_reason_ = HaltReason::None;
    quiescent_skips_ = 0;

    trend_mean_rb_.assign(cfg_.trend_history_length_u32, 0.0);
    trend_void_rb_.assign(cfg_.trend_history_length_u32, 0.0);
    trend_head_ = 0;
    trend_count_ = 0;

    event_rb_.assign(cfg_.event_log_capacity_u32, EventRecord{});
    event_head_ = 0;
    event_count_ = 0;

    run_signatures_.run_param_hash_u32 = param_hash_u32_;
    run_signatures_.state_digest_u32 = fnv1a32_add_u32(fnv1a32_begin(), param_hash_u32_);
    last_stats_ = {};

    logEvent(EventKind::System,
             formatText("Engine reset: %zu nodes, backend %s, seed %u, budget %.3f",
                        n, backend_->name(), cfg_.seed_u32, cfg_.initial_budget));
}

StepOutcome Engine::step() {
    if (halted_) return StepOutcome::Halted;

    const std::size_t n = state_.size();
    CycleStats stats;
    stats.cycle = cycle_;

    if (cfg_.quiescence_skip_enabled_u32 && isQuiescent()) {
        ++quiescent_skips_;
        if ((quiescent_skips_ - 1) % kQuiescenceLogEvery == 0) {
            logEvent(EventKind::Scheduler,
                     formatText("Quiescent field, cycle skipped (%llu skips)",
                                static_cast<unsigned long long>(quiescent_skips_)));
        }
        last_stats_ = stats;
        return StepOutcome::Skipped;
    }

    SimContext ctx{cycle_, n, void_entropy_, rng_};

    // 1) Kernel deltas. A bad kernel halts before any state is touched.
    std::vector<double> delta(n, 0.0);
    try {
        for (std::size_t k = 0; k < kernels_.size(); ++k) {
            const std::vector<double> d = kernels_[k](state_, ctx);
            checkKernelOutput(d, n, k);
            for (std::size_t i = 0; i < n; ++i) {
                delta[i] += d[i];
            }
            stats.stage_work[static_cast<std::size_t>(CycleStage::KernelDeltas)] += n;
        }
    } catch (const NumericDivergence& e) {
        halt(HaltReason::NumericDivergence, e.what());
        last_stats_ = stats;
        throw;
    }

    // 2) Sparse apply + 3) clamp
    double cost = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double d = delta[i];
        cost += std::fabs(d);
        if (std::fabs(d) < cfg_.sparsity_epsilon) {
            ++stats.skipped_deltas_u32;
            continue;
        }
        state_[i] = clamp01(state_[i] + d);
        ++stats.applied_deltas_u32;
    }
    stats.stage_work[static_cast<std::size_t>(CycleStage::SparseApply)] += n;

    // 4) Entanglement. One draw per node keeps the RNG stream independent of p.
    for (std::size_t i = 0; i < n; ++i) {
        if (rng_.uniform01() >= cfg_.entanglement_probability) continue;
        const std::size_t j = rng_.uniformIndex(n);
        if (j == i) continue;
        ++stats.merge_attempts_u32;
        if (uf_.unite(i, j)) ++stats.merges_u32;
    }
    stats.stage_work[static_cast<std::size_t>(CycleStage::Entanglement)] += n;
    if (stats.merges_u32 > 0) {
        logEvent(EventKind::Entanglement,
                 formatText("%u merges, %zu sets remain", stats.merges_u32, uf_.setCount()));
    }

    // 5) Backend blend. Steps 1-4 are not rolled back on divergence.
    try {
        const std::vector<double> field = backend_->propagate(state_, ctx);
        const double w = cfg_.mixing_weight;
        double r_sum = 0.0;
        double r_sq = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            state_[i] = clamp01((1.0 - w) * state_[i] + w * field[i]);
            const double r = state_[i] - field[i];
            r_sum += r;
            r_sq += r * r;
        }
        if (n > 0) {
            const double r_mean = r_sum / static_cast<double>(n);
            stats.blend_residual_std = std::sqrt(std::max(0.0, r_sq / static_cast<double>(n) - r_mean * r_mean));
        }
        stats.stage_work[static_cast<std::size_t>(CycleStage::Backend)] += n;
    } catch (const NumericDivergence& e) {
        halt(HaltReason::NumericDivergence, e.what());
        last_stats_ = stats;
        throw;
    }

    // 6) Ledger
    stats.cost = cost;
    ledger_.charge(cost);
    stats.stage_work[static_cast<std::size_t>(CycleStage::Ledger)] += 1;
    if (ledger_.isExhausted()) {
        halt(HaltReason::BudgetExhausted,
             formatText("free energy exhausted (available %.6f, leakage %.6f)",
                        ledger_.available(), ledger_.leakage()));
        last_stats_ = stats;
        return StepOutcome::Halted;
    }

    // 7) Advance + 8) void entropy and trends
    ++cycle_;
    const double mean = meanState();
    updateVoidEntropy(mean);
    pushTrends(mean);
    foldStateDigest();

    last_stats_ = stats;
    return StepOutcome::Advanced;
}

double Engine::applyNodeAdjustment(std::size_t index, double delta) {
    if (halted_) {
        throw InvalidState("Engine::applyNodeAdjustment: engine is halted");
    }
    if (index >= state_.size()) {
        throw IndexOutOfRange("Engine::applyNodeAdjustment", index, state_.size());
    }
    if (!std::isfinite(delta)) return 0.0;

    const double cap = cfg_.max_agent_adjustment;
    const double d = std::clamp(delta, -cap, cap);
    const double before = state_[index];
    state_[index] = clamp01(before + d);
    const double applied = state_[index] - before;
    if (applied != 0.0 && cfg_.log_level_u32 > 1u) {
        logEvent(EventKind::Agent, formatText("node %zu adjusted by %+.5f", index, applied));
    }
    return applied;
}

double Engine::meanState() const {
    if (state_.empty()) return 0.0;
    double sum = 0.0;
    for (double v : state_) sum += v;
    return sum / static_cast<double>(state_.size());
}

std::vector<double> Engine::meanStateTrend() const {
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(trend_count_));
    const int cap = static_cast<int>(trend_mean_rb_.size());
    int idx = trend_head_ - trend_count_;
    while (idx < 0) idx += cap;
    for (int i = 0; i < trend_count_; ++i) {
        out.push_back(trend_mean_rb_[static_cast<std::size_t>((idx + i) % cap)]);
    }
    return out;
}

std::vector<double> Engine::voidEntropyTrend() const {
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(trend_count_));
    const int cap = static_cast<int>(trend_void_rb_.size());
    int idx = trend_head_ - trend_count_;
    while (idx < 0) idx += cap;
    for (int i = 0; i < trend_count_; ++i) {
        out.push_back(trend_void_rb_[static_cast<std::size_t>((idx + i) % cap)]);
    }
    return out;
}

int Engine::getEventLog(EventRecord* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    const int capacity = static_cast<int>(event_rb_.size());
    const int n = std::min<int>(event_count_, cap);
    // Oldest record index = head - count (mod capacity)
    int idx = event_head_ - event_count_;
    while (idx < 0) idx += capacity;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = event_rb_[static_cast<std::size_t>((idx + i) % capacity)];
    }
    return n;
}

int Engine::exportConfigText(char* buf, int cap) const {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    const EngineConfigV1& c = cfg_;
    int n = 0;
    auto app = [&](const char* fmt, auto... args) {
        if (n >= cap) return;
        const int w = std::snprintf(buf + n, static_cast<std::size_t>(cap - n), fmt, args...);
        if (w > 0) n += std::min(w, cap - n);
    };

    app("%s\n", "EngineConfigV1");
    app("  version_u32=%u\n", c.version_u32);
    app("  size_bytes_u32=%u\n", c.size_bytes_u32);
    app("  node_count_u32=%u\n", c.node_count_u32);
    app("  seed_u32=%u\n", c.seed_u32);
    app("  initial_state_min=%.9g\n", c.initial_state_min);
    app("  initial_state_max=%.9g\n", c.initial_state_max);
    app("  initial_budget=%.9g\n", c.initial_budget);
    app("  entanglement_probability=%.9g\n", c.entanglement_probability);
    app("  mixing_weight=%.9g\n", c.mixing_weight);
    app("  sparsity_epsilon=%.9g\n", c.sparsity_epsilon);
    app("  backend=%s\n", cuf::backendName(c.backend));
    app("  smoothing_passes_u32=%u\n", c.smoothing_passes_u32);
    app("  mixing_passes_u32=%u\n", c.mixing_passes_u32);
    app("  spectral_decay=%.9g\n", c.spectral_decay);
    app("  trend_history_length_u32=%u\n", c.trend_history_length_u32);
    app("  event_log_capacity_u32=%u\n", c.event_log_capacity_u32);
    app("  log_level_u32=%u\n", c.log_level_u32);
    app("  max_agent_adjustment=%.9g\n", c.max_agent_adjustment);
    app("  quiescence_skip_enabled_u32=%u\n", c.quiescence_skip_enabled_u32);
    app("  quiescence_buckets_u32=%u\n", c.quiescence_buckets_u32);
    app("  quiescence_std_threshold=%.9g\n", c.quiescence_std_threshold);
    app("  fnv_hash_u32=0x%08X\n", c.fnv_hash_u32);

    // Convenience: full export hash for copy/paste audits.
    const std::uint32_t export_hash = fnv_hash_text_u32(buf);
    app("ExportTextHash(FNV-1a32)=0x%08X\n", export_hash);

    return std::min(n, cap);
}

EngineSnapshot Engine::captureSnapshot() const {
    EngineSnapshot s;
    s.cycle = cycle_;
    s.halted = halted_;
    s.halt_reason = halt_reason_;
    s.ledger_value = ledger_.available();
    s.leakage = ledger_.leakage();
    s.ledger_consumed = ledger_.consumed();
    s.node_count_u32 = nodeCountU32();
    s.seed_u32 = cfg_.seed_u32;
    s.rng_state_u32 = rng_.state();
    s.param_hash_u32 = param_hash_u32_;
    s.state_digest_u32 = run_signatures_.state_digest_u32;
    s.void_entropy = void_entropy_;
    s.unionfind_parents = uf_.parents();
    s.unionfind_charge_a = uf_.chargesA();
    s.unionfind_charge_b = uf_.chargesB();
    s.node_state = state_;
    s.trend_mean_state = meanStateTrend();
    s.trend_void_entropy = voidEntropyTrend();
    return s;
}

void Engine::restoreSnapshot(const EngineSnapshot& snap) {
    const std::size_t n = state_.size();

    if (snap.format_u32 != 1u) {
        throw SnapshotCorrupt(formatText("unsupported format %u", snap.format_u32));
    }
    if (snap.node_count_u32 != nodeCountU32()) {
        throw SnapshotCorrupt(formatText("node count %u does not match engine (%zu)", snap.node_count_u32, n));
    }
    if (snap.param_hash_u32 != param_hash_u32_) {
        throw SnapshotCorrupt(formatText("config hash 0x%08X does not match engine (0x%08X)",
                                         snap.param_hash_u32, param_hash_u32_));
    }
    if (snap.node_state.size() != n) {
        throw SnapshotCorrupt(formatText("node state length %zu, expected %zu", snap.node_state.size(), n));
    }
    for (double v : snap.node_state) {
        if (!std::isfinite(v)) throw SnapshotCorrupt("non-finite node state");
    }
    const bool reason_known = snap.halt_reason == HaltReason::None ||
                              snap.halt_reason == HaltReason::BudgetExhausted ||
                              snap.halt_reason == HaltReason::NumericDivergence;
    if (!reason_known || snap.halted != (snap.halt_reason != HaltReason::None)) {
        throw SnapshotCorrupt("halt flag and halt reason disagree");
    }
    if (!std::isfinite(snap.ledger_value) || !std::isfinite(snap.leakage) ||
        !std::isfinite(snap.ledger_consumed) || !std::isfinite(snap.void_entropy)) {
        throw SnapshotCorrupt("non-finite ledger or void entropy");
    }
    if (snap.trend_mean_state.size() != snap.trend_void_entropy.size()) {
        throw SnapshotCorrupt("trend histories differ in length");
    }
    if (snap.unionfind_parents.size() != n) {
        throw SnapshotCorrupt(formatText("union-find length %zu, expected %zu", snap.unionfind_parents.size(), n));
    }

    // Build everything that can fail before touching engine state.
    ChargeUnionFind uf;
    try {
        uf = ChargeUnionFind::fromArrays(snap.unionfind_parents, snap.unionfind_charge_a, snap.unionfind_charge_b);
    } catch (const std::invalid_argument& e) {
        throw SnapshotCorrupt(e.what());
    }

    state_ = snap.node_state;
    for (double& v : state_) v = clamp01(v);
    uf_ = std::move(uf);
    ledger_.restore(snap.ledger_value, snap.leakage, snap.ledger_consumed);
    rng_.setState(snap.rng_state_u32);

    cycle_ = snap.cycle;
    halted_ = snap.halted;
    halt_reason_ = snap.halt_reason;
    void_entropy_ = std::clamp(snap.void_entropy, kVoidEntropyMin, kVoidEntropyMax);
    quiescent_skips_ = 0;

    // Keep only the most recent entries that fit the configured history.
    const std::size_t cap = trend_mean_rb_.size();
    const std::size_t total = snap.trend_mean_state.size();
    const std::size_t first = (total > cap) ? (total - cap) : 0;
    std::fill(trend_mean_rb_.begin(), trend_mean_rb_.end(), 0.0);
    std::fill(trend_void_rb_.begin(), trend_void_rb_.end(), 0.0);
    trend_head_ = 0;
    trend_count_ = 0;
    for (std::size_t i = first; i < total; ++i) {
        trend_mean_rb_[static_cast<std::size_t>(trend_head_)] = snap.trend_mean_state[i];
        trend_void_rb_[static_cast<std::size_t>(trend_head_)] = snap.trend_void_entropy[i];
        trend_head_ = (trend_head_ + 1) % static_cast<int>(cap);
        trend_count_ = std::min(trend_count_ + 1, static_cast<int>(cap));
    }

    run_signatures_.run_param_hash_u32 = param_hash_u32_;
    run_signatures_.state_digest_u32 = snap.state_digest_u32;
    last_stats_ = {};

    logEvent(EventKind::Snapshot,
             formatText("State restored from spectral snapshot (cycle %llu%s)",
                        static_cast<unsigned long long>(cycle_), halted_ ? ", halted" : ""));
}

bool Engine::isQuiescent() const {
    const std::size_t n = state_.size();
    const std::size_t buckets = std::min<std::size_t>(cfg_.quiescence_buckets_u32, n);
    if (buckets == 0) return false;

    // Near-equal contiguous chunks: the first (n % buckets) chunks get one extra node.
    const std::size_t base = n / buckets;
    const std::size_t extra = n % buckets;
    std::size_t begin = 0;
    double std_sum = 0.0;
    for (std::size_t b = 0; b < buckets; ++b) {
        const std::size_t len = base + (b < extra ? 1 : 0);
        double mean = 0.0;
        for (std::size_t i = begin; i < begin + len; ++i) mean += state_[i];
        mean /= static_cast<double>(len);
        double var = 0.0;
        for (std::size_t i = begin; i < begin + len; ++i) {
            const double d = state_[i] - mean;
            var += d * d;
        }
        std_sum += std::sqrt(var / static_cast<double>(len));
        begin += len;
    }
    return (std_sum / static_cast<double>(buckets)) < cfg_.quiescence_std_threshold;
}

void Engine::halt(HaltReason reason, const std::string& detail) {
    halted_ = true;
    halt_reason_ = reason;
    logEvent(EventKind::Fatal, std::string(haltReasonName(reason)) + ": " + detail);
}

void Engine::updateVoidEntropy(double mean) {
    void_entropy_ += kVoidEntropyDrift * (mean - 0.5) + rng_.normal(0.0, kVoidEntropyNoise);
    void_entropy_ = std::clamp(void_entropy_, kVoidEntropyMin, kVoidEntropyMax);
}

void Engine::pushTrends(double mean) {
    const int cap = static_cast<int>(trend_mean_rb_.size());
    trend_mean_rb_[static_cast<std::size_t>(trend_head_)] = mean;
    trend_void_rb_[static_cast<std::size_t>(trend_head_)] = void_entropy_;
    trend_head_ = (trend_head_ + 1) % cap;
    trend_count_ = std::min(trend_count_ + 1, cap);
}

void Engine::foldStateDigest() {
    std::uint32_t h = run_signatures_.state_digest_u32;
    h = fnv1a32_add_u64(h, cycle_);
    for (double v : state_) h = fnv1a32_add_f64(h, v);
    for (std::uint32_t p : uf_.parents()) h = fnv1a32_add_u32(h, p);
    h = fnv1a32_update(h, uf_.chargesA().data(), uf_.chargesA().size());
    h = fnv1a32_update(h, uf_.chargesB().data(), uf_.chargesB().size());
    h = fnv1a32_add_f64(h, ledger_.available());
    h = fnv1a32_add_f64(h, void_entropy_);
    run_signatures_.state_digest_u32 = h;
}

void Engine::logEvent(EventKind kind, const std::string& message) {
    EventRecord rec;
    rec.cycle = cycle_;
    rec.kind = kind;
    rec.text = formatText("[C%04llu] %s: ", static_cast<unsigned long long>(cycle_), eventKindName(kind)) + message;

    if (cfg_.log_level_u32 > 0u) {
        std::clog << rec.text << '\n';
    }

    const int cap = static_cast<int>(event_rb_.size());
    event_rb_[static_cast<std::size_t>(event_head_)] = std::move(rec);
    event_head_ = (event_head_ + 1) % cap;
    event_count_ = std::min(event_count_ + 1, cap);
}

} // namespace cuf
