#include "EngineConfig.h"
#include "Signatures.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace cuf {

namespace {

static inline double finiteOr(double x, double fallback) {
    return std::isfinite(x) ? x : fallback;
}

static inline double clampFinite(double x, double lo, double hi, double fallback) {
    return std::clamp(finiteOr(x, fallback), lo, hi);
}

} // namespace

const char* backendName(BackendKind k) {
    switch (k) {
    case BackendKind::LocalAverage:    return "LocalAverage";
    case BackendKind::RandomMixing:    return "RandomMixing";
    case BackendKind::SpectralLowPass: return "SpectralLowPass";
    }
    return "Unknown";
}

bool parseBackendKind(const std::string& name, BackendKind* out) {
    if (!out) return false;
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "local" || v == "localaverage" || v == "average") {
        *out = BackendKind::LocalAverage;
    } else if (v == "mixing" || v == "randommixing" || v == "mps") {
        *out = BackendKind::RandomMixing;
    } else if (v == "spectral" || v == "spectrallowpass" || v == "qft") {
        *out = BackendKind::SpectralLowPass;
    } else {
        return false;
    }
    return true;
}

const char* haltReasonName(HaltReason r) {
    switch (r) {
    case HaltReason::None:              return "None";
    case HaltReason::BudgetExhausted:   return "BudgetExhausted";
    case HaltReason::NumericDivergence: return "NumericDivergence";
    }
    return "Unknown";
}

const char* eventKindName(EventKind k) {
    switch (k) {
    case EventKind::System:       return "System";
    case EventKind::Scheduler:    return "Scheduler";
    case EventKind::Entanglement: return "Entanglement";
    case EventKind::Ledger:       return "Ledger";
    case EventKind::Agent:        return "Agent";
    case EventKind::Snapshot:     return "Snapshot";
    case EventKind::Fatal:        return "FATAL";
    }
    return "Unknown";
}

EngineConfigV1 sanitizeConfig(const EngineConfigV1& in) {
    EngineConfigV1 c = in;
    c.version_u32 = 1;
    c.size_bytes_u32 = sizeof(EngineConfigV1);

    c.node_count_u32 = std::max<std::uint32_t>(1u, c.node_count_u32);

    c.initial_state_min = clampFinite(c.initial_state_min, 0.0, 1.0, 0.4);
    c.initial_state_max = clampFinite(c.initial_state_max, 0.0, 1.0, 0.7);
    if (c.initial_state_max < c.initial_state_min) {
        std::swap(c.initial_state_min, c.initial_state_max);
    }

    // Budget may legitimately start at 0; a negative start would be exhausted before cycle 1.
    c.initial_budget = std::max(0.0, finiteOr(c.initial_budget, 0.0));

    c.entanglement_probability = clampFinite(c.entanglement_probability, 0.0, 1.0, 0.0);
    c.mixing_weight = clampFinite(c.mixing_weight, 0.0, 1.0, 0.0);
    c.sparsity_epsilon = std::max(0.0, finiteOr(c.sparsity_epsilon, 1e-5));

    switch (c.backend) {
    case BackendKind::LocalAverage:
    case BackendKind::RandomMixing:
    case BackendKind::SpectralLowPass:
        break;
    default:
        c.backend = BackendKind::LocalAverage;
        break;
    }
    c.smoothing_passes_u32 = std::clamp<std::uint32_t>(c.smoothing_passes_u32, 1u, 64u);
    c.mixing_passes_u32 = std::clamp<std::uint32_t>(c.mixing_passes_u32, 1u, 64u);
    c.spectral_decay = clampFinite(c.spectral_decay, 0.0, 1.0e4, 10.0);

    c.trend_history_length_u32 = std::clamp<std::uint32_t>(c.trend_history_length_u32, 1u, 1u << 20);
    c.event_log_capacity_u32 = std::clamp<std::uint32_t>(c.event_log_capacity_u32, 1u, 4096u);

    c.max_agent_adjustment = clampFinite(c.max_agent_adjustment, 0.0, 1.0, 0.0);

    c.quiescence_skip_enabled_u32 = c.quiescence_skip_enabled_u32 ? 1u : 0u;
    c.quiescence_buckets_u32 = std::clamp<std::uint32_t>(c.quiescence_buckets_u32, 1u, c.node_count_u32);
    c.quiescence_std_threshold = std::max(0.0, finiteOr(c.quiescence_std_threshold, 0.005));

    c.fnv_hash_u32 = configParamHash(c);
    return c;
}

std::uint32_t configParamHash(const EngineConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, c.size_bytes_u32);
    h = fnv1a32_add_u32(h, c.node_count_u32);
    h = fnv1a32_add_u32(h, c.seed_u32);
    h = fnv1a32_add_f64(h, c.initial_state_min);
    h = fnv1a32_add_f64(h, c.initial_state_max);
    h = fnv1a32_add_f64(h, c.initial_budget);
    h = fnv1a32_add_f64(h, c.entanglement_probability);
    h = fnv1a32_add_f64(h, c.mixing_weight);
    h = fnv1a32_add_f64(h, c.sparsity_epsilon);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(c.backend));
    h = fnv1a32_add_u32(h, c.smoothing_passes_u32);
    h = fnv1a32_add_u32(h, c.mixing_passes_u32);
    h = fnv1a32_add_f64(h, c.spectral_decay);
    h = fnv1a32_add_u32(h, c.trend_history_length_u32);
    h = fnv1a32_add_u32(h, c.event_log_capacity_u32);
    // log_level is presentation-only and excluded from the hash.
    h = fnv1a32_add_f64(h, c.max_agent_adjustment);
    h = fnv1a32_add_u32(h, c.quiescence_skip_enabled_u32);
    h = fnv1a32_add_u32(h, c.quiescence_buckets_u32);
    h = fnv1a32_add_f64(h, c.quiescence_std_threshold);
    return h;
}

} // namespace cuf
