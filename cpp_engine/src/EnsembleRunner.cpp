#include "EnsembleRunner.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace cuf {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampMembers(int members) {
    return members < 1 ? 1 : members;
}
} // namespace

EnsembleRunner::EnsembleRunner() = default;

void EnsembleRunner::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void EnsembleRunner::setRanges(const Ranges& ranges) {
    ranges_ = ranges;
}

EnsembleRunner::Stats EnsembleRunner::summarize(const std::vector<double>& values) {
    Stats result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * static_cast<double>(sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

EnsembleRunner::Summary EnsembleRunner::run(const ScenarioConfig& scenario, int members) const {
    const int count = clampMembers(members);
    std::mt19937 rng(1337u);

    const auto p_samples = latinHypercubeSamples(ranges_.entanglement_probability.min,
                                                 ranges_.entanglement_probability.max,
                                                 count,
                                                 rng);
    const auto w_samples = latinHypercubeSamples(ranges_.mixing_weight.min,
                                                 ranges_.mixing_weight.max,
                                                 count,
                                                 rng);

    std::vector<double> cycles;
    std::vector<double> mean_state;
    std::vector<double> set_count;
    cycles.reserve(static_cast<std::size_t>(count));
    mean_state.reserve(static_cast<std::size_t>(count));
    set_count.reserve(static_cast<std::size_t>(count));

    Summary summary{};
    summary.members = count;
    for (int i = 0; i < count; ++i) {
        ScenarioConfig varied = scenario;
        varied.engine.seed_u32 = scenario.engine.seed_u32 + static_cast<std::uint32_t>(i);
        varied.engine.entanglement_probability = p_samples[static_cast<std::size_t>(i)];
        varied.engine.mixing_weight = w_samples[static_cast<std::size_t>(i)];

        const auto metrics = SensitivityAnalyzer::runScenario(varied);
        cycles.push_back(static_cast<double>(metrics.cycles_survived));
        mean_state.push_back(metrics.final_mean_state);
        set_count.push_back(static_cast<double>(metrics.final_set_count));
        if (metrics.halt_reason != HaltReason::None) ++summary.halted_members;
    }

    summary.cycles_survived = summarize(cycles);
    summary.final_mean_state = summarize(mean_state);
    summary.final_set_count = summarize(set_count);
    return summary;
}

EnsembleRunner::Summary EnsembleRunner::run(int members) const {
    return run(scenario_, members);
}

} // namespace cuf
