#include "SensitivityAnalysis.h"

#include "Engine.h"
#include "EngineErrors.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <utility>

namespace cuf {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SampleResult SensitivityAnalyzer::runScenario(const ScenarioConfig& scenario) {
    Engine engine(scenario.engine);
    if (scenario.reference_kernels) {
        for (auto& k : referenceKernels()) engine.addKernel(std::move(k));
    }

    for (std::uint64_t c = 0; c < scenario.max_cycles; ++c) {
        StepOutcome outcome = StepOutcome::Advanced;
        try {
            outcome = engine.step();
        } catch (const NumericDivergence&) {
            // The engine has already halted with the reason recorded.
            break;
        }
        // A skipped cycle leaves the state unchanged, so every later step would skip too.
        if (outcome != StepOutcome::Advanced) break;
    }

    SampleResult m{};
    m.cycles_survived = engine.cycle();
    m.halt_reason = engine.haltReason();
    m.final_mean_state = engine.meanState();
    m.final_ledger = engine.ledgerValue();
    m.leakage = engine.leakage();
    m.final_set_count = static_cast<std::uint64_t>(engine.unionFind().setCount());
    m.state_digest_u32 = engine.getRunSignatures().state_digest_u32;
    return m;
}

void SensitivityAnalyzer::analyzeEntanglementProbability(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.engine.entanglement_probability = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"entanglement_probability", value, metrics});
    }
}

void SensitivityAnalyzer::analyzeMixingWeight(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.engine.mixing_weight = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"mixing_weight", value, metrics});
    }
}

void SensitivityAnalyzer::analyzeBudget(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.engine.initial_budget = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"initial_budget", value, metrics});
    }
}

void SensitivityAnalyzer::analyzeSparsityEpsilon(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.engine.sparsity_epsilon = value;
        const auto metrics = runScenario(scenario);
        results_.push_back({"sparsity_epsilon", value, metrics});
    }
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,cycles_survived,halt_reason,final_mean_state,final_ledger,leakage,final_set_count\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.cycles_survived << ','
            << haltReasonName(row.metrics.halt_reason) << ','
            << row.metrics.final_mean_state << ','
            << row.metrics.final_ledger << ','
            << row.metrics.leakage << ','
            << row.metrics.final_set_count << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace cuf
