#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "EngineConfig.h"

namespace cuf {

class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        EngineConfigV1 engine{};
        std::uint64_t max_cycles = 200;
        bool reference_kernels = true;
    };

    struct SampleResult {
        std::uint64_t cycles_survived = 0;
        HaltReason halt_reason = HaltReason::None;
        double final_mean_state = 0.0;
        double final_ledger = 0.0;
        double leakage = 0.0;
        std::uint64_t final_set_count = 0;
        std::uint32_t state_digest_u32 = 0;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    SensitivityAnalyzer();

    void setScenario(const ScenarioConfig& scenario);
    void clearResults();

    void analyzeEntanglementProbability(const ParameterRange& range);
    void analyzeMixingWeight(const ParameterRange& range);
    void analyzeBudget(const ParameterRange& range);
    void analyzeSparsityEpsilon(const ParameterRange& range);

    // Returns false if the file cannot be opened.
    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

    // Runs one scenario to completion (halt, quiescent stall, or max_cycles).
    static SampleResult runScenario(const ScenarioConfig& scenario);

private:
    ScenarioConfig scenario_{};
    std::vector<SensitivityRow> results_{};

    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace cuf
