#pragma once

#include <cstdint>
#include <vector>

#include "SensitivityAnalysis.h"

namespace cuf {

// Runs many independent engines ("parallel universes") with different seeds and
// Latin-hypercube sampled cycle rules, then summarizes the spread of outcomes.
class EnsembleRunner {
public:
    using ScenarioConfig = SensitivityAnalyzer::ScenarioConfig;

    struct ParameterRange {
        double min = 0.0;
        double max = 0.0;
    };

    struct Stats {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct Summary {
        int members = 0;
        int halted_members = 0;
        Stats cycles_survived{};
        Stats final_mean_state{};
        Stats final_set_count{};
    };

    struct Ranges {
        ParameterRange entanglement_probability{0.0, 0.2};
        ParameterRange mixing_weight{0.05, 0.5};
    };

    EnsembleRunner();

    void setScenario(const ScenarioConfig& scenario);
    void setRanges(const Ranges& ranges);

    // Member i runs with seed (scenario seed + i). Sampling is fixed-seeded, so the
    // summary is reproducible.
    Summary run(const ScenarioConfig& scenario, int members = 16) const;
    Summary run(int members = 16) const;

    static Stats summarize(const std::vector<double>& values);

private:
    ScenarioConfig scenario_{};
    Ranges ranges_{};
};

} // namespace cuf
