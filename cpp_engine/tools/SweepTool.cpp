#include "EnsembleRunner.h"
#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <entanglement|mixing|budget|epsilon> [--min v] [--max v] [--samples n] [--out file]\n"
              << "            [--nodes n] [--seed s] [--cycles n] [--backend <local|mixing|spectral>]\n"
              << "  SweepTool --ensemble <members> [--nodes n] [--seed s] [--cycles n] [--backend name]\n";
}

void printStats(const char* label, const cuf::EnsembleRunner::Stats& s) {
    std::printf("  %-18s mean=%.4f median=%.4f ci95=[%.4f, %.4f] std=%.4f\n",
                label, s.mean, s.median, s.ci_lower_95, s.ci_upper_95, s.std_dev);
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    int ensemble_members = 0;
    std::string out = "sensitivity.csv";
    bool min_set = false;
    bool max_set = false;

    cuf::SensitivityAnalyzer::ScenarioConfig scenario;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--ensemble" && i + 1 < argc) {
                ensemble_members = std::stoi(argv[++i]);
            } else if (arg == "--nodes" && i + 1 < argc) {
                scenario.engine.node_count_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                scenario.engine.seed_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--cycles" && i + 1 < argc) {
                scenario.max_cycles = std::stoull(argv[++i]);
            } else if (arg == "--backend" && i + 1 < argc) {
                const std::string name = argv[++i];
                if (!cuf::parseBackendKind(name, &scenario.engine.backend)) {
                    std::cout << "Unknown backend: " << name << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        printUsage();
        return 1;
    }

    if (ensemble_members > 0) {
        cuf::EnsembleRunner runner;
        const auto summary = runner.run(scenario, ensemble_members);
        std::printf("Ensemble: %d members, %d halted\n", summary.members, summary.halted_members);
        printStats("cycles_survived", summary.cycles_survived);
        printStats("final_mean_state", summary.final_mean_state);
        printStats("final_set_count", summary.final_set_count);
        return 0;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    cuf::SensitivityAnalyzer analyzer;
    analyzer.setScenario(scenario);

    cuf::SensitivityAnalyzer::ParameterRange range;
    range.samples = samples;

    if (param == "entanglement" || param == "entanglement_probability") {
        range.nominal = scenario.engine.entanglement_probability;
    } else if (param == "mixing" || param == "mixing_weight") {
        range.nominal = scenario.engine.mixing_weight;
    } else if (param == "budget" || param == "initial_budget") {
        range.nominal = scenario.engine.initial_budget;
    } else if (param == "epsilon" || param == "sparsity_epsilon") {
        range.nominal = scenario.engine.sparsity_epsilon;
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    if (!min_set) {
        min_val = range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    if (param == "entanglement" || param == "entanglement_probability") {
        analyzer.analyzeEntanglementProbability(range);
    } else if (param == "mixing" || param == "mixing_weight") {
        analyzer.analyzeMixingWeight(range);
    } else if (param == "budget" || param == "initial_budget") {
        analyzer.analyzeBudget(range);
    } else {
        analyzer.analyzeSparsityEpsilon(range);
    }

    if (!analyzer.exportSensitivityMatrixCSV(out)) {
        std::cerr << "Failed to write: " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    return 0;
}
