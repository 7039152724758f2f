#include "Engine.h"
#include "EngineErrors.h"
#include "SnapshotCodec.h"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
void printUsage() {
    std::cout << "EngineRun usage:\n"
              << "  EngineRun [--nodes n] [--seed s] [--cycles n] [--backend <local|mixing|spectral>]\n"
              << "            [--budget v] [--entanglement p] [--every n] [--log-level n]\n"
              << "            [--load file] [--save file] [--config]\n"
              << "  --load requires the same engine flags that produced the snapshot.\n";
}

void printStatus(const cuf::Engine& engine) {
    std::printf("[C%04llu] mean=%.5f ve=%+.5f ledger=%.4f leakage=%.4f sets=%zu residual=%.5f\n",
                static_cast<unsigned long long>(engine.cycle()),
                engine.meanState(),
                engine.voidEntropy(),
                engine.ledgerValue(),
                engine.leakage(),
                engine.unionFind().setCount(),
                engine.lastCycleStats().blend_residual_std);
}
} // namespace

int main(int argc, char** argv) {
    cuf::EngineConfigV1 cfg;
    std::uint64_t cycles = 100;
    std::uint64_t every = 10;
    std::string load_path;
    std::string save_path;
    bool print_config = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--nodes" && i + 1 < argc) {
                cfg.node_count_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--cycles" && i + 1 < argc) {
                cycles = std::stoull(argv[++i]);
            } else if (arg == "--budget" && i + 1 < argc) {
                cfg.initial_budget = std::stod(argv[++i]);
            } else if (arg == "--entanglement" && i + 1 < argc) {
                cfg.entanglement_probability = std::stod(argv[++i]);
            } else if (arg == "--every" && i + 1 < argc) {
                every = std::stoull(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                cfg.log_level_u32 = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--backend" && i + 1 < argc) {
                const std::string name = argv[++i];
                if (!cuf::parseBackendKind(name, &cfg.backend)) {
                    std::cout << "Unknown backend: " << name << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--load" && i + 1 < argc) {
                load_path = argv[++i];
            } else if (arg == "--save" && i + 1 < argc) {
                save_path = argv[++i];
            } else if (arg == "--config") {
                print_config = true;
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

    cuf::Engine engine(cfg, cuf::referenceKernels());
    const cuf::SnapshotCodec codec;

    if (print_config) {
        std::vector<char> text(4096, '\0');
        engine.exportConfigText(text.data(), static_cast<int>(text.size()));
        std::cout << text.data();
    }

    if (!load_path.empty()) {
        try {
            engine.restoreSnapshot(codec.loadFromFile(load_path));
        } catch (const cuf::SnapshotCorrupt& e) {
            std::cerr << "Load failed: " << e.what() << "\n";
            return 2;
        }
        std::cout << "Loaded " << load_path << " at cycle " << engine.cycle() << "\n";
    }

    printStatus(engine);
    int exit_code = 0;
    for (std::uint64_t c = 0; c < cycles && !engine.isHalted(); ++c) {
        cuf::StepOutcome outcome = cuf::StepOutcome::Advanced;
        try {
            outcome = engine.step();
        } catch (const cuf::NumericDivergence& e) {
            std::cerr << "Diverged: " << e.what() << "\n";
            exit_code = 3;
            break;
        }
        if (outcome == cuf::StepOutcome::Skipped) {
            std::cout << "Field is quiescent; stopping at cycle " << engine.cycle() << "\n";
            break;
        }
        if (every > 0 && engine.cycle() % every == 0) {
            printStatus(engine);
        }
    }
    printStatus(engine);

    if (engine.isHalted()) {
        std::cout << "Halted: " << cuf::haltReasonName(engine.haltReason()) << "\n";
    }

    std::vector<cuf::EventRecord> events(static_cast<std::size_t>(engine.config().event_log_capacity_u32));
    const int n_events = engine.getEventLog(events.data(), static_cast<int>(events.size()));
    std::cout << "Event log (" << n_events << "):\n";
    for (int i = 0; i < n_events; ++i) {
        std::cout << "  " << events[static_cast<std::size_t>(i)].text << "\n";
    }

    const cuf::RunSignatures sig = engine.getRunSignatures();
    std::printf("RunSignatures: param=0x%08X digest=0x%08X\n", sig.run_param_hash_u32, sig.state_digest_u32);

    if (!save_path.empty()) {
        cuf::EncodeReport report;
        if (!codec.saveToFile(engine.captureSnapshot(), save_path, &report)) {
            std::cerr << "Save failed: cannot write " << save_path << "\n";
            return 2;
        }
        std::printf("Saved %s: %zu bytes (raw %zu), %zu/%zu %s coefficients, max error %.3g\n",
                    save_path.c_str(), report.compressed_bytes, report.raw_bytes,
                    report.retained_coefficients, engine.nodeCount(), report.transform_kind.c_str(),
                    report.max_abs_error);
    }
    return exit_code;
}
