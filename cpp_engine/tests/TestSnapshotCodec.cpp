#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Engine.h"
#include "EngineErrors.h"
#include "SnapshotCodec.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

using json = nlohmann::json;
using Bytes = std::vector<std::uint8_t>;

static inline double absd(double x) { return x < 0 ? -x : x; }

static double maxAbsDiff(const std::vector<double>& a, const std::vector<double>& b) {
    double m = 0.0;
    for (std::size_t i = 0; i < a.size() && i < b.size(); ++i) {
        const double d = absd(a[i] - b[i]);
        if (d > m) m = d;
    }
    return m;
}

template <typename Fn>
static bool throwsCorrupt(Fn&& fn) {
    try {
        fn();
    } catch (const cuf::SnapshotCorrupt&) {
        return true;
    }
    return false;
}

static cuf::EngineConfigV1 runConfig() {
    cuf::EngineConfigV1 cfg;
    cfg.node_count_u32 = 64;
    cfg.seed_u32 = 7;
    cfg.entanglement_probability = 0.2;
    cfg.trend_history_length_u32 = 16;
    return cfg;
}

// Engine advanced a few cycles so every snapshot field holds something non-trivial.
static cuf::EngineSnapshot capturedRun(int cycles) {
    cuf::Engine e(runConfig(), cuf::referenceKernels());
    for (int i = 0; i < cycles; ++i) e.step();
    return e.captureSnapshot();
}

// Decode the MessagePack record inside a valid envelope, let the caller edit it, re-wrap.
template <typename Edit>
static Bytes editRecord(const Bytes& envelope, Edit&& edit) {
    json j = json::from_msgpack(cuf::SnapshotCodec::decompressEnvelope(envelope));
    edit(j);
    return cuf::SnapshotCodec::compressEnvelope(json::to_msgpack(j), 6);
}

// =======================
// 5A: Envelope framing
// =======================

static void runEnvelopeLayout_5A1() {
    const cuf::SnapshotCodec codec;
    cuf::EncodeReport report;
    const Bytes bytes = codec.encode(capturedRun(10), &report);

    REQUIRE(bytes.size() > cuf::SnapshotCodec::kEnvelopeHeaderBytes, "5A1: envelope too short");
    REQUIRE(bytes[0] == 'C' && bytes[1] == 'U' && bytes[2] == 'F' && bytes[3] == 'Z', "5A1: magic");
    REQUIRE(bytes[4] == cuf::SnapshotCodec::kEnvelopeFormat, "5A1: format byte");

    std::uint64_t raw_size = 0;
    for (int i = 7; i >= 0; --i) raw_size = (raw_size << 8) | bytes[static_cast<std::size_t>(5 + i)];
    REQUIRE(raw_size == report.raw_bytes, "5A1: header raw size must match the MessagePack payload");
    REQUIRE(report.compressed_bytes == bytes.size(), "5A1: report compressed size");
    REQUIRE(cuf::SnapshotCodec::decompressEnvelope(bytes).size() == raw_size, "5A1: inflate size");

    std::cout << "[PASS] 5A1 CUFZ envelope header (magic, format, LE raw size)\n";
}

static void runEnvelopeDamage_5A2() {
    const cuf::SnapshotCodec codec;
    const Bytes good = codec.encode(capturedRun(5));

    REQUIRE(throwsCorrupt([&] { codec.decode(Bytes{}); }), "5A2: empty input accepted");
    REQUIRE(throwsCorrupt([&] { codec.decode(Bytes(good.begin(), good.begin() + 12)); }), "5A2: short header accepted");

    Bytes bad_magic = good;
    bad_magic[0] = 'X';
    REQUIRE(throwsCorrupt([&] { codec.decode(bad_magic); }), "5A2: bad magic accepted");

    Bytes bad_format = good;
    bad_format[4] = 9;
    REQUIRE(throwsCorrupt([&] { codec.decode(bad_format); }), "5A2: unknown envelope format accepted");

    Bytes truncated(good.begin(), good.end() - 6);
    REQUIRE(throwsCorrupt([&] { codec.decode(truncated); }), "5A2: truncated zlib stream accepted");

    Bytes size_up = good;
    size_up[5] = static_cast<std::uint8_t>(size_up[5] + 1);
    REQUIRE(throwsCorrupt([&] { codec.decode(size_up); }), "5A2: declared size mismatch accepted");

    Bytes zero_size = good;
    for (int i = 5; i < 13; ++i) zero_size[static_cast<std::size_t>(i)] = 0;
    REQUIRE(throwsCorrupt([&] { codec.decode(zero_size); }), "5A2: zero declared size accepted");

    Bytes huge_size = good;
    huge_size[12] = 0x7F;
    REQUIRE(throwsCorrupt([&] { codec.decode(huge_size); }), "5A2: implausible declared size accepted");

    Bytes flipped = good;
    flipped[flipped.size() / 2] ^= 0xFF;
    REQUIRE(throwsCorrupt([&] { codec.decode(flipped); }), "5A2: corrupted body accepted");

    std::cout << "[PASS] 5A2 damaged envelopes raise SnapshotCorrupt\n";
}

// =======================
// 5B: Record validation
// =======================

static void runRecordValidation_5B1() {
    const cuf::SnapshotCodec codec;
    const Bytes good = codec.encode(capturedRun(5));

    // 0xC1 is never used by MessagePack.
    REQUIRE(throwsCorrupt([&] { codec.decode(cuf::SnapshotCodec::compressEnvelope(Bytes{0xC1, 0x00}, 6)); }),
            "5B1: malformed MessagePack accepted");
    REQUIRE(throwsCorrupt([&] { codec.decode(cuf::SnapshotCodec::compressEnvelope(json::to_msgpack(json::array({1, 2})), 6)); }),
            "5B1: non-map record accepted");

    const char* required[] = {
        "format", "cycle", "halted", "halt_reason", "ledger_value", "leakage", "ledger_consumed",
        "node_count", "seed", "rng_state", "void_entropy", "param_hash", "state_digest",
        "unionfind_parents", "unionfind_charge_a", "unionfind_charge_b", "node_state_transform",
        "trend_mean_state", "trend_void_entropy",
    };
    for (const char* key : required) {
        const Bytes missing = editRecord(good, [&](json& j) { j.erase(key); });
        REQUIRE(throwsCorrupt([&] { codec.decode(missing); }), "5B1: missing key accepted: " << key);
    }

    const Bytes wrong_type = editRecord(good, [](json& j) { j["halted"] = 1; });
    REQUIRE(throwsCorrupt([&] { codec.decode(wrong_type); }), "5B1: integer 'halted' accepted");

    const Bytes negative = editRecord(good, [](json& j) { j["cycle"] = -3; });
    REQUIRE(throwsCorrupt([&] { codec.decode(negative); }), "5B1: negative cycle accepted");

    const Bytes halt_mismatch = editRecord(good, [](json& j) { j["halted"] = true; j["halt_reason"] = 0; });
    REQUIRE(throwsCorrupt([&] { codec.decode(halt_mismatch); }), "5B1: halted with reason None accepted");

    const Bytes cyclic = editRecord(good, [](json& j) {
        j["unionfind_parents"][0] = 1;
        j["unionfind_parents"][1] = 0;
    });
    REQUIRE(throwsCorrupt([&] { codec.decode(cyclic); }), "5B1: union-find cycle accepted");

    const Bytes bad_charge = editRecord(good, [](json& j) { j["unionfind_charge_b"][0] = 4; });
    REQUIRE(throwsCorrupt([&] { codec.decode(bad_charge); }), "5B1: unreduced charge accepted");

    const Bytes short_uf = editRecord(good, [](json& j) { j["unionfind_parents"].erase(j["unionfind_parents"].size() - 1); });
    REQUIRE(throwsCorrupt([&] { codec.decode(short_uf); }), "5B1: union-find length mismatch accepted");

    const Bytes bad_kind = editRecord(good, [](json& j) { j["node_state_transform"]["kind"] = "haar"; });
    REQUIRE(throwsCorrupt([&] { codec.decode(bad_kind); }), "5B1: unknown transform kind accepted");

    const Bytes bad_len = editRecord(good, [](json& j) { j["node_state_transform"]["length"] = 63; });
    REQUIRE(throwsCorrupt([&] { codec.decode(bad_len); }), "5B1: transform length mismatch accepted");

    const Bytes no_coeffs = editRecord(good, [](json& j) { j["node_state_transform"]["coefficients"] = json::array(); });
    REQUIRE(throwsCorrupt([&] { codec.decode(no_coeffs); }), "5B1: empty coefficient list accepted");

    const Bytes nan_coeff = editRecord(good, [](json& j) {
        j["node_state_transform"]["coefficients"][0] = std::numeric_limits<double>::quiet_NaN();
    });
    REQUIRE(throwsCorrupt([&] { codec.decode(nan_coeff); }), "5B1: NaN coefficient accepted");

    const Bytes uneven_trends = editRecord(good, [](json& j) { j["trend_void_entropy"].push_back(0.0); });
    REQUIRE(throwsCorrupt([&] { codec.decode(uneven_trends); }), "5B1: trend length mismatch accepted");

    // Untouched record still decodes after a plain re-wrap.
    const Bytes rewrapped = editRecord(good, [](json&) {});
    REQUIRE(codec.decode(rewrapped).node_count_u32 == 64, "5B1: re-wrapped record rejected");

    std::cout << "[PASS] 5B1 record validation (keys, types, union-find, transform)\n";
}

// =======================
// 5C: Round-trip fidelity
// =======================

static void runRoundTripFields_5C1() {
    const cuf::SnapshotCodec codec;
    const cuf::EngineSnapshot src = capturedRun(25);
    cuf::EncodeReport report;
    const cuf::EngineSnapshot out = codec.decode(codec.encode(src, &report));

    REQUIRE(out.format_u32 == src.format_u32, "5C1: format");
    REQUIRE(out.cycle == 25 && out.cycle == src.cycle, "5C1: cycle");
    REQUIRE(out.halted == src.halted && out.halt_reason == src.halt_reason, "5C1: halt state");
    REQUIRE(out.ledger_value == src.ledger_value, "5C1: ledger value must be exact");
    REQUIRE(out.leakage == src.leakage, "5C1: leakage must be exact");
    REQUIRE(out.ledger_consumed == src.ledger_consumed, "5C1: consumed must be exact");
    REQUIRE(out.node_count_u32 == src.node_count_u32, "5C1: node count");
    REQUIRE(out.seed_u32 == src.seed_u32 && out.rng_state_u32 == src.rng_state_u32, "5C1: seed/rng");
    REQUIRE(out.param_hash_u32 == src.param_hash_u32, "5C1: param hash");
    REQUIRE(out.state_digest_u32 == src.state_digest_u32, "5C1: state digest");
    REQUIRE(out.void_entropy == src.void_entropy, "5C1: void entropy must be exact");
    REQUIRE(out.unionfind_parents == src.unionfind_parents, "5C1: union-find parents must be exact");
    REQUIRE(out.unionfind_charge_a == src.unionfind_charge_a, "5C1: charge A must be exact");
    REQUIRE(out.unionfind_charge_b == src.unionfind_charge_b, "5C1: charge B must be exact");
    REQUIRE(out.trend_mean_state == src.trend_mean_state, "5C1: mean-state trend must be exact");
    REQUIRE(out.trend_void_entropy == src.trend_void_entropy, "5C1: void-entropy trend must be exact");
    REQUIRE(out.trend_mean_state.size() == 16, "5C1: trend capped at configured history");

    REQUIRE(out.node_state.size() == src.node_state.size(), "5C1: node state length");
    const double err = maxAbsDiff(out.node_state, src.node_state);
    REQUIRE_FINITE(err, "5C1 err");
    REQUIRE(err <= 1e-2, "5C1: node state error " << err << " exceeds 1e-2");
    REQUIRE(report.max_abs_error <= 1e-2, "5C1: encode reported error above tolerance");
    REQUIRE(report.retained_coefficients >= 16 && report.retained_coefficients <= 64, "5C1: retained count");
    REQUIRE(report.transform_kind == "dct2-ortho-f32", "5C1: default tolerance should stay on float32");
    for (double v : out.node_state) {
        REQUIRE(v >= 0.0 && v <= 1.0, "5C1: reconstruction must be clamped to [0,1]");
    }

    std::cout << "[PASS] 5C1 exact fields + node state within 1e-2 (retained "
              << report.retained_coefficients << "/64)\n";
}

static void runAdaptiveTruncation_5C2() {
    const cuf::SnapshotCodec codec;
    cuf::EngineSnapshot snap = capturedRun(0);

    // Smooth field: the initial quarter of the spectrum is enough.
    snap.node_state.assign(64, 0.5);
    cuf::EncodeReport smooth;
    const cuf::EngineSnapshot s_out = codec.decode(codec.encode(snap, &smooth));
    REQUIRE(smooth.retained_coefficients == 16, "5C2: flat field should keep ceil(0.25 N) coefficients");
    REQUIRE(maxAbsDiff(s_out.node_state, snap.node_state) <= 1e-2, "5C2: flat field error");

    // Alternating field lives at the top of the spectrum: truncation must grow to N.
    for (std::size_t i = 0; i < snap.node_state.size(); ++i) {
        snap.node_state[i] = (i % 2 == 0) ? 0.1 : 0.9;
    }
    cuf::EncodeReport sharp;
    const cuf::EngineSnapshot a_out = codec.decode(codec.encode(snap, &sharp));
    REQUIRE(sharp.retained_coefficients == 64, "5C2: alternating field should keep every coefficient");
    REQUIRE(maxAbsDiff(a_out.node_state, snap.node_state) <= 1e-2, "5C2: alternating field error");

    // Values pinned at the [0,1] edges survive clamped reconstruction.
    for (std::size_t i = 0; i < snap.node_state.size(); ++i) {
        snap.node_state[i] = (i < 32) ? 0.0 : 1.0;
    }
    const cuf::EngineSnapshot e_out = codec.decode(codec.encode(snap));
    REQUIRE(maxAbsDiff(e_out.node_state, snap.node_state) <= 1e-2, "5C2: step field error");

    snap.node_state[3] = std::numeric_limits<double>::infinity();
    bool rejected = false;
    try {
        codec.encode(snap);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    REQUIRE(rejected, "5C2: non-finite node state must not encode");

    std::cout << "[PASS] 5C2 adaptive spectral truncation meets tolerance on smooth and sharp fields\n";
}

static void runTightTolerance_5C4() {
    cuf::SnapshotCodecOptions opts;
    opts.tolerance = 1e-9;
    const cuf::SnapshotCodec tight(opts);
    const cuf::EngineSnapshot src = capturedRun(5);

    // float32 coefficients cannot hold 1e-9; the encoder must widen instead of returning a looser snapshot.
    cuf::EncodeReport report;
    const Bytes bytes = tight.encode(src, &report);
    REQUIRE(report.transform_kind == "dct2-ortho-f64", "5C4: expected float64 spectrum, got " << report.transform_kind);
    REQUIRE(report.max_abs_error <= 1e-9, "5C4: reported error " << report.max_abs_error << " exceeds 1e-9");

    const json record = json::from_msgpack(cuf::SnapshotCodec::decompressEnvelope(bytes));
    REQUIRE(record["node_state_transform"]["kind"] == "dct2-ortho-f64", "5C4: record kind");

    const cuf::EngineSnapshot out = tight.decode(bytes);
    const double err = maxAbsDiff(out.node_state, src.node_state);
    REQUIRE(err <= 1e-9, "5C4: decoded error " << err << " exceeds 1e-9");
    REQUIRE(out.unionfind_parents == src.unionfind_parents, "5C4: union-find");

    // The default codec reads the wider record too.
    const cuf::SnapshotCodec loose;
    REQUIRE(maxAbsDiff(loose.decode(bytes).node_state, src.node_state) <= 1e-9, "5C4: default codec decode");

    // Below double resolution nothing can meet the bound: refuse to encode.
    opts.tolerance = 1e-300;
    const cuf::SnapshotCodec impossible(opts);
    cuf::EngineSnapshot wavy = src;
    for (std::size_t i = 0; i < wavy.node_state.size(); ++i) {
        wavy.node_state[i] = 0.5 + 0.37 * std::sin(0.91 * static_cast<double>(i) + 0.3);
    }
    bool rejected = false;
    try {
        impossible.encode(wavy);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    REQUIRE(rejected, "5C4: unreachable tolerance must raise std::invalid_argument");

    std::cout << "[PASS] 5C4 tolerance below float32 resolution widens to float64 coefficients\n";
}

static void runFileRoundTrip_5C3() {
    const cuf::SnapshotCodec codec;
    const cuf::EngineSnapshot src = capturedRun(12);
    const std::string path = "cuf_snapshot_test.cufz";

    cuf::EncodeReport report;
    REQUIRE(codec.saveToFile(src, path, &report), "5C3: save failed");
    const cuf::EngineSnapshot out = codec.loadFromFile(path);
    std::remove(path.c_str());
    REQUIRE(out.cycle == src.cycle && out.unionfind_parents == src.unionfind_parents, "5C3: file round-trip");
    REQUIRE(maxAbsDiff(out.node_state, src.node_state) <= 1e-2, "5C3: file round-trip node error");

    REQUIRE(throwsCorrupt([&] { codec.loadFromFile("does_not_exist/cuf_snapshot.cufz"); }),
            "5C3: missing file must raise SnapshotCorrupt");
    REQUIRE(!codec.saveToFile(src, "does_not_exist/cuf_snapshot.cufz"), "5C3: unwritable path must fail");

    std::cout << "[PASS] 5C3 save/load through the filesystem\n";
}

// =======================
// 5D: Engine restore
// =======================

static void runRestoreRejects_5D1() {
    const cuf::SnapshotCodec codec;
    const cuf::EngineSnapshot snap = codec.decode(codec.encode(capturedRun(8)));

    cuf::EngineConfigV1 smaller = runConfig();
    smaller.node_count_u32 = 32;
    cuf::Engine other_size(smaller, cuf::referenceKernels());
    other_size.step();
    const auto before = other_size.nodeState();
    REQUIRE(throwsCorrupt([&] { other_size.restoreSnapshot(snap); }), "5D1: node-count mismatch accepted");
    REQUIRE(other_size.nodeState() == before && other_size.cycle() == 1, "5D1: failed restore mutated the engine");

    cuf::EngineConfigV1 reseeded = runConfig();
    reseeded.seed_u32 = 8;
    cuf::Engine other_seed(reseeded, cuf::referenceKernels());
    REQUIRE(throwsCorrupt([&] { other_seed.restoreSnapshot(snap); }), "5D1: config-hash mismatch accepted");

    cuf::Engine target(runConfig(), cuf::referenceKernels());
    cuf::EngineSnapshot broken = snap;
    broken.unionfind_parents[0] = 1;
    broken.unionfind_parents[1] = 0;
    REQUIRE(throwsCorrupt([&] { target.restoreSnapshot(broken); }), "5D1: inconsistent union-find accepted");
    REQUIRE(target.cycle() == 0, "5D1: failed restore advanced the engine");

    cuf::EngineSnapshot nan_state = snap;
    nan_state.node_state[0] = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(throwsCorrupt([&] { target.restoreSnapshot(nan_state); }), "5D1: NaN node state accepted");

    std::cout << "[PASS] 5D1 restore is all-or-nothing and rejects mismatched snapshots\n";
}

static void runResumeDeterminism_5D2() {
    cuf::EngineConfigV1 cfg = runConfig();
    cfg.initial_budget = 1.0e6;
    const cuf::SnapshotCodec codec;

    cuf::Engine uninterrupted(cfg, cuf::referenceKernels());
    for (int i = 0; i < 20; ++i) uninterrupted.step();
    const Bytes saved = codec.encode(uninterrupted.captureSnapshot());

    cuf::Engine resumed(cfg, cuf::referenceKernels());
    resumed.restoreSnapshot(codec.decode(saved));
    REQUIRE(resumed.cycle() == 20, "5D2: restored cycle");
    REQUIRE(resumed.ledgerValue() == uninterrupted.ledgerValue(), "5D2: restored ledger");
    REQUIRE(resumed.voidEntropy() == uninterrupted.voidEntropy(), "5D2: restored void entropy");
    REQUIRE(resumed.meanStateTrend() == uninterrupted.meanStateTrend(), "5D2: restored trend");
    REQUIRE(maxAbsDiff(resumed.nodeState(), uninterrupted.nodeState()) <= 1e-2, "5D2: restored node error");

    for (int i = 0; i < 10; ++i) {
        REQUIRE(uninterrupted.step() == cuf::StepOutcome::Advanced, "5D2: uninterrupted step");
        REQUIRE(resumed.step() == cuf::StepOutcome::Advanced, "5D2: resumed step");
    }
    REQUIRE(resumed.cycle() == 30 && uninterrupted.cycle() == 30, "5D2: cycles after resume");
    REQUIRE(resumed.unionFind().parents() == uninterrupted.unionFind().parents(),
            "5D2: union-find diverged after resume");
    REQUIRE(resumed.unionFind().chargesA() == uninterrupted.unionFind().chargesA() &&
            resumed.unionFind().chargesB() == uninterrupted.unionFind().chargesB(),
            "5D2: charges diverged after resume");
    REQUIRE(maxAbsDiff(resumed.nodeState(), uninterrupted.nodeState()) <= 0.05, "5D2: node state drifted");

    std::vector<cuf::EventRecord> log(32);
    const int n = resumed.getEventLog(log.data(), 32);
    bool saw_restore = false;
    for (int i = 0; i < n; ++i) {
        if (log[static_cast<std::size_t>(i)].kind == cuf::EventKind::Snapshot) saw_restore = true;
    }
    REQUIRE(saw_restore, "5D2: restore must be logged");

    std::cout << "[PASS] 5D2 restore + 10 cycles matches the uninterrupted run's union-find\n";
}

static void runHaltedSnapshot_5D3() {
    cuf::EngineConfigV1 cfg = runConfig();
    cfg.initial_budget = 0.001;
    cuf::Engine exhausted(cfg, cuf::referenceKernels());
    REQUIRE(exhausted.step() == cuf::StepOutcome::Halted, "5D3: tiny budget should halt");

    const cuf::SnapshotCodec codec;
    const cuf::EngineSnapshot snap = codec.decode(codec.encode(exhausted.captureSnapshot()));
    REQUIRE(snap.halted && snap.halt_reason == cuf::HaltReason::BudgetExhausted, "5D3: halt state persisted");
    REQUIRE(snap.ledger_value < 0.0 && snap.leakage > 0.0, "5D3: overdraft persisted");

    cuf::Engine fresh(cfg, cuf::referenceKernels());
    fresh.restoreSnapshot(snap);
    REQUIRE(fresh.isHalted() && fresh.haltReason() == cuf::HaltReason::BudgetExhausted, "5D3: restored halt");
    REQUIRE(fresh.step() == cuf::StepOutcome::Halted, "5D3: restored engine must stay halted");
    REQUIRE(fresh.ledgerValue() == exhausted.ledgerValue(), "5D3: restored ledger");

    std::cout << "[PASS] 5D3 halted snapshots restore as halted\n";
}

} // namespace

int main() {
    // Canary: prove the test fails in Release when checks are active.
    if (std::getenv("CUF_CANARY_NAN")) {
        REQUIRE_FINITE(std::nan(""), "CANARY_NAN");
        return 0; // unreachable
    }

    // =======================
    // Step 5: Snapshot persistence
    // =======================
    runEnvelopeLayout_5A1();
    runEnvelopeDamage_5A2();
    runRecordValidation_5B1();
    runRoundTripFields_5C1();
    runAdaptiveTruncation_5C2();
    runTightTolerance_5C4();
    runFileRoundTrip_5C3();
    runRestoreRejects_5D1();
    runResumeDeterminism_5D2();
    runHaltedSnapshot_5D3();

    return 0;
}
