#include "SnapshotCodec.h"

#include "ChargeUnionFind.h"
#include "EngineErrors.h"
#include "SpectralTransform.h"

#include <nlohmann/json.hpp>
#include <zlib.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace cuf {

using json = nlohmann::json;

namespace {

constexpr char kMagic[4] = {'C', 'U', 'F', 'Z'};
constexpr std::uint32_t kRecordFormat = 1;
// deflate cannot expand data by more than ~1032:1.
constexpr std::uint64_t kMaxInflateRatio = 1032;
constexpr const char* kTransformKindF32 = "dct2-ortho-f32";
constexpr const char* kTransformKindF64 = "dct2-ortho-f64";

static inline double clamp01(double x) {
    return std::clamp(x, 0.0, 1.0);
}

const json& requireKey(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        throw SnapshotCorrupt(std::string("missing key '") + key + "'");
    }
    return *it;
}

std::uint64_t readUnsigned(const json& j, const char* key, std::uint64_t max_value) {
    const json& v = requireKey(j, key);
    if (!v.is_number_unsigned()) {
        throw SnapshotCorrupt(std::string("key '") + key + "' is not an unsigned integer");
    }
    const std::uint64_t x = v.get<std::uint64_t>();
    if (x > max_value) {
        throw SnapshotCorrupt(std::string("key '") + key + "' out of range");
    }
    return x;
}

double finiteValue(const json& v, const char* key) {
    if (!v.is_number()) {
        throw SnapshotCorrupt(std::string("key '") + key + "' is not a number");
    }
    const double x = v.get<double>();
    if (!std::isfinite(x)) {
        throw SnapshotCorrupt(std::string("key '") + key + "' is not finite");
    }
    return x;
}

double readFinite(const json& j, const char* key) {
    return finiteValue(requireKey(j, key), key);
}

bool readBool(const json& j, const char* key) {
    const json& v = requireKey(j, key);
    if (!v.is_boolean()) {
        throw SnapshotCorrupt(std::string("key '") + key + "' is not a boolean");
    }
    return v.get<bool>();
}

std::vector<double> readFiniteArray(const json& j, const char* key) {
    const json& v = requireKey(j, key);
    if (!v.is_array()) {
        throw SnapshotCorrupt(std::string("key '") + key + "' is not an array");
    }
    std::vector<double> out;
    out.reserve(v.size());
    for (const json& e : v) out.push_back(finiteValue(e, key));
    return out;
}

template <typename T>
std::vector<T> readUnsignedArray(const json& j, const char* key, std::uint64_t max_value) {
    const json& v = requireKey(j, key);
    if (!v.is_array()) {
        throw SnapshotCorrupt(std::string("key '") + key + "' is not an array");
    }
    std::vector<T> out;
    out.reserve(v.size());
    for (const json& e : v) {
        if (!e.is_number_unsigned() || e.get<std::uint64_t>() > max_value) {
            throw SnapshotCorrupt(std::string("key '") + key + "' holds an invalid element");
        }
        out.push_back(static_cast<T>(e.get<std::uint64_t>()));
    }
    return out;
}

void putU64LE(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

std::uint64_t getU64LE(const std::uint8_t* p) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return v;
}

// Coefficients quantized to float32, widened back for exact reconstruction checks.
std::vector<double> quantizedSpectrum(const std::vector<double>& spectrum) {
    std::vector<double> coeffs = spectrum;
    for (double& c : coeffs) {
        c = static_cast<double>(static_cast<float>(c));
    }
    return coeffs;
}

double maxReconstructionError(SpectralTransform& spectral,
                              const std::vector<double>& coeffs,
                              const std::vector<double>& state) {
    const std::vector<double> recon = spectral.idct(coeffs, state.size());
    double err = 0.0;
    for (std::size_t i = 0; i < state.size(); ++i) {
        err = std::max(err, std::fabs(clamp01(recon[i]) - state[i]));
    }
    return err;
}

// Grows K from `keep` until the clamped reconstruction meets `tolerance` or K == N.
std::size_t truncateSpectrum(SpectralTransform& spectral,
                             const std::vector<double>& spectrum,
                             const std::vector<double>& state,
                             std::size_t keep,
                             double tolerance,
                             double* err_out) {
    const std::size_t n = state.size();
    double err = 0.0;
    for (;;) {
        const std::vector<double> head(spectrum.begin(), spectrum.begin() + static_cast<std::ptrdiff_t>(keep));
        err = maxReconstructionError(spectral, head, state);
        if (err <= tolerance || keep == n) break;
        keep = std::min(n, std::max(keep + 1, 2 * keep));
    }
    *err_out = err;
    return keep;
}

} // namespace

SnapshotCodec::SnapshotCodec() : SnapshotCodec(SnapshotCodecOptions{}) {}

SnapshotCodec::SnapshotCodec(const SnapshotCodecOptions& opts) : opts_(opts) {
    if (!std::isfinite(opts_.keep_fraction) || opts_.keep_fraction <= 0.0) opts_.keep_fraction = 0.25;
    if (opts_.keep_fraction > 1.0) opts_.keep_fraction = 1.0;
    if (!std::isfinite(opts_.tolerance) || opts_.tolerance <= 0.0) opts_.tolerance = 1e-2;
    opts_.compression_level = std::clamp(opts_.compression_level, -1, 9);
}

std::vector<std::uint8_t> SnapshotCodec::encode(const EngineSnapshot& snap, EncodeReport* report) const {
    const std::size_t n = snap.node_state.size();
    for (double v : snap.node_state) {
        if (!std::isfinite(v)) {
            throw std::invalid_argument("SnapshotCodec::encode: non-finite node state");
        }
    }

    // Adaptive truncation on the float32 spectrum; float64 only when float32 cannot reach the tolerance.
    SpectralTransform spectral;
    const std::vector<double> exact = spectral.dct(snap.node_state);
    std::vector<double> spectrum = quantizedSpectrum(exact);
    const char* kind = kTransformKindF32;
    std::size_t keep = 0;
    double err = 0.0;
    if (n > 0) {
        std::size_t first = static_cast<std::size_t>(std::ceil(opts_.keep_fraction * static_cast<double>(n)));
        first = std::clamp<std::size_t>(first, 1, n);
        keep = truncateSpectrum(spectral, spectrum, snap.node_state, first, opts_.tolerance, &err);
        if (err > opts_.tolerance) {
            spectrum = exact;
            kind = kTransformKindF64;
            keep = truncateSpectrum(spectral, spectrum, snap.node_state, first, opts_.tolerance, &err);
        }
        if (err > opts_.tolerance) {
            throw std::invalid_argument("SnapshotCodec::encode: tolerance " + std::to_string(opts_.tolerance) +
                                        " unreachable (best max abs error " + std::to_string(err) + ")");
        }
    }

    json transform;
    transform["kind"] = kind;
    transform["length"] = static_cast<std::uint64_t>(n);
    transform["coefficients"] = std::vector<double>(spectrum.begin(),
                                                    spectrum.begin() + static_cast<std::ptrdiff_t>(keep));

    json j;
    j["format"] = kRecordFormat;
    j["cycle"] = snap.cycle;
    j["halted"] = snap.halted;
    j["halt_reason"] = static_cast<std::uint32_t>(snap.halt_reason);
    j["ledger_value"] = snap.ledger_value;
    j["leakage"] = snap.leakage;
    j["ledger_consumed"] = snap.ledger_consumed;
    j["node_count"] = snap.node_count_u32;
    j["seed"] = snap.seed_u32;
    j["rng_state"] = snap.rng_state_u32;
    j["void_entropy"] = snap.void_entropy;
    j["param_hash"] = snap.param_hash_u32;
    j["state_digest"] = snap.state_digest_u32;
    j["unionfind_parents"] = snap.unionfind_parents;
    j["unionfind_charge_a"] = snap.unionfind_charge_a;
    j["unionfind_charge_b"] = snap.unionfind_charge_b;
    j["node_state_transform"] = std::move(transform);
    j["trend_mean_state"] = snap.trend_mean_state;
    j["trend_void_entropy"] = snap.trend_void_entropy;

    const std::vector<std::uint8_t> raw = json::to_msgpack(j);
    std::vector<std::uint8_t> envelope = compressEnvelope(raw, opts_.compression_level);

    if (report) {
        report->raw_bytes = raw.size();
        report->compressed_bytes = envelope.size();
        report->retained_coefficients = keep;
        report->max_abs_error = err;
        report->transform_kind = kind;
    }
    return envelope;
}

EngineSnapshot SnapshotCodec::decode(const std::vector<std::uint8_t>& bytes) const {
    const std::vector<std::uint8_t> raw = decompressEnvelope(bytes);

    json j;
    try {
        j = json::from_msgpack(raw);
    } catch (const json::exception& e) {
        throw SnapshotCorrupt(std::string("malformed MessagePack record: ") + e.what());
    }
    if (!j.is_object()) {
        throw SnapshotCorrupt("record is not a map");
    }

    constexpr std::uint64_t kU32Max = std::numeric_limits<std::uint32_t>::max();

    EngineSnapshot s;
    s.format_u32 = static_cast<std::uint32_t>(readUnsigned(j, "format", kU32Max));
    if (s.format_u32 != kRecordFormat) {
        throw SnapshotCorrupt("unsupported record format " + std::to_string(s.format_u32));
    }
    s.cycle = readUnsigned(j, "cycle", std::numeric_limits<std::uint64_t>::max());
    s.halted = readBool(j, "halted");
    s.halt_reason = static_cast<HaltReason>(readUnsigned(j, "halt_reason",
                                                         static_cast<std::uint64_t>(HaltReason::NumericDivergence)));
    if (s.halted != (s.halt_reason != HaltReason::None)) {
        throw SnapshotCorrupt("halt flag and halt reason disagree");
    }
    s.ledger_value = readFinite(j, "ledger_value");
    s.leakage = readFinite(j, "leakage");
    s.ledger_consumed = readFinite(j, "ledger_consumed");
    s.node_count_u32 = static_cast<std::uint32_t>(readUnsigned(j, "node_count", kU32Max));
    s.seed_u32 = static_cast<std::uint32_t>(readUnsigned(j, "seed", kU32Max));
    s.rng_state_u32 = static_cast<std::uint32_t>(readUnsigned(j, "rng_state", kU32Max));
    s.void_entropy = readFinite(j, "void_entropy");
    s.param_hash_u32 = static_cast<std::uint32_t>(readUnsigned(j, "param_hash", kU32Max));
    s.state_digest_u32 = static_cast<std::uint32_t>(readUnsigned(j, "state_digest", kU32Max));

    const std::size_t n = static_cast<std::size_t>(s.node_count_u32);
    s.unionfind_parents = readUnsignedArray<std::uint32_t>(j, "unionfind_parents", kU32Max);
    s.unionfind_charge_a = readUnsignedArray<std::uint8_t>(j, "unionfind_charge_a", ChargeUnionFind::kChargeAModulus - 1);
    s.unionfind_charge_b = readUnsignedArray<std::uint8_t>(j, "unionfind_charge_b", ChargeUnionFind::kChargeBModulus - 1);
    if (s.unionfind_parents.size() != n) {
        throw SnapshotCorrupt("union-find length does not match node_count");
    }
    if (!ChargeUnionFind::isConsistent(s.unionfind_parents, s.unionfind_charge_a, s.unionfind_charge_b)) {
        throw SnapshotCorrupt("union-find arrays are inconsistent");
    }

    const json& transform = requireKey(j, "node_state_transform");
    if (!transform.is_object()) {
        throw SnapshotCorrupt("node_state_transform is not a map");
    }
    const json& kind = requireKey(transform, "kind");
    if (!kind.is_string() ||
        (kind.get<std::string>() != kTransformKindF32 && kind.get<std::string>() != kTransformKindF64)) {
        throw SnapshotCorrupt("unknown node_state_transform kind");
    }
    if (readUnsigned(transform, "length", kU32Max) != n) {
        throw SnapshotCorrupt("node_state_transform length does not match node_count");
    }
    const std::vector<double> coeffs = readFiniteArray(transform, "coefficients");
    if (coeffs.size() > n || (n > 0 && coeffs.empty())) {
        throw SnapshotCorrupt("node_state_transform has an invalid coefficient count");
    }
    SpectralTransform spectral;
    s.node_state = spectral.idct(coeffs, n);
    for (double& v : s.node_state) v = clamp01(v);

    s.trend_mean_state = readFiniteArray(j, "trend_mean_state");
    s.trend_void_entropy = readFiniteArray(j, "trend_void_entropy");
    if (s.trend_mean_state.size() != s.trend_void_entropy.size()) {
        throw SnapshotCorrupt("trend histories differ in length");
    }
    return s;
}

bool SnapshotCodec::saveToFile(const EngineSnapshot& snap, const std::string& path, EncodeReport* report) const {
    const std::vector<std::uint8_t> bytes = encode(snap, report);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    f.close();
    return static_cast<bool>(f);
}

EngineSnapshot SnapshotCodec::loadFromFile(const std::string& path) const {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw SnapshotCorrupt("cannot open '" + path + "'");
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        throw SnapshotCorrupt("read error on '" + path + "'");
    }
    return decode(bytes);
}

std::vector<std::uint8_t> SnapshotCodec::compressEnvelope(const std::vector<std::uint8_t>& raw, int level) {
    uLongf dest_len = compressBound(static_cast<uLong>(raw.size()));
    std::vector<std::uint8_t> out;
    out.reserve(kEnvelopeHeaderBytes + static_cast<std::size_t>(dest_len));
    out.insert(out.end(), std::begin(kMagic), std::end(kMagic));
    out.push_back(kEnvelopeFormat);
    putU64LE(out, static_cast<std::uint64_t>(raw.size()));

    std::vector<std::uint8_t> body(static_cast<std::size_t>(dest_len));
    const int rc = compress2(body.data(), &dest_len, raw.data(), static_cast<uLong>(raw.size()), level);
    if (rc != Z_OK) {
        throw EngineError("SnapshotCodec: zlib compress2 failed (" + std::to_string(rc) + ")");
    }
    out.insert(out.end(), body.begin(), body.begin() + static_cast<std::ptrdiff_t>(dest_len));
    return out;
}

std::vector<std::uint8_t> SnapshotCodec::decompressEnvelope(const std::vector<std::uint8_t>& envelope) {
    if (envelope.size() < kEnvelopeHeaderBytes) {
        throw SnapshotCorrupt("truncated envelope header");
    }
    if (!std::equal(std::begin(kMagic), std::end(kMagic), envelope.begin(),
                    [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; })) {
        throw SnapshotCorrupt("bad magic");
    }
    if (envelope[4] != kEnvelopeFormat) {
        throw SnapshotCorrupt("unsupported envelope format " + std::to_string(envelope[4]));
    }
    const std::uint64_t raw_size = getU64LE(envelope.data() + 5);
    const std::size_t body_size = envelope.size() - kEnvelopeHeaderBytes;
    if (raw_size == 0) {
        throw SnapshotCorrupt("empty payload");
    }
    if (raw_size > kMaxInflateRatio * static_cast<std::uint64_t>(body_size) + 64u) {
        throw SnapshotCorrupt("declared size is implausible for the payload");
    }

    std::vector<std::uint8_t> raw(static_cast<std::size_t>(raw_size));
    uLongf dest_len = static_cast<uLongf>(raw_size);
    const int rc = uncompress(raw.data(), &dest_len,
                              envelope.data() + kEnvelopeHeaderBytes, static_cast<uLong>(body_size));
    if (rc != Z_OK) {
        throw SnapshotCorrupt("zlib stream error (" + std::to_string(rc) + ")");
    }
    if (static_cast<std::uint64_t>(dest_len) != raw_size) {
        throw SnapshotCorrupt("decompressed size mismatch");
    }
    return raw;
}

} // namespace cuf
