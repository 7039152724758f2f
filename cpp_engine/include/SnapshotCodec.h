#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "EngineSnapshot.h"

namespace cuf {

struct SnapshotCodecOptions {
    // Initial share of DCT coefficients kept; grown until the tolerance holds.
    double keep_fraction = 0.25;
    // Max abs reconstruction error allowed on any node.
    double tolerance = 1e-2;
    // zlib level (0..9, or -1 for the zlib default).
    int compression_level = 6;
};

struct EncodeReport {
    std::size_t raw_bytes = 0;        // MessagePack payload
    std::size_t compressed_bytes = 0; // full envelope
    std::size_t retained_coefficients = 0;
    double max_abs_error = 0.0;       // verified on the clamped reconstruction
    std::string transform_kind;       // "dct2-ortho-f32" or "dct2-ortho-f64"
};

// ============================================================
// Snapshot persistence
//
// Envelope (little-endian):
//   "CUFZ" | u8 format | u64 raw_size | zlib stream of a MessagePack map
//
// Rules:
// - Integer, charge, ledger and trend fields round-trip exactly.
// - node_state is stored as a truncated orthonormal DCT-II spectrum, float32
//   ("dct2-ortho-f32") or float64 ("dct2-ortho-f64") when float32 cannot meet
//   the tolerance. encode() verifies max abs error <= tolerance before returning.
// - decode() either returns a complete, internally consistent snapshot or
//   throws SnapshotCorrupt.
// ============================================================
class SnapshotCodec {
public:
    static constexpr std::uint8_t kEnvelopeFormat = 1;
    static constexpr std::size_t kEnvelopeHeaderBytes = 13;

    SnapshotCodec();
    explicit SnapshotCodec(const SnapshotCodecOptions& opts);

    const SnapshotCodecOptions& options() const noexcept { return opts_; }

    // Throws std::invalid_argument for non-finite node values or an unreachable tolerance.
    std::vector<std::uint8_t> encode(const EngineSnapshot& snap, EncodeReport* report = nullptr) const;
    EngineSnapshot decode(const std::vector<std::uint8_t>& bytes) const;

    // Returns false if the file cannot be written.
    bool saveToFile(const EngineSnapshot& snap, const std::string& path, EncodeReport* report = nullptr) const;
    // Throws SnapshotCorrupt if the file is missing, unreadable or invalid.
    EngineSnapshot loadFromFile(const std::string& path) const;

    static std::vector<std::uint8_t> compressEnvelope(const std::vector<std::uint8_t>& raw, int level);
    static std::vector<std::uint8_t> decompressEnvelope(const std::vector<std::uint8_t>& envelope);

private:
    SnapshotCodecOptions opts_{};
};

} // namespace cuf
