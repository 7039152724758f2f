#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cuf {

// ============================================================
// Error taxonomy surfaced to callers.
//
// Budget exhaustion is NOT an error: it is the modeled `halted` state and is
// observable through Engine::isHalted() / Engine::haltReason().
// ============================================================

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& what) : std::runtime_error(what) {}
};

// Programmer error: an index outside the current bounds of a container.
class IndexOutOfRange : public EngineError {
public:
    IndexOutOfRange(const std::string& where, std::size_t index, std::size_t size)
        : EngineError(where + ": index " + std::to_string(index) +
                      " out of range (size " + std::to_string(size) + ")"),
          index_(index), size_(size) {}

    std::size_t index() const noexcept { return index_; }
    std::size_t size() const noexcept { return size_; }

private:
    std::size_t index_ = 0;
    std::size_t size_ = 0;
};

// A kernel or evolution backend produced non-finite or mis-sized output.
// The engine halts before this propagates.
class NumericDivergence : public EngineError {
public:
    explicit NumericDivergence(const std::string& what) : EngineError(what) {}
};

// Snapshot bytes could not be decoded into a complete, consistent state.
class SnapshotCorrupt : public EngineError {
public:
    explicit SnapshotCorrupt(const std::string& what) : EngineError("snapshot corrupt: " + what) {}
};

// Operation attempted in the wrong state machine state (e.g. adjusting a halted engine).
class InvalidState : public EngineError {
public:
    explicit InvalidState(const std::string& what) : EngineError(what) {}
};

} // namespace cuf
