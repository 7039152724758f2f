#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cuf {

class DeterministicRng;

// Disjoint-set over node indices carrying two conserved modular charges per set:
//   charge A in Z2 (mod 2), charge B in Z4 (mod 4).
//
// Invariants:
// - Charges are meaningful only at representatives. On merge the surviving root
//   absorbs the losing root's charges (modular sum); the losing entries are left
//   in place but are never read again.
// - Sum over representatives of charge A (mod 2) and charge B (mod 4) is constant
//   under unite(); addNode() adds exactly the new node's charges.
class ChargeUnionFind {
public:
    static constexpr std::uint32_t kChargeAModulus = 2;
    static constexpr std::uint32_t kChargeBModulus = 4;

    struct ChargeTotals {
        std::uint32_t charge_a = 0; // mod 2
        std::uint32_t charge_b = 0; // mod 4
    };

    ChargeUnionFind() = default;
    // n singletons with zero charge.
    explicit ChargeUnionFind(std::size_t n);

    // Rebuild from persisted arrays. Throws std::invalid_argument unless isConsistent().
    static ChargeUnionFind fromArrays(std::vector<std::uint32_t> parents,
                                      std::vector<std::uint8_t> charge_a,
                                      std::vector<std::uint8_t> charge_b);

    // Equal lengths, every parent in range, charges already reduced, and every
    // parent chain terminates at a self-parented root.
    static bool isConsistent(const std::vector<std::uint32_t>& parents,
                             const std::vector<std::uint8_t>& charge_a,
                             const std::vector<std::uint8_t>& charge_b);

    std::size_t size() const noexcept { return parent_.size(); }

    // Representative with path compression. Throws IndexOutOfRange.
    std::size_t find(std::size_t i);

    // Representative without mutation (observer-safe). Throws IndexOutOfRange.
    std::size_t representative(std::size_t i) const;

    // Merge the sets of i and j; find(i)'s root survives. Returns false if already joined.
    // Throws IndexOutOfRange.
    bool unite(std::size_t i, std::size_t j);

    bool connected(std::size_t i, std::size_t j) { return find(i) == find(j); }

    // Append a singleton; charges are reduced mod 2 / mod 4. Returns the new index.
    std::size_t addNode(std::uint32_t charge_a, std::uint32_t charge_b);
    std::size_t addNode(DeterministicRng& rng);

    // Charges of the set containing i (read at its representative).
    std::uint8_t setChargeA(std::size_t i) const;
    std::uint8_t setChargeB(std::size_t i) const;

    ChargeTotals totalCharges() const;
    std::size_t setCount() const;

    const std::vector<std::uint32_t>& parents() const noexcept { return parent_; }
    const std::vector<std::uint8_t>& chargesA() const noexcept { return charge_a_; }
    const std::vector<std::uint8_t>& chargesB() const noexcept { return charge_b_; }

private:
    void checkIndex(const char* where, std::size_t i) const;

    std::vector<std::uint32_t> parent_;
    std::vector<std::uint8_t> charge_a_;
    std::vector<std::uint8_t> charge_b_;
};

} // namespace cuf
