#include "ChargeUnionFind.h"

#include "DeterministicRng.h"
#include "EngineErrors.h"

#include <stdexcept>
#include <utility>

namespace cuf {

ChargeUnionFind::ChargeUnionFind(std::size_t n)
    : parent_(n), charge_a_(n, 0u), charge_b_(n, 0u) {
    for (std::size_t i = 0; i < n; ++i) {
        parent_[i] = static_cast<std::uint32_t>(i);
    }
}

bool ChargeUnionFind::isConsistent(const std::vector<std::uint32_t>& parents,
                                   const std::vector<std::uint8_t>& charge_a,
                                   const std::vector<std::uint8_t>& charge_b) {
    const std::size_t n = parents.size();
    if (charge_a.size() != n || charge_b.size() != n) return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (parents[i] >= n) return false;
        if (charge_a[i] >= kChargeAModulus) return false;
        if (charge_b[i] >= kChargeBModulus) return false;
    }
    // Cycle check: 0 = unvisited, 1 = on current walk, 2 = known to reach a root.
    std::vector<std::uint8_t> mark(n, 0u);
    std::vector<std::size_t> walk;
    for (std::size_t i = 0; i < n; ++i) {
        if (mark[i] == 2u) continue;
        walk.clear();
        std::size_t x = i;
        while (mark[x] == 0u && parents[x] != x) {
            mark[x] = 1u;
            walk.push_back(x);
            x = parents[x];
        }
        if (mark[x] == 1u) return false;
        mark[x] = 2u;
        for (std::size_t w : walk) mark[w] = 2u;
    }
    return true;
}

ChargeUnionFind ChargeUnionFind::fromArrays(std::vector<std::uint32_t> parents,
                                            std::vector<std::uint8_t> charge_a,
                                            std::vector<std::uint8_t> charge_b) {
    if (!isConsistent(parents, charge_a, charge_b)) {
        throw std::invalid_argument("ChargeUnionFind::fromArrays: inconsistent arrays");
    }
    ChargeUnionFind uf;
    uf.parent_ = std::move(parents);
    uf.charge_a_ = std::move(charge_a);
    uf.charge_b_ = std::move(charge_b);
    return uf;
}

void ChargeUnionFind::checkIndex(const char* where, std::size_t i) const {
    if (i >= parent_.size()) {
        throw IndexOutOfRange(where, i, parent_.size());
    }
}

std::size_t ChargeUnionFind::find(std::size_t i) {
    checkIndex("ChargeUnionFind::find", i);

    std::size_t root = i;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    // Second pass: point every node on the path directly at the root.
    while (parent_[i] != root) {
        const std::size_t next = parent_[i];
        parent_[i] = static_cast<std::uint32_t>(root);
        i = next;
    }
    return root;
}

std::size_t ChargeUnionFind::representative(std::size_t i) const {
    checkIndex("ChargeUnionFind::representative", i);
    while (parent_[i] != i) {
        i = parent_[i];
    }
    return i;
}

bool ChargeUnionFind::unite(std::size_t i, std::size_t j) {
    checkIndex("ChargeUnionFind::unite", i);
    checkIndex("ChargeUnionFind::unite", j);

    const std::size_t root_i = find(i);
    const std::size_t root_j = find(j);
    if (root_i == root_j) return false;

    parent_[root_j] = static_cast<std::uint32_t>(root_i);
    charge_a_[root_i] = static_cast<std::uint8_t>((charge_a_[root_i] + charge_a_[root_j]) % kChargeAModulus);
    charge_b_[root_i] = static_cast<std::uint8_t>((charge_b_[root_i] + charge_b_[root_j]) % kChargeBModulus);
    return true;
}

std::size_t ChargeUnionFind::addNode(std::uint32_t charge_a, std::uint32_t charge_b) {
    const std::size_t idx = parent_.size();
    parent_.push_back(static_cast<std::uint32_t>(idx));
    charge_a_.push_back(static_cast<std::uint8_t>(charge_a % kChargeAModulus));
    charge_b_.push_back(static_cast<std::uint8_t>(charge_b % kChargeBModulus));
    return idx;
}

std::size_t ChargeUnionFind::addNode(DeterministicRng& rng) {
    const std::uint32_t a = static_cast<std::uint32_t>(rng.uniformIndex(kChargeAModulus));
    const std::uint32_t b = static_cast<std::uint32_t>(rng.uniformIndex(kChargeBModulus));
    return addNode(a, b);
}

std::uint8_t ChargeUnionFind::setChargeA(std::size_t i) const {
    return charge_a_[representative(i)];
}

std::uint8_t ChargeUnionFind::setChargeB(std::size_t i) const {
    return charge_b_[representative(i)];
}

ChargeUnionFind::ChargeTotals ChargeUnionFind::totalCharges() const {
    ChargeTotals t;
    for (std::size_t i = 0; i < parent_.size(); ++i) {
        if (parent_[i] != i) continue;
        t.charge_a = (t.charge_a + charge_a_[i]) % kChargeAModulus;
        t.charge_b = (t.charge_b + charge_b_[i]) % kChargeBModulus;
    }
    return t;
}

std::size_t ChargeUnionFind::setCount() const {
    std::size_t roots = 0;
    for (std::size_t i = 0; i < parent_.size(); ++i) {
        if (parent_[i] == i) ++roots;
    }
    return roots;
}

} // namespace cuf
