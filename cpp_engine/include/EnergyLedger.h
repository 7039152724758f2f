#pragma once

namespace cuf {

// Thermodynamic resource ledger: a depleting scalar budget.
//
// - charge() subtracts a non-negative, finite cost; anything else is ignored.
// - The budget may go negative. The first time it does, the ledger latches
//   "exhausted" and records the overdraft magnitude as leakage.
// - Exhaustion is sticky: further charges keep it exhausted (leakage keeps growing).
//   Only replenish() back to >= 0 or reset() clears it.
class EnergyLedger {
public:
    static constexpr double kDefaultBudget = 1000.0;

    EnergyLedger() = default;
    explicit EnergyLedger(double initial_budget);

    void charge(double amount);

    // Adds budget (non-negative, finite). Clears exhaustion only if the budget is back to >= 0.
    void replenish(double amount);

    void reset(double initial_budget);

    // Restore exact persisted values. Exhaustion is derived from available < 0.
    void restore(double available, double leakage, double consumed);

    bool isExhausted() const noexcept { return exhausted_; }
    double available() const noexcept { return available_; }
    double leakage() const noexcept { return leakage_; }
    double consumed() const noexcept { return consumed_; }

private:
    double available_ = kDefaultBudget;
    double leakage_ = 0.0;
    double consumed_ = 0.0;
    bool exhausted_ = false;
};

} // namespace cuf
