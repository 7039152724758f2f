#include "EnergyLedger.h"

#include <cmath>

namespace cuf {

EnergyLedger::EnergyLedger(double initial_budget) {
    reset(initial_budget);
}

void EnergyLedger::charge(double amount) {
    if (!std::isfinite(amount) || amount < 0.0) return;

    available_ -= amount;
    consumed_ += amount;
    if (available_ < 0.0) {
        leakage_ = std::fabs(available_);
        exhausted_ = true;
    }
}

void EnergyLedger::replenish(double amount) {
    if (!std::isfinite(amount) || amount < 0.0) return;

    available_ += amount;
    if (available_ >= 0.0) {
        exhausted_ = false;
        leakage_ = 0.0;
    } else {
        leakage_ = std::fabs(available_);
    }
}

void EnergyLedger::reset(double initial_budget) {
    available_ = (std::isfinite(initial_budget) && initial_budget > 0.0) ? initial_budget : 0.0;
    leakage_ = 0.0;
    consumed_ = 0.0;
    exhausted_ = false;
}

void EnergyLedger::restore(double available, double leakage, double consumed) {
    available_ = std::isfinite(available) ? available : 0.0;
    leakage_ = (std::isfinite(leakage) && leakage > 0.0) ? leakage : 0.0;
    consumed_ = (std::isfinite(consumed) && consumed > 0.0) ? consumed : 0.0;
    exhausted_ = (available_ < 0.0);
}

} // namespace cuf
