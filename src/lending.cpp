// =============================================================================
// lending.cpp - In-process lending pool
// =============================================================================

#include "lev/lending.hpp"

#include <mutex>

#include "lev/ledger.hpp"

namespace lev {

LendingPool::LendingPool(Ledger& ledger, const Currency& asset, const Address& address)
    : ledger_(ledger), asset_(asset), address_(address) {}

// =============================================================================
// ILendingPool
// =============================================================================

void LendingPool::borrow(const Address& borrower, I128 amount) {
    if (amount <= 0) return;
    if (!is_approved(borrower)) {
        throw VaultError(errors::UNAUTHORIZED, "borrower not approved " + addresses::to_hex(borrower));
    }
    if (amount > total_available_asset()) {
        throw VaultError(errors::INSUFFICIENT_LENDING_LIQUIDITY,
            "borrow " + x18::to_int_string(amount) + " > available " +
            x18::to_int_string(total_available_asset()));
    }

    ledger_.transfer(asset_, address_, borrower, amount);

    std::unique_lock lock(mutex_);
    state_.debts[borrower] += amount;
    state_.total_debt += amount;
}

void LendingPool::repay(const Address& borrower, I128 amount) {
    if (amount <= 0) return;
    if (amount > max_repay(borrower)) {
        throw VaultError(errors::REPAY_EXCEEDS_DEBT,
            "repay " + x18::to_int_string(amount) + " > debt " +
            x18::to_int_string(max_repay(borrower)));
    }

    ledger_.transfer(asset_, borrower, address_, amount);

    std::unique_lock lock(mutex_);
    state_.debts[borrower] -= amount;
    state_.total_debt -= amount;
}

I128 LendingPool::max_repay(const Address& borrower) const {
    std::shared_lock lock(mutex_);
    auto it = state_.debts.find(borrower);
    return it != state_.debts.end() ? it->second : 0;
}

I128 LendingPool::total_available_asset() const {
    return ledger_.balance_of(asset_, address_);
}

// =============================================================================
// Administration
// =============================================================================

void LendingPool::supply(const Address& lender, I128 amount) {
    ledger_.transfer(asset_, lender, address_, amount);
}

void LendingPool::approve_borrower(const Address& borrower) {
    std::unique_lock lock(mutex_);
    borrowers_.insert(borrower);
}

bool LendingPool::is_approved(const Address& borrower) const {
    std::shared_lock lock(mutex_);
    return borrowers_.count(borrower) > 0;
}

void LendingPool::accrue_interest(I128 rate) {
    std::unique_lock lock(mutex_);
    I128 total = 0;
    for (auto& [borrower, debt] : state_.debts) {
        debt += x18::mul_div(debt, rate, SAFE_MULTIPLIER);
        total += debt;
    }
    state_.total_debt = total;
}

I128 LendingPool::total_debt() const {
    std::shared_lock lock(mutex_);
    return state_.total_debt;
}

// =============================================================================
// ITransactional
// =============================================================================

void LendingPool::checkpoint() {
    std::unique_lock lock(mutex_);
    snapshots_.push(state_);
}

void LendingPool::commit() {
    std::unique_lock lock(mutex_);
    snapshots_.drop();
}

void LendingPool::rollback() {
    std::unique_lock lock(mutex_);
    snapshots_.restore(state_);
}

} // namespace lev
