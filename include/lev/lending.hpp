#ifndef LEV_LENDING_HPP
#define LEV_LENDING_HPP

#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "environment.hpp"
#include "types.hpp"

namespace lev {

class Ledger;

// =============================================================================
// Lending Pool Interface
// =============================================================================

// Single-asset pool the vault borrows from. The vault's debt ratio is
// computed from max_repay(), so it must include accrued interest.
class ILendingPool {
public:
    virtual ~ILendingPool() = default;

    virtual Currency asset() const = 0;

    // Transfers `amount` of asset() to the borrower.
    // Throws INSUFFICIENT_LENDING_LIQUIDITY, UNAUTHORIZED
    virtual void borrow(const Address& borrower, I128 amount) = 0;

    // Pulls `amount` of asset() from the borrower. Throws REPAY_EXCEEDS_DEBT
    virtual void repay(const Address& borrower, I128 amount) = 0;

    // Outstanding debt of the borrower, principal plus interest
    virtual I128 max_repay(const Address& borrower) const = 0;

    // Asset available to borrow
    virtual I128 total_available_asset() const = 0;
};

// =============================================================================
// LendingPool - in-process pool with per-borrower debt book
// =============================================================================

class LendingPool : public ILendingPool, public ITransactional {
public:
    LendingPool(Ledger& ledger, const Currency& asset, const Address& address);
    ~LendingPool() override = default;

    // Non-copyable
    LendingPool(const LendingPool&) = delete;
    LendingPool& operator=(const LendingPool&) = delete;

    // =========================================================================
    // ILendingPool
    // =========================================================================

    Currency asset() const override { return asset_; }
    void borrow(const Address& borrower, I128 amount) override;
    void repay(const Address& borrower, I128 amount) override;
    I128 max_repay(const Address& borrower) const override;
    I128 total_available_asset() const override;

    // =========================================================================
    // Administration
    // =========================================================================

    // Lender deposits asset into the pool
    void supply(const Address& lender, I128 amount);

    // Only approved borrowers may draw credit
    void approve_borrower(const Address& borrower);
    bool is_approved(const Address& borrower) const;

    // Grow every borrower's debt by rate (1e18 = 100%)
    void accrue_interest(I128 rate);

    I128 total_debt() const;
    const Address& address() const { return address_; }

    // =========================================================================
    // ITransactional
    // =========================================================================

    void checkpoint() override;
    void commit() override;
    void rollback() override;

private:
    struct State {
        std::unordered_map<Address, I128, AddressHash> debts;   // borrower -> debt
        I128 total_debt = 0;
    };

    Ledger& ledger_;
    Currency asset_;
    Address address_;
    std::unordered_set<Address, AddressHash> borrowers_;

    State state_;
    SnapshotStack<State> snapshots_;
    mutable std::shared_mutex mutex_;
};

} // namespace lev

#endif // LEV_LENDING_HPP
