#ifndef LEV_LP_VAULT_HPP
#define LEV_LP_VAULT_HPP

#include <set>
#include <shared_mutex>
#include <vector>

#include "../environment.hpp"
#include "../venue.hpp"
#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Collaborators
// =============================================================================

struct VaultDeps {
    Environment& env;
    Ledger& ledger;
    const IOracle& oracle;
    ISwapRouter& swap_router;
    ILendingPool& token_a_lending;
    ILendingPool& token_b_lending;
    ILiquidityVenue& venue;
    Address vault;           // Custody account of the vault in the ledger
    Address owner;
    Address treasury;
    VaultConfig config;
};

// =============================================================================
// Vault - leveraged LP vault over an asynchronous liquidity venue
// =============================================================================

// Every entry point runs under the single-writer lock inside a transaction:
// a VaultError leaves all state (ledger, lending, venue, store) untouched.
// Events are delivered to subscribers after the commit, outside the lock.
class Vault : public ILiquidityCallback {
public:
    // Throws VaultError(INVALID_CONFIG)
    explicit Vault(const VaultDeps& deps);
    ~Vault() override = default;

    // Non-copyable
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // =========================================================================
    // User Operations
    // =========================================================================

    // Returns the venue request key
    uint64_t deposit(const Address& user, const DepositParams& params);
    uint64_t deposit_native(const Address& user, const DepositParams& params);
    uint64_t withdraw(const Address& user, const WithdrawParams& params);

    // Closed vault: pro-rata share of custody balances
    void emergency_withdraw(const Address& user, I128 shares_amt);

    // Anyone; rejected while Paused or Closed
    void mint_fee();

    // =========================================================================
    // Keeper Operations
    // =========================================================================

    uint64_t process_deposit_failure(const Address& caller, I128 slippage);
    uint64_t process_withdraw_failure(const Address& caller, I128 slippage);

    uint64_t rebalance_add(const Address& caller, const RebalanceAddParams& params);
    uint64_t rebalance_remove(const Address& caller, const RebalanceRemoveParams& params);
    void rebalance_close(const Address& caller);

    uint64_t compound(const Address& caller, const CompoundParams& params);
    void compound_lp(const Address& caller);

    void emergency_pause(const Address& caller);
    uint64_t emergency_repay(const Address& caller);
    void emergency_borrow(const Address& caller);
    uint64_t emergency_resume(const Address& caller);

    // =========================================================================
    // Owner Operations
    // =========================================================================

    void emergency_close(const Address& caller);
    void emergency_status_change(const Address& caller, Status target);

    void update_config(const Address& caller, const VaultConfig& config);
    void update_fee_per_second(const Address& caller, I128 fee_per_second);
    void set_keeper(const Address& caller, const Address& keeper, bool approved);
    void set_treasury(const Address& caller, const Address& treasury);

    // =========================================================================
    // ILiquidityCallback
    // =========================================================================

    CallbackResult after_deposit_execution(uint64_t key, I128 lp_received) override;
    CallbackResult after_deposit_cancellation(uint64_t key) override;
    CallbackResult after_withdrawal_execution(uint64_t key, I128 token_a_received,
                                              I128 token_b_received) override;
    CallbackResult after_withdrawal_cancellation(uint64_t key) override;

    // =========================================================================
    // Views
    // =========================================================================

    Status status() const { return store_.status; }
    I128 lp_amt() const { return store_.lp_amt; }
    const VaultConfig& config() const { return store_.config; }
    const Store& store() const { return store_; }
    bool should_emergency_pause() const { return store_.should_emergency_pause; }

    const Address& address() const { return store_.vault; }
    const Address& owner() const { return owner_; }
    const Address& treasury() const { return store_.treasury; }
    bool is_keeper(const Address& account) const;

    I128 total_supply() const { return store_.shares.total_supply(); }
    I128 balance_of(const Address& holder) const { return store_.shares.balance_of(holder); }

    HealthParams health() const;
    I128 lp_token_value() const;
    TokenAmounts token_weights() const;
    TokenAmounts asset_amt() const;
    TokenAmounts debt_amt() const;
    I128 asset_value() const;
    I128 debt_value() const;
    I128 equity_value() const;
    I128 debt_ratio() const;
    I128 leverage() const;
    I128 delta() const;
    I128 pending_fee() const;
    I128 sv_token_value() const;
    I128 additional_capacity() const;
    I128 capacity() const;

    // =========================================================================
    // Events
    // =========================================================================

    void subscribe(EventCallback callback);

private:
    Store store_;
    Address owner_;
    std::set<Address> keepers_;
    mutable std::shared_mutex keepers_mutex_;

    ReentrancyLock lock_;

    std::vector<EventCallback> subscribers_;
    mutable std::shared_mutex subscribers_mutex_;

    template <typename Fn>
    auto run(Fn&& fn) -> decltype(fn());

    void publish(const std::vector<VaultEvent>& events);

    void only_keeper(const Address& caller) const;
    void only_owner(const Address& caller) const;

    CallbackResult reject(uint64_t key, const char* notification);
};

} // namespace lp
} // namespace lev

#endif // LEV_LP_VAULT_HPP
