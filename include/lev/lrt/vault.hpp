#ifndef LEV_LRT_VAULT_HPP
#define LEV_LRT_VAULT_HPP

#include <set>
#include <shared_mutex>
#include <vector>

#include "../environment.hpp"
#include "types.hpp"

namespace lev {
namespace lrt {

struct VaultDeps {
    Environment& env;
    Ledger& ledger;
    const IOracle& oracle;
    ISwapRouter& swap_router;
    ILendingPool& lending;   // Lends the base token
    Currency lrt;
    Address vault;
    Address owner;
    Address treasury;
    VaultConfig config;      // delta must be Long
};

// =============================================================================
// Vault - leveraged liquid-restaking vault, every operation settles in-call
// =============================================================================

class Vault {
public:
    // Throws VaultError(INVALID_CONFIG)
    explicit Vault(const VaultDeps& deps);
    ~Vault() = default;

    // Non-copyable
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;

    // =========================================================================
    // User Operations
    // =========================================================================

    // Returns the shares minted
    I128 deposit(const Address& user, const DepositParams& params);
    I128 deposit_native(const Address& user, const DepositParams& params);

    // Returns the base token paid out
    I128 withdraw(const Address& user, const WithdrawParams& params);

    void emergency_withdraw(const Address& user, I128 shares_amt);
    void mint_fee();

    // =========================================================================
    // Keeper Operations
    // =========================================================================

    Status rebalance_add(const Address& caller, const RebalanceAddParams& params);
    Status rebalance_remove(const Address& caller, const RebalanceRemoveParams& params);
    void rebalance_close(const Address& caller);

    I128 compound(const Address& caller, const CompoundParams& params);
    void compound_lrt(const Address& caller);

    void emergency_pause(const Address& caller);
    void emergency_repay(const Address& caller);
    void emergency_borrow(const Address& caller);
    void emergency_resume(const Address& caller);

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
    // Views
    // =========================================================================

    Status status() const { return store_.status; }
    I128 lrt_amt() const { return store_.lrt_amt; }
    const VaultConfig& config() const { return store_.config; }
    const Store& store() const { return store_; }

    const Address& address() const { return store_.vault; }
    const Address& owner() const { return owner_; }
    const Address& treasury() const { return store_.treasury; }
    bool is_keeper(const Address& account) const;

    I128 total_supply() const { return store_.shares.total_supply(); }
    I128 balance_of(const Address& holder) const { return store_.shares.balance_of(holder); }

    HealthParams health() const;
    I128 lrt_value() const;
    I128 asset_value() const;
    I128 debt_amt() const;
    I128 debt_value() const;
    I128 equity_value() const;
    I128 debt_ratio() const;
    I128 leverage() const;
    I128 delta() const;
    I128 pending_fee() const;
    I128 sv_token_value() const;
    I128 additional_capacity() const;
    I128 capacity() const;

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
};

} // namespace lrt
} // namespace lev

#endif // LEV_LRT_VAULT_HPP
