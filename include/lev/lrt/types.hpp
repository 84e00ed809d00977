#ifndef LEV_LRT_TYPES_HPP
#define LEV_LRT_TYPES_HPP

#include <vector>

#include "../accounting.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../shares.hpp"
#include "../types.hpp"

namespace lev {

class Environment;
class ILendingPool;
class IOracle;
class ISwapRouter;
class Ledger;

namespace lrt {

// =============================================================================
// Operation Parameters
// =============================================================================

struct DepositParams {
    Currency token;          // base token, the LRT or any priced token
    I128 amt;
    I128 slippage;           // bps, >= min_vault_slippage
};

struct WithdrawParams {
    I128 shares_amt;
    Currency token;          // base token (paid as native when it wraps native)
    I128 min_withdraw_token_amt;
    I128 slippage;
};

struct RebalanceAddParams {
    RebalanceType type;
    I128 borrow_amt;         // base token to borrow and restake
    I128 slippage;
};

struct RebalanceRemoveParams {
    RebalanceType type;
    I128 lrt_amt_to_remove;  // LRT to unstake, proceeds repay the debt
    I128 slippage;
};

struct CompoundParams {
    Currency token_in;
    Currency token_out;      // LRT (credited to the position) or base token
    I128 amt_in;
    I128 slippage;
    uint64_t deadline;
};

// =============================================================================
// Operation Caches (live for one call)
// =============================================================================

struct DepositCache {
    Address user{};
    DepositParams params{};
    I128 deposit_value = 0;
    I128 min_shares_amt = 0;
    I128 shares_to_user = 0;
    I128 borrow_amt = 0;
    HealthParams health;
};

struct WithdrawCache {
    Address user{};
    WithdrawParams params{};
    I128 share_ratio = 0;
    I128 lrt_amt = 0;
    I128 withdraw_value = 0;
    I128 repay_amt = 0;
    I128 assets_to_user = 0;
    HealthParams health;
};

struct RebalanceCache {
    RebalanceType type = RebalanceType::Debt;
    I128 borrow_amt = 0;
    I128 lrt_amt_to_remove = 0;
    HealthParams health;
};

struct CompoundCache {
    CompoundParams params{};
    I128 amt_out = 0;
};

// =============================================================================
// Store
// =============================================================================

struct Store {
    Status status = Status::Open;
    I128 lrt_amt = 0;
    VaultConfig config;
    uint64_t last_fee_collected = 0;

    Currency base;           // Borrowed, usually the wrapped native token
    Currency lrt;            // Position unit
    bool base_is_wnt = false;

    Environment* env = nullptr;
    Ledger* ledger = nullptr;
    const IOracle* oracle = nullptr;
    ISwapRouter* swap_router = nullptr;
    ILendingPool* lending = nullptr;

    Address vault{};
    Address treasury{};
    ShareToken shares;

    DepositCache deposit_cache;
    WithdrawCache withdraw_cache;
    RebalanceCache rebalance_cache;
    CompoundCache compound_cache;

    I128 emergency_repaid = 0;

    std::vector<VaultEvent> events;
};

inline void emit(Store& store, VaultEvent event) {
    event.status = store.status;
    store.events.push_back(event);
}

} // namespace lrt
} // namespace lev

#endif // LEV_LRT_TYPES_HPP
