#ifndef LEV_LP_TYPES_HPP
#define LEV_LP_TYPES_HPP

#include <optional>
#include <vector>

#include "../accounting.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../shares.hpp"
#include "../types.hpp"

namespace lev {

class Environment;
class ILendingPool;
class ILiquidityCallback;
class ILiquidityVenue;
class IOracle;
class ISwapRouter;
class Ledger;

namespace lp {

// =============================================================================
// Token Pair Amounts (A = volatile token, B = stable token)
// =============================================================================

struct TokenAmounts {
    I128 token_a_amt = 0;
    I128 token_b_amt = 0;
};

using BorrowParams = TokenAmounts;
using RepayParams = TokenAmounts;

// =============================================================================
// Operation Parameters
// =============================================================================

struct DepositParams {
    Currency token;          // token A, token B, the LP token or any priced token
    I128 amt;                // Native token units
    I128 slippage;           // bps, >= min_vault_slippage
};

struct WithdrawParams {
    I128 shares_amt;
    Currency token;          // token A or token B
    I128 min_withdraw_token_amt;
    I128 slippage;           // bps
};

struct RebalanceAddParams {
    RebalanceType type;
    BorrowParams borrow;
    I128 slippage;
};

struct RebalanceRemoveParams {
    RebalanceType type;
    I128 lp_amt_to_remove;
    RepayParams repay;
    I128 slippage;
};

struct CompoundParams {
    Currency token_in;       // Reward token held by the vault
    Currency token_out;      // token A or token B
    I128 amt_in;
    I128 slippage;
    uint64_t deadline;
};

// =============================================================================
// Operation Caches
// =============================================================================

struct DepositCache {
    Address user{};
    DepositParams params{};
    bool native = false;
    I128 deposit_value = 0;
    I128 lp_deposit_amt = 0;         // LP supplied directly by the user
    I128 min_shares_amt = 0;
    I128 shares_to_user = 0;
    BorrowParams borrow;
    TokenAmounts added;              // Sent to the venue
    I128 lp_received = 0;
    HealthParams health;
    uint64_t deposit_key = 0;
    uint64_t withdraw_key = 0;       // Failure unwind request
    TokenAmounts unwound;            // Out of the venue, held until the unwind settles
};

struct WithdrawCache {
    Address user{};
    WithdrawParams params{};
    I128 share_ratio = 0;
    I128 lp_amt = 0;                 // LP sent for removal
    I128 withdraw_value = 0;
    TokenAmounts received;
    RepayParams repay;
    I128 assets_to_user = 0;
    HealthParams health;
    uint64_t withdraw_key = 0;
    uint64_t deposit_key = 0;        // Failure re-add request
};

struct RebalanceCache {
    RebalanceType type = RebalanceType::Delta;
    BorrowParams borrow;
    RepayParams repay;
    I128 lp_amt_to_remove = 0;
    HealthParams health;
    uint64_t deposit_key = 0;
    uint64_t withdraw_key = 0;
};

struct CompoundCache {
    CompoundParams params{};
    TokenAmounts added;
    I128 lp_received = 0;
    HealthParams health;
    uint64_t deposit_key = 0;
};

// =============================================================================
// Store - the vault's whole mutable state
// =============================================================================

// Copied wholesale by Transaction<Store>; collaborators are held by pointer.
struct Store {
    Status status = Status::Open;
    I128 lp_amt = 0;
    VaultConfig config;
    uint64_t last_fee_collected = 0;

    // Tokens
    Currency token_a;
    Currency token_b;
    Currency lp_token;
    std::optional<Currency> wnt;

    // Collaborators
    Environment* env = nullptr;
    Ledger* ledger = nullptr;
    const IOracle* oracle = nullptr;
    ISwapRouter* swap_router = nullptr;
    ILendingPool* token_a_lending = nullptr;
    ILendingPool* token_b_lending = nullptr;
    ILiquidityVenue* venue = nullptr;
    ILiquidityCallback* callback = nullptr;

    Address vault{};
    Address treasury{};
    ShareToken shares;

    DepositCache deposit_cache;
    WithdrawCache withdraw_cache;
    RebalanceCache rebalance_cache;
    CompoundCache compound_cache;

    bool should_emergency_pause = false;
    uint64_t emergency_key = 0;
    RepayParams emergency_repaid;

    std::vector<VaultEvent> events;
};

// Queue an event stamped with the current status
inline void emit(Store& store, VaultEvent event) {
    event.status = store.status;
    store.events.push_back(event);
}

} // namespace lp
} // namespace lev

#endif // LEV_LP_TYPES_HPP
