// =============================================================================
// lp/checks.cpp - LP vault guards
// =============================================================================

#include "lev/lp/checks.hpp"

#include "lev/checks.hpp"
#include "lev/ledger.hpp"
#include "lev/lp/reader.hpp"

namespace lev {
namespace lp {
namespace checks {

namespace guards = ::lev::checks;

int32_t validate_config(const VaultConfig& config) {
    if (config.delta == Delta::Short) return errors::INVALID_CONFIG;
    return config.validate();
}

// =============================================================================
// Deposit
// =============================================================================

int32_t before_deposit_checks(const Store& store, const DepositParams& params) {
    if (int32_t code = guards::new_operation(store.status); code != errors::OK) return code;
    if (params.amt <= 0) return errors::EMPTY_DEPOSIT_AMOUNT;
    if (params.token.is_native()) return errors::INVALID_DEPOSIT_TOKEN;
    return guards::slippage(store.config, params.slippage);
}

int32_t before_deposit_value_checks(const Store& store, I128 deposit_value) {
    return guards::deposit_value(store.config, deposit_value, reader::additional_capacity(store));
}

int32_t after_deposit_checks(const Store& store) {
    const DepositCache& dc = store.deposit_cache;
    return guards::after_deposit(store.config, dc.health, dc.shares_to_user, dc.min_shares_amt);
}

// =============================================================================
// Withdraw
// =============================================================================

int32_t before_withdraw_checks(const Store& store, const WithdrawParams& params, const Address& user) {
    if (int32_t code = guards::new_operation(store.status); code != errors::OK) return code;
    if (params.shares_amt <= 0) return errors::EMPTY_WITHDRAW_AMOUNT;
    if (params.token != store.token_a && params.token != store.token_b) {
        return errors::INVALID_WITHDRAW_TOKEN;
    }
    if (store.shares.balance_of(user) < params.shares_amt) return errors::INSUFFICIENT_SHARES_BALANCE;
    return guards::slippage(store.config, params.slippage);
}

int32_t before_withdraw_value_checks(const Store& store, I128 withdraw_value) {
    return guards::withdraw_value(store.config, withdraw_value);
}

int32_t after_withdraw_checks(const Store& store) {
    const WithdrawCache& wc = store.withdraw_cache;
    return guards::after_withdraw(store.config, wc.health, wc.assets_to_user,
                                  wc.params.min_withdraw_token_amt);
}

// =============================================================================
// Rebalance
// =============================================================================

int32_t before_rebalance_checks(const Store& store, RebalanceType type) {
    if (int32_t code = guards::rebalance(store.status); code != errors::OK) return code;
    return guards::rebalance_preconditions(store.config, type, reader::delta(store),
                                           reader::debt_ratio(store));
}

int32_t after_rebalance_checks(const Store& store) {
    const HealthParams& h = store.rebalance_cache.health;
    return guards::rebalance_postconditions(store.config, h.delta_after, h.debt_ratio_after);
}

int32_t before_rebalance_close_checks(const Store& store) {
    return guards::rebalance_close(store.status);
}

// =============================================================================
// Compound
// =============================================================================

int32_t before_compound_checks(const Store& store, const CompoundParams& params) {
    if (int32_t code = guards::new_operation(store.status); code != errors::OK) return code;
    if (params.token_out != store.token_a && params.token_out != store.token_b) {
        return errors::INVALID_COMPOUND_TOKEN;
    }
    if (params.token_in == params.token_out || params.token_in == store.lp_token ||
        params.token_in.is_native()) {
        return errors::INVALID_COMPOUND_TOKEN;
    }
    if (params.amt_in < 0) return errors::EMPTY_COMPOUND_AMOUNT;
    if (params.amt_in == 0 &&
        store.ledger->balance_of(store.token_a, store.vault) == 0 &&
        store.ledger->balance_of(store.token_b, store.vault) == 0) {
        return errors::EMPTY_COMPOUND_AMOUNT;
    }
    return errors::OK;
}

int32_t before_compound_lp_checks(const Store& store) {
    if (int32_t code = guards::new_operation(store.status); code != errors::OK) return code;
    if (store.ledger->balance_of(store.lp_token, store.vault) <= store.lp_amt) {
        return errors::NOTHING_TO_SYNC;
    }
    return errors::OK;
}

// =============================================================================
// Failure recovery
// =============================================================================

int32_t before_process_deposit_failure_checks(const Store& store) {
    if (store.status != Status::Deposit_Failed || store.deposit_cache.withdraw_key != 0) {
        return errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS;
    }
    return errors::OK;
}

int32_t before_process_withdraw_failure_checks(const Store& store) {
    if (store.status != Status::Withdraw_Failed || store.withdraw_cache.deposit_key != 0) {
        return errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS;
    }
    return errors::OK;
}

int32_t before_mint_fee_checks(const Store& store) {
    return guards::mint_fee(store.status);
}

// =============================================================================
// Emergency
// =============================================================================

int32_t before_emergency_pause_checks(const Store& store) {
    return guards::emergency_pause(store.status);
}

int32_t before_emergency_repay_checks(const Store& store) {
    // Retry of a repay whose settlement did not go through
    if (store.status == Status::Repay && store.emergency_key == 0) return errors::OK;
    return guards::emergency_repay(store.status);
}

int32_t before_emergency_borrow_checks(const Store& store) {
    return guards::emergency_borrow(store.status);
}

int32_t before_emergency_resume_checks(const Store& store) {
    return guards::emergency_resume(store.status);
}

int32_t before_emergency_close_checks(const Store& store) {
    return guards::emergency_close(store.status);
}

int32_t before_emergency_withdraw_checks(const Store& store, const Address& user, I128 shares_amt) {
    if (int32_t code = guards::emergency_withdraw(store.status); code != errors::OK) return code;
    if (shares_amt <= 0) return errors::EMPTY_SHARES_AMOUNT;
    if (store.shares.balance_of(user) < shares_amt) return errors::INSUFFICIENT_SHARES_BALANCE;
    return errors::OK;
}

int32_t before_emergency_status_change_checks(const Store& store, Status target) {
    return guards::emergency_status_change(store.status, target);
}

} // namespace checks
} // namespace lp
} // namespace lev
