// =============================================================================
// checks.cpp - Variant independent guards
// =============================================================================

#include "lev/checks.hpp"

namespace lev {
namespace checks {

int32_t status_in(Status current, std::initializer_list<Status> allowed) {
    for (Status s : allowed) {
        if (s == current) return errors::OK;
    }
    return errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS;
}

int32_t slippage(const VaultConfig& config, I128 slippage_bps) {
    if (slippage_bps < config.min_vault_slippage || slippage_bps > BPS_DENOMINATOR) {
        return errors::INSUFFICIENT_SLIPPAGE_AMOUNT;
    }
    return errors::OK;
}

int32_t deposit_value(const VaultConfig& config, I128 value, I128 additional_capacity) {
    if (value < config.min_asset_value) return errors::INSUFFICIENT_DEPOSIT_VALUE;
    if (value > config.max_asset_value) return errors::EXCESSIVE_DEPOSIT_VALUE;
    if (value > additional_capacity) return errors::INSUFFICIENT_CAPACITY;
    return errors::OK;
}

int32_t withdraw_value(const VaultConfig& config, I128 value) {
    if (value < config.min_asset_value) return errors::INSUFFICIENT_WITHDRAW_VALUE;
    if (value > config.max_asset_value) return errors::EXCESSIVE_WITHDRAW_VALUE;
    return errors::OK;
}

int32_t after_deposit(const VaultConfig& config, const HealthParams& health,
                      I128 shares_to_user, I128 min_shares_amt) {
    if (health.position_amt_after <= health.position_amt_before) {
        return errors::POSITION_NOT_INCREASED;
    }
    if (!accounting::is_within_step_change(config.debt_ratio_step_threshold,
                                           health.debt_ratio_before, health.debt_ratio_after)) {
        return errors::DEBT_RATIO_STEP_EXCEEDED;
    }
    if (shares_to_user < min_shares_amt) return errors::INSUFFICIENT_SHARES_MINTED;
    return errors::OK;
}

int32_t after_withdraw(const VaultConfig& config, const HealthParams& health,
                       I128 assets_to_user, I128 min_assets_amt) {
    if (health.position_amt_after >= health.position_amt_before) {
        return errors::POSITION_NOT_DECREASED;
    }
    if (health.equity_after >= health.equity_before) return errors::EQUITY_NOT_DECREASED;
    // A full exit leaves no debt ratio to compare
    if (health.position_amt_after != 0 &&
        !accounting::is_within_step_change(config.debt_ratio_step_threshold,
                                           health.debt_ratio_before, health.debt_ratio_after)) {
        return errors::DEBT_RATIO_STEP_EXCEEDED;
    }
    if (assets_to_user < min_assets_amt) return errors::INSUFFICIENT_ASSETS_RECEIVED;
    return errors::OK;
}

int32_t rebalance_preconditions(const VaultConfig& config, RebalanceType type,
                                I128 delta, I128 debt_ratio) {
    if (type == RebalanceType::Delta) {
        if (config.delta != Delta::Neutral) return errors::INVALID_REBALANCE_PARAMETERS;
        if (delta <= config.delta_upper_limit && delta >= config.delta_lower_limit) {
            return errors::INVALID_REBALANCE_PRECONDITIONS;
        }
        return errors::OK;
    }
    if (debt_ratio <= config.debt_ratio_upper_limit && debt_ratio >= config.debt_ratio_lower_limit) {
        return errors::INVALID_REBALANCE_PRECONDITIONS;
    }
    return errors::OK;
}

int32_t rebalance_postconditions(const VaultConfig& config, I128 delta, I128 debt_ratio) {
    if (config.delta == Delta::Neutral &&
        (delta > config.delta_upper_limit || delta < config.delta_lower_limit)) {
        return errors::INVALID_REBALANCE_DELTA;
    }
    if (debt_ratio > config.debt_ratio_upper_limit || debt_ratio < config.debt_ratio_lower_limit) {
        return errors::INVALID_REBALANCE_DEBT_RATIO;
    }
    return errors::OK;
}

// =============================================================================
// Status gates
// =============================================================================

int32_t new_operation(Status status) {
    return status_in(status, {Status::Open});
}

int32_t rebalance(Status status) {
    return status_in(status, {Status::Open, Status::Rebalance_Open});
}

int32_t rebalance_close(Status status) {
    return status_in(status, {Status::Rebalance_Open});
}

int32_t mint_fee(Status status) {
    if (status == Status::Paused || status == Status::Closed) {
        return errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS;
    }
    return errors::OK;
}

int32_t emergency_pause(Status status) {
    switch (status) {
        case Status::Paused:
        case Status::Repay:
        case Status::Repaid:
        case Status::Resume:
        case Status::Closed:
            return errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS;
        default:
            return errors::OK;
    }
}

int32_t emergency_repay(Status status) {
    return status_in(status, {Status::Paused});
}

int32_t emergency_borrow(Status status) {
    return status_in(status, {Status::Repaid});
}

int32_t emergency_resume(Status status) {
    return status_in(status, {Status::Paused});
}

int32_t emergency_close(Status status) {
    return status_in(status, {Status::Repaid});
}

int32_t emergency_withdraw(Status status) {
    return status_in(status, {Status::Closed});
}

int32_t emergency_status_change(Status status, Status target) {
    if (status != Status::Paused) return errors::NOT_ALLOWED_IN_CURRENT_VAULT_STATUS;
    if (target == Status::Closed) return errors::INVALID_STATUS_TARGET;
    return errors::OK;
}

} // namespace checks
} // namespace lev
