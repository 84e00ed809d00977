#ifndef LEV_LRT_CHECKS_HPP
#define LEV_LRT_CHECKS_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

// =============================================================================
// Checks - guards over the LRT vault store
// =============================================================================

namespace checks {

// OK or INVALID_CONFIG (Long only)
int32_t validate_config(const VaultConfig& config);

int32_t before_deposit_checks(const Store& store, const DepositParams& params);
int32_t before_deposit_value_checks(const Store& store, I128 deposit_value);
int32_t after_deposit_checks(const Store& store);

int32_t before_withdraw_checks(const Store& store, const WithdrawParams& params, const Address& user);
int32_t before_withdraw_value_checks(const Store& store, I128 withdraw_value);
int32_t after_withdraw_checks(const Store& store);

int32_t before_rebalance_checks(const Store& store, RebalanceType type);
int32_t after_rebalance_checks(const Store& store);
int32_t before_rebalance_close_checks(const Store& store);

int32_t before_compound_checks(const Store& store, const CompoundParams& params);
int32_t before_compound_lrt_checks(const Store& store);

int32_t before_mint_fee_checks(const Store& store);

int32_t before_emergency_pause_checks(const Store& store);
int32_t before_emergency_repay_checks(const Store& store);
int32_t before_emergency_borrow_checks(const Store& store);
int32_t before_emergency_resume_checks(const Store& store);
int32_t before_emergency_close_checks(const Store& store);
int32_t before_emergency_withdraw_checks(const Store& store, const Address& user, I128 shares_amt);
int32_t before_emergency_status_change_checks(const Store& store, Status target);

} // namespace checks
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_CHECKS_HPP
