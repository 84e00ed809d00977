#ifndef LEV_LRT_MANAGER_HPP
#define LEV_LRT_MANAGER_HPP

#include "types.hpp"

namespace lev {
namespace lrt {

// =============================================================================
// Manager - borrow, repay and swap primitives of the LRT vault
// =============================================================================

namespace manager {

// Base token to borrow for a deposit of `deposit_value` USD
I128 calc_borrow(const Store& store, I128 deposit_value);

// Outstanding debt scaled by share_ratio (1e18 = all of it)
I128 calc_repay(const Store& store, I128 share_ratio);

I128 calc_amount_in_maximum(const Store& store, const Currency& token_in,
                            const Currency& token_out, I128 amount_out);

// No-op on zero
void borrow(Store& store, I128 amount);
void repay(Store& store, I128 amount);

// Repay up to `amount`, capped at the outstanding debt. Returns the amount
// actually repaid.
I128 repay_up_to(Store& store, I128 amount);

// No-op returning 0 when amount_in is 0
I128 swap_exact_tokens_for_tokens(Store& store, const Currency& token_in, const Currency& token_out,
                                  I128 amount_in, I128 slippage, uint64_t deadline = 0);

// No-op returning 0 when amount_in_max is 0. Returns the input used.
I128 swap_tokens_for_exact_tokens(Store& store, const Currency& token_in, const Currency& token_out,
                                  I128 amount_out, I128 amount_in_max);

void transfer_out(Store& store, const Address& to, const Currency& token, I128 amount,
                  bool unwrap_native);

void mint_fee(Store& store);

} // namespace manager
} // namespace lrt
} // namespace lev

#endif // LEV_LRT_MANAGER_HPP
