#ifndef LEV_LP_MANAGER_HPP
#define LEV_LP_MANAGER_HPP

#include "types.hpp"

namespace lev {
namespace lp {

// =============================================================================
// Manager - borrow, repay, swap and venue primitives of the LP vault
// =============================================================================

namespace manager {

// Debt to take for a deposit of `deposit_value` USD at the target leverage.
// Neutral splits the borrow to hedge token A by pool weight; Long borrows
// token B only.
BorrowParams calc_borrow(const Store& store, I128 deposit_value);

// Outstanding debt scaled by share_ratio (1e18 = all of it)
RepayParams calc_repay(const Store& store, I128 share_ratio);

// Upper bound of token_in for an exact-out swap, inflated by swap_slippage
I128 calc_amount_in_maximum(const Store& store, const Currency& token_in,
                            const Currency& token_out, I128 amount_out);

// Minimum LP out for adding `value` USD of tokens
I128 calc_min_market_slippage_amt(const Store& store, I128 value, I128 slippage);

// Minimum token A and B out for removing `lp_amt`
TokenAmounts calc_min_tokens_slippage_amt(const Store& store, I128 lp_amt, I128 slippage);

struct SwapForRepay {
    bool needed = false;
    Currency token_from;
    Currency token_to;
    I128 token_to_amt = 0;
    I128 token_from_max = 0;
};

// Exact-out swap that covers a repay shortfall in one token from the
// surplus of the other. Partial when the surplus cannot cover it all.
SwapForRepay calc_swap_for_repay(const Store& store, const RepayParams& repay,
                                 const TokenAmounts& available);

// No-op per token on zero
void borrow(Store& store, const BorrowParams& params);
void repay(Store& store, const RepayParams& params);

// No-op returning 0 when amount_in is 0. Minimum out from the oracle value
// less `slippage` bps. deadline 0 means the current block.
I128 swap_exact_tokens_for_tokens(Store& store, const Currency& token_in, const Currency& token_out,
                                  I128 amount_in, I128 slippage, uint64_t deadline = 0);

// No-op returning 0 when amount_in_max is 0. Returns the input used.
I128 swap_tokens_for_exact_tokens(Store& store, const Currency& token_in, const Currency& token_out,
                                  I128 amount_out, I128 amount_in_max);

uint64_t add_liquidity(Store& store, const TokenAmounts& amounts, I128 min_lp_out);
uint64_t remove_liquidity(Store& store, I128 lp_amt, const TokenAmounts& min_tokens_out);

// Swap for repay when short, then repay what `available` covers, capped at
// the outstanding debt. Returns what is left of `available`.
TokenAmounts repay_from(Store& store, const RepayParams& target, TokenAmounts available);

// As repay_from, but `target` (capped at the outstanding debt) must be
// repaid whole. Throws INSUFFICIENT_REPAY_AMOUNT when `available` cannot
// cover it even after the swap.
TokenAmounts repay_in_full(Store& store, const RepayParams& target, TokenAmounts available);

// Pay out from custody; wrapped native is unwrapped when `unwrap_native`
// and falls back to the wrapped token if the recipient refuses native
void transfer_out(Store& store, const Address& to, const Currency& token, I128 amount,
                  bool unwrap_native);

// Mint the pending management fee to the treasury (unguarded)
void mint_fee(Store& store);

} // namespace manager
} // namespace lp
} // namespace lev

#endif // LEV_LP_MANAGER_HPP
