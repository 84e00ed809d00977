// =============================================================================
// lp/manager.cpp - LP vault borrow/repay/swap/venue primitives
// =============================================================================

#include "lev/lp/manager.hpp"

#include "lev/environment.hpp"
#include "lev/ledger.hpp"
#include "lev/lending.hpp"
#include "lev/log.hpp"
#include "lev/lp/reader.hpp"
#include "lev/swap.hpp"
#include "lev/venue.hpp"

namespace lev {
namespace lp {
namespace manager {

namespace {

I128& leg(TokenAmounts& amounts, const Store& store, const Currency& token) {
    return token == store.token_a ? amounts.token_a_amt : amounts.token_b_amt;
}

ILendingPool& lending_for(Store& store, const Currency& token) {
    return token == store.token_a ? *store.token_a_lending : *store.token_b_lending;
}

}  // namespace

// =============================================================================
// Calculations
// =============================================================================

BorrowParams calc_borrow(const Store& store, I128 deposit_value) {
    I128 position_value = x18::mul_div(deposit_value, store.config.leverage, SAFE_MULTIPLIER);
    I128 borrow_value = position_value - deposit_value;

    I128 borrow_a_value = 0;
    I128 borrow_b_value = borrow_value;

    if (store.config.delta == Delta::Neutral) {
        TokenAmounts weights = reader::token_weights(store);
        borrow_a_value = x18::mul_div(position_value, weights.token_a_amt, SAFE_MULTIPLIER);
        borrow_b_value = borrow_value - borrow_a_value;
        if (borrow_b_value < 0) {
            throw VaultError(errors::ARITHMETIC_UNDERFLOW, "token B borrow value below zero");
        }
    }

    return BorrowParams{
        reader::convert_usd_to_token_amt(store, store.token_a, borrow_a_value),
        reader::convert_usd_to_token_amt(store, store.token_b, borrow_b_value)
    };
}

RepayParams calc_repay(const Store& store, I128 share_ratio) {
    TokenAmounts debt = reader::debt_amt(store);
    return RepayParams{
        x18::mul_div(debt.token_a_amt, share_ratio, SAFE_MULTIPLIER),
        x18::mul_div(debt.token_b_amt, share_ratio, SAFE_MULTIPLIER)
    };
}

I128 calc_amount_in_maximum(const Store& store, const Currency& token_in,
                            const Currency& token_out, I128 amount_out) {
    return accounting::calc_amount_in_maximum(*store.oracle, *store.ledger, token_in, token_out,
                                              amount_out, store.config.swap_slippage);
}

I128 calc_min_market_slippage_amt(const Store& store, I128 value, I128 slippage) {
    I128 lp_value = reader::lp_token_value(store);
    if (lp_value == 0) return 0;
    return accounting::slippage_floor(x18::mul_div(value, SAFE_MULTIPLIER, lp_value), slippage);
}

TokenAmounts calc_min_tokens_slippage_amt(const Store& store, I128 lp_amt, I128 slippage) {
    PoolReserves r = store.venue->reserves();
    if (r.lp_supply == 0) return TokenAmounts{};
    return TokenAmounts{
        accounting::slippage_floor(x18::mul_div(r.token_a_amt, lp_amt, r.lp_supply), slippage),
        accounting::slippage_floor(x18::mul_div(r.token_b_amt, lp_amt, r.lp_supply), slippage)
    };
}

SwapForRepay calc_swap_for_repay(const Store& store, const RepayParams& repay,
                                 const TokenAmounts& available) {
    SwapForRepay swap;

    if (available.token_a_amt < repay.token_a_amt && available.token_b_amt > repay.token_b_amt) {
        swap.needed = true;
        swap.token_from = store.token_b;
        swap.token_to = store.token_a;
        swap.token_to_amt = repay.token_a_amt - available.token_a_amt;
        swap.token_from_max = available.token_b_amt - repay.token_b_amt;
    } else if (available.token_b_amt < repay.token_b_amt && available.token_a_amt > repay.token_a_amt) {
        swap.needed = true;
        swap.token_from = store.token_a;
        swap.token_to = store.token_b;
        swap.token_to_amt = repay.token_b_amt - available.token_b_amt;
        swap.token_from_max = available.token_a_amt - repay.token_a_amt;
    } else {
        return swap;
    }

    I128 max_in = calc_amount_in_maximum(store, swap.token_from, swap.token_to, swap.token_to_amt);
    if (max_in > swap.token_from_max) {
        // Surplus cannot buy the whole shortfall: buy what it can
        I128 surplus_value = reader::convert_to_usd_value(store, swap.token_from, swap.token_from_max);
        swap.token_to_amt = accounting::slippage_floor(
            reader::convert_usd_to_token_amt(store, swap.token_to, surplus_value),
            store.config.swap_slippage);
    } else {
        swap.token_from_max = max_in;
    }
    swap.needed = swap.token_to_amt > 0;
    return swap;
}

// =============================================================================
// Lending
// =============================================================================

void borrow(Store& store, const BorrowParams& params) {
    for (const Currency& token : {store.token_a, store.token_b}) {
        I128 amount = token == store.token_a ? params.token_a_amt : params.token_b_amt;
        if (amount == 0) continue;
        lending_for(store, token).borrow(store.vault, amount);
        emit(store, VaultEvent{.kind = EventKind::Borrowed, .token = token, .amount = amount});
    }
}

void repay(Store& store, const RepayParams& params) {
    for (const Currency& token : {store.token_a, store.token_b}) {
        I128 amount = token == store.token_a ? params.token_a_amt : params.token_b_amt;
        if (amount == 0) continue;
        lending_for(store, token).repay(store.vault, amount);
        emit(store, VaultEvent{.kind = EventKind::Repaid, .token = token, .amount = amount});
    }
}

TokenAmounts repay_from(Store& store, const RepayParams& target, TokenAmounts available) {
    TokenAmounts debt = reader::debt_amt(store);
    RepayParams need{
        x18::min(target.token_a_amt, debt.token_a_amt),
        x18::min(target.token_b_amt, debt.token_b_amt)
    };

    SwapForRepay swap = calc_swap_for_repay(store, need, available);
    if (swap.needed) {
        I128 used = swap_tokens_for_exact_tokens(store, swap.token_from, swap.token_to,
                                                 swap.token_to_amt, swap.token_from_max);
        leg(available, store, swap.token_from) -= used;
        leg(available, store, swap.token_to) += swap.token_to_amt;
    }

    RepayParams paid{
        x18::min(need.token_a_amt, available.token_a_amt),
        x18::min(need.token_b_amt, available.token_b_amt)
    };
    repay(store, paid);

    available.token_a_amt -= paid.token_a_amt;
    available.token_b_amt -= paid.token_b_amt;
    return available;
}

TokenAmounts repay_in_full(Store& store, const RepayParams& target, TokenAmounts available) {
    TokenAmounts debt = reader::debt_amt(store);
    RepayParams need{
        x18::min(target.token_a_amt, debt.token_a_amt),
        x18::min(target.token_b_amt, debt.token_b_amt)
    };

    SwapForRepay swap = calc_swap_for_repay(store, need, available);
    if (swap.needed) {
        I128 used = swap_tokens_for_exact_tokens(store, swap.token_from, swap.token_to,
                                                 swap.token_to_amt, swap.token_from_max);
        leg(available, store, swap.token_from) -= used;
        leg(available, store, swap.token_to) += swap.token_to_amt;
    }

    if (available.token_a_amt < need.token_a_amt || available.token_b_amt < need.token_b_amt) {
        throw VaultError(errors::INSUFFICIENT_REPAY_AMOUNT,
            "need a=" + x18::to_int_string(need.token_a_amt) + " b=" + x18::to_int_string(need.token_b_amt) +
            ", have a=" + x18::to_int_string(available.token_a_amt) +
            " b=" + x18::to_int_string(available.token_b_amt));
    }
    repay(store, need);

    available.token_a_amt -= need.token_a_amt;
    available.token_b_amt -= need.token_b_amt;
    return available;
}

// =============================================================================
// Swaps
// =============================================================================

I128 swap_exact_tokens_for_tokens(Store& store, const Currency& token_in, const Currency& token_out,
                                  I128 amount_in, I128 slippage, uint64_t deadline) {
    if (amount_in == 0) return 0;

    I128 value_in = reader::convert_to_usd_value(store, token_in, amount_in);
    I128 min_out = accounting::slippage_floor(
        reader::convert_usd_to_token_amt(store, token_out, value_in), slippage);

    return store.swap_router->swap_exact_in(SwapParams{
        .token_in = token_in,
        .token_out = token_out,
        .amount_in = amount_in,
        .amount_out = min_out,
        .deadline = deadline != 0 ? deadline : store.env->now(),
        .sender = store.vault
    });
}

I128 swap_tokens_for_exact_tokens(Store& store, const Currency& token_in, const Currency& token_out,
                                  I128 amount_out, I128 amount_in_max) {
    if (amount_in_max == 0) return 0;

    return store.swap_router->swap_exact_out(SwapParams{
        .token_in = token_in,
        .token_out = token_out,
        .amount_in = amount_in_max,
        .amount_out = amount_out,
        .deadline = store.env->now(),
        .sender = store.vault
    });
}

// =============================================================================
// Venue
// =============================================================================

uint64_t add_liquidity(Store& store, const TokenAmounts& amounts, I128 min_lp_out) {
    return store.venue->request_add_liquidity(AddLiquidityParams{
        .sender = store.vault,
        .token_a_amt = amounts.token_a_amt,
        .token_b_amt = amounts.token_b_amt,
        .min_lp_out = min_lp_out,
        .callback = store.callback
    });
}

uint64_t remove_liquidity(Store& store, I128 lp_amt, const TokenAmounts& min_tokens_out) {
    return store.venue->request_remove_liquidity(RemoveLiquidityParams{
        .sender = store.vault,
        .lp_amt = lp_amt,
        .min_token_a_out = min_tokens_out.token_a_amt,
        .min_token_b_out = min_tokens_out.token_b_amt,
        .callback = store.callback
    });
}

// =============================================================================
// Custody
// =============================================================================

void transfer_out(Store& store, const Address& to, const Currency& token, I128 amount,
                  bool unwrap_native) {
    if (amount <= 0) return;

    if (unwrap_native && store.wnt && token == *store.wnt) {
        store.ledger->unwrap(store.vault, amount);
        if (store.ledger->try_send_native(store.vault, to, amount)) return;

        log::logger()->warn("native transfer to {} refused, paying wrapped token",
                            addresses::to_hex(to));
        store.ledger->wrap(store.vault, amount);
    }
    store.ledger->transfer(token, store.vault, to, amount);
}

void mint_fee(Store& store) {
    I128 fee = reader::pending_fee(store);
    store.last_fee_collected = store.env->now();
    if (fee == 0) return;

    store.shares.mint(store.treasury, fee);
    emit(store, VaultEvent{.kind = EventKind::FeeMinted, .user = store.treasury, .shares = fee});
}

} // namespace manager
} // namespace lp
} // namespace lev
