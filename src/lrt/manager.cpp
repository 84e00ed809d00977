// =============================================================================
// lrt/manager.cpp - LRT vault borrow/repay/swap primitives
// =============================================================================

#include "lev/lrt/manager.hpp"

#include "lev/environment.hpp"
#include "lev/ledger.hpp"
#include "lev/lending.hpp"
#include "lev/log.hpp"
#include "lev/lrt/reader.hpp"
#include "lev/swap.hpp"

namespace lev {
namespace lrt {
namespace manager {

I128 calc_borrow(const Store& store, I128 deposit_value) {
    I128 borrow_value = x18::mul_div(deposit_value, store.config.leverage - SAFE_MULTIPLIER,
                                     SAFE_MULTIPLIER);
    return reader::convert_usd_to_token_amt(store, store.base, borrow_value);
}

I128 calc_repay(const Store& store, I128 share_ratio) {
    return x18::mul_div(reader::debt_amt(store), share_ratio, SAFE_MULTIPLIER);
}

I128 calc_amount_in_maximum(const Store& store, const Currency& token_in,
                            const Currency& token_out, I128 amount_out) {
    return accounting::calc_amount_in_maximum(*store.oracle, *store.ledger, token_in, token_out,
                                              amount_out, store.config.swap_slippage);
}

void borrow(Store& store, I128 amount) {
    if (amount == 0) return;
    store.lending->borrow(store.vault, amount);
    emit(store, VaultEvent{.kind = EventKind::Borrowed, .token = store.base, .amount = amount});
}

void repay(Store& store, I128 amount) {
    if (amount == 0) return;
    store.lending->repay(store.vault, amount);
    emit(store, VaultEvent{.kind = EventKind::Repaid, .token = store.base, .amount = amount});
}

I128 repay_up_to(Store& store, I128 amount) {
    I128 paid = x18::min(amount, reader::debt_amt(store));
    repay(store, paid);
    return paid;
}

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

void transfer_out(Store& store, const Address& to, const Currency& token, I128 amount,
                  bool unwrap_native) {
    if (amount <= 0) return;

    if (unwrap_native && store.base_is_wnt && token == store.base) {
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
} // namespace lrt
} // namespace lev
