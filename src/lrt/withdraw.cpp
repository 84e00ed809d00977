// =============================================================================
// lrt/withdraw.cpp - Synchronous proportional unwind
// =============================================================================

#include "lev/lrt/withdraw.hpp"

#include "lev/log.hpp"
#include "lev/lrt/checks.hpp"
#include "lev/lrt/manager.hpp"
#include "lev/lrt/reader.hpp"

namespace lev {
namespace lrt {
namespace withdraw {

I128 withdraw(Store& store, const Address& user, const WithdrawParams& params) {
    require(checks::before_withdraw_checks(store, params, user));

    manager::mint_fee(store);

    WithdrawCache wc;
    wc.user = user;
    wc.params = params;
    wc.health = reader::health(store);
    wc.share_ratio = x18::mul_div(params.shares_amt, SAFE_MULTIPLIER, store.shares.total_supply());
    wc.lrt_amt = x18::mul_div(store.lrt_amt, wc.share_ratio, SAFE_MULTIPLIER);
    wc.withdraw_value = reader::convert_to_usd_value(store, store.lrt, wc.lrt_amt);

    require(checks::before_withdraw_value_checks(store, wc.withdraw_value));

    store.shares.burn(user, params.shares_amt);
    store.lrt_amt -= wc.lrt_amt;

    // Buy exactly the debt share first, the rest of the LRT goes to the user
    wc.repay_amt = manager::calc_repay(store, wc.share_ratio);
    I128 lrt_left = wc.lrt_amt;
    if (wc.repay_amt > 0) {
        I128 max_in = x18::min(
            manager::calc_amount_in_maximum(store, store.lrt, store.base, wc.repay_amt), wc.lrt_amt);
        lrt_left -= manager::swap_tokens_for_exact_tokens(store, store.lrt, store.base, wc.repay_amt, max_in);
        manager::repay(store, wc.repay_amt);
    }
    wc.assets_to_user = manager::swap_exact_tokens_for_tokens(store, store.lrt, store.base, lrt_left,
                                                              params.slippage);

    reader::health_after(store, wc.health);
    store.withdraw_cache = wc;
    require(checks::after_withdraw_checks(store));

    manager::transfer_out(store, user, store.base, wc.assets_to_user, true);
    emit(store, VaultEvent{.kind = EventKind::WithdrawCompleted, .user = user, .token = store.base,
                           .amount = wc.assets_to_user, .shares = params.shares_amt});

    log::logger()->info("withdraw user={} shares={} repaid={} paid={}", addresses::to_hex(user),
                        x18::to_string(params.shares_amt), x18::to_int_string(wc.repay_amt),
                        x18::to_int_string(wc.assets_to_user));
    return wc.assets_to_user;
}

} // namespace withdraw
} // namespace lrt
} // namespace lev
