// =============================================================================
// lp/emergency.cpp - Pause, unwind, re-borrow, resume and close
// =============================================================================

#include "lev/lp/emergency.hpp"

#include "lev/environment.hpp"
#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lp/checks.hpp"
#include "lev/lp/manager.hpp"
#include "lev/lp/reader.hpp"

namespace lev {
namespace lp {
namespace emergency {

namespace {

TokenAmounts custody(const Store& store) {
    return TokenAmounts{store.ledger->balance_of(store.token_a, store.vault),
                        store.ledger->balance_of(store.token_b, store.vault)};
}

// Repay all debt from custody, partially when custody falls short
void repay_all(Store& store, uint64_t key, I128 token_a_received, I128 token_b_received) {
    TokenAmounts debt_before = reader::debt_amt(store);
    manager::repay_from(store, debt_before, custody(store));
    TokenAmounts debt_after = reader::debt_amt(store);

    store.emergency_repaid = TokenAmounts{debt_before.token_a_amt - debt_after.token_a_amt,
                                          debt_before.token_b_amt - debt_after.token_b_amt};
    store.emergency_key = 0;
    store.status = Status::Repaid;
    emit(store, VaultEvent{.kind = EventKind::EmergencyRepaid, .key = key});

    log::logger()->warn("emergency repay key={} settled, received a={} b={}, debt left a={} b={}", key,
                        x18::to_int_string(token_a_received), x18::to_int_string(token_b_received),
                        x18::to_int_string(debt_after.token_a_amt),
                        x18::to_int_string(debt_after.token_b_amt));
}

void pause_now(Store& store) {
    store.should_emergency_pause = false;
    store.status = Status::Paused;
    emit(store, VaultEvent{.kind = EventKind::EmergencyPaused});
    log::logger()->warn("vault paused");
}

}  // namespace

void emergency_pause(Store& store) {
    require(checks::before_emergency_pause_checks(store));

    if (store.status == Status::Open || store.status == Status::Rebalance_Open) {
        pause_now(store);
        return;
    }

    store.should_emergency_pause = true;
    emit(store, VaultEvent{.kind = EventKind::EmergencyPauseQueued});
    log::logger()->warn("pause queued while {}", to_string(store.status));
}

void apply_deferred_pause(Store& store) {
    if (!store.should_emergency_pause) return;
    if (store.status != Status::Open && store.status != Status::Rebalance_Open) return;
    pause_now(store);
}

uint64_t emergency_repay(Store& store) {
    require(checks::before_emergency_repay_checks(store));

    // Anything sent to the vault directly is unwound too
    store.lp_amt = store.ledger->balance_of(store.lp_token, store.vault);
    store.status = Status::Repay;

    if (store.lp_amt == 0) {
        repay_all(store, 0, 0, 0);
        return 0;
    }

    TokenAmounts min_out = manager::calc_min_tokens_slippage_amt(store, store.lp_amt,
                                                                 store.config.swap_slippage);
    store.emergency_key = manager::remove_liquidity(store, store.lp_amt, min_out);
    store.lp_amt = 0;

    log::logger()->warn("emergency repay requested key={}", store.emergency_key);
    return store.emergency_key;
}

CallbackResult process_emergency_repay(Store& store, uint64_t key, I128 token_a_received,
                                       I128 token_b_received) {
    int32_t code = errors::OK;
    {
        Transaction<Store> txn(*store.env, store);
        try {
            repay_all(store, key, token_a_received, token_b_received);
            txn.commit();
        } catch (const VaultError& e) {
            code = e.code();
        }
    }
    if (code == errors::OK) return CallbackResult::Committed;

    // Unwound tokens stay in custody; emergency_repay settles them again
    store.emergency_key = 0;
    emit(store, VaultEvent{.kind = EventKind::EmergencyRepayFailed, .key = key, .code = code});
    log::logger()->error("emergency repay key={} not settled: {}, tokens held for retry", key,
                         errors::to_string(code));
    return CallbackResult::Failed;
}

CallbackResult process_emergency_repay_cancellation(Store& store, uint64_t key) {
    store.lp_amt = store.ledger->balance_of(store.lp_token, store.vault);
    store.emergency_key = 0;
    store.status = Status::Paused;
    emit(store, VaultEvent{.kind = EventKind::EmergencyPaused, .key = key});
    log::logger()->warn("emergency repay key={} cancelled, back to Paused", key);
    return CallbackResult::Cancelled;
}

void emergency_borrow(Store& store) {
    require(checks::before_emergency_borrow_checks(store));

    manager::borrow(store, store.emergency_repaid);
    store.emergency_repaid = TokenAmounts{};
    store.status = Status::Paused;
    emit(store, VaultEvent{.kind = EventKind::EmergencyBorrowed});
    log::logger()->warn("emergency borrow done, back to Paused");
}

uint64_t emergency_resume(Store& store) {
    require(checks::before_emergency_resume_checks(store));
    store.should_emergency_pause = false;

    TokenAmounts held = custody(store);
    if (held.token_a_amt == 0 && held.token_b_amt == 0) {
        store.status = Status::Open;
        emit(store, VaultEvent{.kind = EventKind::EmergencyResumed});
        log::logger()->info("vault resumed, nothing to redeploy");
        return 0;
    }

    I128 value = reader::convert_to_usd_value(store, store.token_a, held.token_a_amt) +
                 reader::convert_to_usd_value(store, store.token_b, held.token_b_amt);
    store.emergency_key = manager::add_liquidity(
        store, held, manager::calc_min_market_slippage_amt(store, value, store.config.swap_slippage));
    store.status = Status::Resume;

    log::logger()->info("emergency resume requested key={}", store.emergency_key);
    return store.emergency_key;
}

CallbackResult process_emergency_resume(Store& store, uint64_t key, I128 lp_received) {
    store.lp_amt += lp_received;
    store.emergency_key = 0;
    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::EmergencyResumed, .key = key, .amount = lp_received});
    log::logger()->info("vault resumed key={}, lp={}", key, x18::to_string(lp_received));
    return CallbackResult::Committed;
}

CallbackResult process_emergency_resume_cancellation(Store& store, uint64_t key) {
    store.emergency_key = 0;
    store.status = Status::Paused;
    emit(store, VaultEvent{.kind = EventKind::EmergencyPaused, .key = key});
    log::logger()->warn("emergency resume key={} cancelled, back to Paused", key);
    return CallbackResult::Cancelled;
}

void emergency_close(Store& store) {
    require(checks::before_emergency_close_checks(store));

    manager::mint_fee(store);
    store.status = Status::Closed;
    emit(store, VaultEvent{.kind = EventKind::EmergencyClosed});
    log::logger()->warn("vault closed");
}

void emergency_withdraw(Store& store, const Address& user, I128 shares_amt) {
    require(checks::before_emergency_withdraw_checks(store, user, shares_amt));

    I128 supply = store.shares.total_supply();
    TokenAmounts held = custody(store);
    I128 lp_held = store.ledger->balance_of(store.lp_token, store.vault);

    I128 a_out = x18::mul_div(held.token_a_amt, shares_amt, supply);
    I128 b_out = x18::mul_div(held.token_b_amt, shares_amt, supply);
    I128 lp_out = x18::mul_div(lp_held, shares_amt, supply);

    store.shares.burn(user, shares_amt);
    manager::transfer_out(store, user, store.token_a, a_out, true);
    manager::transfer_out(store, user, store.token_b, b_out, true);
    if (lp_out > 0) {
        store.ledger->transfer(store.lp_token, store.vault, user, lp_out);
        store.lp_amt = x18::sub_floor(store.lp_amt, lp_out);
    }

    emit(store, VaultEvent{.kind = EventKind::EmergencyWithdraw, .user = user, .amount = a_out + b_out,
                           .shares = shares_amt});
    log::logger()->info("emergency withdraw user={} shares={} a={} b={} lp={}", addresses::to_hex(user),
                        x18::to_string(shares_amt), x18::to_int_string(a_out), x18::to_int_string(b_out),
                        x18::to_int_string(lp_out));
}

void emergency_status_change(Store& store, Status target) {
    require(checks::before_emergency_status_change_checks(store, target));

    store.status = target;
    emit(store, VaultEvent{.kind = EventKind::EmergencyStatusChanged});
    log::logger()->warn("status forced Paused -> {}", to_string(target));
}

} // namespace emergency
} // namespace lp
} // namespace lev
