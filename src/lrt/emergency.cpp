// =============================================================================
// lrt/emergency.cpp - Pause, unwind, re-borrow, resume and close
// =============================================================================

#include "lev/lrt/emergency.hpp"

#include "lev/ledger.hpp"
#include "lev/log.hpp"
#include "lev/lrt/checks.hpp"
#include "lev/lrt/manager.hpp"
#include "lev/lrt/reader.hpp"

namespace lev {
namespace lrt {
namespace emergency {

void emergency_pause(Store& store) {
    require(checks::before_emergency_pause_checks(store));

    store.status = Status::Paused;
    emit(store, VaultEvent{.kind = EventKind::EmergencyPaused});
    log::logger()->warn("vault paused");
}

void emergency_repay(Store& store) {
    require(checks::before_emergency_repay_checks(store));

    store.lrt_amt = store.ledger->balance_of(store.lrt, store.vault);
    I128 base_out = manager::swap_exact_tokens_for_tokens(store, store.lrt, store.base, store.lrt_amt,
                                                          store.config.swap_slippage);
    store.lrt_amt = 0;

    store.emergency_repaid = manager::repay_up_to(store, store.ledger->balance_of(store.base, store.vault));
    store.status = Status::Repaid;
    emit(store, VaultEvent{.kind = EventKind::EmergencyRepaid, .token = store.base,
                           .amount = store.emergency_repaid});

    log::logger()->warn("emergency repay: sold lrt for {}, repaid {}, debt left {}",
                        x18::to_int_string(base_out), x18::to_int_string(store.emergency_repaid),
                        x18::to_int_string(reader::debt_amt(store)));
}

void emergency_borrow(Store& store) {
    require(checks::before_emergency_borrow_checks(store));

    manager::borrow(store, store.emergency_repaid);
    store.emergency_repaid = 0;
    store.status = Status::Paused;
    emit(store, VaultEvent{.kind = EventKind::EmergencyBorrowed});
    log::logger()->warn("emergency borrow done, back to Paused");
}

void emergency_resume(Store& store) {
    require(checks::before_emergency_resume_checks(store));

    I128 held = store.ledger->balance_of(store.base, store.vault);
    manager::swap_exact_tokens_for_tokens(store, store.base, store.lrt, held, store.config.swap_slippage);
    store.lrt_amt = store.ledger->balance_of(store.lrt, store.vault);

    store.status = Status::Open;
    emit(store, VaultEvent{.kind = EventKind::EmergencyResumed, .token = store.lrt,
                           .amount = store.lrt_amt});
    log::logger()->info("vault resumed, lrt={}", x18::to_int_string(store.lrt_amt));
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
    I128 base_out = x18::mul_div(store.ledger->balance_of(store.base, store.vault), shares_amt, supply);
    I128 lrt_out = x18::mul_div(store.ledger->balance_of(store.lrt, store.vault), shares_amt, supply);

    store.shares.burn(user, shares_amt);
    manager::transfer_out(store, user, store.base, base_out, true);
    if (lrt_out > 0) {
        store.ledger->transfer(store.lrt, store.vault, user, lrt_out);
        store.lrt_amt = x18::sub_floor(store.lrt_amt, lrt_out);
    }

    emit(store, VaultEvent{.kind = EventKind::EmergencyWithdraw, .user = user, .token = store.base,
                           .amount = base_out, .shares = shares_amt});
    log::logger()->info("emergency withdraw user={} shares={} base={} lrt={}", addresses::to_hex(user),
                        x18::to_string(shares_amt), x18::to_int_string(base_out),
                        x18::to_int_string(lrt_out));
}

void emergency_status_change(Store& store, Status target) {
    require(checks::before_emergency_status_change_checks(store, target));

    store.status = target;
    emit(store, VaultEvent{.kind = EventKind::EmergencyStatusChanged});
    log::logger()->warn("status forced Paused -> {}", to_string(target));
}

} // namespace emergency
} // namespace lrt
} // namespace lev
