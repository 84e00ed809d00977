#ifndef LEV_EVENTS_HPP
#define LEV_EVENTS_HPP

#include <functional>
#include <string>

#include "types.hpp"

namespace lev {

// =============================================================================
// Vault Events
// =============================================================================

enum class EventKind : uint8_t {
    DepositCreated,
    DepositCompleted,
    DepositCancelled,
    DepositFailed,
    DepositFailureLiquidityWithdrawn,
    WithdrawCreated,
    WithdrawCompleted,
    WithdrawCancelled,
    WithdrawFailed,
    WithdrawFailureLiquidityAdded,
    RebalanceAdded,
    RebalanceRemoved,
    RebalanceSuccess,
    RebalanceOpen,
    RebalanceCancelled,
    RebalanceClosed,
    CompoundCompleted,
    CompoundCancelled,
    PositionUnitSynced,
    EmergencyPauseQueued,
    EmergencyPaused,
    EmergencyRepaid,
    EmergencyRepayFailed,
    EmergencyBorrowed,
    EmergencyResumed,
    EmergencyClosed,
    EmergencyWithdraw,
    EmergencyStatusChanged,
    FeeMinted,
    Borrowed,
    Repaid,
    ConfigUpdated,
    CallbackRejected
};

const char* to_string(EventKind kind);

struct VaultEvent {
    EventKind kind;
    uint64_t key = 0;          // Venue request key, when one is involved
    Address user{};
    Currency token{};
    I128 amount = 0;
    I128 shares = 0;
    int32_t code = errors::OK; // Failure reason for *Failed / *Open events
    I128 equity_after = 0;     // Health the failed settlement would have left
    I128 debt_ratio_after = 0;
    Status status = Status::Open;
};

using EventCallback = std::function<void(const VaultEvent&)>;

} // namespace lev

#endif // LEV_EVENTS_HPP
