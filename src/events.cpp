// =============================================================================
// events.cpp - Event names
// =============================================================================

#include "lev/events.hpp"

namespace lev {

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::DepositCreated: return "DepositCreated";
        case EventKind::DepositCompleted: return "DepositCompleted";
        case EventKind::DepositCancelled: return "DepositCancelled";
        case EventKind::DepositFailed: return "DepositFailed";
        case EventKind::DepositFailureLiquidityWithdrawn: return "DepositFailureLiquidityWithdrawn";
        case EventKind::WithdrawCreated: return "WithdrawCreated";
        case EventKind::WithdrawCompleted: return "WithdrawCompleted";
        case EventKind::WithdrawCancelled: return "WithdrawCancelled";
        case EventKind::WithdrawFailed: return "WithdrawFailed";
        case EventKind::WithdrawFailureLiquidityAdded: return "WithdrawFailureLiquidityAdded";
        case EventKind::RebalanceAdded: return "RebalanceAdded";
        case EventKind::RebalanceRemoved: return "RebalanceRemoved";
        case EventKind::RebalanceSuccess: return "RebalanceSuccess";
        case EventKind::RebalanceOpen: return "RebalanceOpen";
        case EventKind::RebalanceCancelled: return "RebalanceCancelled";
        case EventKind::RebalanceClosed: return "RebalanceClosed";
        case EventKind::CompoundCompleted: return "CompoundCompleted";
        case EventKind::CompoundCancelled: return "CompoundCancelled";
        case EventKind::PositionUnitSynced: return "PositionUnitSynced";
        case EventKind::EmergencyPauseQueued: return "EmergencyPauseQueued";
        case EventKind::EmergencyPaused: return "EmergencyPaused";
        case EventKind::EmergencyRepaid: return "EmergencyRepaid";
        case EventKind::EmergencyRepayFailed: return "EmergencyRepayFailed";
        case EventKind::EmergencyBorrowed: return "EmergencyBorrowed";
        case EventKind::EmergencyResumed: return "EmergencyResumed";
        case EventKind::EmergencyClosed: return "EmergencyClosed";
        case EventKind::EmergencyWithdraw: return "EmergencyWithdraw";
        case EventKind::EmergencyStatusChanged: return "EmergencyStatusChanged";
        case EventKind::FeeMinted: return "FeeMinted";
        case EventKind::Borrowed: return "Borrowed";
        case EventKind::Repaid: return "Repaid";
        case EventKind::ConfigUpdated: return "ConfigUpdated";
        case EventKind::CallbackRejected: return "CallbackRejected";
    }
    return "Unknown";
}

} // namespace lev
