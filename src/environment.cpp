// =============================================================================
// environment.cpp - Block clock, transactions, reentrancy lock
// =============================================================================

#include "lev/environment.hpp"

#include <algorithm>

namespace lev {

// =============================================================================
// Environment
// =============================================================================

Environment::Environment(uint64_t start_time) : now_(start_time) {}

void Environment::set_time(uint64_t timestamp) {
    now_.store(timestamp, std::memory_order_release);
}

void Environment::advance(uint64_t seconds) {
    now_.fetch_add(seconds, std::memory_order_acq_rel);
}

void Environment::attach(ITransactional* participant) {
    if (!participant) return;
    if (std::find(participants_.begin(), participants_.end(), participant) != participants_.end()) {
        return;
    }
    participants_.push_back(participant);
}

void Environment::detach(ITransactional* participant) {
    participants_.erase(
        std::remove(participants_.begin(), participants_.end(), participant),
        participants_.end());
}

void Environment::begin() {
    for (auto* p : participants_) p->checkpoint();
    ++depth_;
}

void Environment::commit() {
    if (depth_ == 0) return;
    for (auto* p : participants_) p->commit();
    --depth_;
}

void Environment::rollback() {
    if (depth_ == 0) return;
    for (auto* p : participants_) p->rollback();
    --depth_;
}

// =============================================================================
// ReentrancyLock
// =============================================================================

ReentrancyLock::Guard::Guard(ReentrancyLock& lock) : lock_(lock) {
    if (lock_.owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        throw VaultError(errors::REENTRANCY);
    }
    lock_.mutex_.lock();
    lock_.owner_.store(std::this_thread::get_id(), std::memory_order_release);
}

ReentrancyLock::Guard::~Guard() {
    lock_.owner_.store(std::thread::id{}, std::memory_order_release);
    lock_.mutex_.unlock();
}

bool ReentrancyLock::entered() const {
    return owner_.load(std::memory_order_acquire) != std::thread::id{};
}

} // namespace lev
