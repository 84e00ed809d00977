#ifndef LEV_ENVIRONMENT_HPP
#define LEV_ENVIRONMENT_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "types.hpp"

namespace lev {

// =============================================================================
// Transactional State
// =============================================================================

// Component whose state is restored when an enclosing call aborts.
// checkpoint() pushes a snapshot; commit() drops the newest snapshot and
// rollback() restores it. Calls are strictly nested.
class ITransactional {
public:
    virtual ~ITransactional() = default;

    virtual void checkpoint() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

// Snapshot stack for value-type state
template <typename State>
class SnapshotStack {
public:
    void push(const State& state) { snapshots_.push_back(state); }

    void drop() {
        if (!snapshots_.empty()) snapshots_.pop_back();
    }

    void restore(State& state) {
        if (snapshots_.empty()) return;
        state = std::move(snapshots_.back());
        snapshots_.pop_back();
    }

    size_t depth() const { return snapshots_.size(); }

private:
    std::vector<State> snapshots_;
};

// =============================================================================
// Environment - block clock and transaction coordinator
// =============================================================================

class Environment {
public:
    explicit Environment(uint64_t start_time = 1704067200);

    // Non-copyable
    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    // =========================================================================
    // Clock
    // =========================================================================

    uint64_t now() const { return now_.load(std::memory_order_acquire); }
    void set_time(uint64_t timestamp);
    void advance(uint64_t seconds);

    // =========================================================================
    // Transactions
    // =========================================================================

    void attach(ITransactional* participant);
    void detach(ITransactional* participant);

    void begin();
    void commit();
    void rollback();

    size_t depth() const { return depth_; }

private:
    std::atomic<uint64_t> now_;
    std::vector<ITransactional*> participants_;
    size_t depth_{0};
};

// =============================================================================
// Transaction - RAII guard over the environment and a local state copy
// =============================================================================

// Checkpoints every participant plus `state` on construction. Unless
// commit() is called, the destructor restores all of them.
template <typename State>
class Transaction {
public:
    Transaction(Environment& env, State& state)
        : env_(env), state_(state), saved_(state) {
        env_.begin();
    }

    ~Transaction() {
        if (!done_) {
            env_.rollback();
            state_ = std::move(saved_);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        if (done_) return;
        env_.commit();
        done_ = true;
    }

    void rollback() {
        if (done_) return;
        env_.rollback();
        state_ = std::move(saved_);
        done_ = true;
    }

private:
    Environment& env_;
    State& state_;
    State saved_;
    bool done_ = false;
};

// =============================================================================
// ReentrancyLock - single-writer lock
// =============================================================================

// Serialises callers from different threads and rejects re-entry from the
// thread that already holds the lock with VaultError(REENTRANCY).
class ReentrancyLock {
public:
    class Guard {
    public:
        explicit Guard(ReentrancyLock& lock);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        ReentrancyLock& lock_;
    };

    bool entered() const;

private:
    std::mutex mutex_;
    std::atomic<std::thread::id> owner_{};
};

} // namespace lev

#endif // LEV_ENVIRONMENT_HPP
