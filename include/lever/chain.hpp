#ifndef LEVER_CHAIN_HPP
#define LEVER_CHAIN_HPP

#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace lever {

// =============================================================================
// Journaled State
// =============================================================================

// Participant in an atomic call scope. Checkpoints nest: every checkpoint()
// is matched by exactly one rollback() or commit().
class IJournaled {
public:
    virtual ~IJournaled() = default;

    virtual void checkpoint() = 0;
    virtual void rollback() = 0;
    virtual void commit() = 0;
};

// Snapshot stack for a component whose mutable state lives in one struct
template <typename State>
class Journal {
public:
    void push(const State& state) { stack_.push_back(state); }

    void restore(State& state) {
        state = std::move(stack_.back());
        stack_.pop_back();
    }

    void drop() { stack_.pop_back(); }

    size_t depth() const { return stack_.size(); }

private:
    std::vector<State> stack_;
};

// =============================================================================
// Audit Events
// =============================================================================

struct Event {
    uint64_t block;
    uint64_t timestamp;
    Address emitter;
    std::string name;
    nlohmann::json data;
};

// =============================================================================
// Chain - Execution Context (clock, atomic scopes, event log)
// =============================================================================

class Chain {
public:
    explicit Chain(uint64_t seconds_per_block = 12,
                   uint64_t start_block = 1,
                   uint64_t start_timestamp = 1704067200);
    ~Chain() = default;

    // Non-copyable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // =========================================================================
    // Clock
    // =========================================================================

    uint64_t block_number() const { return block_number_; }
    uint64_t timestamp() const { return timestamp_; }
    uint64_t seconds_per_block() const { return seconds_per_block_; }

    void advance_blocks(uint64_t blocks);
    void advance_time(uint64_t seconds);
    void set_block(uint64_t block) { block_number_ = block; }
    void set_timestamp(uint64_t timestamp) { timestamp_ = timestamp; }

    // =========================================================================
    // Atomic Scopes
    // =========================================================================

    // Components register on construction and unregister on destruction.
    // Throws std::logic_error when called while a scope is open.
    void attach(IJournaled* participant);
    void detach(IJournaled* participant);

    // Run body; any non-OK return or exception rolls back every participant
    // and the events emitted inside the scope.
    int32_t atomic(const std::function<int32_t()>& body);

    size_t scope_depth() const { return event_marks_.size(); }

    // =========================================================================
    // Event Log
    // =========================================================================

    void emit(const Address& emitter, const std::string& name, nlohmann::json data);

    const std::vector<Event>& events() const { return events_; }
    std::vector<Event> events_named(const std::string& name) const;
    size_t count_events(const std::string& name) const;
    nlohmann::json to_json() const;

    using EventListener = std::function<void(const Event&)>;

    // Listeners observe committed events only (at outermost scope exit)
    void set_listener(EventListener listener) { listener_ = std::move(listener); }

private:
    uint64_t seconds_per_block_;
    uint64_t block_number_;
    uint64_t timestamp_;

    std::vector<IJournaled*> participants_;
    std::vector<size_t> event_marks_;

    std::vector<Event> events_;
    size_t published_{0};
    EventListener listener_;

    void publish();
};

// =============================================================================
// Reentrancy Guard
// =============================================================================

// Acquired at every state-mutating entry point; released on every exit path
class NonReentrant {
public:
    explicit NonReentrant(std::atomic<bool>& flag)
        : flag_(flag), acquired_(!flag.exchange(true, std::memory_order_acq_rel)) {}

    ~NonReentrant() {
        if (acquired_) flag_.store(false, std::memory_order_release);
    }

    NonReentrant(const NonReentrant&) = delete;
    NonReentrant& operator=(const NonReentrant&) = delete;

    explicit operator bool() const { return acquired_; }

private:
    std::atomic<bool>& flag_;
    bool acquired_;
};

} // namespace lever

#endif // LEVER_CHAIN_HPP
