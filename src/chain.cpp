// =============================================================================
// chain.cpp - Execution Context
// =============================================================================

#include "lever/chain.hpp"
#include <algorithm>
#include <stdexcept>

namespace lever {

Chain::Chain(uint64_t seconds_per_block, uint64_t start_block, uint64_t start_timestamp)
    : seconds_per_block_(seconds_per_block),
      block_number_(start_block),
      timestamp_(start_timestamp) {}

// =============================================================================
// Clock
// =============================================================================

void Chain::advance_blocks(uint64_t blocks) {
    block_number_ += blocks;
    timestamp_ += blocks * seconds_per_block_;
}

void Chain::advance_time(uint64_t seconds) {
    timestamp_ += seconds;
}

// =============================================================================
// Atomic Scopes
// =============================================================================

void Chain::attach(IJournaled* participant) {
    if (!event_marks_.empty()) {
        throw std::logic_error("Chain: cannot attach inside an atomic scope");
    }
    participants_.push_back(participant);
}

void Chain::detach(IJournaled* participant) {
    if (!event_marks_.empty()) {
        throw std::logic_error("Chain: cannot detach inside an atomic scope");
    }
    participants_.erase(std::remove(participants_.begin(), participants_.end(), participant),
                        participants_.end());
}

int32_t Chain::atomic(const std::function<int32_t()>& body) {
    for (auto* p : participants_) p->checkpoint();
    event_marks_.push_back(events_.size());

    auto rollback = [this]() {
        for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
            (*it)->rollback();
        }
        events_.resize(event_marks_.back());
        event_marks_.pop_back();
    };

    int32_t rc;
    try {
        rc = body();
    } catch (...) {
        rollback();
        throw;
    }

    if (rc != errors::OK) {
        rollback();
        return rc;
    }

    for (auto* p : participants_) p->commit();
    event_marks_.pop_back();

    if (event_marks_.empty()) publish();
    return errors::OK;
}

// =============================================================================
// Event Log
// =============================================================================

void Chain::emit(const Address& emitter, const std::string& name, nlohmann::json data) {
    events_.push_back(Event{block_number_, timestamp_, emitter, name, std::move(data)});
    if (event_marks_.empty()) publish();
}

std::vector<Event> Chain::events_named(const std::string& name) const {
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.name == name) out.push_back(e);
    }
    return out;
}

size_t Chain::count_events(const std::string& name) const {
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
        [&](const Event& e) { return e.name == name; }));
}

nlohmann::json Chain::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : events_) {
        out.push_back({
            {"block", e.block},
            {"timestamp", e.timestamp},
            {"emitter", addresses::to_hex(e.emitter)},
            {"event", e.name},
            {"data", e.data}
        });
    }
    return out;
}

void Chain::publish() {
    if (listener_) {
        while (published_ < events_.size()) {
            listener_(events_[published_++]);
        }
    } else {
        published_ = events_.size();
    }
}

} // namespace lever
