// event_queue.hpp
// FIFO event queue driving the backtest loop
// Single-threaded: the run loop is the only producer and consumer

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include "../core/event_types.hpp"

namespace cryptobt {

// ============================================================================
// Event Queue - strict arrival order, no prioritisation
// ============================================================================

class EventQueue {
private:
    std::deque<EventVariant> events_;

    uint64_t total_published_ = 0;
    uint64_t total_consumed_ = 0;
    size_t high_water_mark_ = 0;

public:
    EventQueue() = default;

    void push(const EventVariant& event) {
        events_.push_back(event);
        total_published_++;
        if (events_.size() > high_water_mark_) {
            high_water_mark_ = events_.size();
        }
    }

    void push(EventVariant&& event) {
        events_.push_back(std::move(event));
        total_published_++;
        if (events_.size() > high_water_mark_) {
            high_water_mark_ = events_.size();
        }
    }

    // Empty optional when there is nothing to consume
    std::optional<EventVariant> pop() {
        if (events_.empty()) {
            return std::nullopt;
        }
        EventVariant event = std::move(events_.front());
        events_.pop_front();
        total_consumed_++;
        return event;
    }

    // Head of the queue without consuming it, nullptr when empty
    const EventVariant* peek() const {
        return events_.empty() ? nullptr : &events_.front();
    }

    bool empty() const { return events_.empty(); }
    size_t size() const { return events_.size(); }

    void clear() {
        events_.clear();
    }

    struct QueueStats {
        uint64_t total_published;
        uint64_t total_consumed;
        size_t current_size;
        size_t high_water_mark;
    };

    QueueStats getStats() const {
        return {total_published_, total_consumed_, events_.size(), high_water_mark_};
    }

    void resetStats() {
        total_published_ = 0;
        total_consumed_ = 0;
        high_water_mark_ = events_.size();
    }
};

} // namespace cryptobt
