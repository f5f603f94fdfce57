// event_builders.hpp
// Event Builder Pattern for the Crypto Backtesting Engine
// Fluent construction of DataEvents with validation

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include "../core/currency.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace cryptobt {

// ============================================================================
// Data Event Builder
// ============================================================================

class DataEventBuilder {
private:
    DataEvent event_;
    inline static std::atomic<uint64_t> sequence_counter_{1};

public:
    DataEventBuilder& withKey(const PairKey& key) {
        event_.exchange = key.exchange;
        event_.asset = key.asset;
        event_.pair = key.pair;
        return *this;
    }

    DataEventBuilder& withOHLC(double o, double h, double l, double c) {
        event_.open = o;
        event_.high = h;
        event_.low = l;
        event_.close = c;
        return *this;
    }

    DataEventBuilder& withVolume(double vol) {
        event_.volume = vol;
        return *this;
    }

    DataEventBuilder& withCandle(const Candle& candle) {
        event_.timestamp = candle.time;
        return withOHLC(candle.open, candle.high, candle.low, candle.close)
              .withVolume(candle.volume);
    }

    DataEventBuilder& withInterval(Interval value) {
        event_.interval = value;
        return *this;
    }

    DataEventBuilder& withTimestamp(Timestamp ts) {
        event_.timestamp = ts;
        return *this;
    }

    DataEvent build() {
        event_.sequence_id = sequence_counter_.fetch_add(1, std::memory_order_relaxed);
        if (!event_.validate()) {
            throw DataException("invalid DataEvent for " + event_.key().toString() +
                                " at " + std::to_string(toUnixSeconds(event_.timestamp)));
        }
        return event_;
    }
};

} // namespace cryptobt
