// data_handler.hpp
// Data Handler Interface for the Crypto Backtesting Engine
// One handler per (exchange, asset, pair) yields time-ordered DataEvents

#pragma once

#include <optional>
#include <vector>
#include "../core/currency.hpp"
#include "../core/event_types.hpp"
#include "../core/kline.hpp"

namespace cryptobt {

// ============================================================================
// Data Handler Interface
// ============================================================================

class IDataHandler {
public:
    virtual ~IDataHandler() = default;

    // Next data point in time order; nullopt once the source is exhausted
    virtual std::optional<DataEvent> next() = 0;
    virtual bool isExhausted() const = 0;
    // Time of the event next() would return; nullopt when unknown until next() is called
    virtual std::optional<Timestamp> peekNextTime() const = 0;
    virtual bool hasDataAtTime(Timestamp t) const = 0;

    // Most recent event handed out by next()
    virtual std::optional<DataEvent> latest() const = 0;
    // Every event handed out so far, oldest first
    virtual const std::vector<DataEvent>& history() const = 0;

    virtual PairKey key() const = 0;
    virtual const IntervalRangeHolder& range() const = 0;

    // Blocking sources (live polling) block inside next()
    virtual bool isLive() const { return false; }

    virtual void reset() {}
};

}  // namespace cryptobt
