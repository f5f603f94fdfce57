// kline_data.hpp
// Historical candle data handler
// Streams a loaded KlineItem as DataEvents, oldest first

#pragma once

#include <optional>
#include <vector>
#include "../builders/event_builders.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/kline.hpp"
#include "../core/logger.hpp"
#include "../interfaces/data_handler.hpp"

namespace cryptobt {

class KlineData : public IDataHandler {
private:
    KlineItem item_;
    IntervalRangeHolder range_;

    std::vector<DataEvent> stream_;
    std::vector<DataEvent> history_;
    size_t offset_ = 0;
    bool loaded_ = false;

public:
    KlineData() = default;
    KlineData(KlineItem item, IntervalRangeHolder range)
        : item_(std::move(item)), range_(std::move(range)) {}

    // Converts candles to events. Candles are sorted; duplicates and invalid bars throw.
    void load() {
        if (item_.exchange.empty() || item_.asset == AssetType::Empty || item_.pair.isEmpty()) {
            throw DataException("cannot load kline data without exchange, asset and pair",
                                ErrorCode::NilArguments);
        }
        item_.sortCandles();

        stream_.clear();
        stream_.reserve(item_.candles.size());
        PairKey k = key();
        for (size_t i = 0; i < item_.candles.size(); ++i) {
            const Candle& candle = item_.candles[i];
            if (i > 0 && candle.time == item_.candles[i - 1].time) {
                throw DataException("duplicate candle for " + k.toString() + " at " +
                                    std::to_string(toUnixSeconds(candle.time)));
            }
            if (!candle.validate()) {
                throw DataException("invalid candle for " + k.toString() + " at " +
                                    std::to_string(toUnixSeconds(candle.time)));
            }
            stream_.push_back(DataEventBuilder()
                                  .withKey(k)
                                  .withCandle(candle)
                                  .withInterval(item_.interval)
                                  .build());
        }

        // Range derived from the candles when the loader did not supply one
        if (range_.ranges.empty() && !item_.candles.empty() && item_.interval.count() > 0) {
            range_ = createIntervalRange(item_.candles.front().time,
                                         item_.candles.back().time + item_.interval,
                                         item_.interval);
        }
        range_.setHasDataFromCandles(item_.candles);

        offset_ = 0;
        history_.clear();
        loaded_ = true;
        CRYPTOBT_LOG_DEBUG(logtag::Data, "loaded " << stream_.size() << " candles for "
                           << k.toString());
    }

    std::optional<DataEvent> next() override {
        if (!loaded_ || offset_ >= stream_.size()) {
            return std::nullopt;
        }
        const DataEvent& event = stream_[offset_++];
        history_.push_back(event);
        return event;
    }

    bool isExhausted() const override {
        return !loaded_ || offset_ >= stream_.size();
    }

    std::optional<Timestamp> peekNextTime() const override {
        if (isExhausted()) return std::nullopt;
        return stream_[offset_].timestamp;
    }

    bool hasDataAtTime(Timestamp t) const override {
        return range_.hasDataAtTime(t);
    }

    std::optional<DataEvent> latest() const override {
        if (history_.empty()) return std::nullopt;
        return history_.back();
    }

    const std::vector<DataEvent>& history() const override { return history_; }

    PairKey key() const override {
        return PairKey(item_.exchange, item_.asset, item_.pair);
    }

    const IntervalRangeHolder& range() const override { return range_; }

    void reset() override {
        offset_ = 0;
        history_.clear();
    }

    const KlineItem& item() const { return item_; }
    size_t size() const { return stream_.size(); }
};

} // namespace cryptobt
