// live_kline_data.hpp
// Live candle data handler
// Polls the exchange once per interval and blocks on the stop signal in between

#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <vector>
#include "../builders/event_builders.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/kline.hpp"
#include "../core/logger.hpp"
#include "../core/stop_signal.hpp"
#include "../interfaces/data_handler.hpp"
#include "../interfaces/host_engine.hpp"

namespace cryptobt {

class LiveKlineData : public IDataHandler {
private:
    IExchange* exchange_;
    PairKey key_;
    Interval interval_;
    std::chrono::milliseconds poll_interval_;
    std::shared_ptr<StopSignal> stop_;

    IntervalRangeHolder range_;
    std::deque<DataEvent> pending_;
    std::vector<DataEvent> history_;
    Timestamp last_emitted_{0};
    uint64_t failed_polls_ = 0;

    // Fetch completed candles newer than the last one handed out
    void poll() {
        Timestamp now = nowTimestamp();
        Timestamp from = last_emitted_.count() == 0
                             ? truncateToInterval(now, interval_) - interval_ * 2
                             : last_emitted_ + interval_;
        if (from >= now) return;

        KlineItem item;
        try {
            item = exchange_->getHistoricCandles(key_.pair, key_.asset, from, now, interval_);
        } catch (const DataException& e) {
            failed_polls_++;
            CRYPTOBT_LOG_WARN(logtag::Data, "live poll failed for " << key_.toString()
                              << ": " << e.what());
            return;
        }
        item.sortCandles();

        for (const auto& candle : item.candles) {
            if (candle.time <= last_emitted_ || candle.time + interval_ > now) {
                continue;  // already seen or still forming
            }
            if (!candle.validate()) {
                CRYPTOBT_LOG_WARN(logtag::Data, "skipping invalid live candle for "
                                  << key_.toString() << " at " << toUnixSeconds(candle.time));
                continue;
            }
            pending_.push_back(DataEventBuilder()
                                   .withKey(key_)
                                   .withCandle(candle)
                                   .withInterval(interval_)
                                   .build());
            last_emitted_ = candle.time;

            if (range_.ranges.empty()) {
                range_.start = candle.time;
                range_.interval = interval_;
                range_.ranges.push_back(IntervalRange{candle.time, candle.time, {}});
            }
            auto& current = range_.ranges.back();
            current.intervals.push_back({candle.time, candle.time + interval_, true});
            current.end = candle.time + interval_;
            range_.end = current.end;
        }
    }

public:
    LiveKlineData(IExchange* exchange, PairKey key, Interval interval,
                  std::shared_ptr<StopSignal> stop,
                  std::chrono::milliseconds poll_interval = std::chrono::milliseconds(0))
        : exchange_(exchange), key_(std::move(key)), interval_(interval),
          poll_interval_(poll_interval), stop_(std::move(stop)) {
        if (!exchange_ || !stop_) {
            throw DataException("live data requires an exchange and a stop signal",
                                ErrorCode::NilArguments);
        }
        if (interval_.count() <= 0) {
            throw DataException("live data requires a candle interval", ErrorCode::IntervalUnset);
        }
        if (poll_interval_.count() <= 0) {
            poll_interval_ = std::chrono::duration_cast<std::chrono::milliseconds>(interval_);
        }
    }

    // Blocks until a new candle completes or stop is requested
    std::optional<DataEvent> next() override {
        while (pending_.empty()) {
            if (stop_->stopRequested()) {
                return std::nullopt;
            }
            poll();
            if (!pending_.empty()) break;
            if (stop_->waitFor(poll_interval_)) {
                return std::nullopt;
            }
        }
        DataEvent event = pending_.front();
        pending_.pop_front();
        history_.push_back(event);
        return event;
    }

    bool isExhausted() const override {
        return pending_.empty() && stop_->stopRequested();
    }

    // Candles that have not been polled yet have no known time
    std::optional<Timestamp> peekNextTime() const override {
        if (pending_.empty()) return std::nullopt;
        return pending_.front().timestamp;
    }

    bool hasDataAtTime(Timestamp t) const override {
        return range_.hasDataAtTime(t);
    }

    std::optional<DataEvent> latest() const override {
        if (history_.empty()) return std::nullopt;
        return history_.back();
    }

    const std::vector<DataEvent>& history() const override { return history_; }

    PairKey key() const override { return key_; }

    const IntervalRangeHolder& range() const override { return range_; }

    bool isLive() const override { return true; }

    uint64_t failedPolls() const { return failed_polls_; }
};

} // namespace cryptobt
