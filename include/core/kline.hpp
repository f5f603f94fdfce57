// kline.hpp
// Candle (kline) data types, supported intervals and data range bookkeeping
// IntervalRangeHolder tracks which sub-intervals of a requested window have data

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "currency.hpp"
#include "exceptions.hpp"

namespace cryptobt {

using Timestamp = std::chrono::nanoseconds;  // since Unix epoch, 0 == unset
using Interval = std::chrono::nanoseconds;

// ============================================================================
// Supported Intervals
// ============================================================================

namespace interval {
inline constexpr Interval OneMin     = std::chrono::minutes(1);
inline constexpr Interval ThreeMin   = std::chrono::minutes(3);
inline constexpr Interval FiveMin    = std::chrono::minutes(5);
inline constexpr Interval TenMin     = std::chrono::minutes(10);
inline constexpr Interval FifteenMin = std::chrono::minutes(15);
inline constexpr Interval ThirtyMin  = std::chrono::minutes(30);
inline constexpr Interval OneHour    = std::chrono::hours(1);
inline constexpr Interval TwoHour    = std::chrono::hours(2);
inline constexpr Interval FourHour   = std::chrono::hours(4);
inline constexpr Interval SixHour    = std::chrono::hours(6);
inline constexpr Interval EightHour  = std::chrono::hours(8);
inline constexpr Interval TwelveHour = std::chrono::hours(12);
inline constexpr Interval OneDay     = std::chrono::hours(24);
inline constexpr Interval ThreeDay   = std::chrono::hours(72);
inline constexpr Interval OneWeek    = std::chrono::hours(168);
} // namespace interval

inline const std::vector<Interval>& supportedIntervals() {
    static const std::vector<Interval> intervals = {
        interval::OneMin, interval::ThreeMin, interval::FiveMin, interval::TenMin,
        interval::FifteenMin, interval::ThirtyMin, interval::OneHour, interval::TwoHour,
        interval::FourHour, interval::SixHour, interval::EightHour, interval::TwelveHour,
        interval::OneDay, interval::ThreeDay, interval::OneWeek
    };
    return intervals;
}

inline bool isSupportedInterval(Interval value) {
    const auto& all = supportedIntervals();
    return std::find(all.begin(), all.end(), value) != all.end();
}

inline std::string intervalToString(Interval value) {
    using namespace std::chrono;
    const auto secs = duration_cast<seconds>(value).count();
    if (secs > 0 && secs % 604800 == 0) return std::to_string(secs / 604800) + "w";
    if (secs > 0 && secs % 86400 == 0) return std::to_string(secs / 86400) + "d";
    if (secs > 0 && secs % 3600 == 0) return std::to_string(secs / 3600) + "h";
    if (secs > 0 && secs % 60 == 0) return std::to_string(secs / 60) + "m";
    return std::to_string(secs) + "s";
}

inline Timestamp fromUnixSeconds(int64_t seconds) {
    return std::chrono::duration_cast<Timestamp>(std::chrono::seconds(seconds));
}

inline int64_t toUnixSeconds(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts).count();
}

inline Timestamp nowTimestamp() {
    return std::chrono::duration_cast<Timestamp>(
        std::chrono::system_clock::now().time_since_epoch());
}

// Align a timestamp down to the start of its interval
inline Timestamp truncateToInterval(Timestamp ts, Interval value) {
    if (value.count() <= 0) return ts;
    return ts - (ts % value);
}

// ============================================================================
// Candles
// ============================================================================

struct Candle {
    Timestamp time{0};
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    bool validate() const {
        return high >= low &&
               high >= open && high >= close &&
               low <= open && low <= close &&
               volume >= 0;
    }
};

struct KlineItem {
    std::string exchange;
    CurrencyPair pair;
    AssetType asset = AssetType::Empty;
    Interval interval{0};
    std::vector<Candle> candles;

    void sortCandles() {
        std::sort(candles.begin(), candles.end(),
                  [](const Candle& a, const Candle& b) { return a.time < b.time; });
    }
};

// ============================================================================
// Data Range Bookkeeping
// ============================================================================

struct IntervalData {
    Timestamp start{0};
    Timestamp end{0};
    bool has_data = false;
};

struct IntervalRange {
    Timestamp start{0};
    Timestamp end{0};
    std::vector<IntervalData> intervals;
};

struct IntervalRangeHolder {
    Timestamp start{0};
    Timestamp end{0};
    Interval interval{0};
    std::vector<IntervalRange> ranges;

    size_t intervalCount() const {
        size_t total = 0;
        for (const auto& range : ranges) total += range.intervals.size();
        return total;
    }

    void setHasDataFromCandles(const std::vector<Candle>& candles) {
        std::set<Timestamp::rep> times;
        for (const auto& candle : candles) {
            times.insert(candle.time.count());
        }
        for (auto& range : ranges) {
            for (auto& data : range.intervals) {
                auto it = times.lower_bound(data.start.count());
                data.has_data = (it != times.end() && *it < data.end.count());
            }
        }
    }

    bool hasDataAtTime(Timestamp t) const {
        for (const auto& range : ranges) {
            if (t < range.start || t >= range.end) continue;
            for (const auto& data : range.intervals) {
                if (t >= data.start && t < data.end) {
                    return data.has_data;
                }
            }
        }
        return false;
    }

    std::vector<IntervalData> missingIntervals() const {
        std::vector<IntervalData> missing;
        for (const auto& range : ranges) {
            for (const auto& data : range.intervals) {
                if (!data.has_data) missing.push_back(data);
            }
        }
        return missing;
    }
};

// Splits [start, end) into intervals, grouped into ranges of at most `limit`
// intervals each (limit 0 keeps a single range). Start is aligned to the interval.
inline IntervalRangeHolder createIntervalRange(Timestamp start, Timestamp end,
                                               Interval value, size_t limit = 0) {
    if (value.count() <= 0) {
        throw DataException("cannot create interval range: candle interval unset",
                            ErrorCode::IntervalUnset);
    }
    if (start.count() == 0 || end.count() == 0 || start >= end) {
        throw DataException("cannot create interval range: start " +
                            std::to_string(toUnixSeconds(start)) + " end " +
                            std::to_string(toUnixSeconds(end)),
                            ErrorCode::StartEndUnset);
    }

    IntervalRangeHolder holder;
    holder.start = truncateToInterval(start, value);
    holder.end = end;
    holder.interval = value;

    IntervalRange current;
    for (Timestamp t = holder.start; t < end; t += value) {
        if (current.intervals.empty()) {
            current.start = t;
        }
        current.intervals.push_back({t, t + value, false});
        current.end = t + value;
        if (limit > 0 && current.intervals.size() == limit) {
            holder.ranges.push_back(std::move(current));
            current = IntervalRange{};
        }
    }
    if (!current.intervals.empty()) {
        holder.ranges.push_back(std::move(current));
    }
    return holder;
}

} // namespace cryptobt
