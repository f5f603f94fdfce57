// currency_statistic.hpp
// Equity series and performance results for one (exchange, asset, pair)
// One point per data timestamp; fills at that timestamp update the point in place

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>
#include "../core/currency.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../portfolio/holdings.hpp"

namespace cryptobt {

// ============================================================================
// Result types
// ============================================================================

struct EquityPoint {
    Timestamp timestamp{0};
    double close_price = 0.0;
    double total_value = 0.0;
    Holdings holdings;
    uint32_t buy_fills = 0;
    uint32_t sell_fills = 0;
    uint32_t rejections = 0;
};

struct Swing {
    Timestamp time{0};
    double value = 0.0;
};

struct MaxDrawdown {
    Swing highest;
    Swing lowest;
    double percentage = 0.0;  // peak-to-trough decline, 0..100
    Interval duration{0};
};

// Largest peak-to-trough decline over a (time, value) series
inline MaxDrawdown calculateMaxDrawdown(const std::vector<Swing>& series) {
    MaxDrawdown worst;
    if (series.empty()) return worst;

    Swing peak = series.front();
    worst.highest = peak;
    worst.lowest = peak;
    for (const auto& point : series) {
        if (point.value > peak.value) {
            peak = point;
            continue;
        }
        if (peak.value <= 0) continue;
        double pct = (peak.value - point.value) / peak.value * 100.0;
        if (pct > worst.percentage) {
            worst.highest = peak;
            worst.lowest = point;
            worst.percentage = pct;
            worst.duration = point.time - peak.time;
        }
    }
    return worst;
}

struct CurrencyResult {
    PairKey key;
    size_t equity_points = 0;
    uint64_t buy_orders = 0;
    uint64_t sell_orders = 0;
    uint64_t rejected_orders = 0;
    uint64_t winning_sells = 0;
    double total_fees = 0.0;

    double initial_funds = 0.0;
    double final_value = 0.0;
    double final_quantity = 0.0;
    double final_funds = 0.0;
    double realized_pnl = 0.0;
    double unrealized_pnl = 0.0;

    double starting_close = 0.0;
    double ending_close = 0.0;
    double total_return_pct = 0.0;
    double buy_and_hold_pct = 0.0;
    double sharpe_ratio = 0.0;
    double win_rate = 0.0;  // winning sells / sells
    MaxDrawdown max_drawdown;
};

// ============================================================================
// Per-pair statistic
// ============================================================================

class CurrencyStatistic {
private:
    PairKey key_;
    double initial_funds_ = 0.0;
    std::vector<EquityPoint> points_;

    uint64_t buy_orders_ = 0;
    uint64_t sell_orders_ = 0;
    uint64_t rejected_orders_ = 0;
    uint64_t winning_sells_ = 0;
    double last_realized_pnl_ = 0.0;

    static double mean(const std::vector<double>& values) {
        if (values.empty()) return 0.0;
        double sum = 0.0;
        for (double v : values) sum += v;
        return sum / static_cast<double>(values.size());
    }

    static double sampleStdDev(const std::vector<double>& values, double avg) {
        if (values.size() < 2) return 0.0;
        double acc = 0.0;
        for (double v : values) acc += (v - avg) * (v - avg);
        return std::sqrt(acc / static_cast<double>(values.size() - 1));
    }

public:
    CurrencyStatistic() = default;
    CurrencyStatistic(const PairKey& key, double initial_funds)
        : key_(key), initial_funds_(initial_funds) {}

    // A repeated timestamp refreshes the current point; an earlier one is fatal
    void addDataPoint(const DataEvent& data, const Holdings& holdings) {
        if (!points_.empty()) {
            EquityPoint& last = points_.back();
            if (data.timestamp < last.timestamp) {
                throw StatisticsException(ErrorCode::OutOfOrderEvent,
                                          "out of order data event for " + key_.toString() +
                                          ": " + std::to_string(toUnixSeconds(data.timestamp)) +
                                          " before " + std::to_string(toUnixSeconds(last.timestamp)));
            }
            if (data.timestamp == last.timestamp) {
                last.close_price = data.close;
                last.holdings = holdings;
                last.total_value = holdings.total_value;
                return;
            }
        }

        EquityPoint point;
        point.timestamp = data.timestamp;
        point.close_price = data.close;
        point.holdings = holdings;
        point.total_value = holdings.total_value;
        points_.push_back(point);
    }

    void addFill(const FillEvent& fill, const Holdings& holdings) {
        if (points_.empty() || fill.timestamp != points_.back().timestamp) {
            throw StatisticsException(ErrorCode::OutOfOrderEvent,
                                      "out of order fill for " + key_.toString() + " at " +
                                      std::to_string(toUnixSeconds(fill.timestamp)) +
                                      ": no equity point for that time");
        }
        EquityPoint& point = points_.back();
        point.holdings = holdings;
        point.total_value = holdings.total_value;

        if (!fill.isFilled()) {
            point.rejections++;
            rejected_orders_++;
            return;
        }
        if (fill.direction == Direction::Buy) {
            point.buy_fills++;
            buy_orders_++;
        } else if (fill.direction == Direction::Sell) {
            point.sell_fills++;
            sell_orders_++;
            if (holdings.realized_pnl > last_realized_pnl_) winning_sells_++;
        }
        last_realized_pnl_ = holdings.realized_pnl;
    }

    // Pure reduction over the accumulated series
    CurrencyResult calculateResults(double risk_free_rate) const {
        CurrencyResult result;
        result.key = key_;
        result.initial_funds = initial_funds_;
        result.equity_points = points_.size();
        result.buy_orders = buy_orders_;
        result.sell_orders = sell_orders_;
        result.rejected_orders = rejected_orders_;
        result.winning_sells = winning_sells_;
        if (points_.empty()) return result;

        const EquityPoint& first = points_.front();
        const EquityPoint& last = points_.back();
        result.total_fees = last.holdings.total_fees;
        result.final_value = last.total_value;
        result.final_quantity = last.holdings.base_quantity;
        result.final_funds = last.holdings.remaining_funds;
        result.realized_pnl = last.holdings.realized_pnl;
        result.unrealized_pnl = last.holdings.unrealizedPnL();
        result.starting_close = first.close_price;
        result.ending_close = last.close_price;

        if (initial_funds_ > 0) {
            result.total_return_pct = (result.final_value - initial_funds_) / initial_funds_ * 100.0;
        }
        if (first.close_price > 0) {
            result.buy_and_hold_pct =
                (last.close_price - first.close_price) / first.close_price * 100.0;
        }
        if (sell_orders_ > 0) {
            result.win_rate = static_cast<double>(winning_sells_) / static_cast<double>(sell_orders_);
        }

        std::vector<Swing> series;
        series.reserve(points_.size());
        for (const auto& point : points_) series.push_back({point.timestamp, point.total_value});
        result.max_drawdown = calculateMaxDrawdown(series);

        std::vector<double> excess;
        excess.reserve(points_.size());
        for (size_t i = 1; i < points_.size(); ++i) {
            double prev = points_[i - 1].total_value;
            if (prev <= 0) continue;
            excess.push_back((points_[i].total_value - prev) / prev - risk_free_rate);
        }
        double avg = mean(excess);
        double sd = sampleStdDev(excess, avg);
        result.sharpe_ratio = sd > 0 ? avg / sd : 0.0;
        return result;
    }

    const PairKey& key() const { return key_; }
    double initialFunds() const { return initial_funds_; }
    const std::vector<EquityPoint>& points() const { return points_; }
    uint64_t rejectedOrders() const { return rejected_orders_; }
};

} // namespace cryptobt
