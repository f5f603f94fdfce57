// exchange_simulator.hpp
// Simulated Exchange for the Crypto Backtesting Engine
// Fills risk-checked orders against the current candle: market at close, limit inside [low, high]

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include "../config/config.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"

namespace cryptobt {

// ============================================================================
// Exchange Simulator
// ============================================================================

class ExchangeSimulator {
public:
    struct ExecutionStats {
        uint64_t total_orders = 0;
        uint64_t filled_orders = 0;
        uint64_t rejected_orders = 0;
        double total_fees = 0.0;
        double total_slippage = 0.0;   // quote value lost to slippage
        double traded_value = 0.0;
    };

private:
    std::map<PairKey, CurrencySettings> settings_;
    ExecutionStats stats_;
    uint64_t fill_id_counter_ = 1;

    // Deterministic adverse price move: buyers pay more, sellers receive less
    static double applySlippage(double price, Direction direction, double slippage_bps) {
        if (slippage_bps <= 0) return price;
        double adjustment = price * slippage_bps / 10000.0;
        return direction == Direction::Buy ? price + adjustment : price - adjustment;
    }

    FillEvent reject(FillEvent fill, const std::string& why) {
        fill.status = OrderStatus::Rejected;
        fill.reason = why;
        stats_.rejected_orders++;
        CRYPTOBT_LOG_DEBUG(logtag::Exchange, "order " << fill.order_id << " rejected: " << why);
        return fill;
    }

public:
    ExchangeSimulator() = default;

    void setCurrencySettings(const CurrencySettings& cs) {
        settings_[cs.key()] = cs;
    }

    const CurrencySettings& getCurrencySettings(const PairKey& key) const {
        auto it = settings_.find(key);
        if (it == settings_.end()) {
            throw ExecutionException("currency settings not found for " + key.toString(),
                                     ErrorCode::CurrencySettingsNotFound);
        }
        return it->second;
    }

    // Always produces a fill; an order that cannot execute becomes a rejected fill
    FillEvent executeOrder(const OrderEvent& order, const DataEvent& data) {
        stats_.total_orders++;
        const CurrencySettings& cs = getCurrencySettings(order.key());

        FillEvent fill(order);
        fill.timestamp = data.timestamp;
        fill.close_price = data.close;

        if (!order.validate()) {
            return reject(std::move(fill), "malformed order");
        }

        double base_price = data.close;
        double fee_rate = cs.taker_fee;
        if (order.order_type == OrderType::Limit) {
            const double limit = *order.limit_price;
            if (limit < data.low || limit > data.high) {
                return reject(std::move(fill), "limit price " + std::to_string(limit) +
                              " outside candle range [" + std::to_string(data.low) + ", " +
                              std::to_string(data.high) + "]");
            }
            base_price = limit;
            fee_rate = cs.maker_fee;
        }

        // Limit orders rest on the book; only market orders take slippage
        double price = order.order_type == OrderType::Market
            ? applySlippage(base_price, order.direction, cs.slippage_bps)
            : base_price;
        if (price <= 0) {
            return reject(std::move(fill), "slippage leaves no positive fill price");
        }

        fill.fill_price = price;
        fill.amount = order.amount;
        fill.fee = order.amount * price * fee_rate;
        fill.status = OrderStatus::Filled;
        if (fill.order_id.empty()) {
            fill.order_id = "FILL_" + std::to_string(fill_id_counter_);
        }
        fill_id_counter_++;

        stats_.filled_orders++;
        stats_.total_fees += fill.fee;
        stats_.total_slippage += std::abs(price - base_price) * order.amount;
        stats_.traded_value += order.amount * price;

        CRYPTOBT_LOG_DEBUG(logtag::Exchange, directionToString(fill.direction) << " "
                           << fill.amount << " " << fill.key().toString() << " @ "
                           << fill.fill_price << " fee " << fill.fee);
        return fill;
    }

    const ExecutionStats& getStats() const { return stats_; }

    void reset() {
        settings_.clear();
        stats_ = ExecutionStats{};
        fill_id_counter_ = 1;
    }
};

} // namespace cryptobt
