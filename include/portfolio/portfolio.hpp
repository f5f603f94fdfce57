// portfolio.hpp
// Portfolio Manager for the Crypto Backtesting Engine
// Turns signals into sized, risk-checked orders and owns holdings per pair

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../config/config.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../interfaces/strategy.hpp"
#include "holdings.hpp"
#include "risk.hpp"
#include "size.hpp"

namespace cryptobt {

// ============================================================================
// Portfolio with per-pair holdings, sizing and risk checks
// ============================================================================

class Portfolio : public IHoldingsView {
public:
    struct PairState {
        CurrencySettings settings;
        Holdings holdings;
        bool funds_set = false;
        uint64_t orders_sent = 0;
        uint64_t rejections = 0;
    };

private:
    static constexpr double kEpsilon = 1e-9;

    Size size_;
    Risk risk_;
    double risk_free_rate_ = 0.0;

    std::map<PairKey, PairState> pairs_;
    uint64_t order_id_counter_ = 1;

    std::string generateOrderId() {
        return "ORD_" + std::to_string(order_id_counter_++);
    }

    PairState& findPair(const PairKey& key) {
        auto it = pairs_.find(key);
        if (it == pairs_.end()) {
            throw PortfolioException(ErrorCode::CurrencySettingsNotFound,
                                     "currency settings not found for " + key.toString());
        }
        return it->second;
    }

    const PairState& findPair(const PairKey& key) const {
        auto it = pairs_.find(key);
        if (it == pairs_.end()) {
            throw PortfolioException(ErrorCode::CurrencySettingsNotFound,
                                     "currency settings not found for " + key.toString());
        }
        return it->second;
    }

    PairState& findFundedPair(const PairKey& key) {
        PairState& state = findPair(key);
        if (!state.funds_set) {
            throw PortfolioException(ErrorCode::CurrencySettingsNotFound,
                                     "initial funds not set for " + key.toString());
        }
        return state;
    }

    static double feeRate(const CurrencySettings& cs, OrderType type) {
        return type == OrderType::Limit ? cs.maker_fee : cs.taker_fee;
    }

    EventVariant reject(PairState& state, const SignalEvent& signal, const std::string& why) {
        state.rejections++;
        CRYPTOBT_LOG_DEBUG(logtag::Portfolio, "rejected " << directionToString(signal.direction)
                           << " for " << signal.key().toString() << ": " << why);
        return FillEvent::rejected(signal, why);
    }

public:
    Portfolio() = default;
    Portfolio(Size size, Risk risk, double risk_free_rate)
        : size_(std::move(size)), risk_(std::move(risk)), risk_free_rate_(risk_free_rate) {}

    static std::unique_ptr<Portfolio> setup(const Size& size, const Risk& risk,
                                            double risk_free_rate) {
        if (risk_free_rate < 0) {
            throw ConfigException(ErrorCode::NilArguments, "risk free rate cannot be negative");
        }
        return std::make_unique<Portfolio>(size, risk, risk_free_rate);
    }

    // Must be called for every pair before setInitialFunds
    CurrencySettings& setupCurrencySettingsMap(const PairKey& key) {
        if (key.exchange.empty() || key.asset == AssetType::Empty || key.pair.isEmpty()) {
            throw PortfolioException(ErrorCode::NilArguments,
                                     "exchange, asset and pair are required: " + key.toString());
        }
        PairState& state = pairs_[key];
        state.holdings.key = key;
        return state.settings;
    }

    CurrencySettings& setupCurrencySettingsMap(const CurrencySettings& settings) {
        CurrencySettings& stored = setupCurrencySettingsMap(settings.key());
        stored = settings;
        return stored;
    }

    void setInitialFunds(const PairKey& key, double funds) {
        PairState& state = findPair(key);
        if (funds <= 0) {
            throw PortfolioException(ErrorCode::BadInitialFunds,
                                     "initial funds must be greater than zero for " +
                                     key.toString());
        }
        state.settings.initial_funds = funds;
        state.holdings = Holdings{};
        state.holdings.key = key;
        state.holdings.initial_funds = funds;
        state.holdings.remaining_funds = funds;
        state.holdings.total_value = funds;
        state.funds_set = true;
    }

    double getInitialFunds(const PairKey& key) const {
        return findPair(key).holdings.initial_funds;
    }

    const CurrencySettings& getCurrencySettings(const PairKey& key) const {
        return findPair(key).settings;
    }

    // Mark holdings to market on new data
    void updateHoldings(const DataEvent& data) {
        PairState& state = findFundedPair(data.key());
        state.holdings.updateValue(data.close, data.timestamp);
    }

    // Hold produces nothing, a failed check produces a rejected fill, otherwise an order
    std::optional<EventVariant> onSignal(const SignalEvent& signal, const DataEvent& data) {
        if (signal.direction == Direction::Hold || signal.direction == Direction::DoNothing) {
            return std::nullopt;
        }
        PairState& state = findFundedPair(signal.key());
        Holdings& holdings = state.holdings;
        const CurrencySettings& cs = state.settings;
        const double fee_rate = feeRate(cs, OrderType::Market);
        // Buys are sized at the worst price the exchange may fill them at
        double price = data.close;
        if (signal.direction == Direction::Buy && cs.slippage_bps > 0) {
            price *= 1.0 + cs.slippage_bps / 10000.0;
        }

        if (signal.direction == Direction::Sell && holdings.base_quantity <= kEpsilon) {
            return reject(state, signal, "no holdings to sell");
        }

        double affordable = 0.0;
        if (signal.direction == Direction::Buy) {
            double fee_estimate = holdings.remaining_funds * fee_rate;
            affordable = (holdings.remaining_funds - fee_estimate) / price;
            if (affordable <= 0) {
                return reject(state, signal, "insufficient funds after fee estimate");
            }
        } else {
            affordable = holdings.base_quantity;
        }

        double amount = size_.sizeOrder(signal.direction, signal.amount, affordable, price, cs);
        if (signal.direction == Direction::Sell) {
            amount = std::min(amount, holdings.base_quantity);
        }

        MinMax limits = size_.bounds(signal.direction, cs);
        if (amount <= 0 || (limits.minimum_size > 0 && amount < limits.minimum_size)) {
            return reject(state, signal, "sized amount " + std::to_string(amount) +
                          " cannot meet minimum " + std::to_string(limits.minimum_size));
        }

        OrderEvent order(signal);
        order.amount = amount;
        order.order_type = OrderType::Market;
        order.close_price = data.close;
        order.order_id = generateOrderId();

        if (auto why = risk_.evaluate(order, price, fee_rate, holdings, totalValue(), cs)) {
            return reject(state, signal, *why);
        }

        state.orders_sent++;
        return EventVariant(order);
    }

    // Rejected fills leave holdings untouched
    void onFill(const FillEvent& fill) {
        PairState& state = findFundedPair(fill.key());
        Holdings& h = state.holdings;
        if (!fill.isFilled()) {
            return;
        }

        const double notional = fill.amount * fill.fill_price;
        if (fill.direction == Direction::Buy) {
            double new_quantity = h.base_quantity + fill.amount;
            h.cost_basis = (h.cost_basis * h.base_quantity + notional) / new_quantity;
            h.base_quantity = new_quantity;
            h.remaining_funds -= notional + fill.fee;
            h.bought_amount += fill.amount;
            h.bought_value += notional;
        } else if (fill.direction == Direction::Sell) {
            if (fill.amount > h.base_quantity + kEpsilon) {
                throw PortfolioException(ErrorCode::NegativeHoldings,
                                         "holdings cannot go negative: selling " +
                                         std::to_string(fill.amount) + " of " +
                                         std::to_string(h.base_quantity) + " for " +
                                         fill.key().toString());
            }
            h.realized_pnl += fill.amount * (fill.fill_price - h.cost_basis);
            h.base_quantity -= fill.amount;
            if (h.base_quantity < kEpsilon) {
                h.base_quantity = 0.0;
                h.cost_basis = 0.0;
            }
            h.remaining_funds += notional - fill.fee;
            h.sold_amount += fill.amount;
            h.sold_value += notional;
        } else {
            return;
        }
        h.total_fees += fill.fee;

        if (h.remaining_funds < -kEpsilon * std::max(1.0, h.initial_funds)) {
            throw PortfolioException(ErrorCode::NegativeHoldings,
                                     "holdings cannot go negative: funds " +
                                     std::to_string(h.remaining_funds) + " for " +
                                     fill.key().toString());
        }
        if (h.remaining_funds < 0) h.remaining_funds = 0.0;
        h.updateValue(fill.close_price > 0 ? fill.close_price : fill.fill_price, fill.timestamp);
    }

    Holdings getLatestHoldings(const PairKey& key) const override {
        return findPair(key).holdings;
    }

    double totalValue() const {
        double total = 0.0;
        for (const auto& [_, state] : pairs_) {
            total += state.holdings.total_value;
        }
        return total;
    }

    std::vector<PairKey> pairs() const {
        std::vector<PairKey> keys;
        keys.reserve(pairs_.size());
        for (const auto& [key, _] : pairs_) keys.push_back(key);
        return keys;
    }

    const PairState& pairState(const PairKey& key) const { return findPair(key); }

    double riskFreeRate() const { return risk_free_rate_; }

    void reset() {
        pairs_.clear();
        order_id_counter_ = 1;
    }
};

} // namespace cryptobt
