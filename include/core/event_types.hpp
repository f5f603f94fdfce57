// event_types.hpp
// Event Type Definitions for the Crypto Backtesting Engine
// Data, signal, order and fill events; every event carries its routing identity

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include "branch_hints.hpp"
#include "currency.hpp"
#include "kline.hpp"

namespace cryptobt {

// ============================================================================
// Base Event
// ============================================================================

struct Event {
    Timestamp timestamp;
    uint64_t sequence_id;
    std::string exchange;
    AssetType asset;
    CurrencyPair pair;

    Event() : timestamp(0), sequence_id(0), asset(AssetType::Empty) {}

    PairKey key() const { return PairKey(exchange, asset, pair); }

    // Routing identity must always be present
    bool validate() const {
        return CRYPTOBT_LIKELY(!exchange.empty() &&
                               asset != AssetType::Empty &&
                               !pair.isEmpty() &&
                               timestamp.count() != 0);
    }

protected:
    // Derived events copy identity from the event that caused them
    void copyIdentity(const Event& cause) {
        timestamp = cause.timestamp;
        sequence_id = cause.sequence_id;
        exchange = cause.exchange;
        asset = cause.asset;
        pair = cause.pair;
    }
};

// ============================================================================
// Data Event - new market data became available (HOT PATH)
// ============================================================================

struct DataEvent : Event {
    double open, high, low, close, volume;
    Interval interval;

    DataEvent() : Event(), open(0), high(0), low(0), close(0), volume(0), interval(0) {}

    CRYPTOBT_HOT_FUNCTION
    bool validate() const {
        return CRYPTOBT_LIKELY(Event::validate() &&
                               high >= low &&
                               high >= open && high >= close &&
                               low <= open && low <= close &&
                               close > 0 &&
                               volume >= 0);
    }
};

// ============================================================================
// Direction
// ============================================================================

enum class Direction { Buy, Sell, Hold, DoNothing };

inline const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::Buy: return "BUY";
        case Direction::Sell: return "SELL";
        case Direction::Hold: return "HOLD";
        case Direction::DoNothing: return "DO NOTHING";
    }
    return "UNKNOWN";
}

// ============================================================================
// Signal Event - strategy decision
// ============================================================================

struct SignalEvent : Event {
    Direction direction;
    double amount;       // 0 lets the portfolio size the order
    double close_price;
    std::string reason;

    SignalEvent() : Event(), direction(Direction::Hold), amount(0.0), close_price(0.0) {}

    explicit SignalEvent(const DataEvent& data)
        : Event(), direction(Direction::Hold), amount(0.0), close_price(data.close) {
        copyIdentity(data);
    }

    bool validate() const {
        return Event::validate() && amount >= 0.0 && direction != Direction::DoNothing;
    }
};

// ============================================================================
// Order Event - sized instruction pending execution
// ============================================================================

enum class OrderType { Market, Limit };

struct OrderEvent : Event {
    Direction direction;
    OrderType order_type;
    double amount;
    std::optional<double> limit_price;
    double close_price;
    std::string order_id;

    OrderEvent() : Event(), direction(Direction::Buy), order_type(OrderType::Market),
                   amount(0.0), close_price(0.0) {}

    explicit OrderEvent(const SignalEvent& signal)
        : Event(), direction(signal.direction), order_type(OrderType::Market),
          amount(0.0), close_price(signal.close_price) {
        copyIdentity(signal);
    }

    bool validate() const {
        if (CRYPTOBT_UNLIKELY(!Event::validate() || amount <= 0 || order_id.empty())) {
            return false;
        }
        if (direction != Direction::Buy && direction != Direction::Sell) {
            return false;
        }
        // Limit orders need a positive price
        if (CRYPTOBT_UNLIKELY(order_type == OrderType::Limit &&
                              (!limit_price || *limit_price <= 0))) {
            return false;
        }
        return true;
    }
};

// ============================================================================
// Fill Event - execution outcome
// ============================================================================

enum class OrderStatus { Filled, Rejected };

inline const char* orderStatusToString(OrderStatus status) {
    return status == OrderStatus::Filled ? "FILLED" : "REJECTED";
}

struct FillEvent : Event {
    Direction direction;
    double amount;
    double fill_price;
    double fee;
    double close_price;
    OrderStatus status;
    std::string order_id;
    std::string reason;

    FillEvent() : Event(), direction(Direction::DoNothing), amount(0.0), fill_price(0.0),
                  fee(0.0), close_price(0.0), status(OrderStatus::Rejected) {}

    explicit FillEvent(const OrderEvent& order)
        : Event(), direction(order.direction), amount(order.amount), fill_price(0.0),
          fee(0.0), close_price(order.close_price), status(OrderStatus::Rejected),
          order_id(order.order_id) {
        copyIdentity(order);
    }

    // Rejection raised before an order existed (portfolio risk checks)
    static FillEvent rejected(const SignalEvent& signal, const std::string& why) {
        FillEvent fill;
        fill.copyIdentity(signal);
        fill.direction = Direction::DoNothing;
        fill.close_price = signal.close_price;
        fill.status = OrderStatus::Rejected;
        fill.reason = why;
        return fill;
    }

    bool isFilled() const { return status == OrderStatus::Filled; }

    bool validate() const {
        if (!Event::validate()) return false;
        if (status == OrderStatus::Rejected) return true;
        return amount > 0 && fill_price > 0 && fee >= 0 &&
               (direction == Direction::Buy || direction == Direction::Sell);
    }
};

// ============================================================================
// Event Variant - Type-safe event container
// ============================================================================

using EventVariant = std::variant<DataEvent, SignalEvent, OrderEvent, FillEvent>;

// ============================================================================
// Event Utility Functions
// ============================================================================

inline const char* getEventTypeName(const EventVariant& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DataEvent>) return "DataEvent";
        else if constexpr (std::is_same_v<T, SignalEvent>) return "SignalEvent";
        else if constexpr (std::is_same_v<T, OrderEvent>) return "OrderEvent";
        else if constexpr (std::is_same_v<T, FillEvent>) return "FillEvent";
        else return "UnknownEvent";
    }, event);
}

inline bool validateEvent(const EventVariant& event) {
    return std::visit([](auto&& arg) { return arg.validate(); }, event);
}

inline Timestamp getEventTimestamp(const EventVariant& event) {
    return std::visit([](auto&& arg) { return arg.timestamp; }, event);
}

inline PairKey getEventKey(const EventVariant& event) {
    return std::visit([](auto&& arg) { return arg.key(); }, event);
}

} // namespace cryptobt
