// holdings.hpp
// Position and funds held for one (exchange, asset, pair)
// Only the Portfolio mutates Holdings; everyone else receives copies

#pragma once

#include "../core/currency.hpp"
#include "../core/kline.hpp"

namespace cryptobt {

struct Holdings {
    PairKey key;
    Timestamp timestamp{0};

    double initial_funds = 0.0;
    double remaining_funds = 0.0;  // quote currency available
    double base_quantity = 0.0;    // base currency held
    double cost_basis = 0.0;       // average entry price of base_quantity
    double close_price = 0.0;

    double base_value = 0.0;       // base_quantity * close_price
    double total_value = 0.0;      // remaining_funds + base_value

    double bought_amount = 0.0;
    double bought_value = 0.0;
    double sold_amount = 0.0;
    double sold_value = 0.0;
    double total_fees = 0.0;
    double realized_pnl = 0.0;

    // Mark to market at the given close
    void updateValue(double close, Timestamp ts) {
        close_price = close;
        timestamp = ts;
        base_value = base_quantity * close_price;
        total_value = remaining_funds + base_value;
    }

    double unrealizedPnL() const {
        return base_quantity * (close_price - cost_basis);
    }
};

} // namespace cryptobt
