// risk.hpp
// Pre-trade risk sub-policy of the portfolio
// A failed check is a rejection reason, never an exception

#pragma once

#include <optional>
#include <string>
#include "../config/config.hpp"
#include "../core/event_types.hpp"
#include "holdings.hpp"

namespace cryptobt {

class Risk {
public:
    // Returns the rejection reason, or nullopt when the order may proceed
    std::optional<std::string> evaluate(const OrderEvent& order, double price, double fee_rate,
                                        const Holdings& holdings, double portfolio_value,
                                        const CurrencySettings& cs) const {
        const double notional = order.amount * price;
        const double fee = notional * fee_rate;

        if (order.direction == Direction::Sell) {
            if (holdings.base_quantity <= 0) {
                return "no holdings to sell";
            }
            if (order.amount > holdings.base_quantity) {
                return "sell amount exceeds holdings";
            }
            if (fee > notional + holdings.remaining_funds) {
                return "fee exceeds sale proceeds and available funds";
            }
            return std::nullopt;
        }

        // Relative tolerance absorbs rounding of a full-funds buy
        if (notional + fee > holdings.remaining_funds * (1.0 + 1e-12)) {
            return "insufficient funds: order cost " + std::to_string(notional + fee) +
                   " available " + std::to_string(holdings.remaining_funds);
        }

        const double exposure_after = holdings.base_value + notional;
        if (cs.max_exposure > 0 && exposure_after > cs.max_exposure) {
            return "exposure " + std::to_string(exposure_after) + " exceeds limit " +
                   std::to_string(cs.max_exposure);
        }
        if (cs.maximum_holdings_ratio > 0 && portfolio_value > 0) {
            double ratio = exposure_after / portfolio_value;
            if (ratio > cs.maximum_holdings_ratio) {
                return "holdings ratio " + std::to_string(ratio) + " exceeds limit " +
                       std::to_string(cs.maximum_holdings_ratio);
            }
        }
        return std::nullopt;
    }
};

} // namespace cryptobt
