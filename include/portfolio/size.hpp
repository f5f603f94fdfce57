// size.hpp
// Order sizing sub-policy of the portfolio
// Clamps a requested or affordable amount into the configured buy/sell bounds

#pragma once

#include <algorithm>
#include "../config/config.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace cryptobt {

class Size {
public:
    // Portfolio-wide bounds; per-currency bounds tighten them further
    MinMax buy_side;
    MinMax sell_side;

    Size() = default;
    Size(const MinMax& buy, const MinMax& sell) : buy_side(buy), sell_side(sell) {}

    // Tightest of the portfolio-wide and per-currency bounds for a direction
    MinMax bounds(Direction direction, const CurrencySettings& cs) const {
        const MinMax& global = direction == Direction::Sell ? sell_side : buy_side;
        const MinMax& local = direction == Direction::Sell ? cs.sell_side : cs.buy_side;

        auto tighterCap = [](double a, double b) {
            if (a <= 0) return b;
            if (b <= 0) return a;
            return std::min(a, b);
        };

        MinMax merged;
        merged.minimum_size = std::max(global.minimum_size, local.minimum_size);
        merged.maximum_size = tighterCap(global.maximum_size, local.maximum_size);
        merged.maximum_total = tighterCap(global.maximum_total, local.maximum_total);
        return merged;
    }

    // requested > 0 is an explicit amount from the strategy and must meet the minimum;
    // otherwise the affordable amount is used. The result never exceeds the maxima.
    double sizeOrder(Direction direction, double requested, double affordable,
                     double price, const CurrencySettings& cs) const {
        MinMax limits = bounds(direction, cs);

        double amount = affordable;
        if (requested > 0) {
            if (limits.minimum_size > 0 && requested < limits.minimum_size) {
                throw PortfolioException(ErrorCode::AmountBelowMinimum,
                                         "amount below minimum: requested " +
                                         std::to_string(requested) + " minimum " +
                                         std::to_string(limits.minimum_size));
            }
            amount = requested;
        }

        if (limits.maximum_size > 0) {
            amount = std::min(amount, limits.maximum_size);
        }
        if (limits.maximum_total > 0 && price > 0) {
            amount = std::min(amount, limits.maximum_total / price);
        }
        return std::max(amount, 0.0);
    }
};

} // namespace cryptobt
