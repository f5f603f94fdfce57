// strategy_registry.hpp
// Strategy lookup by name, resolved once at setup

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "../interfaces/strategy.hpp"
#include "../core/exceptions.hpp"
#include "dollar_cost_average.hpp"
#include "rsi_strategy.hpp"

namespace cryptobt {

using StrategyFactory = std::function<std::unique_ptr<IStrategy>()>;

namespace detail {
inline std::map<std::string, StrategyFactory>& strategyRegistry() {
    static std::map<std::string, StrategyFactory> registry = {
        {DollarCostAverageStrategy::kName,
         [] { return std::make_unique<DollarCostAverageStrategy>(); }},
        {RSIStrategy::kName,
         [] { return std::make_unique<RSIStrategy>(); }},
    };
    return registry;
}
} // namespace detail

// Adds or replaces a factory; names are matched case-sensitively
inline void registerStrategy(const std::string& name, StrategyFactory factory) {
    if (name.empty() || !factory) {
        throw ConfigException(ErrorCode::NilArguments, "strategy name and factory are required");
    }
    detail::strategyRegistry()[name] = std::move(factory);
}

inline std::vector<std::string> getStrategyNames() {
    std::vector<std::string> names;
    for (const auto& [name, _] : detail::strategyRegistry()) names.push_back(name);
    return names;
}

inline std::unique_ptr<IStrategy> loadStrategyByName(const std::string& name, bool simultaneous) {
    const auto& registry = detail::strategyRegistry();
    auto it = registry.find(name);
    if (it == registry.end()) {
        throw ConfigException(ErrorCode::StrategyNotFound, "strategy not found: '" + name + "'");
    }
    std::unique_ptr<IStrategy> strategy = it->second();
    if (simultaneous && !strategy->supportsSimultaneousProcessing()) {
        throw ConfigException(ErrorCode::SimultaneousProcessingUnsupported,
                              "strategy '" + name + "' does not support simultaneous processing");
    }
    strategy->setSimultaneousProcessing(simultaneous);
    strategy->setDefaults();
    return strategy;
}

} // namespace cryptobt
