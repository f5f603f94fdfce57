// dollar_cost_average.hpp
// Dollar Cost Average Strategy
// Buys on every data point; the portfolio decides how much

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "../interfaces/strategy.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace cryptobt {

class DollarCostAverageStrategy : public IStrategy {
public:
    static constexpr const char* kName = "dollarcostaverage";

private:
    uint64_t signals_generated_ = 0;

    SignalEvent buySignal(const IDataHandler& data) {
        auto latest = data.latest();
        if (!latest) {
            throw StrategyException(ErrorCode::NilArguments,
                                    "no data point available for " + data.key().toString());
        }
        SignalEvent signal(*latest);
        signal.direction = Direction::Buy;
        signal.reason = "DCA purchase at " + std::to_string(latest->close);
        signals_generated_++;
        return signal;
    }

public:
    std::string name() const override { return kName; }

    std::string description() const override {
        return "Dollar-cost averaging: signals a buy on every candle";
    }

    SignalEvent onSignal(const IDataHandler& data, const Holdings& holdings) override {
        (void)holdings;
        return buySignal(data);
    }

    std::vector<SignalEvent> onSimultaneousSignals(const std::vector<const IDataHandler*>& data,
                                                   const IHoldingsView& holdings) override {
        (void)holdings;
        std::vector<SignalEvent> signals;
        signals.reserve(data.size());
        for (const auto* handler : data) {
            if (!handler) {
                throw StrategyException(ErrorCode::NilArguments, "nil data handler received");
            }
            signals.push_back(buySignal(*handler));
        }
        return signals;
    }

    bool supportsSimultaneousProcessing() const override { return true; }

    // No settings of its own
    void setCustomSettings(const CustomSettings& settings) override { (void)settings; }
    void setDefaults() override {}

    uint64_t getSignalsGenerated() const { return signals_generated_; }
};

} // namespace cryptobt
