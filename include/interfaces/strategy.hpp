// strategy.hpp
// Strategy Interface for the Crypto Backtesting Engine

#pragma once

#include <string>
#include <vector>
#include "../config/config.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../portfolio/holdings.hpp"
#include "data_handler.hpp"

namespace cryptobt {

// Read-only view of current holdings, used by simultaneous strategies
class IHoldingsView {
public:
    virtual ~IHoldingsView() = default;
    virtual Holdings getLatestHoldings(const PairKey& key) const = 0;
};

// ============================================================================
// Strategy Interface
// ============================================================================

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const { return ""; }

    // One pair at a time: data carries the pair's latest point and history
    virtual SignalEvent onSignal(const IDataHandler& data, const Holdings& holdings) = 0;

    // All configured pairs for the same timestamp; one signal per handler, same order
    virtual std::vector<SignalEvent> onSimultaneousSignals(
        const std::vector<const IDataHandler*>& data, const IHoldingsView& holdings) {
        (void)data;
        (void)holdings;
        throw StrategyException(ErrorCode::SimultaneousProcessingUnsupported,
                                name() + " does not support simultaneous processing");
    }

    virtual bool supportsSimultaneousProcessing() const { return false; }

    void setSimultaneousProcessing(bool enabled) { simultaneous_ = enabled; }
    bool usingSimultaneousProcessing() const { return simultaneous_; }

    // Unknown keys are ignored by implementations
    virtual void setCustomSettings(const CustomSettings& settings) = 0;
    virtual void setDefaults() = 0;

private:
    bool simultaneous_ = false;
};

} // namespace cryptobt
