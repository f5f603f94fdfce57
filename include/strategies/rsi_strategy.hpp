// rsi_strategy.hpp
// Relative Strength Index Strategy
// Sells when RSI is above the high threshold and buys when it is below the low one

#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include "../interfaces/strategy.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"

namespace cryptobt {

class RSIStrategy : public IStrategy {
public:
    static constexpr const char* kName = "rsi";
    static constexpr const char* kPeriodKey = "rsi-period";
    static constexpr const char* kHighKey = "rsi-high";
    static constexpr const char* kLowKey = "rsi-low";
    static constexpr double kMaxPeriod = 100000.0;

    struct RSIConfig {
        size_t period;
        double high;
        double low;

        RSIConfig()
            : period(14)
            , high(70.0)
            , low(30.0) {}

        static RSIConfig getDefault() {
            return RSIConfig();
        }
    };

private:
    RSIConfig config_;

    // Wilder's RSI over the last `period` changes of the history
    std::optional<double> calculateRSI(const std::vector<DataEvent>& history) const {
        if (history.size() < config_.period + 1) return std::nullopt;

        double gains = 0.0;
        double losses = 0.0;
        const size_t first = history.size() - config_.period;
        for (size_t i = first; i < history.size(); ++i) {
            double change = history[i].close - history[i - 1].close;
            if (change > 0) gains += change;
            else losses -= change;
        }
        const double avg_gain = gains / static_cast<double>(config_.period);
        const double avg_loss = losses / static_cast<double>(config_.period);
        if (avg_loss == 0.0) {
            return avg_gain == 0.0 ? 50.0 : 100.0;
        }
        const double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    }

    SignalEvent evaluate(const IDataHandler& data) const {
        auto latest = data.latest();
        if (!latest) {
            throw StrategyException(ErrorCode::NilArguments,
                                    "no data point available for " + data.key().toString());
        }
        SignalEvent signal(*latest);
        auto rsi = calculateRSI(data.history());
        if (!rsi) {
            signal.direction = Direction::Hold;
            signal.reason = "warming up";
            return signal;
        }
        if (*rsi > config_.high) {
            signal.direction = Direction::Sell;
        } else if (*rsi < config_.low) {
            signal.direction = Direction::Buy;
        } else {
            signal.direction = Direction::Hold;
        }
        signal.reason = "RSI " + std::to_string(*rsi);
        return signal;
    }

public:
    RSIStrategy() : config_(RSIConfig::getDefault()) {}
    explicit RSIStrategy(const RSIConfig& config) : config_(config) {}

    std::string name() const override { return kName; }

    std::string description() const override {
        return "Relative Strength Index: sells above rsi-high, buys below rsi-low";
    }

    SignalEvent onSignal(const IDataHandler& data, const Holdings& holdings) override {
        (void)holdings;
        return evaluate(data);
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
            signals.push_back(evaluate(*handler));
        }
        return signals;
    }

    bool supportsSimultaneousProcessing() const override { return true; }

    void setCustomSettings(const CustomSettings& settings) override {
        RSIConfig updated = config_;
        try {
            if (auto period = getSetting<double>(settings, kPeriodKey)) {
                if (!(*period >= 1 && *period <= kMaxPeriod) || std::floor(*period) != *period) {
                    throw StrategyException(ErrorCode::InvalidCustomSetting,
                                            "invalid custom setting '" + std::string(kPeriodKey) +
                                            "': must be a whole number in [1, 100000]");
                }
                updated.period = static_cast<size_t>(*period);
            }
            if (auto high = getSetting<double>(settings, kHighKey)) updated.high = *high;
            if (auto low = getSetting<double>(settings, kLowKey)) updated.low = *low;
        } catch (const ConfigException& e) {
            throw StrategyException(ErrorCode::InvalidCustomSetting, e.what());
        }
        if (!std::isfinite(updated.low) || !std::isfinite(updated.high) ||
            updated.low < 0 || updated.high > 100 || updated.low >= updated.high) {
            throw StrategyException(ErrorCode::InvalidCustomSetting,
                                    "invalid custom setting: rsi-low must be below rsi-high "
                                    "within [0, 100]");
        }
        config_ = updated;
        CRYPTOBT_LOG_DEBUG(logtag::Strategy, "rsi period " << config_.period << " high "
                           << config_.high << " low " << config_.low);
    }

    void setDefaults() override {
        config_ = RSIConfig::getDefault();
    }

    const RSIConfig& getConfig() const { return config_; }
};

} // namespace cryptobt
