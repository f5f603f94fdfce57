// statistic.hpp
// Run-wide statistics: per-pair equity series plus aggregate results
// Only the orchestrator feeds it; reports read it once finalized

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../core/currency.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../portfolio/holdings.hpp"
#include "currency_statistic.hpp"

namespace cryptobt {

struct OverallResult {
    double initial_funds = 0.0;
    double final_value = 0.0;
    double total_return_pct = 0.0;
    uint64_t buy_orders = 0;
    uint64_t sell_orders = 0;
    uint64_t rejected_orders = 0;
    double total_fees = 0.0;
    MaxDrawdown max_drawdown;
    std::optional<PairKey> best_pair;
    std::optional<PairKey> worst_pair;
};

// ============================================================================
// Statistic
// ============================================================================

class Statistic {
private:
    std::string strategy_name_;
    std::string strategy_description_;
    double risk_free_rate_ = 0.0;

    std::map<PairKey, CurrencyStatistic> pairs_;
    std::map<PairKey, CurrencyResult> results_;
    std::optional<OverallResult> overall_;
    bool finalized_ = false;

    CurrencyStatistic& pairFor(const PairKey& key, const Holdings& holdings) {
        if (finalized_) {
            throw StatisticsException(ErrorCode::InvalidState,
                                      "statistics already finalized, update for " + key.toString());
        }
        auto it = pairs_.find(key);
        if (it == pairs_.end()) {
            it = pairs_.emplace(key, CurrencyStatistic(key, holdings.initial_funds)).first;
        }
        return it->second;
    }

    // Sum of pair values, each carried forward to every timestamp seen by any pair
    std::vector<Swing> combinedEquity() const {
        std::map<Timestamp::rep, double> totals;
        for (const auto& [_, stat] : pairs_) {
            for (const auto& point : stat.points()) totals[point.timestamp.count()] = 0.0;
        }
        for (const auto& [_, stat] : pairs_) {
            const auto& points = stat.points();
            size_t idx = 0;
            double carried = stat.initialFunds();
            for (auto& [time, total] : totals) {
                while (idx < points.size() && points[idx].timestamp.count() <= time) {
                    carried = points[idx].total_value;
                    idx++;
                }
                total += carried;
            }
        }
        std::vector<Swing> series;
        series.reserve(totals.size());
        for (const auto& [time, total] : totals) series.push_back({Timestamp(time), total});
        return series;
    }

public:
    Statistic() = default;
    explicit Statistic(double risk_free_rate) : risk_free_rate_(risk_free_rate) {}

    void setStrategyName(const std::string& name, const std::string& description = "") {
        strategy_name_ = name;
        strategy_description_ = description;
    }
    const std::string& strategyName() const { return strategy_name_; }
    const std::string& strategyDescription() const { return strategy_description_; }

    void setRiskFreeRate(double rate) { risk_free_rate_ = rate; }
    double riskFreeRate() const { return risk_free_rate_; }

    void setupPair(const PairKey& key, double initial_funds) {
        pairs_[key] = CurrencyStatistic(key, initial_funds);
    }

    void update(const DataEvent& data, const Holdings& holdings) {
        pairFor(data.key(), holdings).addDataPoint(data, holdings);
    }

    void update(const FillEvent& fill, const Holdings& holdings) {
        pairFor(fill.key(), holdings).addFill(fill, holdings);
    }

    // Idempotent: every call recomputes from the same series
    void calculateAll() {
        results_.clear();
        OverallResult overall;
        std::optional<double> best_return, worst_return;

        for (const auto& [key, stat] : pairs_) {
            CurrencyResult result = stat.calculateResults(risk_free_rate_);
            overall.initial_funds += result.initial_funds;
            overall.final_value += result.equity_points > 0 ? result.final_value
                                                            : result.initial_funds;
            overall.buy_orders += result.buy_orders;
            overall.sell_orders += result.sell_orders;
            overall.rejected_orders += result.rejected_orders;
            overall.total_fees += result.total_fees;

            if (result.equity_points > 0) {
                if (!best_return || result.total_return_pct > *best_return) {
                    best_return = result.total_return_pct;
                    overall.best_pair = key;
                }
                if (!worst_return || result.total_return_pct < *worst_return) {
                    worst_return = result.total_return_pct;
                    overall.worst_pair = key;
                }
            }
            results_.emplace(key, result);
        }

        if (overall.initial_funds > 0) {
            overall.total_return_pct =
                (overall.final_value - overall.initial_funds) / overall.initial_funds * 100.0;
        }
        overall.max_drawdown = calculateMaxDrawdown(combinedEquity());
        overall_ = overall;
    }

    void finalize() {
        if (!overall_) {
            throw StatisticsException(ErrorCode::InvalidState,
                                      "cannot finalize statistics before calculateAll");
        }
        finalized_ = true;
        CRYPTOBT_LOG_INFO(logtag::Statistics, "finalized statistics for " << pairs_.size()
                          << " pair(s), total return " << overall_->total_return_pct << "%");
    }

    bool isFinalized() const { return finalized_; }
    bool isCalculated() const { return overall_.has_value(); }

    const std::map<PairKey, CurrencyResult>& results() const { return results_; }

    const OverallResult& overall() const {
        if (!overall_) {
            throw StatisticsException(ErrorCode::InvalidState, "results not calculated");
        }
        return *overall_;
    }

    const CurrencyStatistic* pair(const PairKey& key) const {
        auto it = pairs_.find(key);
        return it == pairs_.end() ? nullptr : &it->second;
    }

    size_t pairCount() const { return pairs_.size(); }

    size_t totalEquityPoints() const {
        size_t total = 0;
        for (const auto& [_, stat] : pairs_) total += stat.points().size();
        return total;
    }

    void reset() {
        pairs_.clear();
        results_.clear();
        overall_.reset();
        finalized_ = false;
        strategy_name_.clear();
        strategy_description_.clear();
    }
};

} // namespace cryptobt
