// event_dispatcher.hpp
// Event Dispatcher for the Crypto Backtesting Engine
// Routes each event kind to its handler and pushes the follow-up event, if any

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../data/handler_per_currency.hpp"
#include "../execution/exchange_simulator.hpp"
#include "../interfaces/strategy.hpp"
#include "../portfolio/portfolio.hpp"
#include "../statistics/statistic.hpp"
#include "event_queue.hpp"

namespace cryptobt {

// ============================================================================
// Event Visitor
// ============================================================================

class EventDispatcher {
public:
    struct DispatchStats {
        uint64_t data_events = 0;
        uint64_t signal_events = 0;
        uint64_t order_events = 0;
        uint64_t fill_events = 0;
        uint64_t rejected_fills = 0;
        uint64_t hold_signals = 0;
    };

private:
    IStrategy& strategy_;
    Portfolio& portfolio_;
    ExchangeSimulator& exchange_;
    Statistic& statistic_;
    HandlerPerCurrency& datas_;
    EventQueue& queue_;

    // Pairs whose data arrived since the last simultaneous flush
    std::vector<PairKey> batch_;
    DispatchStats stats_;

    const IDataHandler& handlerFor(const PairKey& key) const {
        const IDataHandler* handler = datas_.getDataForCurrency(key);
        if (CRYPTOBT_UNLIKELY(!handler)) {
            throw DataException("no data handler for " + key.toString(), ErrorCode::NilArguments);
        }
        return *handler;
    }

    DataEvent currentData(const PairKey& key) const {
        auto latest = handlerFor(key).latest();
        if (CRYPTOBT_UNLIKELY(!latest)) {
            throw DataException("no current data point for " + key.toString(),
                                ErrorCode::DataUnavailable);
        }
        return *latest;
    }

    void flushSimultaneous() {
        std::vector<const IDataHandler*> handlers;
        handlers.reserve(batch_.size());
        for (const auto& key : batch_) handlers.push_back(&handlerFor(key));
        batch_.clear();

        auto signals = strategy_.onSimultaneousSignals(handlers, portfolio_);
        if (signals.size() != handlers.size()) {
            throw StrategyException(ErrorCode::InvalidState,
                                    strategy_.name() + " returned " +
                                    std::to_string(signals.size()) + " signals for " +
                                    std::to_string(handlers.size()) + " pairs");
        }
        for (auto& signal : signals) queue_.push(EventVariant(std::move(signal)));
    }

public:
    EventDispatcher(IStrategy& strategy, Portfolio& portfolio, ExchangeSimulator& exchange,
                    Statistic& statistic, HandlerPerCurrency& datas, EventQueue& queue)
        : strategy_(strategy), portfolio_(portfolio), exchange_(exchange),
          statistic_(statistic), datas_(datas), queue_(queue) {}

    void operator()(const DataEvent& e) {
        if (CRYPTOBT_UNLIKELY(!e.validate())) {
            throw DataException("invalid data event for " + e.key().toString(),
                                ErrorCode::DataUnavailable);
        }
        stats_.data_events++;
        portfolio_.updateHoldings(e);
        statistic_.update(e, portfolio_.getLatestHoldings(e.key()));

        if (strategy_.usingSimultaneousProcessing()) {
            batch_.push_back(e.key());
            // The last data event at this timestamp triggers the batch
            const EventVariant* next = queue_.peek();
            const DataEvent* next_data = next ? std::get_if<DataEvent>(next) : nullptr;
            if (!next_data || next_data->timestamp != e.timestamp) {
                flushSimultaneous();
            }
            return;
        }

        SignalEvent signal = strategy_.onSignal(handlerFor(e.key()),
                                                portfolio_.getLatestHoldings(e.key()));
        queue_.push(EventVariant(std::move(signal)));
    }

    void operator()(const SignalEvent& e) {
        stats_.signal_events++;
        if (e.direction == Direction::Hold) {
            stats_.hold_signals++;
            return;
        }
        if (auto follow_up = portfolio_.onSignal(e, currentData(e.key()))) {
            queue_.push(std::move(*follow_up));
        }
    }

    void operator()(const OrderEvent& e) {
        stats_.order_events++;
        queue_.push(EventVariant(exchange_.executeOrder(e, currentData(e.key()))));
    }

    void operator()(const FillEvent& e) {
        stats_.fill_events++;
        if (!e.isFilled()) stats_.rejected_fills++;
        portfolio_.onFill(e);
        statistic_.update(e, portfolio_.getLatestHoldings(e.key()));
    }

    const DispatchStats& getStats() const { return stats_; }
};

} // namespace cryptobt
