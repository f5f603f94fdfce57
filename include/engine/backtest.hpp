// backtest.hpp
// Backtest Orchestrator for the Crypto Backtesting Engine
// Owns every component, drains the event queue and drives the run state machine

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../config/config.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../core/stop_signal.hpp"
#include "../data/handler_per_currency.hpp"
#include "../execution/exchange_simulator.hpp"
#include "../interfaces/host_engine.hpp"
#include "../interfaces/report_sink.hpp"
#include "../interfaces/strategy.hpp"
#include "../portfolio/portfolio.hpp"
#include "../report/text_report.hpp"
#include "../statistics/statistic.hpp"
#include "../strategies/strategy_registry.hpp"
#include "data_loader.hpp"
#include "event_dispatcher.hpp"
#include "event_queue.hpp"

namespace cryptobt {

// ============================================================================
// Backtest
// ============================================================================

class BackTest {
public:
    enum class State { Created, Running, Completed, Stopped, Failed };

    static const char* stateToString(State state) {
        switch (state) {
            case State::Created: return "CREATED";
            case State::Running: return "RUNNING";
            case State::Completed: return "COMPLETED";
            case State::Stopped: return "STOPPED";
            case State::Failed: return "FAILED";
        }
        return "UNKNOWN";
    }

private:
    IHostEngine* host_ = nullptr;
    std::string host_config_path_;
    std::string report_output_path_;

    EventQueue event_queue_;
    HandlerPerCurrency datas_;
    std::unique_ptr<IStrategy> strategy_;
    std::unique_ptr<Portfolio> portfolio_;
    std::unique_ptr<ExchangeSimulator> exchange_;
    std::unique_ptr<Statistic> statistic_;
    std::unique_ptr<IReportSink> report_;

    std::shared_ptr<StopSignal> stop_ = std::make_shared<StopSignal>();
    State state_ = State::Created;
    uint64_t events_processed_ = 0;

    void requireCreated(const char* what) const {
        if (state_ != State::Created) {
            throw BacktestException(std::string("cannot ") + what + " in state " +
                                    stateToString(state_), ErrorCode::InvalidState);
        }
    }

    // Pulls every handler whose next candle is at the earliest pending time, in
    // configuration order. Handlers that cannot tell their next time are pulled too.
    bool pullNextData() {
        std::optional<Timestamp> earliest;
        for (IDataHandler* handler : datas_.getAllData()) {
            if (handler->isExhausted()) continue;
            if (auto t = handler->peekNextTime()) {
                if (!earliest || *t < *earliest) earliest = *t;
            }
        }

        bool pushed = false;
        for (IDataHandler* handler : datas_.getAllData()) {
            if (handler->isExhausted()) continue;
            auto t = handler->peekNextTime();
            if (t && *t != *earliest) continue;
            if (auto data = handler->next()) {
                event_queue_.push(EventVariant(std::move(*data)));
                pushed = true;
            }
        }
        return pushed;
    }

    void logRunSummary(const EventDispatcher& dispatcher) const {
        const auto& s = dispatcher.getStats();
        CRYPTOBT_LOG_INFO(logtag::Backtester, "run " << stateToString(state_) << ": "
                          << events_processed_ << " events (" << s.data_events << " data, "
                          << s.signal_events << " signals, " << s.order_events << " orders, "
                          << s.fill_events << " fills, " << s.rejected_fills << " rejected)");
    }

public:
    BackTest() = default;

    BackTest(const BackTest&) = delete;
    BackTest& operator=(const BackTest&) = delete;

    // Validates the configuration in a fixed order, then wires every component
    static std::unique_ptr<BackTest> newFromConfig(const Config* cfg,
                                                   const std::string& host_config_path,
                                                   const std::string& report_output_path,
                                                   IHostEngine* host) {
        if (!cfg) {
            throw ConfigException(ErrorCode::NilConfig, "nil config received");
        }
        if (!host) {
            throw ConfigException(ErrorCode::NilBot, "nil host engine received");
        }
        validateCurrencySettings(cfg->currency_settings);

        std::vector<IExchange*> exchanges;
        for (const auto& cs : cfg->currency_settings) {
            IExchange* exchange = host->getExchangeByName(lowerExchangeName(cs.exchange_name));
            if (!exchange) {
                throw ConfigException(ErrorCode::ExchangeNotFound,
                                      "exchange not found: '" + cs.exchange_name + "'");
            }
            exchanges.push_back(exchange);
        }

        validateDataSettings(cfg->data_settings);
        std::unique_ptr<IStrategy> strategy = loadStrategyByName(
            cfg->strategy_settings.name, cfg->strategy_settings.simultaneous_signal_processing);
        validateMinMax(*cfg);

        if (cfg->verbose) {
            Logger::instance().setLevel(LogLevel::Debug);
        }
        strategy->setCustomSettings(cfg->strategy_settings.custom_settings);

        auto bt = std::make_unique<BackTest>();
        bt->host_ = host;
        bt->host_config_path_ = host_config_path;
        bt->report_output_path_ = report_output_path;

        auto portfolio = Portfolio::setup(Size(cfg->portfolio_settings.buy_side,
                                               cfg->portfolio_settings.sell_side),
                                          Risk(), cfg->statistic_settings.risk_free_rate);
        auto exchange_sim = std::make_unique<ExchangeSimulator>();
        auto statistic = std::make_unique<Statistic>(cfg->statistic_settings.risk_free_rate);
        statistic->setStrategyName(strategy->name(), strategy->description());

        bt->datas_.setup();
        for (size_t i = 0; i < cfg->currency_settings.size(); ++i) {
            const CurrencySettings& cs = cfg->currency_settings[i];
            const PairKey key = cs.key();
            portfolio->setupCurrencySettingsMap(cs);
            portfolio->setInitialFunds(key, cs.initial_funds);
            exchange_sim->setCurrencySettings(cs);
            statistic->setupPair(key, cs.initial_funds);

            bt->datas_.setDataForCurrency(
                loadData(cfg->data_settings, exchanges[i], key, host, bt->stop_));
            CRYPTOBT_LOG_INFO(logtag::Setup, "loaded " << key.toString() << " with funds "
                              << cs.initial_funds);
        }

        bt->strategy_ = std::move(strategy);
        bt->portfolio_ = std::move(portfolio);
        bt->exchange_ = std::move(exchange_sim);
        bt->statistic_ = std::move(statistic);
        if (!report_output_path.empty()) {
            bt->report_ = std::make_unique<TextReport>(report_output_path);
        }
        CRYPTOBT_LOG_INFO(logtag::Setup, "backtest '" << cfg->nickname << "' ready with strategy "
                          << bt->strategy_->name());
        return bt;
    }

    // Component injection for assembling a backtest by hand
    void setStrategy(std::unique_ptr<IStrategy> strategy) {
        requireCreated("change components");
        strategy_ = std::move(strategy);
    }

    void setPortfolio(std::unique_ptr<Portfolio> portfolio) {
        requireCreated("change components");
        portfolio_ = std::move(portfolio);
    }

    void setExchange(std::unique_ptr<ExchangeSimulator> exchange) {
        requireCreated("change components");
        exchange_ = std::move(exchange);
    }

    void setStatistic(std::unique_ptr<Statistic> statistic) {
        requireCreated("change components");
        statistic_ = std::move(statistic);
    }

    void setReportSink(std::unique_ptr<IReportSink> report) {
        requireCreated("change components");
        report_ = std::move(report);
    }

    void addDataHandler(std::unique_ptr<IDataHandler> handler) {
        requireCreated("change components");
        datas_.setDataForCurrency(std::move(handler));
    }

    // Live handlers built outside newFromConfig wait on this signal
    std::shared_ptr<StopSignal> stopSignal() const { return stop_; }

    // Main simulation loop; fatal errors leave the run Failed and propagate
    void run() {
        requireCreated("run");
        if (!strategy_ || !portfolio_ || !exchange_ || !statistic_ || datas_.empty()) {
            throw BacktestException("all components must be set before running",
                                    ErrorCode::NilArguments);
        }

        state_ = State::Running;
        EventDispatcher dispatcher(*strategy_, *portfolio_, *exchange_, *statistic_, datas_,
                                   event_queue_);
        CRYPTOBT_LOG_INFO(logtag::Backtester, "running " << datas_.size() << " pair(s) with "
                          << strategy_->name());
        try {
            while (true) {
                if (stop_->stopRequested()) {
                    state_ = State::Stopped;
                    break;
                }
                if (event_queue_.empty()) {
                    if (datas_.allExhausted()) {
                        state_ = State::Completed;
                        break;
                    }
                    pullNextData();
                    continue;
                }

                auto event = event_queue_.pop();
                std::visit(dispatcher, *event);
                events_processed_++;
            }

            if (state_ == State::Completed) {
                statistic_->calculateAll();
                statistic_->finalize();
            }
        } catch (const std::exception& e) {
            state_ = State::Failed;
            CRYPTOBT_LOG_ERROR(logtag::Backtester, "run failed: " << e.what());
            logRunSummary(dispatcher);
            throw;
        }
        logRunSummary(dispatcher);

        // A sink failure leaves the run Completed with finalized statistics
        if (state_ == State::Completed && report_) {
            try {
                report_->generateReport(*statistic_);
            } catch (const ReportException& e) {
                CRYPTOBT_LOG_ERROR(logtag::Report, e.what());
                throw;
            } catch (const std::exception& e) {
                CRYPTOBT_LOG_ERROR(logtag::Report, "report sink failed: " << e.what());
                throw ReportException(e.what());
            }
        }
    }

    // Best effort; safe before run, during run and more than once
    void stop() {
        if (stop_->requestStop()) {
            CRYPTOBT_LOG_INFO(logtag::Backtester, "stop requested");
        }
    }

    // Back to an empty, unconfigured backtest
    void reset() {
        stop_->requestStop();
        event_queue_.clear();
        event_queue_.resetStats();
        datas_.setup();
        strategy_.reset();
        portfolio_.reset();
        exchange_.reset();
        statistic_.reset();
        report_.reset();
        host_ = nullptr;
        host_config_path_.clear();
        report_output_path_.clear();
        stop_ = std::make_shared<StopSignal>();
        state_ = State::Created;
        events_processed_ = 0;
    }

    State state() const { return state_; }
    uint64_t eventsProcessed() const { return events_processed_; }
    EventQueue::QueueStats queueStats() const { return event_queue_.getStats(); }

    IHostEngine* host() const { return host_; }
    const std::string& hostConfigPath() const { return host_config_path_; }
    const std::string& reportOutputPath() const { return report_output_path_; }

    IStrategy* strategy() const { return strategy_.get(); }
    Portfolio* portfolio() const { return portfolio_.get(); }
    ExchangeSimulator* exchange() const { return exchange_.get(); }
    Statistic* statistic() const { return statistic_.get(); }
    IReportSink* reportSink() const { return report_.get(); }
    const HandlerPerCurrency& datas() const { return datas_; }
};

} // namespace cryptobt
