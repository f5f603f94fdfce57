// test_exchange_statistics.cpp
// Tests for simulated order execution and the equity statistics

#include <cassert>
#include <cmath>
#include <iostream>
#include "test_helpers.hpp"
#include "../include/builders/event_builders.hpp"
#include "../include/execution/exchange_simulator.hpp"
#include "../include/statistics/statistic.hpp"

using namespace cryptobt;
using namespace cryptobt::testing;

namespace {

const Timestamp kT0 = fromUnixSeconds(1609459200);

CurrencySettings pairSettings(const std::string& base) {
    CurrencySettings cs;
    cs.exchange_name = "binance";
    cs.asset = "spot";
    cs.base = base;
    cs.quote = "USDT";
    cs.initial_funds = 1000.0;
    cs.maker_fee = 0.0005;
    cs.taker_fee = 0.001;
    return cs;
}

DataEvent bar(const PairKey& key, int step, double o, double h, double l, double c) {
    return DataEventBuilder()
        .withKey(key)
        .withOHLC(o, h, l, c)
        .withVolume(10.0)
        .withInterval(interval::OneHour)
        .withTimestamp(kT0 + interval::OneHour * step)
        .build();
}

DataEvent flat(const PairKey& key, int step, double price) {
    return bar(key, step, price, price, price, price);
}

OrderEvent marketOrder(const DataEvent& data, Direction direction, double amount) {
    SignalEvent signal(data);
    signal.direction = direction;
    OrderEvent order(signal);
    order.amount = amount;
    order.order_id = "ORD_1";
    return order;
}

Holdings holdingsWorth(const PairKey& key, double funds, double quantity, double close,
                       double initial = 1000.0) {
    Holdings h;
    h.key = key;
    h.initial_funds = initial;
    h.remaining_funds = funds;
    h.base_quantity = quantity;
    h.updateValue(close, Timestamp(1));
    return h;
}

} // namespace

// ============================================================================
// Exchange Simulator
// ============================================================================

void test_market_fill_at_close() {
    ExchangeSimulator exchange;
    CurrencySettings cs = pairSettings("BTC");
    exchange.setCurrencySettings(cs);

    DataEvent data = bar(cs.key(), 0, 100.0, 110.0, 95.0, 105.0);
    OrderEvent order = marketOrder(data, Direction::Buy, 2.0);
    order.timestamp = kT0 - interval::OneHour;  // stale order time is replaced by the candle time

    FillEvent fill = exchange.executeOrder(order, data);
    assert(fill.isFilled());
    assert(fill.fill_price == 105.0);
    assert(fill.amount == 2.0);
    assert(approxEqual(fill.fee, 2.0 * 105.0 * 0.001));
    assert(fill.timestamp == data.timestamp);
    assert(fill.order_id == "ORD_1");
    assert(fill.validate());

    const auto& stats = exchange.getStats();
    assert(stats.total_orders == 1 && stats.filled_orders == 1);
    assert(approxEqual(stats.traded_value, 210.0));
}

void test_market_slippage() {
    ExchangeSimulator exchange;
    CurrencySettings cs = pairSettings("BTC");
    cs.slippage_bps = 50.0;
    exchange.setCurrencySettings(cs);
    DataEvent data = flat(cs.key(), 0, 200.0);

    FillEvent buy = exchange.executeOrder(marketOrder(data, Direction::Buy, 1.0), data);
    FillEvent sell = exchange.executeOrder(marketOrder(data, Direction::Sell, 1.0), data);
    assert(approxEqual(buy.fill_price, 201.0));
    assert(approxEqual(sell.fill_price, 199.0));
    assert(approxEqual(exchange.getStats().total_slippage, 2.0));
}

void test_limit_orders() {
    ExchangeSimulator exchange;
    CurrencySettings cs = pairSettings("BTC");
    cs.slippage_bps = 50.0;
    exchange.setCurrencySettings(cs);
    DataEvent data = bar(cs.key(), 0, 100.0, 110.0, 95.0, 105.0);

    OrderEvent inside = marketOrder(data, Direction::Buy, 1.0);
    inside.order_type = OrderType::Limit;
    inside.limit_price = 97.0;
    FillEvent fill = exchange.executeOrder(inside, data);
    assert(fill.isFilled());
    assert(fill.fill_price == 97.0 && "limit fills take no slippage");
    assert(approxEqual(fill.fee, 97.0 * 0.0005));

    OrderEvent outside = inside;
    outside.limit_price = 90.0;
    FillEvent missed = exchange.executeOrder(outside, data);
    assert(missed.status == OrderStatus::Rejected);
    assert(missed.reason.find("outside candle range") != std::string::npos);
    assert(exchange.getStats().rejected_orders == 1);
}

void test_malformed_and_unknown_orders() {
    ExchangeSimulator exchange;
    CurrencySettings cs = pairSettings("BTC");
    exchange.setCurrencySettings(cs);
    DataEvent data = flat(cs.key(), 0, 100.0);

    OrderEvent empty = marketOrder(data, Direction::Buy, 0.0);
    FillEvent fill = exchange.executeOrder(empty, data);
    assert(fill.status == OrderStatus::Rejected);
    assert(fill.reason == "malformed order");

    DataEvent eth = flat(pairSettings("ETH").key(), 0, 100.0);
    expectErrorCode(ErrorCode::CurrencySettingsNotFound, [&] {
        exchange.executeOrder(marketOrder(eth, Direction::Buy, 1.0), eth);
    });

    exchange.reset();
    assert(exchange.getStats().total_orders == 0);
    expectErrorCode(ErrorCode::CurrencySettingsNotFound, [&] {
        exchange.getCurrencySettings(cs.key());
    });
}

// ============================================================================
// Drawdown
// ============================================================================

void test_max_drawdown() {
    std::vector<Swing> series = {
        {kT0, 100.0},
        {kT0 + interval::OneHour, 120.0},
        {kT0 + interval::OneHour * 2, 90.0},
        {kT0 + interval::OneHour * 3, 130.0},
        {kT0 + interval::OneHour * 4, 110.0},
    };
    MaxDrawdown dd = calculateMaxDrawdown(series);
    assert(approxEqual(dd.percentage, 25.0));
    assert(dd.highest.value == 120.0);
    assert(dd.lowest.value == 90.0);
    assert(dd.duration == interval::OneHour);

    MaxDrawdown none = calculateMaxDrawdown({{kT0, 1.0}, {kT0 + interval::OneHour, 2.0}});
    assert(none.percentage == 0.0);
    assert(calculateMaxDrawdown({}).percentage == 0.0);
}

// ============================================================================
// Currency Statistic
// ============================================================================

void test_equity_points_and_ordering() {
    PairKey key = pairSettings("BTC").key();
    CurrencyStatistic stat(key, 1000.0);

    stat.addDataPoint(flat(key, 0, 100.0), holdingsWorth(key, 1000.0, 0.0, 100.0));
    stat.addDataPoint(flat(key, 1, 110.0), holdingsWorth(key, 1000.0, 0.0, 110.0));
    // Same timestamp refreshes the last point
    stat.addDataPoint(flat(key, 1, 111.0), holdingsWorth(key, 1000.0, 0.0, 111.0));
    assert(stat.points().size() == 2);
    assert(stat.points().back().close_price == 111.0);

    expectErrorCode(ErrorCode::OutOfOrderEvent, [&] {
        stat.addDataPoint(flat(key, 0, 100.0), holdingsWorth(key, 1000.0, 0.0, 100.0));
    });

    FillEvent stale = FillEvent::rejected(SignalEvent(flat(key, 0, 100.0)), "late");
    expectErrorCode(ErrorCode::OutOfOrderEvent, [&] {
        stat.addFill(stale, holdingsWorth(key, 1000.0, 0.0, 100.0));
    });

    CurrencyStatistic empty(key, 1000.0);
    expectErrorCode(ErrorCode::OutOfOrderEvent, [&] {
        empty.addFill(stale, holdingsWorth(key, 1000.0, 0.0, 100.0));
    });
}

void test_fills_and_results() {
    PairKey key = pairSettings("BTC").key();
    CurrencyStatistic stat(key, 1000.0);

    DataEvent d0 = flat(key, 0, 100.0);
    stat.addDataPoint(d0, holdingsWorth(key, 1000.0, 0.0, 100.0));
    FillEvent buy = FillEvent(marketOrder(d0, Direction::Buy, 5.0));
    buy.status = OrderStatus::Filled;
    buy.fill_price = 100.0;
    stat.addFill(buy, holdingsWorth(key, 500.0, 5.0, 100.0));

    DataEvent d1 = flat(key, 1, 120.0);
    stat.addDataPoint(d1, holdingsWorth(key, 500.0, 5.0, 120.0));
    FillEvent sell = FillEvent(marketOrder(d1, Direction::Sell, 5.0));
    sell.status = OrderStatus::Filled;
    sell.fill_price = 120.0;
    Holdings after_sell = holdingsWorth(key, 1100.0, 0.0, 120.0);
    after_sell.realized_pnl = 100.0;
    stat.addFill(sell, after_sell);
    stat.addFill(FillEvent::rejected(SignalEvent(d1), "no holdings to sell"), after_sell);

    DataEvent d2 = flat(key, 2, 90.0);
    Holdings end = after_sell;
    end.updateValue(90.0, d2.timestamp);
    stat.addDataPoint(d2, end);

    CurrencyResult r = stat.calculateResults(0.0);
    assert(r.equity_points == 3);
    assert(r.buy_orders == 1 && r.sell_orders == 1);
    assert(r.rejected_orders == 1);
    assert(r.winning_sells == 1 && r.win_rate == 1.0);
    assert(approxEqual(r.final_value, 1100.0));
    assert(approxEqual(r.total_return_pct, 10.0));
    assert(approxEqual(r.buy_and_hold_pct, -10.0));
    assert(r.starting_close == 100.0 && r.ending_close == 90.0);
    assert(approxEqual(r.realized_pnl, 100.0));
    assert(r.max_drawdown.percentage == 0.0);
    assert(stat.points()[1].sell_fills == 1);
    assert(stat.points()[1].rejections == 1);
}

void test_sharpe_ratio() {
    PairKey key = pairSettings("BTC").key();
    CurrencyStatistic stat(key, 100.0);
    const double values[] = {100.0, 110.0, 99.0, 108.9};
    for (int i = 0; i < 4; ++i) {
        stat.addDataPoint(flat(key, i, 1.0), holdingsWorth(key, values[i], 0.0, 1.0, 100.0));
    }

    // Returns: +10%, -10%, +10%
    CurrencyResult r = stat.calculateResults(0.0);
    double mean = (0.1 - 0.1 + 0.1) / 3.0;
    double var = ((0.1 - mean) * (0.1 - mean) * 2 + (-0.1 - mean) * (-0.1 - mean)) / 2.0;
    assert(approxEqual(r.sharpe_ratio, mean / std::sqrt(var), 1e-6));

    CurrencyResult shifted = stat.calculateResults(0.01);
    assert(shifted.sharpe_ratio < r.sharpe_ratio);
}

// ============================================================================
// Statistic
// ============================================================================

void test_statistic_lifecycle() {
    PairKey btc = pairSettings("BTC").key();
    PairKey eth = pairSettings("ETH").key();

    Statistic statistic(0.0);
    statistic.setStrategyName("dollarcostaverage", "buys every candle");
    statistic.setupPair(btc, 1000.0);

    expectErrorCode(ErrorCode::InvalidState, [&] { statistic.finalize(); });
    expectErrorCode(ErrorCode::InvalidState, [&] { statistic.overall(); });

    statistic.update(flat(btc, 0, 100.0), holdingsWorth(btc, 1000.0, 0.0, 100.0));
    statistic.update(flat(btc, 1, 100.0), holdingsWorth(btc, 1200.0, 0.0, 100.0));
    // A pair seen for the first time is created on the fly
    statistic.update(flat(eth, 1, 10.0), holdingsWorth(eth, 800.0, 0.0, 10.0));
    assert(statistic.pairCount() == 2);
    assert(statistic.totalEquityPoints() == 3);

    statistic.calculateAll();
    OverallResult first = statistic.overall();
    statistic.calculateAll();
    OverallResult second = statistic.overall();
    assert(first.final_value == second.final_value && "calculation is idempotent");

    assert(approxEqual(first.initial_funds, 2000.0));
    assert(approxEqual(first.final_value, 2000.0));
    assert(first.best_pair && *first.best_pair == btc);
    assert(first.worst_pair && *first.worst_pair == eth);
    assert(statistic.results().size() == 2);
    assert(approxEqual(statistic.results().at(btc).total_return_pct, 20.0));

    // Combined series: 1000 + 1000 carried, then 1200 + 800
    assert(first.max_drawdown.percentage == 0.0);

    statistic.finalize();
    assert(statistic.isFinalized());
    expectErrorCode(ErrorCode::InvalidState, [&] {
        statistic.update(flat(btc, 2, 100.0), holdingsWorth(btc, 1200.0, 0.0, 100.0));
    });

    statistic.reset();
    assert(!statistic.isFinalized() && !statistic.isCalculated());
    assert(statistic.pairCount() == 0);
    assert(statistic.strategyName().empty());
}

void test_combined_drawdown() {
    PairKey btc = pairSettings("BTC").key();
    PairKey eth = pairSettings("ETH").key();
    Statistic statistic;
    statistic.setupPair(btc, 1000.0);
    statistic.setupPair(eth, 1000.0);

    statistic.update(flat(btc, 0, 1.0), holdingsWorth(btc, 1000.0, 0.0, 1.0));
    statistic.update(flat(eth, 0, 1.0), holdingsWorth(eth, 1000.0, 0.0, 1.0));
    statistic.update(flat(btc, 1, 1.0), holdingsWorth(btc, 500.0, 0.0, 1.0));
    // eth has no point at step 1 and carries 1000 forward
    statistic.update(flat(btc, 2, 1.0), holdingsWorth(btc, 1000.0, 0.0, 1.0));
    statistic.update(flat(eth, 2, 1.0), holdingsWorth(eth, 1000.0, 0.0, 1.0));

    statistic.calculateAll();
    assert(approxEqual(statistic.overall().max_drawdown.percentage, 25.0));
    assert(approxEqual(statistic.results().at(btc).max_drawdown.percentage, 50.0));
}

int main() {
    std::cout << "\n=== Exchange and Statistics Test Suite ===" << std::endl;
    std::cout << "==========================================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Exchange Simulator Tests:" << std::endl;
    reporter.test("Market Fill At Close", test_market_fill_at_close);
    reporter.test("Market Slippage", test_market_slippage);
    reporter.test("Limit Orders", test_limit_orders);
    reporter.test("Malformed And Unknown Orders", test_malformed_and_unknown_orders);

    std::cout << "\nStatistics Tests:" << std::endl;
    reporter.test("Max Drawdown", test_max_drawdown);
    reporter.test("Equity Points And Ordering", test_equity_points_and_ordering);
    reporter.test("Fills And Results", test_fills_and_results);
    reporter.test("Sharpe Ratio", test_sharpe_ratio);
    reporter.test("Statistic Lifecycle", test_statistic_lifecycle);
    reporter.test("Combined Drawdown", test_combined_drawdown);

    return reporter.report();
}
