// test_strategies.cpp
// Tests for the strategy registry, dollar cost averaging and RSI

#include <algorithm>
#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>
#include "test_helpers.hpp"
#include "fake_host_engine.hpp"
#include "../include/data/kline_data.hpp"
#include "../include/strategies/strategy_registry.hpp"

using namespace cryptobt;
using namespace cryptobt::testing;

namespace {

const PairKey kBtc("binance", AssetType::Spot, CurrencyPair("BTC", "USDT"));
const PairKey kEth("binance", AssetType::Spot, CurrencyPair("ETH", "USDT"));
const Timestamp kT0 = fromUnixSeconds(1609459200);

// Loads the closes and advances the handler through all of them
std::unique_ptr<KlineData> replayed(const PairKey& key, const std::vector<double>& closes) {
    KlineItem item;
    item.exchange = key.exchange;
    item.asset = key.asset;
    item.pair = key.pair;
    item.interval = interval::OneHour;
    for (size_t i = 0; i < closes.size(); ++i) {
        item.candles.push_back(flatCandle(kT0 + interval::OneHour * static_cast<int>(i),
                                          closes[i]));
    }
    auto data = std::make_unique<KlineData>(item, IntervalRangeHolder{});
    data->load();
    while (data->next()) {}
    return data;
}

class SingleOnlyStrategy : public IStrategy {
public:
    std::string name() const override { return "singleonly"; }
    SignalEvent onSignal(const IDataHandler& data, const Holdings&) override {
        return SignalEvent(*data.latest());
    }
    void setCustomSettings(const CustomSettings&) override {}
    void setDefaults() override {}
};

class EmptyHoldings : public IHoldingsView {
public:
    Holdings getLatestHoldings(const PairKey& key) const override {
        Holdings h;
        h.key = key;
        return h;
    }
};

} // namespace

// ============================================================================
// Registry
// ============================================================================

void test_registry_lookup() {
    auto names = getStrategyNames();
    assert(std::find(names.begin(), names.end(), "dollarcostaverage") != names.end());
    assert(std::find(names.begin(), names.end(), "rsi") != names.end());

    auto dca = loadStrategyByName("dollarcostaverage", false);
    assert(dca->name() == "dollarcostaverage");
    assert(!dca->usingSimultaneousProcessing());

    auto rsi = loadStrategyByName("rsi", true);
    assert(rsi->usingSimultaneousProcessing());
    assert(!rsi->description().empty());

    expectErrorCode(ErrorCode::StrategyNotFound, [] { loadStrategyByName("moonshot", false); });
    expectErrorCode(ErrorCode::StrategyNotFound, [] { loadStrategyByName("RSI", false); });
}

void test_registry_simultaneous_support() {
    registerStrategy("singleonly", [] { return std::make_unique<SingleOnlyStrategy>(); });
    auto single = loadStrategyByName("singleonly", false);
    assert(!single->supportsSimultaneousProcessing());

    expectErrorCode(ErrorCode::SimultaneousProcessingUnsupported, [] {
        loadStrategyByName("singleonly", true);
    });

    EmptyHoldings holdings;
    expectErrorCode(ErrorCode::SimultaneousProcessingUnsupported, [&] {
        single->onSimultaneousSignals({}, holdings);
    });

    expectErrorCode(ErrorCode::NilArguments, [] { registerStrategy("", nullptr); });
}

// ============================================================================
// Dollar Cost Average
// ============================================================================

void test_dca_always_buys() {
    DollarCostAverageStrategy dca;
    auto data = replayed(kBtc, {100.0, 90.0, 80.0});

    SignalEvent signal = dca.onSignal(*data, Holdings{});
    assert(signal.direction == Direction::Buy);
    assert(signal.key() == kBtc);
    assert(signal.close_price == 80.0);
    assert(signal.timestamp == kT0 + interval::OneHour * 2);
    assert(signal.amount == 0.0 && "portfolio decides the size");
    assert(dca.getSignalsGenerated() == 1);
}

void test_dca_simultaneous() {
    DollarCostAverageStrategy dca;
    auto btc = replayed(kBtc, {100.0});
    auto eth = replayed(kEth, {10.0});
    EmptyHoldings holdings;

    auto signals = dca.onSimultaneousSignals({btc.get(), eth.get()}, holdings);
    assert(signals.size() == 2);
    assert(signals[0].key() == kBtc && signals[1].key() == kEth);
    assert(signals[0].direction == Direction::Buy && signals[1].direction == Direction::Buy);

    expectErrorCode(ErrorCode::NilArguments, [&] {
        dca.onSimultaneousSignals({btc.get(), nullptr}, holdings);
    });
}

void test_dca_requires_data() {
    DollarCostAverageStrategy dca;
    KlineItem item;
    item.exchange = kBtc.exchange;
    item.asset = kBtc.asset;
    item.pair = kBtc.pair;
    item.interval = interval::OneHour;
    item.candles.push_back(flatCandle(kT0, 1.0));
    KlineData untouched(item, IntervalRangeHolder{});
    untouched.load();

    expectErrorCode(ErrorCode::NilArguments, [&] { dca.onSignal(untouched, Holdings{}); });
}

// ============================================================================
// RSI
// ============================================================================

void test_rsi_signals() {
    RSIStrategy rsi;
    CustomSettings settings;
    settings[RSIStrategy::kPeriodKey] = 3.0;
    rsi.setCustomSettings(settings);
    assert(rsi.getConfig().period == 3);

    auto warming = replayed(kBtc, {1.0, 2.0, 3.0});
    SignalEvent hold = rsi.onSignal(*warming, Holdings{});
    assert(hold.direction == Direction::Hold);
    assert(hold.reason == "warming up");

    auto rising = replayed(kBtc, {1.0, 2.0, 3.0, 4.0});
    assert(rsi.onSignal(*rising, Holdings{}).direction == Direction::Sell);

    auto falling = replayed(kBtc, {4.0, 3.0, 2.0, 1.0});
    assert(rsi.onSignal(*falling, Holdings{}).direction == Direction::Buy);

    auto flat = replayed(kBtc, {2.0, 2.0, 2.0, 2.0});
    SignalEvent neutral = rsi.onSignal(*flat, Holdings{});
    assert(neutral.direction == Direction::Hold);
    assert(neutral.reason.find("RSI 50") == 0);

    // +2, -1, +2: gain 4/3, loss 1/3, RSI 80
    auto mixed = replayed(kBtc, {10.0, 12.0, 11.0, 13.0});
    assert(rsi.onSignal(*mixed, Holdings{}).direction == Direction::Sell);

    settings[RSIStrategy::kHighKey] = 85.0;
    rsi.setCustomSettings(settings);
    assert(rsi.onSignal(*mixed, Holdings{}).direction == Direction::Hold);
}

void test_rsi_only_last_period_counts() {
    RSIStrategy rsi;
    CustomSettings settings;
    settings[RSIStrategy::kPeriodKey] = 2.0;
    rsi.setCustomSettings(settings);

    // A long decline followed by two rises
    auto data = replayed(kBtc, {100.0, 80.0, 60.0, 40.0, 41.0, 42.0});
    assert(rsi.onSignal(*data, Holdings{}).direction == Direction::Sell);
}

void test_rsi_settings_validation() {
    RSIStrategy rsi;
    CustomSettings wrong_kind;
    wrong_kind[RSIStrategy::kPeriodKey] = std::string("fourteen");
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(wrong_kind); });

    CustomSettings fractional;
    fractional[RSIStrategy::kPeriodKey] = 2.5;
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(fractional); });

    CustomSettings zero;
    zero[RSIStrategy::kPeriodKey] = 0.0;
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(zero); });

    CustomSettings huge;
    huge[RSIStrategy::kPeriodKey] = 1e30;
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(huge); });

    CustomSettings infinite;
    infinite[RSIStrategy::kPeriodKey] = std::numeric_limits<double>::infinity();
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(infinite); });

    CustomSettings not_a_number;
    not_a_number[RSIStrategy::kHighKey] = std::numeric_limits<double>::quiet_NaN();
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] {
        rsi.setCustomSettings(not_a_number);
    });

    CustomSettings inverted;
    inverted[RSIStrategy::kLowKey] = 80.0;
    inverted[RSIStrategy::kHighKey] = 70.0;
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(inverted); });

    CustomSettings out_of_range;
    out_of_range[RSIStrategy::kHighKey] = 120.0;
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] { rsi.setCustomSettings(out_of_range); });

    // Failed updates leave the configuration untouched
    assert(rsi.getConfig().period == 14);
    assert(rsi.getConfig().high == 70.0);
    assert(rsi.getConfig().low == 30.0);

    CustomSettings unrelated;
    unrelated["something-else"] = true;
    rsi.setCustomSettings(unrelated);

    CustomSettings valid;
    valid[RSIStrategy::kPeriodKey] = 10.0;
    valid[RSIStrategy::kLowKey] = 20.0;
    rsi.setCustomSettings(valid);
    assert(rsi.getConfig().period == 10 && rsi.getConfig().low == 20.0);

    rsi.setDefaults();
    assert(rsi.getConfig().period == 14 && rsi.getConfig().low == 30.0);
}

void test_rsi_simultaneous() {
    RSIStrategy rsi;
    CustomSettings settings;
    settings[RSIStrategy::kPeriodKey] = 2.0;
    rsi.setCustomSettings(settings);

    auto btc = replayed(kBtc, {1.0, 2.0, 3.0});
    auto eth = replayed(kEth, {3.0, 2.0, 1.0});
    EmptyHoldings holdings;
    auto signals = rsi.onSimultaneousSignals({btc.get(), eth.get()}, holdings);
    assert(signals.size() == 2);
    assert(signals[0].direction == Direction::Sell);
    assert(signals[1].direction == Direction::Buy);
}

int main() {
    std::cout << "\n=== Strategy Test Suite ===" << std::endl;
    std::cout << "===========================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Registry Tests:" << std::endl;
    reporter.test("Registry Lookup", test_registry_lookup);
    reporter.test("Simultaneous Support", test_registry_simultaneous_support);

    std::cout << "\nDollar Cost Average Tests:" << std::endl;
    reporter.test("Always Buys", test_dca_always_buys);
    reporter.test("Simultaneous Signals", test_dca_simultaneous);
    reporter.test("Requires Data", test_dca_requires_data);

    std::cout << "\nRSI Tests:" << std::endl;
    reporter.test("RSI Signals", test_rsi_signals);
    reporter.test("Only Last Period Counts", test_rsi_only_last_period_counts);
    reporter.test("Settings Validation", test_rsi_settings_validation);
    reporter.test("RSI Simultaneous", test_rsi_simultaneous);

    return reporter.report();
}
