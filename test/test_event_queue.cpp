// test_event_queue.cpp
// Unit tests for events, the event queue, kline ranges, config validation and the stop signal

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <variant>
#include "test_helpers.hpp"
#include "../include/builders/event_builders.hpp"
#include "../include/config/config.hpp"
#include "../include/core/event_types.hpp"
#include "../include/core/kline.hpp"
#include "../include/core/stop_signal.hpp"
#include "../include/engine/event_queue.hpp"

using namespace cryptobt;
using namespace cryptobt::testing;

namespace {

const PairKey kKey("binance", AssetType::Spot, CurrencyPair("btc", "usdt"));
const Timestamp kT0 = fromUnixSeconds(1609459200);  // 2021-01-01

DataEvent makeData(Timestamp ts, double close) {
    return DataEventBuilder()
        .withKey(kKey)
        .withOHLC(close, close, close, close)
        .withVolume(1.0)
        .withInterval(interval::FifteenMin)
        .withTimestamp(ts)
        .build();
}

} // namespace

// ============================================================================
// Events
// ============================================================================

void test_event_identity() {
    DataEvent data = makeData(kT0, 100.0);
    assert(data.validate());
    assert(data.key() == kKey);
    assert(data.pair.base == "BTC" && data.pair.quote == "USDT");

    SignalEvent signal(data);
    signal.direction = Direction::Buy;
    assert(signal.validate());
    assert(signal.key() == kKey);
    assert(signal.timestamp == kT0);
    assert(signal.close_price == 100.0);

    OrderEvent order(signal);
    assert(!order.validate() && "order without amount or id is invalid");
    order.amount = 1.0;
    order.order_id = "ORD_1";
    assert(order.validate());

    order.order_type = OrderType::Limit;
    assert(!order.validate() && "limit order needs a price");
    order.limit_price = 99.0;
    assert(order.validate());

    FillEvent fill(order);
    assert(fill.key() == kKey);
    assert(!fill.isFilled());
    assert(fill.order_id == "ORD_1");

    FillEvent rejected = FillEvent::rejected(signal, "no funds");
    assert(rejected.direction == Direction::DoNothing);
    assert(rejected.status == OrderStatus::Rejected);
    assert(rejected.reason == "no funds");
    assert(rejected.validate());
}

void test_event_validation_failures() {
    DataEvent missing_identity;
    missing_identity.close = missing_identity.open = missing_identity.high =
        missing_identity.low = 1.0;
    missing_identity.timestamp = kT0;
    assert(!missing_identity.validate());

    expectErrorCode(ErrorCode::DataUnavailable, [] {
        DataEventBuilder().withKey(kKey).withOHLC(10, 9, 11, 10).withTimestamp(kT0).build();
    });
    expectErrorCode(ErrorCode::DataUnavailable, [] {
        DataEventBuilder().withKey(kKey).withOHLC(10, 10, 10, 10).build();
    });
}

void test_event_utilities() {
    EventVariant ev = makeData(kT0, 5.0);
    assert(std::string(getEventTypeName(ev)) == "DataEvent");
    assert(getEventTimestamp(ev) == kT0);
    assert(getEventKey(ev) == kKey);
    assert(validateEvent(ev));

    SignalEvent signal(std::get<DataEvent>(ev));
    EventVariant sv = signal;
    assert(std::string(getEventTypeName(sv)) == "SignalEvent");
}

void test_sequence_ids_increase() {
    DataEvent a = makeData(kT0, 1.0);
    DataEvent b = makeData(kT0 + interval::FifteenMin, 1.0);
    assert(b.sequence_id > a.sequence_id);
}

// ============================================================================
// Event Queue
// ============================================================================

void test_queue_fifo() {
    EventQueue queue;
    assert(queue.empty());
    assert(!queue.pop().has_value());
    assert(queue.peek() == nullptr);

    DataEvent first = makeData(kT0, 1.0);
    SignalEvent second(first);
    DataEvent third = makeData(kT0 + interval::FifteenMin, 2.0);
    queue.push(EventVariant(first));
    queue.push(EventVariant(second));
    queue.push(EventVariant(third));
    assert(queue.size() == 3);

    assert(std::holds_alternative<DataEvent>(*queue.peek()));
    auto a = queue.pop();
    auto b = queue.pop();
    auto c = queue.pop();
    assert(a && std::get<DataEvent>(*a).close == 1.0);
    assert(b && std::holds_alternative<SignalEvent>(*b));
    assert(c && std::get<DataEvent>(*c).close == 2.0);
    assert(!queue.pop().has_value());
}

void test_queue_push_mid_drain() {
    EventQueue queue;
    queue.push(EventVariant(makeData(kT0, 1.0)));
    queue.push(EventVariant(makeData(kT0 + interval::FifteenMin, 2.0)));

    auto head = queue.pop();
    queue.push(EventVariant(SignalEvent(std::get<DataEvent>(*head))));

    // The follow-up goes behind what was already queued
    auto next = queue.pop();
    assert(std::holds_alternative<DataEvent>(*next));
    auto last = queue.pop();
    assert(std::holds_alternative<SignalEvent>(*last));
}

void test_queue_stats() {
    EventQueue queue;
    for (int i = 0; i < 5; ++i) {
        queue.push(EventVariant(makeData(kT0 + interval::OneMin * i, 1.0)));
    }
    queue.pop();
    queue.pop();
    auto stats = queue.getStats();
    assert(stats.total_published == 5);
    assert(stats.total_consumed == 2);
    assert(stats.current_size == 3);
    assert(stats.high_water_mark == 5);

    queue.clear();
    assert(queue.empty());
    queue.resetStats();
    stats = queue.getStats();
    assert(stats.total_published == 0 && stats.high_water_mark == 0);
}

// ============================================================================
// Kline ranges
// ============================================================================

void test_interval_range_batches() {
    Timestamp end = kT0 + interval::OneHour * 10;
    IntervalRangeHolder holder = createIntervalRange(kT0, end, interval::OneHour, 4);
    assert(holder.intervalCount() == 10);
    assert(holder.ranges.size() == 3);
    assert(holder.ranges[0].intervals.size() == 4);
    assert(holder.ranges[2].intervals.size() == 2);
    assert(holder.ranges[1].start == kT0 + interval::OneHour * 4);

    std::vector<Candle> candles;
    for (int i = 0; i < 10; ++i) {
        if (i == 3 || i == 7) continue;
        Candle c;
        c.time = kT0 + interval::OneHour * i;
        c.open = c.high = c.low = c.close = 1.0;
        candles.push_back(c);
    }
    holder.setHasDataFromCandles(candles);
    assert(holder.hasDataAtTime(kT0));
    assert(!holder.hasDataAtTime(kT0 + interval::OneHour * 3));
    assert(holder.missingIntervals().size() == 2);
    assert(!holder.hasDataAtTime(end + interval::OneHour));
}

void test_interval_range_errors() {
    expectErrorCode(ErrorCode::IntervalUnset, [] {
        createIntervalRange(kT0, kT0 + interval::OneHour, Interval(0));
    });
    expectErrorCode(ErrorCode::StartEndUnset, [] {
        createIntervalRange(kT0, kT0, interval::OneHour);
    });
    expectErrorCode(ErrorCode::StartEndUnset, [] {
        createIntervalRange(Timestamp(0), kT0, interval::OneHour);
    });
}

void test_supported_intervals() {
    assert(isSupportedInterval(interval::FifteenMin));
    assert(isSupportedInterval(interval::OneWeek));
    assert(!isSupportedInterval(std::chrono::minutes(7)));
    assert(intervalToString(interval::FifteenMin) == "15m");
    assert(intervalToString(interval::FourHour) == "4h");
    assert(intervalToString(interval::OneDay) == "1d");
    assert(truncateToInterval(kT0 + std::chrono::minutes(20), interval::FifteenMin) ==
           kT0 + interval::FifteenMin);
}

// ============================================================================
// Config
// ============================================================================

void test_custom_settings() {
    CustomSettings settings;
    settings["name"] = std::string("moto");
    settings["period"] = 14.0;
    settings["enabled"] = true;

    assert(getSetting<std::string>(settings, "name").value() == "moto");
    assert(getSetting<double>(settings, "period").value() == 14.0);
    assert(getSetting<bool>(settings, "enabled").value());
    assert(!getSetting<double>(settings, "missing").has_value());
    expectErrorCode(ErrorCode::InvalidCustomSetting, [&] {
        getSetting<double>(settings, "name");
    });
}

void test_data_settings_validation() {
    DataSettings data;
    expectErrorCode(ErrorCode::NoDataSource, [&] { validateDataSettings(data); });

    data.csv_data = CSVData{"prices.csv"};
    data.api_data = APIData{};
    expectErrorCode(ErrorCode::AmbiguousDataSource, [&] { validateDataSettings(data); });

    data.csv_data.reset();
    data.data_type = "orderbook";
    expectErrorCode(ErrorCode::UnrecognisedDataType, [&] { validateDataSettings(data); });

    data.data_type = kTradeStr;
    expectErrorCode(ErrorCode::UnrecognisedDataType, [&] { validateDataSettings(data); });

    data.data_type = kCandleStr;
    expectErrorCode(ErrorCode::StartEndUnset, [&] { validateDataSettings(data); });

    data.api_data->start_date = kT0;
    data.api_data->end_date = kT0 + interval::OneDay;
    expectErrorCode(ErrorCode::IntervalUnset, [&] { validateDataSettings(data); });

    data.interval = std::chrono::minutes(7);
    expectErrorCode(ErrorCode::IntervalUnset, [&] { validateDataSettings(data); });

    data.interval = interval::FifteenMin;
    validateDataSettings(data);
}

void test_min_max_validation() {
    Config cfg;
    cfg.portfolio_settings.buy_side.minimum_size = 2.0;
    cfg.portfolio_settings.buy_side.maximum_size = 1.0;
    expectErrorCode(ErrorCode::InvalidMinMax, [&] { validateMinMax(cfg); });

    cfg.portfolio_settings.buy_side.maximum_size = 0.0;
    validateMinMax(cfg);
}

// ============================================================================
// Stop signal
// ============================================================================

void test_stop_signal() {
    StopSignal stop;
    assert(!stop.stopRequested());
    assert(!stop.waitFor(std::chrono::milliseconds(1)));

    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.requestStop();
    });
    auto start = std::chrono::steady_clock::now();
    bool stopped = stop.waitFor(std::chrono::seconds(10));
    auto waited = std::chrono::steady_clock::now() - start;
    stopper.join();

    assert(stopped);
    assert(waited < std::chrono::seconds(5) && "waiter wakes as soon as stop is requested");
    assert(!stop.requestStop() && "second stop is a no-op");

    stop.reset();
    assert(!stop.stopRequested());
}

int main() {
    std::cout << "\n=== Events and Event Queue Test Suite ===" << std::endl;
    std::cout << "==========================================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Event Tests:" << std::endl;
    reporter.test("Event Identity", test_event_identity);
    reporter.test("Event Validation Failures", test_event_validation_failures);
    reporter.test("Event Utilities", test_event_utilities);
    reporter.test("Sequence Ids", test_sequence_ids_increase);

    std::cout << "\nEvent Queue Tests:" << std::endl;
    reporter.test("FIFO Order", test_queue_fifo);
    reporter.test("Push While Draining", test_queue_push_mid_drain);
    reporter.test("Queue Stats", test_queue_stats);

    std::cout << "\nKline Range Tests:" << std::endl;
    reporter.test("Interval Range Batches", test_interval_range_batches);
    reporter.test("Interval Range Errors", test_interval_range_errors);
    reporter.test("Supported Intervals", test_supported_intervals);

    std::cout << "\nConfig Tests:" << std::endl;
    reporter.test("Custom Settings", test_custom_settings);
    reporter.test("Data Settings Validation", test_data_settings_validation);
    reporter.test("MinMax Validation", test_min_max_validation);

    std::cout << "\nStop Signal Tests:" << std::endl;
    reporter.test("Stop Signal", test_stop_signal);

    return reporter.report();
}
