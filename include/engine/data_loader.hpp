// data_loader.hpp
// Builds the data handler for one currency from the configured source
// API, database, CSV and live sources; exactly one is selected at setup

#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include "../config/config.hpp"
#include "../core/exceptions.hpp"
#include "../core/kline.hpp"
#include "../core/logger.hpp"
#include "../core/stop_signal.hpp"
#include "../data/csv_loader.hpp"
#include "../data/kline_data.hpp"
#include "../data/live_kline_data.hpp"
#include "../interfaces/data_handler.hpp"
#include "../interfaces/host_engine.hpp"

namespace cryptobt {

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

inline void logMissingIntervals(const IntervalRangeHolder& range, const PairKey& key) {
    for (const auto& missing : range.missingIntervals()) {
        CRYPTOBT_LOG_WARN(logtag::Setup, key.toString() << " missing data at "
                          << toUnixSeconds(missing.start));
    }
}

inline std::unique_ptr<KlineData> makeKlineData(KlineItem item, IntervalRangeHolder range) {
    auto data = std::make_unique<KlineData>(std::move(item), std::move(range));
    data->load();
    return data;
}

// Keeps only candles inside [start, end)
inline void clampCandles(KlineItem& item, Timestamp start, Timestamp end) {
    auto outside = [&](const Candle& c) { return c.time < start || c.time >= end; };
    item.candles.erase(std::remove_if(item.candles.begin(), item.candles.end(), outside),
                       item.candles.end());
}

} // namespace detail

// ============================================================================
// API
// ============================================================================

// Eagerly fetches [start, end) in batches of the exchange's request limit
inline std::unique_ptr<KlineData> loadAPIData(const APIData& api, IExchange* exchange,
                                              const PairKey& key, Interval interval) {
    if (!exchange) {
        throw DataException("nil exchange received", ErrorCode::NilArguments);
    }
    Timestamp end = api.end_date;
    if (api.inclusive_end_date) {
        end += interval;
    }
    validateDateRange(api.start_date, end);
    validateInterval(interval);

    IntervalRangeHolder range = createIntervalRange(api.start_date, end, interval,
                                                    exchange->candleRequestLimit());
    KlineItem item;
    item.exchange = key.exchange;
    item.asset = key.asset;
    item.pair = key.pair;
    item.interval = interval;

    for (const auto& batch : range.ranges) {
        KlineItem fetched = exchange->getHistoricCandles(key.pair, key.asset, batch.start,
                                                         batch.end, interval);
        item.candles.insert(item.candles.end(), fetched.candles.begin(), fetched.candles.end());
    }
    detail::clampCandles(item, range.start, range.end);
    if (item.candles.empty()) {
        throw DataException("no candle data returned by " + exchange->name() + " for " +
                            key.toString());
    }

    range.setHasDataFromCandles(item.candles);
    detail::logMissingIntervals(range, key);
    CRYPTOBT_LOG_INFO(logtag::Setup, "fetched " << item.candles.size() << " "
                      << intervalToString(interval) << " candles for " << key.toString()
                      << " in " << range.ranges.size() << " request(s)");
    return detail::makeKlineData(std::move(item), std::move(range));
}

// ============================================================================
// Database
// ============================================================================

inline std::unique_ptr<KlineData> loadDatabaseData(const DataSettings* cfg,
                                                   const std::string& exchange_name,
                                                   const CurrencyPair& pair, AssetType asset,
                                                   DataType data_type, IHostEngine* host) {
    if (!cfg || !cfg->database_data) {
        throw DataException("nil config data received", ErrorCode::NilArguments);
    }
    const DatabaseData& db = *cfg->database_data;
    if (db.start_date.count() == 0 || db.end_date.count() == 0 || db.start_date >= db.end_date) {
        throw DataException("database data start or end dates are invalid",
                            ErrorCode::StartEndUnset);
    }
    if (cfg->interval.count() <= 0) {
        throw DataException("database data candle interval unset", ErrorCode::IntervalUnset);
    }
    if (exchange_name.empty() || pair.base.empty() || pair.quote.empty() ||
        asset == AssetType::Empty) {
        throw DataException("exchange, base, quote, asset, interval, start & end cannot be empty",
                            ErrorCode::EmptyDatabaseQuery);
    }
    if (data_type != DataType::Candle) {
        throw DataException("unrecognised dataType for database source",
                            ErrorCode::UnrecognisedDataType);
    }

    IKlineDatabase* database = host ? host->database() : nullptr;
    if (!database || !database->enabled()) {
        throw DataException("database support is disabled", ErrorCode::DatabaseDisabled);
    }

    Timestamp end = db.inclusive_end_date ? db.end_date + cfg->interval : db.end_date;
    IntervalRangeHolder range = createIntervalRange(db.start_date, end, cfg->interval);
    KlineItem item = database->getCandles(lowerExchangeName(exchange_name), pair, asset,
                                          cfg->interval, range.start, range.end);
    item.exchange = lowerExchangeName(exchange_name);
    item.pair = pair;
    item.asset = asset;
    item.interval = cfg->interval;
    detail::clampCandles(item, range.start, range.end);
    if (item.candles.empty()) {
        throw DataException("no candle data in database for " + exchange_name + " " +
                            pair.toString());
    }
    range.setHasDataFromCandles(item.candles);
    detail::logMissingIntervals(range, PairKey(item.exchange, asset, pair));
    return detail::makeKlineData(std::move(item), std::move(range));
}

// ============================================================================
// CSV
// ============================================================================

inline std::unique_ptr<KlineData> loadCSVData(const CSVData& csv, const PairKey& key,
                                              Interval interval, DataType data_type) {
    if (csv.full_path.empty()) {
        throw DataException("no CSV file path set", ErrorCode::NilArguments);
    }
    CsvLoader loader;
    KlineItem item = data_type == DataType::Trade
        ? loader.loadTradesAsCandles(csv.full_path, key, interval)
        : loader.loadCandles(csv.full_path, key, interval);
    return detail::makeKlineData(std::move(item), IntervalRangeHolder{});
}

// ============================================================================
// Live
// ============================================================================

// Applies credential overrides and checks them before any polling starts
inline std::unique_ptr<LiveKlineData> loadLiveData(const DataSettings* cfg, IExchange* exchange,
                                                   const PairKey& key,
                                                   std::shared_ptr<StopSignal> stop) {
    if (!cfg || !exchange || !cfg->live_data) {
        throw DataException("received nil argument(s)", ErrorCode::NilArguments);
    }
    const LiveData& live = *cfg->live_data;

    // The exchange is only updated once every check has passed
    ExchangeCredentials creds = exchange->credentials();
    if (live.hasOverrides()) {
        if (!live.api_key_override.empty()) creds.key = live.api_key_override;
        if (!live.api_secret_override.empty()) creds.secret = live.api_secret_override;
        if (!live.api_client_id_override.empty()) creds.client_id = live.api_client_id_override;
        if (!live.api_2fa_override.empty()) creds.one_time_password = live.api_2fa_override;
    }

    if (live.authenticated_data) {
        if (!live.hasOverrides() && creds.isEmpty()) {
            throw DataException("received nil argument(s): " + exchange->name() +
                                " has no credentials for authenticated live data",
                                ErrorCode::NilArguments);
        }
        if (!exchange->credentialsValidator().satisfiedBy(creds)) {
            throw ConfigException(ErrorCode::InvalidCredentials,
                                  "credentials do not satisfy exchange requirements for " +
                                  exchange->name());
        }
    }

    validateInterval(cfg->interval);
    if (live.hasOverrides()) {
        exchange->setCredentials(creds);
        exchange->setAuthenticatedSupport(true);
    }
    CRYPTOBT_LOG_INFO(logtag::Setup, "live data for " << key.toString() << " every "
                      << intervalToString(cfg->interval));
    return std::make_unique<LiveKlineData>(exchange, key, cfg->interval, std::move(stop));
}

// ============================================================================
// Source selection
// ============================================================================

inline std::unique_ptr<IDataHandler> loadData(const DataSettings& cfg, IExchange* exchange,
                                              const PairKey& key, IHostEngine* host,
                                              std::shared_ptr<StopSignal> stop) {
    DataType data_type = parseDataType(cfg.data_type);
    if (cfg.sourceCount() == 0) {
        throw ConfigException(ErrorCode::NoDataSource, "no data settings set in config");
    }
    if (cfg.sourceCount() > 1) {
        throw ConfigException(ErrorCode::AmbiguousDataSource, "multiple data sources set in config");
    }

    if (cfg.api_data) {
        if (data_type != DataType::Candle) {
            throw ConfigException(ErrorCode::UnrecognisedDataType,
                                  "unrecognised dataType for API source");
        }
        return loadAPIData(*cfg.api_data, exchange, key, cfg.interval);
    }
    if (cfg.database_data) {
        try {
            return loadDatabaseData(&cfg, key.exchange, key.pair, key.asset, data_type, host);
        } catch (const DataException& e) {
            if (e.code() != ErrorCode::DatabaseDisabled) throw;
            throw DataException(std::string("unable to retrieve data from database: ") + e.what(),
                                ErrorCode::DatabaseDisabled);
        }
    }
    if (cfg.csv_data) {
        return loadCSVData(*cfg.csv_data, key, cfg.interval, data_type);
    }
    if (data_type != DataType::Candle) {
        throw ConfigException(ErrorCode::UnrecognisedDataType,
                              "unrecognised dataType for live source");
    }
    return loadLiveData(&cfg, exchange, key, std::move(stop));
}

} // namespace cryptobt
