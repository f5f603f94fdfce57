// config.hpp
// Backtest configuration structures and semantic validation
// Parsing a config file is left to the caller; these are the in-memory settings

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../core/currency.hpp"
#include "../core/exceptions.hpp"
#include "../core/kline.hpp"

namespace cryptobt {

// ============================================================================
// Strategy custom settings: weakly typed key -> value bag
// ============================================================================

using SettingValue = std::variant<std::string, double, bool>;
using CustomSettings = std::map<std::string, SettingValue>;

// Returns nullopt when the key is absent. Throws when present with another kind.
template <typename T>
std::optional<T> getSetting(const CustomSettings& settings, const std::string& key) {
    auto it = settings.find(key);
    if (it == settings.end()) return std::nullopt;
    if (const T* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    throw ConfigException(ErrorCode::InvalidCustomSetting,
                          "invalid custom setting '" + key + "': unexpected value kind");
}

// ============================================================================
// Data type strings
// ============================================================================

constexpr const char* kCandleStr = "candle";
constexpr const char* kTradeStr = "trade";

enum class DataType { Candle, Trade };

// ============================================================================
// Settings structures
// ============================================================================

struct MinMax {
    double minimum_size = 0.0;   // 0 = no minimum
    double maximum_size = 0.0;   // 0 = no maximum
    double maximum_total = 0.0;  // quote value cap per order, 0 = no cap

    bool validate() const {
        if (minimum_size < 0 || maximum_size < 0 || maximum_total < 0) return false;
        return maximum_size == 0.0 || minimum_size <= maximum_size;
    }
};

struct CurrencySettings {
    std::string exchange_name;
    std::string asset;
    std::string base;
    std::string quote;

    double initial_funds = 0.0;
    double maker_fee = 0.0;  // fraction of notional, e.g. 0.001 == 0.1%
    double taker_fee = 0.0;

    MinMax buy_side;
    MinMax sell_side;

    double maximum_holdings_ratio = 0.0;  // pair value / total value, 0 = unlimited
    double max_exposure = 0.0;            // quote value held in the pair, 0 = unlimited
    double slippage_bps = 0.0;

    PairKey key() const {
        return PairKey(lowerExchangeName(exchange_name), assetTypeFromString(asset),
                       CurrencyPair(base, quote));
    }
};

struct StrategySettings {
    std::string name;
    bool simultaneous_signal_processing = false;
    CustomSettings custom_settings;
};

struct APIData {
    Timestamp start_date{0};
    Timestamp end_date{0};
    bool inclusive_end_date = false;
};

struct DatabaseData {
    Timestamp start_date{0};
    Timestamp end_date{0};
    bool inclusive_end_date = false;
};

struct CSVData {
    std::string full_path;
};

struct LiveData {
    std::string api_key_override;
    std::string api_secret_override;
    std::string api_client_id_override;
    std::string api_2fa_override;
    bool authenticated_data = false;

    bool hasOverrides() const {
        return !api_key_override.empty() || !api_secret_override.empty() ||
               !api_client_id_override.empty() || !api_2fa_override.empty();
    }
};

struct DataSettings {
    Interval interval{0};
    std::string data_type;
    std::optional<APIData> api_data;
    std::optional<DatabaseData> database_data;
    std::optional<CSVData> csv_data;
    std::optional<LiveData> live_data;

    size_t sourceCount() const {
        return (api_data ? 1 : 0) + (database_data ? 1 : 0) +
               (csv_data ? 1 : 0) + (live_data ? 1 : 0);
    }
};

struct PortfolioSettings {
    MinMax buy_side;
    MinMax sell_side;
};

struct StatisticSettings {
    double risk_free_rate = 0.0;  // per-period rate used for the Sharpe ratio
};

struct Config {
    std::string nickname;
    std::string goal;
    bool verbose = false;
    StrategySettings strategy_settings;
    std::vector<CurrencySettings> currency_settings;
    DataSettings data_settings;
    PortfolioSettings portfolio_settings;
    StatisticSettings statistic_settings;

    static Config getDefault() {
        return Config();
    }
};

// ============================================================================
// Semantic validation
// ============================================================================

inline DataType parseDataType(const std::string& value) {
    if (value == kCandleStr) return DataType::Candle;
    if (value == kTradeStr) return DataType::Trade;
    throw ConfigException(ErrorCode::UnrecognisedDataType,
                          "unrecognised dataType '" + value + "'");
}

// Initial funds and asset of each pair
inline void validateCurrencySettings(const std::vector<CurrencySettings>& settings) {
    if (settings.empty()) {
        throw ConfigException(ErrorCode::NoCurrencySettings,
                              "no currency settings set in config");
    }
    for (const auto& cs : settings) {
        if (cs.initial_funds <= 0) {
            throw ConfigException(ErrorCode::BadInitialFunds,
                                  "initial funds must be greater than zero for " +
                                  cs.exchange_name + " " + cs.base + "/" + cs.quote);
        }
        if (assetTypeFromString(cs.asset) == AssetType::Empty) {
            throw ConfigException(ErrorCode::UnsetAsset,
                                  "asset type unset for " + cs.exchange_name + " " +
                                  cs.base + "/" + cs.quote);
        }
    }
}

inline void validateDateRange(Timestamp start, Timestamp end) {
    if (start.count() == 0 || end.count() == 0 || start >= end) {
        throw ConfigException(ErrorCode::StartEndUnset,
                              "data start or end dates are invalid: start " +
                              std::to_string(toUnixSeconds(start)) + " end " +
                              std::to_string(toUnixSeconds(end)));
    }
}

inline void validateInterval(Interval value) {
    if (value.count() <= 0 || !isSupportedInterval(value)) {
        throw ConfigException(ErrorCode::IntervalUnset,
                              "candle interval unset or unsupported: " +
                              intervalToString(value));
    }
}

// Data source, data type, date range and interval, in that order
inline void validateDataSettings(const DataSettings& data) {
    if (data.sourceCount() == 0) {
        throw ConfigException(ErrorCode::NoDataSource, "no data settings set in config");
    }
    if (data.sourceCount() > 1) {
        throw ConfigException(ErrorCode::AmbiguousDataSource,
                              "multiple data sources set in config");
    }
    DataType type = parseDataType(data.data_type);
    if (type == DataType::Trade && !data.csv_data) {
        throw ConfigException(ErrorCode::UnrecognisedDataType,
                              "unrecognised dataType 'trade' for non-CSV data source");
    }
    if (data.api_data) {
        validateDateRange(data.api_data->start_date, data.api_data->end_date);
    }
    if (data.database_data) {
        validateDateRange(data.database_data->start_date, data.database_data->end_date);
    }
    validateInterval(data.interval);
}

inline void validateMinMax(const Config& cfg) {
    auto check = [](const MinMax& mm, const std::string& where) {
        if (!mm.validate()) {
            throw ConfigException(ErrorCode::InvalidMinMax,
                                  "minimum size exceeds maximum size or negative bound: " + where);
        }
    };
    check(cfg.portfolio_settings.buy_side, "portfolio buy side");
    check(cfg.portfolio_settings.sell_side, "portfolio sell side");
    for (const auto& cs : cfg.currency_settings) {
        check(cs.buy_side, cs.base + "/" + cs.quote + " buy side");
        check(cs.sell_side, cs.base + "/" + cs.quote + " sell side");
    }
}

} // namespace cryptobt
