// csv_loader.hpp
// CSV candle and trade file loading
// Candle rows: timestamp,open,high,low,close,volume
// Trade rows:  timestamp,price,amount (aggregated into candles of the configured interval)
// Timestamps are Unix seconds; a leading header row is skipped

#pragma once

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include "../core/currency.hpp"
#include "../core/exceptions.hpp"
#include "../core/kline.hpp"
#include "../core/logger.hpp"

namespace cryptobt {

class CsvLoader {
public:
    struct CsvConfig {
        char delimiter;
        bool check_data_integrity;

        CsvConfig()
            : delimiter(',')
            , check_data_integrity(true) {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

    struct Trade {
        Timestamp time{0};
        double price = 0.0;
        double amount = 0.0;
    };

private:
    CsvConfig config_;

    std::vector<std::string> splitLine(const std::string& line, char delimiter) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            // Trim whitespace
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        return tokens;
    }

    static bool looksNumeric(const std::string& token) {
        return !token.empty() &&
               (std::isdigit(static_cast<unsigned char>(token[0])) || token[0] == '-');
    }

    // Calls on_row for every data row; header and blank lines are skipped
    template <typename RowFn>
    void readRows(const std::string& filepath, size_t min_columns, RowFn on_row) const {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw DataException("failed to open CSV file: " + filepath);
        }

        std::string line;
        size_t line_num = 0;
        while (std::getline(file, line)) {
            line_num++;
            auto tokens = splitLine(line, config_.delimiter);
            if (tokens.empty() || (tokens.size() == 1 && tokens[0].empty())) continue;
            if (line_num == 1 && !looksNumeric(tokens[0])) continue;

            if (tokens.size() < min_columns) {
                throw DataException("invalid CSV format at line " + std::to_string(line_num) +
                                    " of " + filepath);
            }
            try {
                on_row(tokens);
            } catch (const std::logic_error& e) {
                // std::stod / std::stoll report malformed numbers as logic errors
                throw DataException("error parsing line " + std::to_string(line_num) +
                                    " of " + filepath + ": " + e.what());
            }
        }
    }

public:
    CsvLoader() : config_(CsvConfig::getDefault()) {}
    explicit CsvLoader(const CsvConfig& config) : config_(config) {}

    KlineItem loadCandles(const std::string& filepath, const PairKey& key, Interval interval) const {
        KlineItem item;
        item.exchange = key.exchange;
        item.asset = key.asset;
        item.pair = key.pair;
        item.interval = interval;

        readRows(filepath, 6, [&](const std::vector<std::string>& tokens) {
            Candle candle;
            candle.time = fromUnixSeconds(std::stoll(tokens[0]));
            candle.open = std::stod(tokens[1]);
            candle.high = std::stod(tokens[2]);
            candle.low = std::stod(tokens[3]);
            candle.close = std::stod(tokens[4]);
            candle.volume = std::stod(tokens[5]);
            if (config_.check_data_integrity && !candle.validate()) {
                throw DataException("invalid candle at " +
                                    std::to_string(toUnixSeconds(candle.time)) + " in " + filepath);
            }
            item.candles.push_back(candle);
        });

        if (item.candles.empty()) {
            throw DataException("no valid candles loaded from: " + filepath);
        }
        item.sortCandles();
        CRYPTOBT_LOG_INFO(logtag::Data, "loaded " << item.candles.size() << " candles from "
                          << filepath);
        return item;
    }

    std::vector<Trade> loadTrades(const std::string& filepath) const {
        std::vector<Trade> trades;
        readRows(filepath, 3, [&](const std::vector<std::string>& tokens) {
            Trade trade;
            trade.time = fromUnixSeconds(std::stoll(tokens[0]));
            trade.price = std::stod(tokens[1]);
            trade.amount = std::stod(tokens[2]);
            if (config_.check_data_integrity && (trade.price <= 0 || trade.amount < 0)) {
                throw DataException("invalid trade at " +
                                    std::to_string(toUnixSeconds(trade.time)) + " in " + filepath);
            }
            trades.push_back(trade);
        });
        if (trades.empty()) {
            throw DataException("no valid trades loaded from: " + filepath);
        }
        std::stable_sort(trades.begin(), trades.end(),
                         [](const Trade& a, const Trade& b) { return a.time < b.time; });
        return trades;
    }

    // Buckets trades by interval start; open/close follow trade order within a bucket
    static std::vector<Candle> tradesToCandles(const std::vector<Trade>& trades, Interval interval) {
        if (interval.count() <= 0) {
            throw DataException("cannot convert trades to candles: candle interval unset",
                                ErrorCode::IntervalUnset);
        }
        std::map<Timestamp::rep, Candle> buckets;
        for (const auto& trade : trades) {
            Timestamp start = truncateToInterval(trade.time, interval);
            auto it = buckets.find(start.count());
            if (it == buckets.end()) {
                Candle candle;
                candle.time = start;
                candle.open = candle.high = candle.low = candle.close = trade.price;
                candle.volume = trade.amount;
                buckets.emplace(start.count(), candle);
                continue;
            }
            Candle& candle = it->second;
            candle.high = std::max(candle.high, trade.price);
            candle.low = std::min(candle.low, trade.price);
            candle.close = trade.price;
            candle.volume += trade.amount;
        }

        std::vector<Candle> candles;
        candles.reserve(buckets.size());
        for (const auto& [_, candle] : buckets) candles.push_back(candle);
        return candles;
    }

    KlineItem loadTradesAsCandles(const std::string& filepath, const PairKey& key,
                                  Interval interval) const {
        KlineItem item;
        item.exchange = key.exchange;
        item.asset = key.asset;
        item.pair = key.pair;
        item.interval = interval;
        item.candles = tradesToCandles(loadTrades(filepath), interval);
        CRYPTOBT_LOG_INFO(logtag::Data, "aggregated trades from " << filepath << " into "
                          << item.candles.size() << " " << intervalToString(interval)
                          << " candles");
        return item;
    }
};

} // namespace cryptobt
