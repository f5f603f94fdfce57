// cli_options.hpp
// Command line options of the backtest application and their conversion to a Config

#pragma once

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include "../config/config.hpp"
#include "../strategies/dollar_cost_average.hpp"

namespace cryptobt {

// ============================================================================
// Command Line Argument Parser
// ============================================================================

struct CliOptions {
    std::string csv_file;
    std::string data_type = kCandleStr;
    std::string exchange = "binance";
    std::string asset = "spot";
    std::string base = "BTC";
    std::string quote = "USDT";
    long interval_seconds = 3600;
    double funds = 10000.0;
    double maker_fee = 0.001;
    double taker_fee = 0.001;
    std::string strategy = DollarCostAverageStrategy::kName;
    CustomSettings settings;
    bool simultaneous = false;
    std::string output_file = "backtest_report.txt";
    bool verbose = false;
};

// Numbers become doubles, true/false become booleans, anything else stays text
inline SettingValue parseSettingValue(const std::string& text) {
    if (text == "true") return SettingValue(true);
    if (text == "false") return SettingValue(false);
    try {
        size_t consumed = 0;
        double number = std::stod(text, &consumed);
        if (consumed == text.size()) return SettingValue(number);
    } catch (const std::logic_error&) {
        // not a number
    }
    return SettingValue(text);
}

// Whole text must convert; prints the offending flag otherwise
inline bool parseNumber(const std::string& flag, const std::string& text, long& out) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed == text.size()) {
            out = value;
            return true;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    std::cerr << "Invalid number for " << flag << ": " << text << std::endl;
    return false;
}

inline bool parseNumber(const std::string& flag, const std::string& text, double& out) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == text.size()) {
            out = value;
            return true;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    std::cerr << "Invalid number for " << flag << ": " << text << std::endl;
    return false;
}

inline bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return false;
        }
        else if (arg == "--csv" && i + 1 < argc) {
            options.csv_file = argv[++i];
        }
        else if (arg == "--data-type" && i + 1 < argc) {
            options.data_type = argv[++i];
        }
        else if (arg == "--exchange" && i + 1 < argc) {
            options.exchange = argv[++i];
        }
        else if (arg == "--asset" && i + 1 < argc) {
            options.asset = argv[++i];
        }
        else if (arg == "--base" && i + 1 < argc) {
            options.base = argv[++i];
        }
        else if (arg == "--quote" && i + 1 < argc) {
            options.quote = argv[++i];
        }
        else if (arg == "--interval" && i + 1 < argc) {
            if (!parseNumber(arg, argv[++i], options.interval_seconds)) return false;
        }
        else if (arg == "--funds" && i + 1 < argc) {
            if (!parseNumber(arg, argv[++i], options.funds)) return false;
        }
        else if (arg == "--maker-fee" && i + 1 < argc) {
            if (!parseNumber(arg, argv[++i], options.maker_fee)) return false;
        }
        else if (arg == "--taker-fee" && i + 1 < argc) {
            if (!parseNumber(arg, argv[++i], options.taker_fee)) return false;
        }
        else if (arg == "--strategy" && i + 1 < argc) {
            options.strategy = argv[++i];
        }
        else if (arg == "--setting" && i + 1 < argc) {
            std::string setting = argv[++i];
            size_t eq = setting.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Invalid setting (expected KEY=VALUE): " << setting << std::endl;
                return false;
            }
            options.settings[setting.substr(0, eq)] = parseSettingValue(setting.substr(eq + 1));
        }
        else if (arg == "--simultaneous") {
            options.simultaneous = true;
        }
        else if (arg == "--output" && i + 1 < argc) {
            options.output_file = argv[++i];
        }
        else if (arg == "--verbose") {
            options.verbose = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    if (options.csv_file.empty()) {
        std::cerr << "A CSV file is required" << std::endl;
        return false;
    }
    return true;
}

inline Config buildConfig(const CliOptions& options) {
    Config cfg = Config::getDefault();
    cfg.nickname = "cli";
    cfg.goal = "CSV backtest of " + options.base + "/" + options.quote;
    cfg.verbose = options.verbose;

    cfg.strategy_settings.name = options.strategy;
    cfg.strategy_settings.simultaneous_signal_processing = options.simultaneous;
    cfg.strategy_settings.custom_settings = options.settings;

    CurrencySettings cs;
    cs.exchange_name = options.exchange;
    cs.asset = options.asset;
    cs.base = options.base;
    cs.quote = options.quote;
    cs.initial_funds = options.funds;
    cs.maker_fee = options.maker_fee;
    cs.taker_fee = options.taker_fee;
    cfg.currency_settings.push_back(cs);

    cfg.data_settings.interval = std::chrono::seconds(options.interval_seconds);
    cfg.data_settings.data_type = options.data_type;
    cfg.data_settings.csv_data = CSVData{options.csv_file};
    return cfg;
}

} // namespace cryptobt
