// main.cpp
// Crypto Backtesting Engine
// CSV-driven backtest of one pair against an offline host engine

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>

#include "app/cli_options.hpp"
#include "engine/backtest.hpp"
#include "core/exceptions.hpp"
#include "core/logger.hpp"
#include "interfaces/host_engine.hpp"
#include "report/text_report.hpp"
#include "strategies/strategy_registry.hpp"

using namespace cryptobt;

// ============================================================================
// Offline host engine: knows exchange names, has no connectivity
// ============================================================================

class OfflineExchange : public IExchange {
public:
    explicit OfflineExchange(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    KlineItem getHistoricCandles(const CurrencyPair& pair, AssetType, Timestamp, Timestamp,
                                 Interval) override {
        throw DataException("offline exchange " + name_ + " cannot fetch candles for " +
                            pair.toString());
    }

    const ExchangeCredentials& credentials() const override { return credentials_; }
    void setCredentials(const ExchangeCredentials& creds) override { credentials_ = creds; }
    const CredentialsValidator& credentialsValidator() const override { return validator_; }
    bool authenticatedSupport() const override { return authenticated_; }
    void setAuthenticatedSupport(bool enabled) override { authenticated_ = enabled; }

private:
    std::string name_;
    ExchangeCredentials credentials_;
    CredentialsValidator validator_;
    bool authenticated_ = false;
};

class OfflineHostEngine : public IHostEngine {
public:
    explicit OfflineHostEngine(const std::string& exchange)
        : exchange_(lowerExchangeName(exchange)) {}

    IExchange* getExchangeByName(const std::string& name) override {
        return lowerExchangeName(name) == exchange_.name() ? &exchange_ : nullptr;
    }

    IKlineDatabase* database() override { return nullptr; }

private:
    OfflineExchange exchange_;
};

// ============================================================================
// Usage
// ============================================================================

void printUsage(const char* program_name) {
    std::cout << "Crypto Backtesting Engine\n";
    std::cout << "=========================\n\n";
    std::cout << "Usage: " << program_name << " --csv FILE [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --csv FILE               Candle or trade CSV file (required)\n";
    std::cout << "  --data-type TYPE         candle or trade (default: candle)\n";
    std::cout << "  --exchange NAME          Exchange name (default: binance)\n";
    std::cout << "  --asset TYPE             spot, margin, futures, perpetualswap (default: spot)\n";
    std::cout << "  --base CODE              Base currency (default: BTC)\n";
    std::cout << "  --quote CODE             Quote currency (default: USDT)\n";
    std::cout << "  --interval SECONDS       Candle interval in seconds (default: 3600)\n";
    std::cout << "  --funds AMOUNT           Initial funds in quote currency (default: 10000)\n";
    std::cout << "  --maker-fee RATE         Maker fee as a fraction (default: 0.001)\n";
    std::cout << "  --taker-fee RATE         Taker fee as a fraction (default: 0.001)\n";
    std::cout << "  --strategy NAME          Strategy name (default: dollarcostaverage)\n";
    std::cout << "  --setting KEY=VALUE      Strategy custom setting, repeatable\n";
    std::cout << "  --simultaneous           Use simultaneous signal processing\n";
    std::cout << "  --output FILE            Report file (default: backtest_report.txt)\n";
    std::cout << "  --verbose                Enable debug logging\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nStrategies:";
    for (const auto& name : getStrategyNames()) std::cout << " " << name;
    std::cout << "\n\nExamples:\n";
    std::cout << "  " << program_name << " --csv data/btc_usdt_1h.csv\n";
    std::cout << "  " << program_name << " --csv data/btc_usdt_1h.csv --strategy rsi "
              << "--setting rsi-period=10 --setting rsi-high=75\n";
}

void printSummary(const Statistic& statistic, double elapsed_seconds) {
    std::cout << "\n";
    TextReport::write(std::cout, statistic);
    std::cout << "Runtime: " << elapsed_seconds << " seconds\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))
               ? 0 : 1;
    }

    try {
        auto start_time = std::chrono::steady_clock::now();

        Config cfg = buildConfig(options);
        OfflineHostEngine host(options.exchange);
        auto backtest = BackTest::newFromConfig(&cfg, "", options.output_file, &host);

        backtest->run();

        auto end_time = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(end_time - start_time).count();
        printSummary(*backtest->statistic(), elapsed);
        return 0;
    }
    catch (const ConfigException& e) {
        std::cerr << e.what() << " [" << errorCodeName(e.code()) << "]" << std::endl;
        return 2;
    }
    catch (const BacktestException& e) {
        std::cerr << e.what() << " [" << errorCodeName(e.code()) << "]" << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
