// exceptions.hpp
// Exception Types for the Crypto Backtesting Engine
// Every exception carries an ErrorCode so callers can tell failure modes apart

#pragma once

#include <stdexcept>
#include <string>

namespace cryptobt {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Unknown,
    // Configuration
    NilConfig,
    NilBot,
    NoCurrencySettings,
    BadInitialFunds,
    UnsetAsset,
    ExchangeNotFound,
    NoDataSource,
    AmbiguousDataSource,
    UnrecognisedDataType,
    StartEndUnset,
    IntervalUnset,
    StrategyNotFound,
    SimultaneousProcessingUnsupported,
    InvalidMinMax,
    InvalidCustomSetting,
    // Setup dependencies
    NilArguments,
    InvalidCredentials,
    DatabaseDisabled,
    EmptyDatabaseQuery,
    DataUnavailable,
    // Runtime
    CurrencySettingsNotFound,
    AmountBelowMinimum,
    NegativeHoldings,
    OutOfOrderEvent,
    InvalidState,
    // Output
    ReportFailed
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NilConfig: return "NilConfig";
        case ErrorCode::NilBot: return "NilBot";
        case ErrorCode::NoCurrencySettings: return "NoCurrencySettings";
        case ErrorCode::BadInitialFunds: return "BadInitialFunds";
        case ErrorCode::UnsetAsset: return "UnsetAsset";
        case ErrorCode::ExchangeNotFound: return "ExchangeNotFound";
        case ErrorCode::NoDataSource: return "NoDataSource";
        case ErrorCode::AmbiguousDataSource: return "AmbiguousDataSource";
        case ErrorCode::UnrecognisedDataType: return "UnrecognisedDataType";
        case ErrorCode::StartEndUnset: return "StartEndUnset";
        case ErrorCode::IntervalUnset: return "IntervalUnset";
        case ErrorCode::StrategyNotFound: return "StrategyNotFound";
        case ErrorCode::SimultaneousProcessingUnsupported: return "SimultaneousProcessingUnsupported";
        case ErrorCode::InvalidMinMax: return "InvalidMinMax";
        case ErrorCode::InvalidCustomSetting: return "InvalidCustomSetting";
        case ErrorCode::NilArguments: return "NilArguments";
        case ErrorCode::InvalidCredentials: return "InvalidCredentials";
        case ErrorCode::DatabaseDisabled: return "DatabaseDisabled";
        case ErrorCode::EmptyDatabaseQuery: return "EmptyDatabaseQuery";
        case ErrorCode::DataUnavailable: return "DataUnavailable";
        case ErrorCode::CurrencySettingsNotFound: return "CurrencySettingsNotFound";
        case ErrorCode::AmountBelowMinimum: return "AmountBelowMinimum";
        case ErrorCode::NegativeHoldings: return "NegativeHoldings";
        case ErrorCode::OutOfOrderEvent: return "OutOfOrderEvent";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::ReportFailed: return "ReportFailed";
        case ErrorCode::Unknown: break;
    }
    return "Unknown";
}

// ============================================================================
// Exception Types for Better Error Handling
// ============================================================================

class BacktestException : public std::runtime_error {
public:
    explicit BacktestException(const std::string& msg, ErrorCode code = ErrorCode::Unknown)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Configuration errors: raised before a run can start
class ConfigException : public BacktestException {
public:
    ConfigException(ErrorCode code, const std::string& msg)
        : BacktestException("Config Error: " + msg, code) {}
};

// Data loading and setup-dependency errors
class DataException : public BacktestException {
public:
    explicit DataException(const std::string& msg, ErrorCode code = ErrorCode::DataUnavailable)
        : BacktestException("Data Error: " + msg, code) {}
};

class ExecutionException : public BacktestException {
public:
    explicit ExecutionException(const std::string& msg, ErrorCode code = ErrorCode::Unknown)
        : BacktestException("Execution Error: " + msg, code) {}
};

class PortfolioException : public BacktestException {
public:
    PortfolioException(ErrorCode code, const std::string& msg)
        : BacktestException("Portfolio Error: " + msg, code) {}
};

class StatisticsException : public BacktestException {
public:
    StatisticsException(ErrorCode code, const std::string& msg)
        : BacktestException("Statistics Error: " + msg, code) {}
};

class StrategyException : public BacktestException {
public:
    StrategyException(ErrorCode code, const std::string& msg)
        : BacktestException("Strategy Error: " + msg, code) {}
};

// Report sink errors: the run itself finished
class ReportException : public BacktestException {
public:
    explicit ReportException(const std::string& msg)
        : BacktestException("Report Error: " + msg, ErrorCode::ReportFailed) {}
};

} // namespace cryptobt
