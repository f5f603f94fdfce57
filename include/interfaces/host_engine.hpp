// host_engine.hpp
// Collaborator interfaces supplied by the hosting trading engine
// Exchange lookup, exchange candle access, credentials and the kline database

#pragma once

#include <string>
#include "../core/currency.hpp"
#include "../core/kline.hpp"

namespace cryptobt {

// ============================================================================
// Credentials
// ============================================================================

struct ExchangeCredentials {
    std::string key;
    std::string secret;
    std::string client_id;
    std::string pem_key;
    std::string one_time_password;

    bool isEmpty() const {
        return key.empty() && secret.empty() && client_id.empty() && pem_key.empty();
    }
};

struct CredentialsValidator {
    bool requires_pem = false;
    bool requires_key = false;
    bool requires_secret = false;
    bool requires_client_id = false;

    bool satisfiedBy(const ExchangeCredentials& creds) const {
        if (requires_pem && creds.pem_key.empty()) return false;
        if (requires_key && creds.key.empty()) return false;
        if (requires_secret && creds.secret.empty()) return false;
        if (requires_client_id && creds.client_id.empty()) return false;
        return true;
    }
};

// ============================================================================
// Exchange Interface
// ============================================================================

class IExchange {
public:
    virtual ~IExchange() = default;

    virtual std::string name() const = 0;

    // Candles in [start, end) at the given interval. Throws DataException on failure.
    virtual KlineItem getHistoricCandles(const CurrencyPair& pair, AssetType asset,
                                         Timestamp start, Timestamp end,
                                         Interval interval) = 0;

    // Maximum candles per request, 0 when unlimited
    virtual size_t candleRequestLimit() const { return 0; }

    virtual const ExchangeCredentials& credentials() const = 0;
    virtual void setCredentials(const ExchangeCredentials& creds) = 0;
    virtual const CredentialsValidator& credentialsValidator() const = 0;

    virtual bool authenticatedSupport() const = 0;
    virtual void setAuthenticatedSupport(bool enabled) = 0;
};

// ============================================================================
// Kline Database Interface
// ============================================================================

class IKlineDatabase {
public:
    virtual ~IKlineDatabase() = default;

    virtual bool enabled() const = 0;

    virtual KlineItem getCandles(const std::string& exchange, const CurrencyPair& pair,
                                 AssetType asset, Interval interval,
                                 Timestamp start, Timestamp end) = 0;
};

// ============================================================================
// Host Engine Interface
// ============================================================================

class IHostEngine {
public:
    virtual ~IHostEngine() = default;

    // nullptr when the exchange is not loaded
    virtual IExchange* getExchangeByName(const std::string& name) = 0;

    // nullptr when no database is configured
    virtual IKlineDatabase* database() = 0;
};

} // namespace cryptobt
