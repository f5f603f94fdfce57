// currency.hpp
// Currency pair, asset type and routing key definitions
// Every event and every per-pair container is keyed by (exchange, asset, pair)

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <tuple>

namespace cryptobt {

// ============================================================================
// Asset Types
// ============================================================================

enum class AssetType { Empty, Spot, Margin, Futures, PerpetualSwap };

inline std::string assetTypeToString(AssetType asset) {
    switch (asset) {
        case AssetType::Spot: return "spot";
        case AssetType::Margin: return "margin";
        case AssetType::Futures: return "futures";
        case AssetType::PerpetualSwap: return "perpetualswap";
        case AssetType::Empty: break;
    }
    return "";
}

// Unknown or empty strings map to AssetType::Empty
inline AssetType assetTypeFromString(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "spot") return AssetType::Spot;
    if (value == "margin") return AssetType::Margin;
    if (value == "futures") return AssetType::Futures;
    if (value == "perpetualswap") return AssetType::PerpetualSwap;
    return AssetType::Empty;
}

// ============================================================================
// Currency Pair
// ============================================================================

struct CurrencyPair {
    std::string base;
    std::string quote;

    CurrencyPair() = default;
    CurrencyPair(std::string b, std::string q) {
        std::transform(b.begin(), b.end(), b.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        std::transform(q.begin(), q.end(), q.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        base = std::move(b);
        quote = std::move(q);
    }

    bool isEmpty() const { return base.empty() && quote.empty(); }

    std::string toString(const std::string& delimiter = "/") const {
        return base + delimiter + quote;
    }

    bool operator==(const CurrencyPair& other) const {
        return base == other.base && quote == other.quote;
    }
    bool operator!=(const CurrencyPair& other) const { return !(*this == other); }
    bool operator<(const CurrencyPair& other) const {
        return std::tie(base, quote) < std::tie(other.base, other.quote);
    }
};

// ============================================================================
// Exchange/Asset/Pair routing key
// ============================================================================

struct PairKey {
    std::string exchange;
    AssetType asset = AssetType::Empty;
    CurrencyPair pair;

    PairKey() = default;
    PairKey(std::string ex, AssetType a, CurrencyPair p)
        : exchange(std::move(ex)), asset(a), pair(std::move(p)) {}

    std::string toString() const {
        return exchange + " " + assetTypeToString(asset) + " " + pair.toString();
    }

    bool operator==(const PairKey& other) const {
        return exchange == other.exchange && asset == other.asset && pair == other.pair;
    }
    bool operator!=(const PairKey& other) const { return !(*this == other); }
    bool operator<(const PairKey& other) const {
        return std::tie(exchange, asset, pair) < std::tie(other.exchange, other.asset, other.pair);
    }
};

inline std::string lowerExchangeName(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

} // namespace cryptobt
