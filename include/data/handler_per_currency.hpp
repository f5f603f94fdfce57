// handler_per_currency.hpp
// Owns one data handler per (exchange, asset, pair), in configuration order

#pragma once

#include <memory>
#include <vector>
#include "../core/currency.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/data_handler.hpp"

namespace cryptobt {

class HandlerPerCurrency {
private:
    std::vector<std::unique_ptr<IDataHandler>> handlers_;

public:
    void setup() {
        handlers_.clear();
    }

    // Replaces an existing handler for the same key
    void setDataForCurrency(std::unique_ptr<IDataHandler> handler) {
        if (!handler) {
            throw DataException("nil data handler received", ErrorCode::NilArguments);
        }
        PairKey k = handler->key();
        for (auto& existing : handlers_) {
            if (existing->key() == k) {
                existing = std::move(handler);
                return;
            }
        }
        handlers_.push_back(std::move(handler));
    }

    IDataHandler* getDataForCurrency(const PairKey& key) const {
        for (const auto& handler : handlers_) {
            if (handler->key() == key) return handler.get();
        }
        return nullptr;
    }

    std::vector<IDataHandler*> getAllData() const {
        std::vector<IDataHandler*> all;
        all.reserve(handlers_.size());
        for (const auto& handler : handlers_) all.push_back(handler.get());
        return all;
    }

    bool allExhausted() const {
        for (const auto& handler : handlers_) {
            if (!handler->isExhausted()) return false;
        }
        return true;
    }

    void reset() {
        for (auto& handler : handlers_) handler->reset();
    }

    bool empty() const { return handlers_.empty(); }
    size_t size() const { return handlers_.size(); }
};

} // namespace cryptobt
