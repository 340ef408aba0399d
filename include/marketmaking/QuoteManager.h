#pragma once

#include "analytics/OrderBookStore.h"
#include "marketmaking/AvellanedaStoikovEngine.h"
#include "marketmaking/InventoryState.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace quantcore {
namespace marketmaking {

// Per-symbol quoting state. Book updates, fills and requotes for one symbol
// are serialized on that symbol's mutex; different symbols run independently.
class QuoteManager {
public:
    QuoteManager(const ASParameters& params, int order_book_levels = 5);

    // Applies the snapshot (last-write-wins) and requotes. Returns nullopt
    // when the snapshot was stale and discarded.
    std::optional<ASSignal> onOrderBook(const analytics::OrderBookSnapshot& snapshot);

    // Signed fill, buy > 0. Requotes when a book is held for the symbol.
    std::optional<ASSignal> onFill(const std::string& symbol, double signed_quantity,
                                   double price, Timestamp ts);

    // Recomputes from the held snapshot; nullopt when no book has arrived yet.
    std::optional<ASSignal> requote(const std::string& symbol);

    std::optional<ASSignal> lastQuote(const std::string& symbol) const;
    InventoryState inventory(const std::string& symbol) const;
    ASFeatures features(const std::string& symbol, const MarketContext& context = MarketContext()) const;

    void setParameters(const ASParameters& params);
    ASParameters parameters() const;

    const analytics::OrderBookStore& books() const { return books_; }

private:
    struct SymbolState {
        mutable std::mutex mutex;
        InventoryState inventory;
        std::optional<ASSignal> last_quote;
    };

    SymbolState& stateFor(const std::string& symbol);
    const SymbolState* findState(const std::string& symbol) const;
    std::optional<ASSignal> requoteLocked(const std::string& symbol, SymbolState& state);

    AvellanedaStoikovEngine engine_;
    analytics::OrderBookStore books_;

    mutable std::mutex params_mutex_;
    ASParameters params_;

    mutable std::mutex states_mutex_;
    std::unordered_map<std::string, std::unique_ptr<SymbolState>> states_;
};

} // namespace marketmaking
} // namespace quantcore
