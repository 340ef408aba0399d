#include "marketmaking/QuoteManager.h"
#include "common/Logger.h"

namespace quantcore {
namespace marketmaking {

QuoteManager::QuoteManager(const ASParameters& params, int order_book_levels)
    : engine_(order_book_levels)
    , params_(params)
{
    LOG_INFO("QuoteManager initialized: {}", params_.toString());
}

QuoteManager::SymbolState& QuoteManager::stateFor(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto& slot = states_[symbol];
    if (!slot) {
        slot = std::make_unique<SymbolState>();
        ASParameters params = parameters();
        slot->inventory = InventoryState(symbol, 0.0, params.max_inventory, params.target_inventory);
    }
    return *slot;
}

const QuoteManager::SymbolState* QuoteManager::findState(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = states_.find(symbol);
    return it == states_.end() ? nullptr : it->second.get();
}

std::optional<ASSignal> QuoteManager::onOrderBook(const analytics::OrderBookSnapshot& snapshot) {
    SymbolState& state = stateFor(snapshot.symbol);
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!books_.apply(snapshot)) {
        return std::nullopt;
    }
    return requoteLocked(snapshot.symbol, state);
}

std::optional<ASSignal> QuoteManager::onFill(const std::string& symbol, double signed_quantity,
                                             double price, Timestamp ts) {
    SymbolState& state = stateFor(symbol);
    std::lock_guard<std::mutex> lock(state.mutex);

    state.inventory.applyFill(signed_quantity, price, ts);
    LOG_INFO("{} - fill {:+.4f} @ {:.8f}, inventory {:.4f}",
             symbol, signed_quantity, price, state.inventory.current_inventory);

    return requoteLocked(symbol, state);
}

std::optional<ASSignal> QuoteManager::requote(const std::string& symbol) {
    SymbolState& state = stateFor(symbol);
    std::lock_guard<std::mutex> lock(state.mutex);
    return requoteLocked(symbol, state);
}

std::optional<ASSignal> QuoteManager::requoteLocked(const std::string& symbol, SymbolState& state) {
    auto book = books_.get(symbol);
    if (!book) {
        return std::nullopt;
    }

    ASSignal quote = engine_.computeQuote(*book, parameters(), state.inventory.current_inventory);
    if (quote.is_valid) {
        Logger::getInstance().logQuote(symbol, quote.bid_price, quote.bid_quantity,
                                       quote.ask_price, quote.ask_quantity, quote.spreadBps());
    }

    state.last_quote = quote;
    return quote;
}

std::optional<ASSignal> QuoteManager::lastQuote(const std::string& symbol) const {
    const SymbolState* state = findState(symbol);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->last_quote;
}

InventoryState QuoteManager::inventory(const std::string& symbol) const {
    const SymbolState* state = findState(symbol);
    if (!state) {
        ASParameters params = parameters();
        return InventoryState(symbol, 0.0, params.max_inventory, params.target_inventory);
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->inventory;
}

ASFeatures QuoteManager::features(const std::string& symbol, const MarketContext& context) const {
    auto book = books_.get(symbol);
    double held = inventory(symbol).current_inventory;
    return engine_.extractFeatures(book ? *book : analytics::OrderBookSnapshot(), parameters(), held, context);
}

void QuoteManager::setParameters(const ASParameters& params) {
    std::lock_guard<std::mutex> lock(params_mutex_);
    params_ = params;
}

ASParameters QuoteManager::parameters() const {
    std::lock_guard<std::mutex> lock(params_mutex_);
    return params_;
}

} // namespace marketmaking
} // namespace quantcore
