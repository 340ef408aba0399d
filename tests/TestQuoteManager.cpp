#include "marketmaking/QuoteManager.h"
#include "common/Logger.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace quantcore;
using namespace quantcore::marketmaking;
using quantcore::analytics::OrderBookLevel;
using quantcore::analytics::OrderBookSnapshot;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

OrderBookSnapshot makeBook(const std::string& symbol, Timestamp ts, double mid) {
    OrderBookSnapshot book;
    book.symbol = symbol;
    book.exchange = "test";
    book.timestamp = ts;
    book.bids = {OrderBookLevel(mid - 0.01, 1.0), OrderBookLevel(mid - 0.02, 2.0)};
    book.asks = {OrderBookLevel(mid + 0.01, 1.0), OrderBookLevel(mid + 0.02, 2.0)};
    return book;
}

}

int main() {
    Logger::getInstance().initializeConsoleOnly("warn");

    // Quotes follow the newest book; stale snapshots are dropped
    {
        QuoteManager manager(ASParameters::conservative(1.0));

        auto first = manager.onOrderBook(makeBook("BTCUSDT", 2000, 100.0));
        assert(first && first->is_valid);
        assert(near(first->midPrice(), 100.0, 1e-6));

        auto stale = manager.onOrderBook(makeBook("BTCUSDT", 1000, 90.0));
        assert(!stale);
        auto duplicate = manager.onOrderBook(makeBook("BTCUSDT", 2000, 95.0));
        assert(!duplicate);
        assert(manager.books().discardedCount() == 2);

        // Last quote still reflects the 100.0 book
        auto last = manager.lastQuote("BTCUSDT");
        assert(last && near(last->midPrice(), 100.0, 1e-6));

        auto newer = manager.onOrderBook(makeBook("BTCUSDT", 3000, 101.0));
        assert(newer && near(newer->midPrice(), 101.0, 1e-6));
    }

    // Fills move inventory and skew the next quote
    {
        QuoteManager manager(ASParameters::conservative(1.0));

        // No book yet: inventory updates, no quote
        assert(!manager.onFill("ETHUSDT", 0.2, 100.0, 10));
        assert(near(manager.inventory("ETHUSDT").current_inventory, 0.2));
        assert(!manager.lastQuote("ETHUSDT"));

        auto quote = manager.onOrderBook(makeBook("ETHUSDT", 20, 100.0));
        assert(quote && quote->is_valid);
        assert(*quote->reservation_price < 100.0);
        assert(near(*quote->current_inventory, 0.2));

        auto after_sell = manager.onFill("ETHUSDT", -0.4, 101.0, 30);
        assert(after_sell && after_sell->is_valid);
        assert(*after_sell->reservation_price > 100.0);
        assert(near(manager.inventory("ETHUSDT").current_inventory, -0.2));
        assert(near(manager.inventory("ETHUSDT").realized_pnl, 0.2));

        auto features = manager.features("ETHUSDT");
        assert(near(features.current_inventory, -0.2));
        assert(near(features.inventory_pct, 0.2));
        assert(features.best_bid > 0.0);
    }

    // Unknown symbols
    {
        QuoteManager manager(ASParameters::aggressive(5.0));
        assert(!manager.requote("XRPUSDT"));
        auto inv = manager.inventory("XRPUSDT");
        assert(inv.current_inventory == 0.0);
        assert(inv.max_inventory == 5.0);
        assert(manager.features("XRPUSDT").best_bid == 0.0);
    }

    // Parameter swap applies to the next requote
    {
        QuoteManager manager(ASParameters::conservative(1.0));
        auto wide = manager.onOrderBook(makeBook("BTCUSDT", 1, 100.0));
        manager.setParameters(ASParameters::aggressive(1.0));
        assert(manager.parameters().gamma == ASParameters::aggressive(1.0).gamma);
        auto tight = manager.requote("BTCUSDT");
        assert(wide && tight);
        assert(tight->spread() < wide->spread());
    }

    // Symbols are handled concurrently without cross-talk
    {
        QuoteManager manager(ASParameters::conservative(10.0));
        const std::vector<std::string> symbols = {"BTCUSDT", "ETHUSDT", "SOLUSDT", "XRPUSDT"};

        std::vector<std::thread> threads;
        for (size_t s = 0; s < symbols.size(); ++s) {
            threads.emplace_back([&, s]() {
                const std::string& symbol = symbols[s];
                for (int i = 1; i <= 200; ++i) {
                    manager.onOrderBook(makeBook(symbol, i, 100.0 + s));
                    if (i % 20 == 0) {
                        manager.onFill(symbol, 0.1, 100.0 + s, i);
                    }
                }
            });
        }
        for (auto& th : threads) th.join();

        for (size_t s = 0; s < symbols.size(); ++s) {
            auto inv = manager.inventory(symbols[s]);
            assert(near(inv.current_inventory, 1.0, 1e-9));

            auto book = manager.books().get(symbols[s]);
            assert(book && book->timestamp == 200);

            auto quote = manager.lastQuote(symbols[s]);
            assert(quote && quote->is_valid);
            assert(near(*quote->current_inventory, 1.0, 1e-9));
        }
        assert(manager.books().discardedCount() == 0);
    }

    std::cout << "[TEST] QuoteManager PASSED\n";
    return 0;
}
