#include "analytics/OrderBook.h"
#include "analytics/OrderBookStore.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace quantcore;
using namespace quantcore::analytics;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

OrderBookSnapshot sampleBook(const std::string& symbol, Timestamp ts) {
    OrderBookSnapshot book;
    book.symbol = symbol;
    book.exchange = "test";
    book.timestamp = ts;
    book.bids = {OrderBookLevel(100.0, 2.0), OrderBookLevel(99.0, 1.0)};
    book.asks = {OrderBookLevel(101.0, 1.0), OrderBookLevel(102.0, 3.0)};
    return book;
}

}

int main() {
    Logger::getInstance().initializeConsoleOnly("warn");

    // Derived metrics
    {
        auto book = sampleBook("BTCUSDT", 1000);
        assert(book.isValid());
        assert(book.bestBid() == 100.0);
        assert(book.bestAsk() == 101.0);
        assert(book.spread() == 1.0);
        assert(book.midPrice() == 100.5);
        assert(near(book.spreadPercent(), 1.0 / 100.5));

        // Top-level quantities pull the microprice toward the thinner side
        assert(near(book.microprice(), (100.0 * 1.0 + 101.0 * 2.0) / 3.0));

        assert(book.getBidVolume(5) == 3.0);
        assert(book.getAskVolume(5) == 4.0);
        assert(near(book.getOrderBookImbalance(5), -1.0 / 7.0));
        assert(near(book.getOrderBookImbalance(1), 1.0 / 3.0));

        assert(near(book.getBidDepth(5), 299.0));
        assert(near(book.getAskDepth(5), 407.0));
        assert(near(book.getTotalDepth(1), 301.0));

        double wmid = book.getWeightedMidPrice(5);
        assert(wmid > book.bestBid() && wmid < book.bestAsk());
    }

    // Validity
    {
        OrderBookSnapshot empty;
        assert(!empty.isValid());

        auto crossed = sampleBook("X", 1);
        crossed.asks.front().price = 100.0;
        assert(!crossed.isValid());

        auto unsorted_bids = sampleBook("X", 1);
        unsorted_bids.bids = {OrderBookLevel(99.0, 1.0), OrderBookLevel(100.0, 1.0)};
        assert(!unsorted_bids.isValid());

        auto unsorted_asks = sampleBook("X", 1);
        unsorted_asks.asks = {OrderBookLevel(101.0, 1.0), OrderBookLevel(101.0, 2.0)};
        assert(!unsorted_asks.isValid());

        auto one_sided = sampleBook("X", 1);
        one_sided.asks.clear();
        assert(!one_sided.isValid());
    }

    // Zero-volume guards
    {
        OrderBookSnapshot book;
        book.bids = {OrderBookLevel(10.0, 0.0)};
        book.asks = {OrderBookLevel(11.0, 0.0)};
        assert(book.getOrderBookImbalance() == 0.0);
        assert(book.getWeightedMidPrice() == book.midPrice());
        assert(book.microprice() == book.midPrice());

        OrderBookSnapshot empty;
        assert(empty.spreadPercent() == 0.0);
        assert(empty.getOrderBookImbalance() == 0.0);
    }

    // Sweep estimates
    {
        auto book = sampleBook("BTCUSDT", 1);

        // Fits in the first ask level
        assert(near(book.estimateFillPrice(50.5, OrderSide::BUY), 101.0));

        // 101 notional at 101 and 204 notional at 102
        double fill = book.estimateFillPrice(305.0, OrderSide::BUY);
        assert(near(fill, 305.0 / 3.0));
        assert(book.estimateSlippagePct(305.0, OrderSide::BUY) > 0.0);

        assert(near(book.estimateFillPrice(100.0, OrderSide::SELL), 100.0));
        assert(book.estimateSlippagePct(100.0, OrderSide::SELL) > 0.0);

        assert(book.estimateFillPrice(0.0, OrderSide::BUY) == 0.0);
        assert(OrderBookSnapshot().estimateFillPrice(100.0, OrderSide::BUY) == 0.0);
    }

    // JSON in both level encodings
    {
        auto j = nlohmann::json::parse(R"({
            "symbol": "ETHUSDT",
            "exchange": "binance",
            "timestamp": 1700000000000,
            "bids": [[2000.5, 1.5, 3], [2000.0, 2.0]],
            "asks": [{"price": 2001.0, "quantity": 0.5, "order_count": 1}, {"price": 2001.5, "quantity": 4.0}]
        })");
        auto book = OrderBookSnapshot::fromJson(j);
        assert(book.symbol == "ETHUSDT");
        assert(book.timestamp == 1700000000000LL);
        assert(book.bids.size() == 2 && book.asks.size() == 2);
        assert(book.bids[0].order_count && *book.bids[0].order_count == 3);
        assert(!book.bids[1].order_count);
        assert(book.asks[0].order_count && *book.asks[0].order_count == 1);
        assert(book.isValid());

        auto out = book.toJson();
        assert(out["mid_price"].get<double>() == book.midPrice());
        assert(out["bids"].size() == 2);

        bool thrown = false;
        try {
            OrderBookSnapshot::fromJson(nlohmann::json::parse(R"({"bids": [[1.0]], "asks": []})"));
        } catch (const InvalidParameterError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Store keeps the newest snapshot per symbol
    {
        OrderBookStore store;
        assert(store.apply(sampleBook("BTCUSDT", 200)));

        auto older = sampleBook("BTCUSDT", 100);
        older.bids.front().price = 95.0;
        assert(!store.apply(older));
        assert(!store.apply(sampleBook("BTCUSDT", 200)));
        assert(store.discardedCount() == 2);
        assert(store.get("BTCUSDT")->bestBid() == 100.0);

        auto newer = sampleBook("BTCUSDT", 300);
        newer.bids.front().price = 100.25;
        assert(store.apply(newer));
        assert(store.get("BTCUSDT")->bestBid() == 100.25);

        assert(store.apply(sampleBook("ETHUSDT", 50)));
        assert(store.symbols().size() == 2);
        assert(!store.get("XRPUSDT"));

        store.clear();
        assert(store.symbols().empty());
        assert(store.discardedCount() == 0);
    }

    std::cout << "[TEST] OrderBook PASSED\n";
    return 0;
}
