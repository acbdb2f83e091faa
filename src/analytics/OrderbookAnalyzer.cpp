#include "analytics/OrderbookAnalyzer.h"
#include <cmath>

namespace tradesense {
namespace analytics {

OrderbookSnapshot OrderbookAnalyzer::analyze(const Orderbook& orderbook) {
    OrderbookSnapshot snapshot;

    if (orderbook.bids.empty() || orderbook.asks.empty()) {
        return snapshot;
    }

    snapshot.best_bid = orderbook.bids.front().price;
    snapshot.best_ask = orderbook.asks.front().price;

    bool priced = std::isfinite(snapshot.best_bid) && std::isfinite(snapshot.best_ask) &&
                  snapshot.best_bid > 0.0 && snapshot.best_ask >= snapshot.best_bid;
    if (!priced) {
        return snapshot;
    }

    snapshot.mid_price = (snapshot.best_bid + snapshot.best_ask) * 0.5;
    snapshot.spread_pct = (snapshot.best_ask - snapshot.best_bid) / snapshot.mid_price;

    snapshot.valid = true;
    return snapshot;
}

} // namespace analytics
} // namespace tradesense
