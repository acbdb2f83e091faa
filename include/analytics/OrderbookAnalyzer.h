#pragma once

#include "common/Types.h"

namespace tradesense {
namespace analytics {

struct OrderbookSnapshot {
    double best_bid;
    double best_ask;
    double mid_price;
    double spread_pct;      // (ask - bid) / mid
    bool valid;

    OrderbookSnapshot()
        : best_bid(0.0)
        , best_ask(0.0)
        , mid_price(0.0)
        , spread_pct(0.0)
        , valid(false)
    {}
};

class OrderbookAnalyzer {
public:
    // valid == false when either side is empty or the book is crossed
    static OrderbookSnapshot analyze(const Orderbook& orderbook);
};

} // namespace analytics
} // namespace tradesense
