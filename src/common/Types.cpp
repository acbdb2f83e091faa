#include "common/Types.h"

namespace tradesense {

const char* toString(TradeAction action) {
    switch (action) {
        case TradeAction::BUY:
            return "buy";
        case TradeAction::SELL:
            return "sell";
        case TradeAction::HOLD:
            return "hold";
    }
    return "hold";
}

const char* toString(MarketRegime regime) {
    switch (regime) {
        case MarketRegime::BULL:
            return "bull";
        case MarketRegime::BEAR:
            return "bear";
        case MarketRegime::SIDEWAYS:
            return "sideways";
        case MarketRegime::VOLATILE:
            return "volatile";
    }
    return "sideways";
}

} // namespace tradesense
