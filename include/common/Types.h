#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace tradesense {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class TradeAction { BUY, SELL, HOLD };

enum class MarketRegime {
    BULL,       // persistent bullish EMA alignment with positive slope
    BEAR,       // persistent bearish EMA alignment with negative slope
    SIDEWAYS,   // no persistent direction
    VOLATILE    // ATR percentile above the high-volatility threshold
};

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

struct OrderbookLevel {
    Price price;
    Volume size;

    OrderbookLevel() : price(0), size(0) {}
    OrderbookLevel(Price p, Volume s) : price(p), size(s) {}
};

// Best levels first on both sides
struct Orderbook {
    std::vector<OrderbookLevel> bids;
    std::vector<OrderbookLevel> asks;
};

struct MarketData {
    std::string symbol;
    std::vector<Candle> candles;      // oldest first
    std::vector<Volume> volume;       // empty or aligned with candles
    std::optional<Orderbook> orderbook;
};

struct MarketSignal {
    std::string symbol;
    TradeAction action;
    double confidence;                // 0.0 ~ 1.0
    double strength;                  // 0.0 ~ 1.0
    double risk_score;                // 0.0 ~ 1.0
    MarketRegime market_regime;
    std::vector<std::string> reasoning;
    Timestamp timestamp;

    MarketSignal()
        : action(TradeAction::HOLD)
        , confidence(0.0)
        , strength(0.0)
        , risk_score(0.0)
        , market_regime(MarketRegime::SIDEWAYS)
    {}
};

struct RiskMetrics {
    double overall_risk_score;
    double volatility;                // annualized stdev of period returns
    double sharpe_ratio;
    double max_drawdown;              // fraction, >= 0
    double var_95;                    // historical 95% one-period loss, >= 0
    double volatility_risk;
    double liquidity_risk;
    double drawdown_risk;
    bool liquidity_degraded;          // order book missing, default applied
    MarketRegime market_regime;
    Timestamp timestamp;

    RiskMetrics()
        : overall_risk_score(0.0), volatility(0.0), sharpe_ratio(0.0)
        , max_drawdown(0.0), var_95(0.0)
        , volatility_risk(0.0), liquidity_risk(0.0), drawdown_risk(0.0)
        , liquidity_degraded(false)
        , market_regime(MarketRegime::SIDEWAYS)
    {}
};

struct AdaptiveParameters {
    MarketRegime market_regime;
    double confidence_threshold;
    double position_multiplier;
    double risk_per_trade;
    double stop_loss_pct;
    double take_profit_pct;
    bool trailing_stop_enabled;
    std::vector<std::string> adaptive_reasoning;

    AdaptiveParameters()
        : market_regime(MarketRegime::SIDEWAYS)
        , confidence_threshold(0.65)
        , position_multiplier(1.0)
        , risk_per_trade(0.02)
        , stop_loss_pct(0.02)
        , take_profit_pct(0.05)
        , trailing_stop_enabled(true)
    {}
};

struct PositionSizeResult {
    double position_size;             // units of the instrument
    double position_value;            // position_size * entry_price
    double risk_amount;               // balance * risk_per_trade
    double percentage_of_account;     // 0 ~ 100
    bool capped_by_exposure;

    PositionSizeResult()
        : position_size(0.0), position_value(0.0), risk_amount(0.0)
        , percentage_of_account(0.0), capped_by_exposure(false)
    {}
};

struct TradingDecision {
    MarketSignal signal;
    RiskMetrics risk;
    AdaptiveParameters parameters;
    std::optional<PositionSizeResult> position;
};

const char* toString(TradeAction action);
const char* toString(MarketRegime regime);

} // namespace tradesense
