#include "analytics/RegimeDetector.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace tradesense {
namespace analytics {

RegimeDetector::RegimeDetector(const RegimeDetectorConfig& config, const IndicatorSettings& indicators)
    : config_(config)
    , indicators_(indicators)
{}

RegimeInputs RegimeDetector::measure(const std::vector<Candle>& candles) const {
    RegimeInputs inputs;

    auto prices = TechnicalIndicators::extractClosePrices(candles);

    // 1. EMA alignment persistence
    auto ema_short = TechnicalIndicators::calculateEMAVector(prices, indicators_.ema_short);
    auto ema_medium = TechnicalIndicators::calculateEMAVector(prices, indicators_.ema_medium);
    auto ema_long = TechnicalIndicators::calculateEMAVector(prices, indicators_.ema_long);

    size_t bars = std::min({static_cast<size_t>(config_.persistence_lookback),
                            ema_short.size(), ema_medium.size(), ema_long.size()});
    int bullish = 0;
    int bearish = 0;
    for (size_t j = 1; j <= bars; ++j) {
        double s = ema_short[ema_short.size() - j];
        double m = ema_medium[ema_medium.size() - j];
        double l = ema_long[ema_long.size() - j];
        if (s > m && m > l) ++bullish;
        else if (s < m && m < l) ++bearish;
    }
    if (bars > 0) {
        inputs.bull_persistence = static_cast<double>(bullish) / bars;
        inputs.bear_persistence = static_cast<double>(bearish) / bars;
    }

    // 2. Trend slope over the recent window, as a fraction of price
    size_t span = std::min(static_cast<size_t>(config_.slope_lookback), prices.size());
    std::vector<double> recent(prices.end() - span, prices.end());
    double slope = TechnicalIndicators::calculateLinearRegressionSlope(recent);
    inputs.trend_slope = slope * static_cast<double>(span) / prices.back();

    // 3. ATR percentile vs its own trailing history
    auto atr_series = TechnicalIndicators::calculateATRSeries(candles, indicators_.atr_period);
    size_t history_len = std::min(static_cast<size_t>(indicators_.atr_history_lookback), atr_series.size());
    std::vector<double> history(atr_series.end() - history_len, atr_series.end());
    inputs.atr_percentile = TechnicalIndicators::percentileRank(history, atr_series.back());

    return inputs;
}

RegimeAnalysis RegimeDetector::classify(const RegimeInputs& inputs) const {
    RegimeAnalysis result;
    result.inputs = inputs;

    // Volatility outranks any directional conviction
    if (inputs.atr_percentile > config_.high_volatility_percentile) {
        result.regime = MarketRegime::VOLATILE;
        result.description = fmt::format("High volatility (ATR at {:.0f}th percentile)",
                                         inputs.atr_percentile * 100.0);
        if (inputs.bull_persistence >= config_.min_persistence ||
            inputs.bear_persistence >= config_.min_persistence) {
            result.description += ", overriding directional alignment";
        }
        return result;
    }

    if (inputs.bull_persistence >= config_.min_persistence && inputs.trend_slope >= config_.min_trend_slope) {
        result.regime = MarketRegime::BULL;
        result.description = fmt::format("Bull: bullish EMA alignment on {:.0f}% of recent bars, slope {:+.2f}%",
                                         inputs.bull_persistence * 100.0, inputs.trend_slope * 100.0);
    } else if (inputs.bear_persistence >= config_.min_persistence && inputs.trend_slope <= -config_.min_trend_slope) {
        result.regime = MarketRegime::BEAR;
        result.description = fmt::format("Bear: bearish EMA alignment on {:.0f}% of recent bars, slope {:+.2f}%",
                                         inputs.bear_persistence * 100.0, inputs.trend_slope * 100.0);
    } else {
        result.regime = MarketRegime::SIDEWAYS;
        result.description = fmt::format("Sideways: no persistent trend (slope {:+.2f}%)",
                                         inputs.trend_slope * 100.0);
    }

    return result;
}

RegimeAnalysis RegimeDetector::analyzeRegime(const std::vector<Candle>& candles) const {
    return classify(measure(candles));
}

} // namespace analytics
} // namespace tradesense
