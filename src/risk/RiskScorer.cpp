#include "risk/RiskScorer.h"
#include "analytics/OrderbookAnalyzer.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace tradesense {
namespace risk {

namespace {

double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

}

RiskScorer::RiskScorer(const RiskScorerConfig& config)
    : config_(config)
{}

double RiskScorer::volatilityRisk(
    const analytics::IndicatorSnapshot& snapshot,
    const analytics::VolatilityResult& volatility
) const {
    if (snapshot.atr_history_max <= 0.0) {
        return 0.0;
    }
    return clamp01((snapshot.atr / snapshot.atr_history_max) * volatility.risk_multiplier);
}

double RiskScorer::liquidityRisk(const std::optional<Orderbook>& orderbook, bool* degraded) const {
    if (degraded) *degraded = false;

    if (!orderbook) {
        if (degraded) *degraded = true;
        return config_.missing_orderbook_liquidity_risk;
    }

    auto snapshot = analytics::OrderbookAnalyzer::analyze(*orderbook);
    if (!snapshot.valid) {
        if (degraded) *degraded = true;
        return config_.missing_orderbook_liquidity_risk;
    }

    return clamp01(snapshot.spread_pct);
}

double RiskScorer::drawdownRisk(double max_drawdown) const {
    if (config_.drawdown_cap <= 0.0) {
        return max_drawdown > 0.0 ? 1.0 : 0.0;
    }
    return clamp01(std::abs(max_drawdown) / config_.drawdown_cap);
}

RiskMetrics RiskScorer::assess(
    const std::vector<Candle>& candles,
    const analytics::IndicatorSnapshot& snapshot,
    const analytics::VolatilityResult& volatility,
    const std::optional<Orderbook>& orderbook,
    MarketRegime regime
) const {
    using analytics::TechnicalIndicators;

    RiskMetrics metrics;
    metrics.market_regime = regime;
    metrics.timestamp = std::chrono::system_clock::now();

    auto closes = TechnicalIndicators::extractClosePrices(candles);

    // 1. Component risks
    metrics.volatility_risk = volatilityRisk(snapshot, volatility);

    bool degraded = false;
    metrics.liquidity_risk = liquidityRisk(orderbook, &degraded);
    metrics.liquidity_degraded = degraded;
    if (degraded) {
        LOG_WARN("DegradedInputWarning: order book {}, liquidity risk defaulted to {:.2f}",
                 orderbook ? "unusable" : "missing", metrics.liquidity_risk);
    }

    metrics.max_drawdown = TechnicalIndicators::calculateMaxDrawdown(closes);
    metrics.drawdown_risk = drawdownRisk(metrics.max_drawdown);

    metrics.overall_risk_score = clamp01(
        config_.volatility_weight * metrics.volatility_risk +
        config_.liquidity_weight * metrics.liquidity_risk +
        config_.drawdown_weight * metrics.drawdown_risk
    );

    // 2. Return statistics
    auto returns = TechnicalIndicators::calculateReturns(closes);
    double mean = TechnicalIndicators::calculateMean(returns);
    double std_dev = TechnicalIndicators::calculateStandardDeviation(returns, mean);
    double annualization = std::sqrt(config_.annualization_periods);

    metrics.volatility = std_dev * annualization;
    metrics.sharpe_ratio = std_dev > 1e-12 ? (mean / std_dev) * annualization : 0.0;

    if (!returns.empty()) {
        std::vector<double> sorted(returns);
        std::sort(sorted.begin(), sorted.end());
        size_t var_index = static_cast<size_t>(std::floor(0.05 * static_cast<double>(sorted.size() - 1)));
        metrics.var_95 = std::max(0.0, -sorted[var_index]);
    }

    LOG_DEBUG("Risk: vol_risk={:.3f} liq_risk={:.3f} dd_risk={:.3f} overall={:.3f}",
              metrics.volatility_risk, metrics.liquidity_risk, metrics.drawdown_risk,
              metrics.overall_risk_score);

    return metrics;
}

} // namespace risk
} // namespace tradesense
