#pragma once

#include "common/Types.h"
#include "analytics/AnalyzerTypes.h"
#include "analytics/TechnicalIndicators.h"
#include <optional>
#include <vector>

namespace tradesense {
namespace risk {

struct RiskScorerConfig {
    double volatility_weight = 0.5;
    double liquidity_weight = 0.3;
    double drawdown_weight = 0.2;
    double drawdown_cap = 0.20;                 // drawdown mapped to risk 1.0
    double missing_orderbook_liquidity_risk = 0.5;
    double annualization_periods = 252.0;
};

// Composite risk: volatility (self-scaled ATR), liquidity (spread), drawdown
class RiskScorer {
public:
    explicit RiskScorer(const RiskScorerConfig& config = RiskScorerConfig());

    RiskMetrics assess(
        const std::vector<Candle>& candles,
        const analytics::IndicatorSnapshot& snapshot,
        const analytics::VolatilityResult& volatility,
        const std::optional<Orderbook>& orderbook,
        MarketRegime regime
    ) const;

    // ATR14 / trailing max ATR, scaled by the volatility analyzer's multiplier
    double volatilityRisk(const analytics::IndicatorSnapshot& snapshot,
                          const analytics::VolatilityResult& volatility) const;
    // Spread / mid; the conservative default when the book is missing or unusable
    double liquidityRisk(const std::optional<Orderbook>& orderbook, bool* degraded = nullptr) const;
    double drawdownRisk(double max_drawdown) const;

private:
    RiskScorerConfig config_;
};

} // namespace risk
} // namespace tradesense
