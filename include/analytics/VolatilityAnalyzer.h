#pragma once

#include "analytics/AnalyzerTypes.h"
#include "analytics/TechnicalIndicators.h"

namespace tradesense {
namespace analytics {

// Bollinger squeeze/breakout state and ATR percentile. Produces a magnitude
// for the risk scorer, never a directional score.
class VolatilityAnalyzer {
public:
    explicit VolatilityAnalyzer(const VolatilityAnalyzerConfig& config = VolatilityAnalyzerConfig());

    VolatilityResult analyze(const IndicatorSnapshot& snapshot) const;

private:
    VolatilityAnalyzerConfig config_;
};

} // namespace analytics
} // namespace tradesense
