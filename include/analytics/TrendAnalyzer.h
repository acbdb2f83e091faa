#pragma once

#include "analytics/AnalyzerTypes.h"
#include "analytics/TechnicalIndicators.h"

namespace tradesense {
namespace analytics {

// EMA9/21/50 ordering and slope, golden/death cross detection
class TrendAnalyzer {
public:
    explicit TrendAnalyzer(const TrendAnalyzerConfig& config = TrendAnalyzerConfig());

    AnalyzerResult analyze(const IndicatorSnapshot& snapshot) const;

private:
    TrendAnalyzerConfig config_;
};

} // namespace analytics
} // namespace tradesense
