#pragma once

#include "analytics/AnalyzerTypes.h"
#include "analytics/TechnicalIndicators.h"

namespace tradesense {
namespace analytics {

// Mean of RSI, MACD and Stochastic contributions.
// The RSI contribution never decreases as RSI rises.
class MomentumAnalyzer {
public:
    explicit MomentumAnalyzer(const MomentumAnalyzerConfig& config = MomentumAnalyzerConfig());

    AnalyzerResult analyze(const IndicatorSnapshot& snapshot) const;

    double rsiContribution(const IndicatorSnapshot& snapshot, std::vector<std::string>* reasoning = nullptr) const;
    double macdContribution(const IndicatorSnapshot& snapshot, std::vector<std::string>* reasoning = nullptr) const;
    double stochasticContribution(const IndicatorSnapshot& snapshot, std::vector<std::string>* reasoning = nullptr) const;

private:
    MomentumAnalyzerConfig config_;
};

} // namespace analytics
} // namespace tradesense
