#pragma once

#include "common/Types.h"
#include "analytics/TechnicalIndicators.h"
#include <vector>
#include <string>

namespace tradesense {
namespace analytics {

struct RegimeDetectorConfig {
    double high_volatility_percentile = 0.80;   // above this ATR percentile -> VOLATILE
    int slope_lookback = 20;
    int persistence_lookback = 10;
    double min_persistence = 0.6;               // share of bars with full EMA alignment
    double min_trend_slope = 0.02;              // regression move over slope_lookback / price
};

struct RegimeInputs {
    double trend_slope = 0.0;           // normalized, signed
    double bull_persistence = 0.0;      // 0~1
    double bear_persistence = 0.0;      // 0~1
    double atr_percentile = 0.0;        // 0~1
};

struct RegimeAnalysis {
    MarketRegime regime = MarketRegime::SIDEWAYS;
    RegimeInputs inputs;
    std::string description;
};

class RegimeDetector {
public:
    explicit RegimeDetector(const RegimeDetectorConfig& config = RegimeDetectorConfig(),
                            const IndicatorSettings& indicators = IndicatorSettings());

    // Detect current regime from the full window
    RegimeAnalysis analyzeRegime(const std::vector<Candle>& candles) const;

    RegimeInputs measure(const std::vector<Candle>& candles) const;
    RegimeAnalysis classify(const RegimeInputs& inputs) const;

private:
    RegimeDetectorConfig config_;
    IndicatorSettings indicators_;
};

} // namespace analytics
} // namespace tradesense
