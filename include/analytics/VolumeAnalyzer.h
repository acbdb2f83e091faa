#pragma once

#include "analytics/AnalyzerTypes.h"
#include "analytics/TechnicalIndicators.h"

namespace tradesense {
namespace analytics {

// OBV/price alignment and volume spikes, expressed as a score multiplier
class VolumeAnalyzer {
public:
    explicit VolumeAnalyzer(const VolumeAnalyzerConfig& config = VolumeAnalyzerConfig());

    VolumeResult analyze(const IndicatorSnapshot& snapshot) const;

private:
    VolumeAnalyzerConfig config_;
};

} // namespace analytics
} // namespace tradesense
