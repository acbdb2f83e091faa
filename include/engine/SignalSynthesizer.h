#pragma once

#include "common/Types.h"
#include "analytics/AnalyzerTypes.h"
#include <string>
#include <vector>

namespace tradesense {
namespace engine {

struct SynthesisConfig {
    double trend_weight = 0.30;
    double momentum_weight = 0.40;
    // Opposing trend/momentum both at or below this magnitude force HOLD
    double tie_break_magnitude = 0.5;
};

struct SynthesisResult {
    TradeAction action = TradeAction::HOLD;
    double score = 0.0;             // weighted, volume-adjusted composite
    double confidence = 0.0;
    double strength = 0.0;
    bool tie_break_applied = false;
    std::vector<std::string> reasoning;
};

// Fuses analyzer outputs into one action. Volatility contributes text only;
// its magnitude goes to the risk scorer.
class SignalSynthesizer {
public:
    explicit SignalSynthesizer(const SynthesisConfig& config = SynthesisConfig());

    SynthesisResult synthesize(
        const analytics::AnalyzerResult& trend,
        const analytics::AnalyzerResult& momentum,
        const analytics::VolatilityResult& volatility,
        const analytics::VolumeResult& volume,
        double confidence_threshold
    ) const;

private:
    SynthesisConfig config_;
};

} // namespace engine
} // namespace tradesense
