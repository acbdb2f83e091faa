#include "engine/SignalSynthesizer.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace tradesense {
namespace engine {

SignalSynthesizer::SignalSynthesizer(const SynthesisConfig& config)
    : config_(config)
{}

SynthesisResult SignalSynthesizer::synthesize(
    const analytics::AnalyzerResult& trend,
    const analytics::AnalyzerResult& momentum,
    const analytics::VolatilityResult& volatility,
    const analytics::VolumeResult& volume,
    double confidence_threshold
) const {
    SynthesisResult result;

    double score = config_.trend_weight * trend.score + config_.momentum_weight * momentum.score;
    score *= volume.multiplier;
    result.score = score;

    if (score >= confidence_threshold) {
        result.action = TradeAction::BUY;
    } else if (score <= -confidence_threshold) {
        result.action = TradeAction::SELL;
    }

    result.confidence = std::min(1.0, std::abs(score));
    result.strength = std::min(1.0, (std::abs(trend.score) + std::abs(momentum.score)) / 2.0);

    // Contradicting weak evidence is never acted on
    bool opposing = trend.score * momentum.score < 0.0;
    bool both_weak = std::abs(trend.score) <= config_.tie_break_magnitude &&
                     std::abs(momentum.score) <= config_.tie_break_magnitude;
    if (opposing && both_weak) {
        result.tie_break_applied = true;
        result.action = TradeAction::HOLD;
    }

    auto& reasons = result.reasoning;
    reasons.insert(reasons.end(), trend.reasoning.begin(), trend.reasoning.end());
    reasons.insert(reasons.end(), momentum.reasoning.begin(), momentum.reasoning.end());
    reasons.insert(reasons.end(), volatility.reasoning.begin(), volatility.reasoning.end());
    reasons.insert(reasons.end(), volume.reasoning.begin(), volume.reasoning.end());

    if (reasons.empty()) {
        reasons.push_back("No strong signal detected");
    }

    if (result.tie_break_applied) {
        reasons.push_back(fmt::format("Trend ({:+.2f}) and momentum ({:+.2f}) disagree: holding",
                                      trend.score, momentum.score));
    }

    return result;
}

} // namespace engine
} // namespace tradesense
