#include "analytics/VolatilityAnalyzer.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace tradesense {
namespace analytics {

const char* toString(VolatilityState state) {
    switch (state) {
        case VolatilityState::NORMAL:
            return "normal";
        case VolatilityState::SQUEEZE:
            return "squeeze";
        case VolatilityState::BREAKOUT_UP:
            return "breakout_up";
        case VolatilityState::BREAKOUT_DOWN:
            return "breakout_down";
    }
    return "normal";
}

VolatilityAnalyzer::VolatilityAnalyzer(const VolatilityAnalyzerConfig& config)
    : config_(config)
{}

VolatilityResult VolatilityAnalyzer::analyze(const IndicatorSnapshot& s) const {
    VolatilityResult result;
    result.atr_percentile = s.atr_percentile;
    result.magnitude = std::clamp(s.atr_percentile, 0.0, 1.0);

    double risk_multiplier = 1.0;

    // Breakout outranks squeeze: a close outside the bands ends the squeeze
    if (s.close > s.bb_upper && s.bb_upper > s.bb_lower) {
        result.state = VolatilityState::BREAKOUT_UP;
        risk_multiplier += config_.breakout_risk_add;
        result.reasoning.push_back(fmt::format("Price broke above upper Bollinger Band ({:.2f})", s.bb_upper));
    } else if (s.close < s.bb_lower && s.bb_upper > s.bb_lower) {
        result.state = VolatilityState::BREAKOUT_DOWN;
        risk_multiplier += config_.breakout_risk_add;
        result.reasoning.push_back(fmt::format("Price broke below lower Bollinger Band ({:.2f})", s.bb_lower));
    } else if (s.bb_bandwidth < config_.squeeze_bandwidth) {
        result.state = VolatilityState::SQUEEZE;
        result.reasoning.push_back(fmt::format("Bollinger squeeze (bandwidth {:.2f}%)", s.bb_bandwidth * 100.0));
    }

    if (s.atr_percentile > config_.high_atr_percentile) {
        result.high_volatility = true;
        risk_multiplier += config_.high_volatility_risk_add;
        result.reasoning.push_back(fmt::format("ATR at {:.0f}th percentile of trailing history",
                                               s.atr_percentile * 100.0));
    }

    result.risk_multiplier = std::clamp(risk_multiplier, 1.0, 1.5);
    return result;
}

} // namespace analytics
} // namespace tradesense
