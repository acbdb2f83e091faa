#include "analytics/TrendAnalyzer.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace tradesense {
namespace analytics {

TrendAnalyzer::TrendAnalyzer(const TrendAnalyzerConfig& config)
    : config_(config)
{}

AnalyzerResult TrendAnalyzer::analyze(const IndicatorSnapshot& s) const {
    AnalyzerResult result;
    double score = 0.0;

    // 1. EMA ordering
    if (s.ema_short > s.ema_medium && s.ema_medium > s.ema_long) {
        score = config_.full_alignment_score;
        result.reasoning.push_back("Bullish EMA alignment (EMA9 > EMA21 > EMA50)");
    } else if (s.ema_short < s.ema_medium && s.ema_medium < s.ema_long) {
        score = -config_.full_alignment_score;
        result.reasoning.push_back("Bearish EMA alignment (EMA9 < EMA21 < EMA50)");
    } else if (s.ema_short > s.ema_medium) {
        score = config_.partial_alignment_score;
        result.reasoning.push_back("EMA9 above EMA21 (partial bullish alignment)");
    } else if (s.ema_short < s.ema_medium) {
        score = -config_.partial_alignment_score;
        result.reasoning.push_back("EMA9 below EMA21 (partial bearish alignment)");
    }

    // 2. Long EMA slope
    bool slope_up = s.ema_long_slope > config_.min_slope;
    bool slope_down = s.ema_long_slope < -config_.min_slope;
    if ((score > 0.0 && slope_down) || (score < 0.0 && slope_up)) {
        score *= config_.slope_conflict_factor;
        result.reasoning.push_back(fmt::format("EMA50 slope ({:+.2f}%) opposes short-term alignment",
                                               s.ema_long_slope * 100.0));
    }

    // 3. EMA9 x EMA21 crossover on the last bar, confirmed by EMA50 direction
    bool golden = s.prev_ema_short <= s.prev_ema_medium && s.ema_short > s.ema_medium;
    bool death = s.prev_ema_short >= s.prev_ema_medium && s.ema_short < s.ema_medium;

    if (golden) {
        if (slope_up) {
            score = std::max(score, config_.confirmed_cross_score);
            result.reasoning.push_back("Golden cross: EMA9 crossed above EMA21 with rising EMA50");
        } else {
            result.reasoning.push_back("EMA9 crossed above EMA21 without EMA50 confirmation");
        }
    } else if (death) {
        if (slope_down) {
            score = std::min(score, -config_.confirmed_cross_score);
            result.reasoning.push_back("Death cross: EMA9 crossed below EMA21 with falling EMA50");
        } else {
            result.reasoning.push_back("EMA9 crossed below EMA21 without EMA50 confirmation");
        }
    }

    // Key levels are reported, not scored
    if (s.near_support && !s.near_resistance) {
        result.reasoning.push_back(fmt::format("Price near support ({:.2f})", s.nearest_support));
    } else if (s.near_resistance && !s.near_support) {
        result.reasoning.push_back(fmt::format("Price near resistance ({:.2f})", s.nearest_resistance));
    }

    result.score = std::clamp(score, -1.0, 1.0);
    return result;
}

} // namespace analytics
} // namespace tradesense
