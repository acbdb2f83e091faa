#pragma once

#include <string>
#include <vector>

namespace tradesense {
namespace analytics {

// Directional analyzer output: -1.0 (bearish) ~ +1.0 (bullish)
struct AnalyzerResult {
    double score = 0.0;
    std::vector<std::string> reasoning;
};

enum class VolatilityState {
    NORMAL,
    SQUEEZE,            // Bollinger bandwidth below threshold
    BREAKOUT_UP,        // close above upper band
    BREAKOUT_DOWN       // close below lower band
};

// Magnitude only; never a direction
struct VolatilityResult {
    VolatilityState state = VolatilityState::NORMAL;
    double atr_percentile = 0.0;
    double magnitude = 0.0;             // 0 ~ 1
    double risk_multiplier = 1.0;       // 1.0 ~ 1.5, applied to volatility risk
    bool high_volatility = false;
    std::vector<std::string> reasoning;
};

enum class VolumeConfirmation { NONE, CONFIRMED, DIVERGENT };

struct VolumeResult {
    VolumeConfirmation confirmation = VolumeConfirmation::NONE;
    bool volume_spike = false;
    double multiplier = 1.0;            // 0.8 ~ 1.2
    std::vector<std::string> reasoning;
};

struct TrendAnalyzerConfig {
    double full_alignment_score = 1.0;
    double partial_alignment_score = 0.5;
    double slope_conflict_factor = 0.6;     // applied when EMA50 slope opposes the ordering
    double min_slope = 0.0005;              // |EMA50 slope| below this counts as flat
    double confirmed_cross_score = 0.8;
};

struct MomentumAnalyzerConfig {
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
    double rsi_scale = 20.0;                // RSI points from 50 to a full contribution
    double divergence_adjustment = 0.25;
    double macd_trend_score = 0.5;          // histogram sign without a crossover
    double stoch_overbought = 80.0;
    double stoch_oversold = 20.0;
};

struct VolatilityAnalyzerConfig {
    double squeeze_bandwidth = 0.04;
    double high_atr_percentile = 0.80;
    double breakout_risk_add = 0.2;
    double high_volatility_risk_add = 0.3;
};

struct VolumeAnalyzerConfig {
    double confirmation_step = 0.1;
    double spike_step = 0.1;
    double min_multiplier = 0.8;
    double max_multiplier = 1.2;
};

const char* toString(VolatilityState state);

} // namespace analytics
} // namespace tradesense
