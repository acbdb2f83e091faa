#include "analytics/MomentumAnalyzer.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace tradesense {
namespace analytics {

MomentumAnalyzer::MomentumAnalyzer(const MomentumAnalyzerConfig& config)
    : config_(config)
{}

double MomentumAnalyzer::rsiContribution(
    const IndicatorSnapshot& s,
    std::vector<std::string>* reasoning
) const {
    double contribution = (s.rsi - 50.0) / config_.rsi_scale;

    if (s.rsi > config_.rsi_overbought) {
        if (reasoning) reasoning->push_back(fmt::format("RSI overbought ({:.1f})", s.rsi));
    } else if (s.rsi < config_.rsi_oversold) {
        if (reasoning) reasoning->push_back(fmt::format("RSI oversold ({:.1f})", s.rsi));
    }

    // Divergence: price and RSI disagree on direction
    bool price_up = s.price_change_pct > 0.0;
    bool price_down = s.price_change_pct < 0.0;

    if (price_up && (s.rsi < s.rsi_prev || s.rsi < config_.rsi_oversold)) {
        contribution -= config_.divergence_adjustment;
        if (reasoning) {
            reasoning->push_back(fmt::format("Bearish RSI divergence: price {:+.2f}% while RSI {:.1f} (was {:.1f})",
                                             s.price_change_pct * 100.0, s.rsi, s.rsi_prev));
        }
    } else if (price_down && (s.rsi > s.rsi_prev || s.rsi > config_.rsi_overbought)) {
        contribution += config_.divergence_adjustment;
        if (reasoning) {
            reasoning->push_back(fmt::format("Bullish RSI divergence: price {:+.2f}% while RSI {:.1f} (was {:.1f})",
                                             s.price_change_pct * 100.0, s.rsi, s.rsi_prev));
        }
    }

    return std::clamp(contribution, -1.0, 1.0);
}

double MomentumAnalyzer::macdContribution(
    const IndicatorSnapshot& s,
    std::vector<std::string>* reasoning
) const {
    switch (s.macd_crossover) {
        case Crossover::BULLISH:
            if (reasoning) reasoning->push_back("MACD bullish crossover");
            return 1.0;
        case Crossover::BEARISH:
            if (reasoning) reasoning->push_back("MACD bearish crossover");
            return -1.0;
        case Crossover::NONE:
            break;
    }

    if (s.macd_histogram > 0.0) {
        if (reasoning) reasoning->push_back(fmt::format("MACD histogram positive ({:.4f})", s.macd_histogram));
        return config_.macd_trend_score;
    }
    if (s.macd_histogram < 0.0) {
        if (reasoning) reasoning->push_back(fmt::format("MACD histogram negative ({:.4f})", s.macd_histogram));
        return -config_.macd_trend_score;
    }
    return 0.0;
}

double MomentumAnalyzer::stochasticContribution(
    const IndicatorSnapshot& s,
    std::vector<std::string>* reasoning
) const {
    bool cross_up = s.stoch_prev_k <= s.stoch_prev_d && s.stoch_k > s.stoch_d;
    bool cross_down = s.stoch_prev_k >= s.stoch_prev_d && s.stoch_k < s.stoch_d;

    if (cross_up && s.stoch_k < config_.stoch_oversold) {
        if (reasoning) {
            reasoning->push_back(fmt::format("Stochastic bullish crossover in oversold zone (%K {:.1f})", s.stoch_k));
        }
        return 1.0;
    }
    if (cross_down && s.stoch_k > config_.stoch_overbought) {
        if (reasoning) {
            reasoning->push_back(fmt::format("Stochastic bearish crossover in overbought zone (%K {:.1f})", s.stoch_k));
        }
        return -1.0;
    }
    return 0.0;
}

AnalyzerResult MomentumAnalyzer::analyze(const IndicatorSnapshot& snapshot) const {
    AnalyzerResult result;

    double rsi = rsiContribution(snapshot, &result.reasoning);
    double macd = macdContribution(snapshot, &result.reasoning);
    double stoch = stochasticContribution(snapshot, &result.reasoning);

    result.score = std::clamp((rsi + macd + stoch) / 3.0, -1.0, 1.0);
    return result;
}

} // namespace analytics
} // namespace tradesense
