#include "engine/MarketAnalysisEngine.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cmath>

namespace tradesense {
namespace engine {

MarketAnalysisEngine::MarketAnalysisEngine(const EngineConfig& config)
    : config_(config)
    , trend_analyzer_(config.trend)
    , momentum_analyzer_(config.momentum)
    , volatility_analyzer_(config.volatility)
    , volume_analyzer_(config.volume)
    , regime_detector_(config.regime, config.indicators)
    , synthesizer_(config.synthesis)
    , risk_scorer_(config.risk)
    , parameter_provider_(config.regime_profiles, config.defaults, config.preset)
{
    if (config_.min_candles < static_cast<size_t>(config_.indicators.ema_long)) {
        throw InvalidParameterError("engine.min_candles",
                                    fmt::format("{} is below the EMA({}) lookback",
                                                config_.min_candles, config_.indicators.ema_long));
    }
    if (config_.regime.slope_lookback < 2) {
        throw InvalidParameterError("engine.regime.slope_lookback",
                                    fmt::format("regression needs at least 2 bars, got {}",
                                                config_.regime.slope_lookback));
    }
}

void MarketAnalysisEngine::validate(const MarketData& data) const {
    if (data.candles.size() < config_.min_candles) {
        throw InsufficientDataError("candles", config_.min_candles, data.candles.size());
    }
    if (!data.volume.empty() && data.volume.size() != data.candles.size()) {
        throw InvalidParameterError("volume",
                                    fmt::format("{} values for {} candles",
                                                data.volume.size(), data.candles.size()));
    }
    analytics::TechnicalIndicators::validateCandles(data.candles);
}

std::vector<double> MarketAnalysisEngine::resolveVolumes(const MarketData& data) const {
    if (data.volume.empty()) {
        return analytics::TechnicalIndicators::extractVolumes(data.candles);
    }
    for (size_t i = 0; i < data.volume.size(); ++i) {
        if (!std::isfinite(data.volume[i]) || data.volume[i] < 0.0) {
            throw InvalidParameterError("volume", fmt::format("invalid value at index {}", i));
        }
    }
    return data.volume;
}

TradingDecision MarketAnalysisEngine::evaluate(const MarketData& data) const {
    validate(data);
    auto volumes = resolveVolumes(data);

    // 1. Indicators
    auto snapshot = analytics::TechnicalIndicators::buildSnapshot(data.candles, volumes, config_.indicators);

    // 2. Regime and the parameters it selects
    auto regime = regime_detector_.analyzeRegime(data.candles);
    LOG_DEBUG("[{}] {}", data.symbol, regime.description);

    TradingDecision decision;
    decision.parameters = parameter_provider_.parametersFor(regime.regime);

    // 3. Analyzers
    auto trend = trend_analyzer_.analyze(snapshot);
    auto momentum = momentum_analyzer_.analyze(snapshot);
    auto volatility = volatility_analyzer_.analyze(snapshot);
    auto volume = volume_analyzer_.analyze(snapshot);
    LOG_DEBUG("[{}] trend={:+.3f} momentum={:+.3f} volatility={} volume_mult={:.2f}",
              data.symbol, trend.score, momentum.score,
              analytics::toString(volatility.state), volume.multiplier);

    // 4. Synthesis against the regime's threshold
    auto synthesis = synthesizer_.synthesize(trend, momentum, volatility, volume,
                                             decision.parameters.confidence_threshold);

    // 5. Risk
    decision.risk = risk_scorer_.assess(data.candles, snapshot, volatility, data.orderbook, regime.regime);

    MarketSignal& signal = decision.signal;
    signal.symbol = data.symbol;
    signal.action = synthesis.action;
    signal.confidence = synthesis.confidence;
    signal.strength = synthesis.strength;
    signal.risk_score = decision.risk.overall_risk_score;
    signal.market_regime = regime.regime;
    signal.reasoning = std::move(synthesis.reasoning);
    signal.timestamp = std::chrono::system_clock::now();

    if (decision.risk.liquidity_degraded) {
        std::string note = fmt::format("Order book unavailable: liquidity risk set to {:.2f}",
                                       decision.risk.liquidity_risk);
        signal.reasoning.push_back(note);
        decision.parameters.adaptive_reasoning.push_back(note);
    }

    return decision;
}

void MarketAnalysisEngine::record(const MarketSignal& signal) const {
    LOG_INFO("[{}] {} conf={:.2f} strength={:.2f} risk={:.2f} regime={}",
             signal.symbol, toString(signal.action), signal.confidence, signal.strength,
             signal.risk_score, toString(signal.market_regime));
    Logger::getInstance().logDecision(signal.symbol, toString(signal.action),
                                      signal.confidence, signal.strength,
                                      signal.risk_score, toString(signal.market_regime));
}

MarketSignal MarketAnalysisEngine::analyze(const MarketData& data) const {
    MarketSignal signal = evaluate(data).signal;
    record(signal);
    return signal;
}

RiskMetrics MarketAnalysisEngine::assessRisk(const MarketData& data) const {
    return evaluate(data).risk;
}

AdaptiveParameters MarketAnalysisEngine::adaptiveParameters(const MarketData& data) const {
    return evaluate(data).parameters;
}

PositionSizeResult MarketAnalysisEngine::sizePosition(
    const risk::SizingRequest& request,
    const AdaptiveParameters& parameters
) const {
    risk::SizingRequest resolved = request;
    if (!resolved.risk_per_trade) {
        resolved.risk_per_trade = parameters.risk_per_trade;
    }
    if (!resolved.max_account_exposure) {
        resolved.max_account_exposure = strategy::presetConfig(config_.preset).max_account_exposure;
    }
    return risk::PositionSizer::calculate(resolved, parameters.position_multiplier);
}

TradingDecision MarketAnalysisEngine::decide(
    const MarketData& data,
    const std::optional<risk::SizingRequest>& sizing
) const {
    TradingDecision decision = evaluate(data);
    record(decision.signal);

    if (sizing && decision.signal.action != TradeAction::HOLD) {
        decision.position = sizePosition(*sizing, decision.parameters);
        LOG_INFO("[{}] size {:.6f} ({:.2f}% of account{})",
                 data.symbol, decision.position->position_size,
                 decision.position->percentage_of_account,
                 decision.position->capped_by_exposure ? ", exposure capped" : "");
    }

    return decision;
}

} // namespace engine
} // namespace tradesense
