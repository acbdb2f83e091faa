#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/SignalSynthesizer.h"
#include "analytics/TrendAnalyzer.h"
#include "analytics/MomentumAnalyzer.h"
#include "analytics/VolatilityAnalyzer.h"
#include "analytics/VolumeAnalyzer.h"
#include "analytics/RegimeDetector.h"
#include "risk/RiskScorer.h"
#include "risk/PositionSizer.h"
#include "strategy/AdaptiveParameterProvider.h"
#include <optional>
#include <vector>

namespace tradesense {
namespace engine {

// Engine facade. Immutable after construction: every call takes the full
// window and shares nothing with other calls, so one instance can serve
// any number of threads.
class MarketAnalysisEngine {
public:
    explicit MarketAnalysisEngine(const EngineConfig& config = EngineConfig());

    MarketSignal analyze(const MarketData& data) const;
    RiskMetrics assessRisk(const MarketData& data) const;
    AdaptiveParameters adaptiveParameters(const MarketData& data) const;

    // Missing risk_per_trade / max_account_exposure come from the parameters
    // and the active preset
    PositionSizeResult sizePosition(const risk::SizingRequest& request,
                                    const AdaptiveParameters& parameters) const;

    TradingDecision decide(const MarketData& data,
                           const std::optional<risk::SizingRequest>& sizing = std::nullopt) const;

    const EngineConfig& config() const { return config_; }

private:
    void validate(const MarketData& data) const;
    std::vector<double> resolveVolumes(const MarketData& data) const;
    TradingDecision evaluate(const MarketData& data) const;
    // Only signal-producing calls land in decisions.log
    void record(const MarketSignal& signal) const;

    EngineConfig config_;
    analytics::TrendAnalyzer trend_analyzer_;
    analytics::MomentumAnalyzer momentum_analyzer_;
    analytics::VolatilityAnalyzer volatility_analyzer_;
    analytics::VolumeAnalyzer volume_analyzer_;
    analytics::RegimeDetector regime_detector_;
    SignalSynthesizer synthesizer_;
    risk::RiskScorer risk_scorer_;
    strategy::AdaptiveParameterProvider parameter_provider_;
};

} // namespace engine
} // namespace tradesense
