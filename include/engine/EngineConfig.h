#pragma once

#include "analytics/AnalyzerTypes.h"
#include "analytics/RegimeDetector.h"
#include "analytics/TechnicalIndicators.h"
#include "engine/SignalSynthesizer.h"
#include "risk/RiskScorer.h"
#include "strategy/StrategyConfig.h"
#include <cstddef>

namespace tradesense {
namespace engine {

// Every tunable of the engine. Held by value; the engine never mutates it.
struct EngineConfig {
    size_t min_candles = 50;            // EMA-50 lookback

    analytics::IndicatorSettings indicators;
    analytics::TrendAnalyzerConfig trend;
    analytics::MomentumAnalyzerConfig momentum;
    analytics::VolatilityAnalyzerConfig volatility;
    analytics::VolumeAnalyzerConfig volume;
    analytics::RegimeDetectorConfig regime;

    SynthesisConfig synthesis;
    risk::RiskScorerConfig risk;

    strategy::RiskPreset preset = strategy::RiskPreset::MODERATE;
    strategy::GlobalStrategyDefaults defaults;
    strategy::RegimeProfileTable regime_profiles;
};

} // namespace engine
} // namespace tradesense
