#pragma once

#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace tradesense {
namespace strategy {

// Regime -> parameter bundle. Each deviation from the global defaults is
// written to adaptive_reasoning.
class AdaptiveParameterProvider {
public:
    AdaptiveParameterProvider(const RegimeProfileTable& profiles,
                              const GlobalStrategyDefaults& defaults,
                              RiskPreset preset);

    AdaptiveParameters parametersFor(MarketRegime regime) const;

private:
    RegimeProfileTable profiles_;
    GlobalStrategyDefaults defaults_;
    RiskPreset preset_;
};

} // namespace strategy
} // namespace tradesense
