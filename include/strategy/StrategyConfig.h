#pragma once

#include "common/Types.h"
#include <string>

namespace tradesense {
namespace strategy {

enum class RiskPreset { CONSERVATIVE, MODERATE, AGGRESSIVE };

struct RiskPresetConfig {
    double risk_per_trade;
    double max_account_exposure;
};

// Closed mapping: every preset's numbers are visible here
inline RiskPresetConfig presetConfig(RiskPreset preset) {
    switch (preset) {
        case RiskPreset::CONSERVATIVE:
            return {0.01, 0.05};
        case RiskPreset::MODERATE:
            return {0.02, 0.10};
        case RiskPreset::AGGRESSIVE:
            return {0.05, 0.20};
    }
    return {0.02, 0.10};
}

const char* toString(RiskPreset preset);
// Throws InvalidParameterError for unknown names
RiskPreset parseRiskPreset(const std::string& name);

struct RegimeProfile {
    double confidence_threshold;
    double position_multiplier;
    double stop_loss_pct;
    double take_profit_pct;
    bool trailing_stop_enabled;
};

// Values applied when no regime deviation exists
struct GlobalStrategyDefaults {
    double confidence_threshold = 0.65;
    double position_multiplier = 1.0;
    double stop_loss_pct = 0.02;
    double take_profit_pct = 0.05;
    bool trailing_stop_enabled = true;
};

struct RegimeProfileTable {
    RegimeProfile bull{0.65, 1.2, 0.02, 0.06, true};
    RegimeProfile bear{0.70, 0.8, 0.025, 0.04, true};
    RegimeProfile sideways{0.70, 0.6, 0.015, 0.05, false};
    RegimeProfile volatile_market{0.75, 0.7, 0.03, 0.08, true};

    const RegimeProfile& forRegime(MarketRegime regime) const {
        switch (regime) {
            case MarketRegime::BULL:
                return bull;
            case MarketRegime::BEAR:
                return bear;
            case MarketRegime::VOLATILE:
                return volatile_market;
            case MarketRegime::SIDEWAYS:
                break;
        }
        return sideways;
    }

    RegimeProfile& forRegime(MarketRegime regime) {
        switch (regime) {
            case MarketRegime::BULL:
                return bull;
            case MarketRegime::BEAR:
                return bear;
            case MarketRegime::VOLATILE:
                return volatile_market;
            case MarketRegime::SIDEWAYS:
                break;
        }
        return sideways;
    }
};

} // namespace strategy
} // namespace tradesense
