#include "strategy/AdaptiveParameterProvider.h"
#include "common/Errors.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace tradesense {
namespace strategy {

namespace {

bool differs(double a, double b) {
    return std::abs(a - b) > 1e-12;
}

}

const char* toString(RiskPreset preset) {
    switch (preset) {
        case RiskPreset::CONSERVATIVE:
            return "conservative";
        case RiskPreset::MODERATE:
            return "moderate";
        case RiskPreset::AGGRESSIVE:
            return "aggressive";
    }
    return "moderate";
}

RiskPreset parseRiskPreset(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "conservative") return RiskPreset::CONSERVATIVE;
    if (lower == "moderate") return RiskPreset::MODERATE;
    if (lower == "aggressive") return RiskPreset::AGGRESSIVE;

    throw InvalidParameterError("config.preset", "unknown risk preset '" + name + "'");
}

AdaptiveParameterProvider::AdaptiveParameterProvider(
    const RegimeProfileTable& profiles,
    const GlobalStrategyDefaults& defaults,
    RiskPreset preset
)
    : profiles_(profiles)
    , defaults_(defaults)
    , preset_(preset)
{}

AdaptiveParameters AdaptiveParameterProvider::parametersFor(MarketRegime regime) const {
    const RegimeProfile& profile = profiles_.forRegime(regime);
    const char* regime_name = toString(regime);

    AdaptiveParameters params;
    params.market_regime = regime;
    params.confidence_threshold = profile.confidence_threshold;
    params.position_multiplier = profile.position_multiplier;
    params.risk_per_trade = presetConfig(preset_).risk_per_trade;
    params.stop_loss_pct = profile.stop_loss_pct;
    params.take_profit_pct = profile.take_profit_pct;
    params.trailing_stop_enabled = profile.trailing_stop_enabled;

    auto& notes = params.adaptive_reasoning;
    if (differs(profile.confidence_threshold, defaults_.confidence_threshold)) {
        notes.push_back(fmt::format("confidence_threshold {:.2f} -> {:.2f} ({} regime)",
                                    defaults_.confidence_threshold, profile.confidence_threshold, regime_name));
    }
    if (differs(profile.position_multiplier, defaults_.position_multiplier)) {
        notes.push_back(fmt::format("position_multiplier {:.2f} -> {:.2f} ({} regime)",
                                    defaults_.position_multiplier, profile.position_multiplier, regime_name));
    }
    if (differs(profile.stop_loss_pct, defaults_.stop_loss_pct)) {
        notes.push_back(fmt::format("stop_loss_pct {:.3f} -> {:.3f} ({} regime)",
                                    defaults_.stop_loss_pct, profile.stop_loss_pct, regime_name));
    }
    if (differs(profile.take_profit_pct, defaults_.take_profit_pct)) {
        notes.push_back(fmt::format("take_profit_pct {:.3f} -> {:.3f} ({} regime)",
                                    defaults_.take_profit_pct, profile.take_profit_pct, regime_name));
    }
    if (profile.trailing_stop_enabled != defaults_.trailing_stop_enabled) {
        notes.push_back(fmt::format("trailing_stop {} ({} regime)",
                                    profile.trailing_stop_enabled ? "enabled" : "disabled", regime_name));
    }
    if (preset_ != RiskPreset::MODERATE) {
        notes.push_back(fmt::format("risk_per_trade {:.3f} ({} preset)", params.risk_per_trade, toString(preset_)));
    }

    return params;
}

} // namespace strategy
} // namespace tradesense
