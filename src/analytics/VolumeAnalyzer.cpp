#include "analytics/VolumeAnalyzer.h"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace tradesense {
namespace analytics {

VolumeAnalyzer::VolumeAnalyzer(const VolumeAnalyzerConfig& config)
    : config_(config)
{}

VolumeResult VolumeAnalyzer::analyze(const IndicatorSnapshot& s) const {
    VolumeResult result;
    double multiplier = 1.0;

    int price_dir = (s.price_change_pct > 0.0) - (s.price_change_pct < 0.0);
    int obv_dir = (s.obv_change > 0.0) - (s.obv_change < 0.0);

    if (price_dir != 0 && obv_dir != 0) {
        if (price_dir == obv_dir) {
            result.confirmation = VolumeConfirmation::CONFIRMED;
            multiplier += config_.confirmation_step;
            result.reasoning.push_back(price_dir > 0 ? "OBV rising with price (volume confirms)"
                                                     : "OBV falling with price (volume confirms)");
        } else {
            result.confirmation = VolumeConfirmation::DIVERGENT;
            multiplier -= config_.confirmation_step;
            result.reasoning.push_back("OBV diverges from price trend");
        }
    }

    if (s.volume_spike) {
        result.volume_spike = true;
        // A spike amplifies whatever the OBV alignment says
        if (result.confirmation == VolumeConfirmation::CONFIRMED) {
            multiplier += config_.spike_step;
        } else if (result.confirmation == VolumeConfirmation::DIVERGENT) {
            multiplier -= config_.spike_step;
        }
        result.reasoning.push_back(fmt::format("Volume spike ({:.1f}x trailing average)", s.relative_volume));
    }

    result.multiplier = std::clamp(multiplier, config_.min_multiplier, config_.max_multiplier);
    return result;
}

} // namespace analytics
} // namespace tradesense
