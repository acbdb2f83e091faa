#pragma once

#include "common/Types.h"
#include <optional>

namespace tradesense {
namespace risk {

constexpr double DEFAULT_RISK_PER_TRADE = 0.02;
constexpr double DEFAULT_MAX_ACCOUNT_EXPOSURE = 0.10;

struct SizingRequest {
    double account_balance = 0.0;
    double entry_price = 0.0;
    double stop_distance = 0.0;         // absolute price distance to the stop
    // Unset fractions fall back to the defaults above, or to the preset when
    // sized through the engine
    std::optional<double> risk_per_trade;
    std::optional<double> max_account_exposure;
};

// Fixed-fractional sizing capped by account exposure
class PositionSizer {
public:
    // Throws InvalidParameterError on non-positive or non-finite inputs
    static PositionSizeResult calculate(const SizingRequest& request, double position_multiplier = 1.0);

    static double stopDistanceFromPct(double entry_price, double stop_loss_pct);
};

} // namespace risk
} // namespace tradesense
