#include "risk/PositionSizer.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace tradesense {
namespace risk {

namespace {

void requirePositive(const char* name, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidParameterError(std::string("PositionSizer.") + name,
                                    "must be a positive finite number, got " + std::to_string(value));
    }
}

void requireFraction(const char* name, double value) {
    if (!std::isfinite(value) || value <= 0.0 || value > 1.0) {
        throw InvalidParameterError(std::string("PositionSizer.") + name,
                                    "must be within (0, 1], got " + std::to_string(value));
    }
}

}

PositionSizeResult PositionSizer::calculate(const SizingRequest& request, double position_multiplier) {
    requirePositive("account_balance", request.account_balance);
    requirePositive("entry_price", request.entry_price);
    requirePositive("stop_distance", request.stop_distance);
    requirePositive("position_multiplier", position_multiplier);
    double risk_per_trade = request.risk_per_trade.value_or(DEFAULT_RISK_PER_TRADE);
    double max_exposure = request.max_account_exposure.value_or(DEFAULT_MAX_ACCOUNT_EXPOSURE);
    requireFraction("risk_per_trade", risk_per_trade);
    requireFraction("max_account_exposure", max_exposure);

    PositionSizeResult result;
    result.risk_amount = request.account_balance * risk_per_trade;

    double raw_size = result.risk_amount / request.stop_distance;
    double exposure_cap = request.account_balance * max_exposure / request.entry_price;

    // The regime multiplier never lifts a position past the exposure cap
    double size = std::min(raw_size, exposure_cap) * position_multiplier;
    if (size >= exposure_cap) {
        size = exposure_cap;
        result.capped_by_exposure = true;
    }

    result.position_size = size;
    result.position_value = size * request.entry_price;
    result.percentage_of_account = (result.position_value / request.account_balance) * 100.0;

    LOG_DEBUG("Position size: raw={:.6f} cap={:.6f} multiplier={:.2f} final={:.6f}",
              raw_size, exposure_cap, position_multiplier, size);

    return result;
}

double PositionSizer::stopDistanceFromPct(double entry_price, double stop_loss_pct) {
    requirePositive("entry_price", entry_price);
    requireFraction("stop_loss_pct", stop_loss_pct);
    return entry_price * stop_loss_pct;
}

} // namespace risk
} // namespace tradesense
