#pragma once

#include "common/Types.h"
#include <nlohmann/json.hpp>
#include <string>

namespace tradesense {

// Throws InvalidParameterError naming the offending field on any shape error
MarketData marketDataFromJson(const nlohmann::json& j);
MarketData loadMarketDataFile(const std::string& path);

nlohmann::json toJson(const MarketSignal& signal);
nlohmann::json toJson(const RiskMetrics& risk);
nlohmann::json toJson(const AdaptiveParameters& params);
nlohmann::json toJson(const PositionSizeResult& position);
nlohmann::json toJson(const TradingDecision& decision);

} // namespace tradesense
