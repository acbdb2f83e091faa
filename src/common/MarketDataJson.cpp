#include "common/MarketDataJson.h"
#include "common/Errors.h"
#include <fstream>

namespace tradesense {

namespace {

long long toMillis(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

double readNumber(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw InvalidParameterError(where, std::string("missing '") + key + "'");
    }
    const auto& v = j[key];
    if (!v.is_number()) {
        throw InvalidParameterError(where, std::string("'") + key + "' is not a number");
    }
    return v.get<double>();
}

Candle readCandle(const nlohmann::json& j, size_t index) {
    std::string where = "market_data.candles[" + std::to_string(index) + "]";
    if (!j.is_object()) {
        throw InvalidParameterError(where, "expected an object");
    }

    Candle candle;
    candle.open = readNumber(j, "open", where);
    candle.high = readNumber(j, "high", where);
    candle.low = readNumber(j, "low", where);
    candle.close = readNumber(j, "close", where);
    candle.volume = j.contains("volume") ? readNumber(j, "volume", where) : 0.0;
    if (j.contains("timestamp")) {
        if (!j["timestamp"].is_number_integer()) {
            throw InvalidParameterError(where, "'timestamp' is not an integer");
        }
        candle.timestamp = j["timestamp"].get<long long>();
    }
    return candle;
}

// [price, size] pairs or {"price", "size"} objects
std::vector<OrderbookLevel> readLevels(const nlohmann::json& j, const std::string& where) {
    if (!j.is_array()) {
        throw InvalidParameterError(where, "expected an array of levels");
    }

    std::vector<OrderbookLevel> levels;
    levels.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& level = j[i];
        std::string level_where = where + "[" + std::to_string(i) + "]";
        if (level.is_array()) {
            if (level.size() != 2 || !level[0].is_number() || !level[1].is_number()) {
                throw InvalidParameterError(level_where, "expected [price, size]");
            }
            levels.emplace_back(level[0].get<double>(), level[1].get<double>());
        } else if (level.is_object()) {
            levels.emplace_back(readNumber(level, "price", level_where),
                                readNumber(level, "size", level_where));
        } else {
            throw InvalidParameterError(level_where, "expected [price, size]");
        }
    }
    return levels;
}

nlohmann::json reasoningArray(const std::vector<std::string>& lines) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& line : lines) {
        arr.push_back(line);
    }
    return arr;
}

}

MarketData marketDataFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidParameterError("market_data", "expected an object");
    }

    MarketData data;
    if (j.contains("symbol")) {
        if (!j["symbol"].is_string()) {
            throw InvalidParameterError("market_data.symbol", "expected a string");
        }
        data.symbol = j["symbol"].get<std::string>();
    }

    if (!j.contains("candles") || !j["candles"].is_array()) {
        throw InvalidParameterError("market_data.candles", "expected an array");
    }
    const auto& candles = j["candles"];
    data.candles.reserve(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        data.candles.push_back(readCandle(candles[i], i));
    }

    if (j.contains("volume") && !j["volume"].is_null()) {
        const auto& volume = j["volume"];
        if (!volume.is_array()) {
            throw InvalidParameterError("market_data.volume", "expected an array");
        }
        data.volume.reserve(volume.size());
        for (size_t i = 0; i < volume.size(); ++i) {
            if (!volume[i].is_number()) {
                throw InvalidParameterError("market_data.volume[" + std::to_string(i) + "]",
                                            "expected a number");
            }
            data.volume.push_back(volume[i].get<double>());
        }
    }

    if (j.contains("orderbook") && !j["orderbook"].is_null()) {
        const auto& book = j["orderbook"];
        if (!book.is_object()) {
            throw InvalidParameterError("market_data.orderbook", "expected an object");
        }
        Orderbook orderbook;
        if (book.contains("bids")) {
            orderbook.bids = readLevels(book["bids"], "market_data.orderbook.bids");
        }
        if (book.contains("asks")) {
            orderbook.asks = readLevels(book["asks"], "market_data.orderbook.asks");
        }
        data.orderbook = std::move(orderbook);
    }

    return data;
}

MarketData loadMarketDataFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InvalidParameterError("market_data", "cannot open " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidParameterError("market_data", path + ": " + e.what());
    }

    MarketData data = marketDataFromJson(j);
    if (data.symbol.empty()) {
        data.symbol = path;
    }
    return data;
}

nlohmann::json toJson(const MarketSignal& signal) {
    return {
        {"symbol", signal.symbol},
        {"action", toString(signal.action)},
        {"confidence", signal.confidence},
        {"strength", signal.strength},
        {"risk_score", signal.risk_score},
        {"market_regime", toString(signal.market_regime)},
        {"reasoning", reasoningArray(signal.reasoning)},
        {"timestamp", toMillis(signal.timestamp)}
    };
}

nlohmann::json toJson(const RiskMetrics& risk) {
    return {
        {"overall_risk_score", risk.overall_risk_score},
        {"volatility", risk.volatility},
        {"sharpe_ratio", risk.sharpe_ratio},
        {"max_drawdown", risk.max_drawdown},
        {"var_95", risk.var_95},
        {"volatility_risk", risk.volatility_risk},
        {"liquidity_risk", risk.liquidity_risk},
        {"drawdown_risk", risk.drawdown_risk},
        {"liquidity_degraded", risk.liquidity_degraded},
        {"market_regime", toString(risk.market_regime)},
        {"timestamp", toMillis(risk.timestamp)}
    };
}

nlohmann::json toJson(const AdaptiveParameters& params) {
    return {
        {"market_regime", toString(params.market_regime)},
        {"confidence_threshold", params.confidence_threshold},
        {"position_multiplier", params.position_multiplier},
        {"risk_per_trade", params.risk_per_trade},
        {"stop_loss_pct", params.stop_loss_pct},
        {"take_profit_pct", params.take_profit_pct},
        {"trailing_stop_enabled", params.trailing_stop_enabled},
        {"adaptive_reasoning", reasoningArray(params.adaptive_reasoning)}
    };
}

nlohmann::json toJson(const PositionSizeResult& position) {
    return {
        {"position_size", position.position_size},
        {"position_value", position.position_value},
        {"risk_amount", position.risk_amount},
        {"percentage_of_account", position.percentage_of_account},
        {"capped_by_exposure", position.capped_by_exposure}
    };
}

nlohmann::json toJson(const TradingDecision& decision) {
    nlohmann::json j = toJson(decision.signal);
    j["risk"] = toJson(decision.risk);
    j["parameters"] = toJson(decision.parameters);
    j["position"] = decision.position ? toJson(*decision.position) : nlohmann::json(nullptr);
    return j;
}

} // namespace tradesense
