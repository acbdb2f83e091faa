#include "common/MarketDataJson.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "engine/MarketAnalysisEngine.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace tradesense;

namespace {

nlohmann::json risingCandles(int count) {
    nlohmann::json candles = nlohmann::json::array();
    for (int i = 0; i < count; ++i) {
        double close = 100.0 + 0.25 * i;
        candles.push_back({
            {"open", close - 0.1}, {"high", close + 0.5}, {"low", close - 0.5},
            {"close", close}, {"volume", 1500.0}, {"timestamp", 1700000000000LL + i * 60000LL}
        });
    }
    return candles;
}

bool rejects(const nlohmann::json& j, const std::string& stage_prefix) {
    try {
        marketDataFromJson(j);
    } catch (const InvalidParameterError& e) {
        if (e.stage().rfind(stage_prefix, 0) != 0) {
            std::cerr << "[TEST] unexpected stage: " << e.stage() << "\n";
            return false;
        }
        return true;
    }
    return false;
}

}

int main() {
    std::cout << "[TEST] Starting MarketDataJson Test..." << std::endl;

    // 1. Full document
    nlohmann::json doc = {
        {"symbol", "BTC-USD"},
        {"candles", risingCandles(60)},
        {"volume", std::vector<double>(60, 1500.0)},
        {"orderbook", {
            {"bids", {{99.9, 2.0}, {99.8, 4.0}}},
            {"asks", nlohmann::json::array({nlohmann::json{{"price", 100.1}, {"size", 1.5}}})}
        }}
    };
    auto data = marketDataFromJson(doc);
    assert(data.symbol == "BTC-USD");
    assert(data.candles.size() == 60);
    assert(data.candles[1].timestamp == 1700000060000LL);
    assert(data.volume.size() == 60);
    assert(data.orderbook.has_value());
    assert(data.orderbook->bids.size() == 2);
    assert(data.orderbook->bids[1].size == 4.0);
    assert(data.orderbook->asks.front().price == 100.1);

    // 2. Optional parts
    auto minimal = marketDataFromJson({{"candles", risingCandles(3)}, {"orderbook", nullptr}});
    assert(minimal.symbol.empty());
    assert(minimal.volume.empty());
    assert(!minimal.orderbook);

    // 3. Shape errors name the field
    if (!rejects(nlohmann::json::array(), "market_data")) return 1;
    if (!rejects({{"symbol", "X"}}, "market_data.candles")) return 1;
    nlohmann::json bad_candle = {{"candles", risingCandles(2)}};
    bad_candle["candles"][1]["close"] = "101";
    if (!rejects(bad_candle, "market_data.candles[1]")) return 1;
    nlohmann::json bad_volume = {{"candles", risingCandles(2)}, {"volume", {1.0, "x"}}};
    if (!rejects(bad_volume, "market_data.volume[1]")) return 1;
    nlohmann::json bad_level = {{"candles", risingCandles(2)}};
    bad_level["orderbook"]["bids"] = nlohmann::json::array({nlohmann::json::array({1.0})});
    if (!rejects(bad_level, "market_data.orderbook.bids[0]")) return 1;

    // 4. Decision serialization
    spdlog::set_level(spdlog::level::warn);
    engine::MarketAnalysisEngine engine;
    risk::SizingRequest sizing;
    sizing.account_balance = 5000.0;
    sizing.entry_price = data.candles.back().close;
    sizing.stop_distance = 2.0;
    auto decision = engine.decide(data, sizing);

    auto out = toJson(decision);
    assert(out["symbol"] == "BTC-USD");
    const std::string action = out["action"].get<std::string>();
    assert(action == "buy" || action == "sell" || action == "hold");
    assert(out["confidence"].is_number());
    assert(out["reasoning"].is_array() && !out["reasoning"].empty());
    assert(out["timestamp"].is_number_integer());
    assert(out["risk"]["liquidity_degraded"] == false);
    assert(out["parameters"]["market_regime"] == out["market_regime"]);
    assert(out["parameters"].contains("adaptive_reasoning"));
    if (decision.position) {
        assert(out["position"]["position_size"].get<double>() == decision.position->position_size);
    } else {
        assert(out["position"].is_null());
    }

    // 5. File loading falls back to the path for a missing symbol
    const auto path = std::filesystem::temp_directory_path() / "tradesense_market.json";
    {
        std::ofstream file(path);
        nlohmann::json file_doc;
        file_doc["candles"] = risingCandles(5);
        file << file_doc.dump();
    }
    auto loaded = loadMarketDataFile(path.string());
    assert(loaded.symbol == path.string());
    assert(loaded.candles.size() == 5);
    std::filesystem::remove(path);

    bool threw = false;
    try {
        loadMarketDataFile("does/not/exist.json");
    } catch (const InvalidParameterError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[TEST] MarketDataJson Test PASSED!" << std::endl;
    return 0;
}
