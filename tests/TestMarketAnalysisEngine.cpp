#include "engine/MarketAnalysisEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <limits>
#include <random>
#include <string>

using namespace tradesense;
using engine::EngineConfig;
using engine::MarketAnalysisEngine;

namespace {

bool inUnit(double v) {
    return v >= 0.0 && v <= 1.0;
}

bool contains(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

// 60 flat bars at 100, then 10 bars rising linearly to 110
MarketData flatThenRising() {
    MarketData data;
    data.symbol = "TEST-FLAT";
    for (int i = 0; i < 60; ++i) {
        data.candles.emplace_back(100.0, 100.0, 100.0, 100.0, 1000.0, i * 60000LL);
    }
    double prev = 100.0;
    for (int i = 1; i <= 10; ++i) {
        double close = 100.0 + i;
        data.candles.emplace_back(prev, close, prev, close, 1000.0, (59 + i) * 60000LL);
        prev = close;
    }
    data.volume.assign(data.candles.size(), 1000.0);
    return data;
}

MarketData trending(const std::string& symbol, size_t count, double start, double step) {
    MarketData data;
    data.symbol = symbol;
    for (size_t i = 0; i < count; ++i) {
        double close = start + step * static_cast<double>(i);
        data.candles.emplace_back(close - step / 2.0, close + 0.5, close - 0.5, close, 1000.0,
                                  static_cast<long long>(i) * 60000);
    }
    return data;
}

MarketData randomWalk(std::mt19937& rng, size_t count) {
    std::normal_distribution<double> returns(0.0, 0.015);
    std::uniform_real_distribution<double> wick(0.0, 0.01);
    std::uniform_real_distribution<double> volume(100.0, 5000.0);

    MarketData data;
    data.symbol = "RANDOM";
    double close = 100.0;
    for (size_t i = 0; i < count; ++i) {
        double open = close;
        close = open * std::exp(returns(rng));
        double high = std::max(open, close) * (1.0 + wick(rng));
        double low = std::min(open, close) * (1.0 - wick(rng));
        data.candles.emplace_back(open, high, low, close, volume(rng), static_cast<long long>(i));
    }
    return data;
}

void testRisingScenario() {
    MarketAnalysisEngine engine;
    auto data = flatThenRising();

    auto signal = engine.analyze(data);
    assert(signal.action == TradeAction::BUY || signal.action == TradeAction::HOLD);
    assert(signal.confidence > 0.0);
    assert(signal.symbol == "TEST-FLAT");

    auto closes = analytics::TechnicalIndicators::extractClosePrices(data.candles);
    assert(analytics::TechnicalIndicators::calculateRSI(closes) > 50.0);

    // No order book: conservative liquidity default, noted in both reasoning lists
    auto risk = engine.assessRisk(data);
    assert(risk.liquidity_risk == 0.5);
    assert(risk.liquidity_degraded);
    assert(contains(signal.reasoning, "Order book unavailable"));
    auto params = engine.adaptiveParameters(data);
    assert(contains(params.adaptive_reasoning, "Order book unavailable"));

    std::cout << "[TEST] rising scenario PASSED" << std::endl;
}

void testDeterminism() {
    MarketAnalysisEngine engine;
    std::mt19937 rng(7);
    auto data = randomWalk(rng, 120);

    auto first = engine.decide(data);
    auto second = engine.decide(data);
    assert(first.signal.action == second.signal.action);
    assert(first.signal.confidence == second.signal.confidence);
    assert(first.signal.strength == second.signal.strength);
    assert(first.signal.risk_score == second.signal.risk_score);
    assert(first.signal.market_regime == second.signal.market_regime);
    assert(first.signal.reasoning == second.signal.reasoning);
    assert(first.risk.var_95 == second.risk.var_95);
    assert(first.parameters.adaptive_reasoning == second.parameters.adaptive_reasoning);

    std::cout << "[TEST] determinism PASSED" << std::endl;
}

void testBoundsOverRandomWindows() {
    MarketAnalysisEngine engine;
    std::mt19937 rng(20240611);

    for (int series = 0; series < 5; ++series) {
        auto full = randomWalk(rng, 260);
        for (size_t length = 50; length <= 200; length += 25) {
            for (size_t start = 0; start + length <= full.candles.size(); start += 30) {
                MarketData window;
                window.symbol = "RANDOM";
                window.candles.assign(full.candles.begin() + start, full.candles.begin() + start + length);
                if (start % 60 == 0) {
                    Orderbook book;
                    double mid = window.candles.back().close;
                    book.bids = {OrderbookLevel(mid * 0.999, 3.0)};
                    book.asks = {OrderbookLevel(mid * 1.001, 2.0)};
                    window.orderbook = book;
                }

                auto decision = engine.decide(window);
                const auto& s = decision.signal;
                assert(s.action == TradeAction::BUY || s.action == TradeAction::SELL ||
                       s.action == TradeAction::HOLD);
                assert(inUnit(s.confidence));
                assert(inUnit(s.strength));
                assert(inUnit(s.risk_score));
                assert(!s.reasoning.empty());
                assert(inUnit(decision.risk.volatility_risk));
                assert(inUnit(decision.risk.liquidity_risk));
                assert(inUnit(decision.risk.drawdown_risk));
                assert(!decision.position);
            }
        }
    }

    std::cout << "[TEST] bounds over random windows PASSED" << std::endl;
}

void testContractErrors() {
    MarketAnalysisEngine engine;

    auto data = trending("SHORT", 49, 100.0, 0.5);
    bool threw = false;
    try {
        engine.analyze(data);
    } catch (const InsufficientDataError& e) {
        threw = true;
        assert(e.required() == 50);
        assert(e.actual() == 49);
        assert(e.stage() == "candles");
    }
    assert(threw);

    data = trending("MISALIGNED", 60, 100.0, 0.5);
    data.volume.assign(59, 1000.0);
    threw = false;
    try {
        engine.analyze(data);
    } catch (const InvalidParameterError& e) {
        threw = true;
        assert(e.stage() == "volume");
    }
    assert(threw);

    data = trending("NAN", 60, 100.0, 0.5);
    data.candles[30].close = std::numeric_limits<double>::quiet_NaN();
    threw = false;
    try {
        engine.analyze(data);
    } catch (const InvalidParameterError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    EngineConfig config;
    config.min_candles = 20;
    try {
        MarketAnalysisEngine bad(config);
    } catch (const InvalidParameterError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    EngineConfig short_slope;
    short_slope.regime.slope_lookback = 1;
    try {
        MarketAnalysisEngine bad(short_slope);
    } catch (const InvalidParameterError& e) {
        threw = true;
        assert(e.stage() == "engine.regime.slope_lookback");
    }
    assert(threw);

    std::cout << "[TEST] contract errors PASSED" << std::endl;
}

void testDecisionSizing() {
    // Lower thresholds so a clean trend trades
    EngineConfig config;
    config.regime_profiles.bull.confidence_threshold = 0.35;
    config.regime_profiles.bear.confidence_threshold = 0.35;
    MarketAnalysisEngine engine(config);

    auto data = trending("UP", 80, 100.0, 0.5);
    risk::SizingRequest request;
    request.account_balance = 10000.0;
    request.entry_price = data.candles.back().close;
    request.stop_distance = 20.0;

    auto decision = engine.decide(data, request);
    assert(decision.signal.market_regime == MarketRegime::BULL);
    assert(decision.signal.action == TradeAction::BUY);
    assert(decision.parameters.position_multiplier == 1.2);
    assert(decision.position.has_value());

    // 200 at risk / 20 stop = 10 units, x1.2 = 12, capped at 1000 / entry
    double cap = 10000.0 * 0.10 / request.entry_price;
    assert(decision.position->position_size <= cap * (1.0 + 1e-12));
    assert(decision.position->capped_by_exposure);

    auto down = engine.decide(trending("DOWN", 80, 200.0, -0.5), request);
    assert(down.signal.market_regime == MarketRegime::BEAR);
    assert(down.signal.action == TradeAction::SELL);
    assert(down.position.has_value());
    assert(down.parameters.position_multiplier == 0.8);

    // Hold never carries a position
    MarketAnalysisEngine strict;
    auto held = strict.decide(flatThenRising(), request);
    if (held.signal.action == TradeAction::HOLD) {
        assert(!held.position);
    }

    // Explicit fractions override the preset
    request.risk_per_trade = 0.001;
    request.max_account_exposure = 0.5;
    auto sized = engine.sizePosition(request, decision.parameters);
    assert(std::abs(sized.position_size - 10.0 * 0.1 * 1.2 / 2.0) < 1e-9);
    assert(!sized.capped_by_exposure);

    std::cout << "[TEST] decision sizing PASSED" << std::endl;
}

void testConcurrentCalls() {
    const MarketAnalysisEngine engine;
    std::mt19937 rng(99);

    std::vector<MarketData> inputs;
    for (int i = 0; i < 8; ++i) {
        inputs.push_back(randomWalk(rng, 100 + i * 10));
    }

    std::vector<MarketSignal> sequential;
    for (const auto& data : inputs) {
        sequential.push_back(engine.analyze(data));
    }

    std::vector<std::future<MarketSignal>> tasks;
    for (const auto& data : inputs) {
        tasks.push_back(std::async(std::launch::async, [&engine, &data]() { return engine.analyze(data); }));
    }

    for (size_t i = 0; i < tasks.size(); ++i) {
        auto parallel = tasks[i].get();
        assert(parallel.action == sequential[i].action);
        assert(parallel.confidence == sequential[i].confidence);
        assert(parallel.risk_score == sequential[i].risk_score);
        assert(parallel.reasoning == sequential[i].reasoning);
    }

    std::cout << "[TEST] concurrent calls PASSED" << std::endl;
}

// Lines across decisions*.log files under dir
size_t decisionLines(const std::filesystem::path& dir) {
    size_t lines = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("decisions", 0) != 0) continue;
        std::ifstream in(entry.path());
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) ++lines;
        }
    }
    return lines;
}

void testDecisionLog() {
    const auto dir = std::filesystem::temp_directory_path() / "tradesense_decision_log";
    std::filesystem::remove_all(dir);
    Logger::getInstance().initialize(dir.string(), "warn");

    MarketAnalysisEngine engine;
    auto data = trending("LOGGED", 80, 100.0, 0.5);

    engine.analyze(data);
    assert(decisionLines(dir) == 1);

    // On-demand views are not decisions
    engine.assessRisk(data);
    engine.adaptiveParameters(data);
    assert(decisionLines(dir) == 1);

    engine.decide(data);
    assert(decisionLines(dir) == 2);

    std::cout << "[TEST] decision log PASSED" << std::endl;
}

}

int main() {
    std::cout << "[TEST] Starting MarketAnalysisEngine Test..." << std::endl;
    spdlog::set_level(spdlog::level::warn);

    testRisingScenario();
    testDeterminism();
    testBoundsOverRandomWindows();
    testContractErrors();
    testDecisionSizing();
    testConcurrentCalls();
    testDecisionLog();

    std::cout << "[TEST] MarketAnalysisEngine Test PASSED!" << std::endl;
    return 0;
}
