#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <vector>

using namespace tradesense;
using analytics::TechnicalIndicators;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

std::vector<Candle> flatCandles(size_t count, double price, double range, double volume) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < count; ++i) {
        candles.emplace_back(price, price + range / 2.0, price - range / 2.0, price, volume,
                             static_cast<long long>(i) * 60000);
    }
    return candles;
}

std::vector<Candle> trendCandles(size_t count, double start, double step) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < count; ++i) {
        double close = start + step * static_cast<double>(i);
        candles.emplace_back(close - step / 2.0, close + 0.5, close - 0.5, close, 1000.0,
                             static_cast<long long>(i) * 60000);
    }
    return candles;
}

void testMovingAverages() {
    std::vector<double> flat(30, 100.0);
    assert(near(TechnicalIndicators::calculateEMA(flat, 9), 100.0));
    assert(TechnicalIndicators::calculateEMAVector(flat, 9).size() == 22);

    std::vector<double> prices = {1, 2, 3, 4, 5};
    assert(near(TechnicalIndicators::calculateSMA(prices, 5), 3.0));
    assert(near(TechnicalIndicators::calculateSMA(prices, 2), 4.5));
    // SMA seed then one step: (5 - 2) * 2/4 + 2 = 3.5
    assert(near(TechnicalIndicators::calculateEMA({1, 2, 3, 5}, 3), 3.5));

    std::cout << "[TEST] moving averages PASSED" << std::endl;
}

void testRSI() {
    std::vector<double> rising;
    std::vector<double> falling;
    for (int i = 0; i < 30; ++i) {
        rising.push_back(100.0 + i);
        falling.push_back(200.0 - i);
    }
    assert(near(TechnicalIndicators::calculateRSI(rising), 100.0));
    assert(near(TechnicalIndicators::calculateRSI(falling), 0.0));
    assert(near(TechnicalIndicators::calculateRSI(std::vector<double>(30, 50.0)), 50.0));

    std::vector<double> zigzag;
    for (int i = 0; i < 31; ++i) {
        zigzag.push_back(i % 2 == 0 ? 100.0 : 101.0);
    }
    double rsi = TechnicalIndicators::calculateRSI(zigzag);
    assert(rsi > 40.0 && rsi < 60.0);

    auto series = TechnicalIndicators::calculateRSISeries(rising, 14);
    assert(series.size() == rising.size() - 14);

    bool threw = false;
    try {
        TechnicalIndicators::calculateRSI(std::vector<double>(10, 1.0), 14);
    } catch (const InsufficientDataError& e) {
        threw = true;
        assert(e.stage() == "RSI(14)");
        assert(e.required() == 15);
        assert(e.actual() == 10);
    }
    assert(threw);

    std::cout << "[TEST] RSI PASSED" << std::endl;
}

void testMACD() {
    std::vector<double> rising;
    for (int i = 0; i < 60; ++i) {
        rising.push_back(100.0 + i);
    }
    auto macd = TechnicalIndicators::calculateMACD(rising);
    assert(macd.macd > 0.0);
    assert(near(macd.histogram, macd.macd - macd.signal));

    // Long decline then a sharp reversal flips the histogram positive
    std::vector<double> reversal;
    for (int i = 0; i < 50; ++i) {
        reversal.push_back(200.0 - i);
    }
    auto before = TechnicalIndicators::calculateMACD(reversal);
    assert(before.histogram <= 1e-9);
    bool crossed = false;
    for (int i = 0; i < 20 && !crossed; ++i) {
        reversal.push_back(reversal.back() + 4.0);
        auto step = TechnicalIndicators::calculateMACD(reversal);
        crossed = step.crossover == analytics::Crossover::BULLISH;
        if (crossed) {
            assert(step.prev_histogram <= 0.0 && step.histogram > 0.0);
        }
    }
    assert(crossed);

    bool threw = false;
    try {
        TechnicalIndicators::calculateMACD(std::vector<double>(34, 1.0));
    } catch (const InsufficientDataError& e) {
        threw = true;
        assert(e.required() == 35);
    }
    assert(threw);

    std::cout << "[TEST] MACD PASSED" << std::endl;
}

void testBollingerAndATR() {
    auto bb = TechnicalIndicators::calculateBollingerBands(std::vector<double>(25, 100.0));
    assert(near(bb.upper, 100.0) && near(bb.lower, 100.0));
    assert(near(bb.bandwidth, 0.0));
    assert(near(bb.percent_b, 0.5));

    std::vector<double> alternating;
    for (int i = 0; i < 20; ++i) {
        alternating.push_back(i % 2 == 0 ? 99.0 : 101.0);
    }
    bb = TechnicalIndicators::calculateBollingerBands(alternating, 20, 2.0);
    assert(near(bb.middle, 100.0));
    assert(near(bb.upper, 102.0) && near(bb.lower, 98.0));
    assert(near(bb.bandwidth, 0.04));

    auto candles = flatCandles(30, 100.0, 2.0, 1000.0);
    assert(near(TechnicalIndicators::calculateATR(candles), 2.0));
    assert(TechnicalIndicators::calculateATRSeries(candles, 14).size() == 30 - 14);

    std::cout << "[TEST] Bollinger/ATR PASSED" << std::endl;
}

void testStochastic() {
    auto candles = trendCandles(30, 100.0, 1.0);
    // Close sits 0.5 below the top of the range on every bar
    auto stoch = TechnicalIndicators::calculateStochastic(candles);
    assert(stoch.k > 95.0 && stoch.k <= 100.0);

    auto flat = flatCandles(20, 100.0, 0.0, 1.0);
    stoch = TechnicalIndicators::calculateStochastic(flat);
    assert(near(stoch.k, 50.0) && near(stoch.d, 50.0));

    std::cout << "[TEST] Stochastic PASSED" << std::endl;
}

void testVolume() {
    std::vector<Candle> candles = {
        Candle(10, 10, 10, 10, 100, 0),
        Candle(11, 11, 11, 11, 200, 1),
        Candle(10, 10, 10, 10, 50, 2),
        Candle(10, 10, 10, 10, 70, 3),
    };
    auto obv = TechnicalIndicators::calculateOBV(candles, TechnicalIndicators::extractVolumes(candles));
    assert(obv.size() == 4);
    assert(near(obv[1], 200.0));
    assert(near(obv[2], 150.0));
    assert(near(obv[3], 150.0));

    bool threw = false;
    try {
        TechnicalIndicators::calculateOBV(candles, {1.0, 2.0});
    } catch (const InvalidParameterError&) {
        threw = true;
    }
    assert(threw);

    std::vector<double> volumes(20, 1000.0);
    volumes.push_back(3000.0);
    assert(near(TechnicalIndicators::calculateRelativeVolume(volumes, 20), 3.0));
    assert(TechnicalIndicators::detectVolumeSpike(volumes, 20, 1.5));
    volumes.back() = 1200.0;
    assert(!TechnicalIndicators::detectVolumeSpike(volumes, 20, 1.5));

    std::cout << "[TEST] OBV/volume PASSED" << std::endl;
}

void testLevelsAndStatistics() {
    assert(near(TechnicalIndicators::calculateMaxDrawdown({100, 120, 90, 130}), 0.25));
    assert(near(TechnicalIndicators::calculateMaxDrawdown({1, 2, 3}), 0.0));

    assert(near(TechnicalIndicators::calculateLinearRegressionSlope({1, 2, 3, 4}), 1.0));
    assert(near(TechnicalIndicators::calculateLinearRegressionSlope({5, 5, 5}), 0.0));

    std::vector<double> history = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    assert(near(TechnicalIndicators::percentileRank(history, 10.0), 0.95));
    assert(near(TechnicalIndicators::percentileRank(std::vector<double>(10, 2.0), 2.0), 0.5));

    auto returns = TechnicalIndicators::calculateReturns({100, 110, 99});
    assert(returns.size() == 2);
    assert(near(returns[0], 0.10) && near(returns[1], -0.10));

    // V shape: one support at the trough, fallback resistance above price
    std::vector<Candle> candles;
    for (int i = 0; i < 21; ++i) {
        double p = 100.0 + std::abs(i - 10);
        candles.emplace_back(p, p + 0.5, p - 0.5, p, 1000.0, i);
    }
    auto supports = TechnicalIndicators::findSupportLevels(candles, 5);
    assert(supports.size() == 1 && near(supports.front(), 99.5));
    auto levels = TechnicalIndicators::findNearestLevels(candles, 5, 0.02);
    assert(near(levels.nearest_support, 99.5));
    assert(near(levels.nearest_resistance, candles.back().close * 1.05));
    assert(!levels.near_support);

    std::cout << "[TEST] levels/statistics PASSED" << std::endl;
}

void testValidationAndSnapshot() {
    auto candles = trendCandles(70, 100.0, 0.5);
    TechnicalIndicators::validateCandles(candles);

    auto bad = candles;
    bad[10].close = std::numeric_limits<double>::quiet_NaN();
    bool threw = false;
    try {
        TechnicalIndicators::validateCandles(bad);
    } catch (const InvalidParameterError& e) {
        threw = true;
        assert(e.stage() == "candles");
    }
    assert(threw);

    bad = candles;
    bad[3].low = -1.0;
    threw = false;
    try {
        TechnicalIndicators::validateCandles(bad);
    } catch (const InvalidParameterError&) {
        threw = true;
    }
    assert(threw);

    auto snap = TechnicalIndicators::buildSnapshot(candles, TechnicalIndicators::extractVolumes(candles));
    assert(snap.ema_short > snap.ema_medium && snap.ema_medium > snap.ema_long);
    assert(snap.ema_long_slope > 0.0);
    assert(snap.price_change_pct > 0.0);
    assert(snap.rsi > 50.0);
    assert(snap.obv_change > 0.0);
    assert(snap.atr_percentile >= 0.0 && snap.atr_percentile <= 1.0);
    assert(near(snap.close, candles.back().close));

    std::vector<Candle> short_window(candles.begin(), candles.begin() + 40);
    threw = false;
    try {
        TechnicalIndicators::buildSnapshot(short_window, TechnicalIndicators::extractVolumes(short_window));
    } catch (const InsufficientDataError& e) {
        threw = true;
        assert(e.stage() == "EMA(50)");
        assert(e.required() == 50 && e.actual() == 40);
    }
    assert(threw);

    std::cout << "[TEST] validation/snapshot PASSED" << std::endl;
}

}

int main() {
    std::cout << "[TEST] Starting TechnicalIndicators Test..." << std::endl;

    testMovingAverages();
    testRSI();
    testMACD();
    testBollingerAndATR();
    testStochastic();
    testVolume();
    testLevelsAndStatistics();
    testValidationAndSnapshot();

    std::cout << "[TEST] TechnicalIndicators Test PASSED!" << std::endl;
    return 0;
}
