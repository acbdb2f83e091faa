#pragma once

#include <vector>
#include <string>
#include "common/Types.h"

namespace tradesense {
namespace analytics {

struct IndicatorSettings {
    int ema_short = 9;
    int ema_medium = 21;
    int ema_long = 50;
    int rsi_period = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;
    int stoch_k_period = 14;
    int stoch_d_period = 3;
    int bollinger_period = 20;
    double bollinger_std_mult = 2.0;
    int atr_period = 14;
    int atr_history_lookback = 90;      // trailing ATR values for percentile/normalization
    int volume_lookback = 20;
    double volume_spike_multiplier = 1.5;
    int support_resistance_window = 5;
    double near_level_pct = 0.02;
    int divergence_lookback = 14;       // price/RSI/OBV direction comparison span
    int ema_slope_lookback = 5;
};

enum class Crossover { NONE, BULLISH, BEARISH };

// Per-call indicator values. Built fresh for every window, never cached.
struct IndicatorSnapshot {
    double close = 0.0;
    double price_change_pct = 0.0;      // close vs close divergence_lookback bars ago

    double ema_short = 0.0;
    double ema_medium = 0.0;
    double ema_long = 0.0;
    double prev_ema_short = 0.0;
    double prev_ema_medium = 0.0;
    double ema_long_slope = 0.0;        // fractional change of EMA50 over ema_slope_lookback

    double rsi = 50.0;
    double rsi_prev = 50.0;             // RSI divergence_lookback bars ago

    double macd_line = 0.0;
    double macd_signal = 0.0;
    double macd_histogram = 0.0;
    double macd_prev_histogram = 0.0;
    Crossover macd_crossover = Crossover::NONE;

    double stoch_k = 50.0;
    double stoch_d = 50.0;
    double stoch_prev_k = 50.0;
    double stoch_prev_d = 50.0;

    double bb_upper = 0.0;
    double bb_middle = 0.0;
    double bb_lower = 0.0;
    double bb_bandwidth = 0.0;          // (upper - lower) / middle
    double bb_percent_b = 0.5;

    double atr = 0.0;
    double atr_percentile = 0.0;        // 0~1 rank of the latest ATR in its trailing history
    double atr_history_max = 0.0;

    double obv = 0.0;
    double obv_change = 0.0;            // OBV delta over divergence_lookback
    bool volume_spike = false;
    double relative_volume = 1.0;

    double nearest_support = 0.0;
    double nearest_resistance = 0.0;
    bool near_support = false;
    bool near_resistance = false;
};

// Technical indicators. All functions are pure and take the full series;
// windows shorter than the lookback raise InsufficientDataError.
class TechnicalIndicators {
public:
    // RSI (Wilder smoothing). 70+ overbought, 30- oversold.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);
    // One value per bar starting at index `period`
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    struct MACDResult {
        double macd;
        double signal;
        double histogram;
        double prev_histogram;
        Crossover crossover;    // histogram sign change on the last bar

        MACDResult() : macd(0), signal(0), histogram(0), prev_histogram(0), crossover(Crossover::NONE) {}
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerBands {
        double upper;
        double middle;          // SMA
        double lower;
        double width;           // upper - lower
        double bandwidth;       // width / middle
        double percent_b;       // 0 at lower band, 1 at upper band

        BollingerBands() : upper(0), middle(0), lower(0), width(0), bandwidth(0), percent_b(0.5) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    static double calculateATR(const std::vector<Candle>& candles, int period = 14);
    // One value per bar starting at index `period`
    static std::vector<double> calculateATRSeries(const std::vector<Candle>& candles, int period = 14);

    // EMA seeded with the SMA of the first `period` values
    static double calculateEMA(const std::vector<double>& prices, int period);
    // One value per bar starting at index period - 1
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);

    static double calculateSMA(const std::vector<double>& prices, int period);

    struct StochasticResult {
        double k;
        double d;               // SMA of the last d_period %K values
        double prev_k;
        double prev_d;

        StochasticResult() : k(50), d(50), prev_k(50), prev_d(50) {}
    };
    static StochasticResult calculateStochastic(const std::vector<Candle>& candles,
                                                int k_period = 14,
                                                int d_period = 3);

    // Running volume signed by close-to-close direction, one value per candle
    static std::vector<double> calculateOBV(const std::vector<Candle>& candles,
                                            const std::vector<double>& volumes);

    // current / mean(previous `lookback` volumes)
    static double calculateRelativeVolume(const std::vector<double>& volumes, int lookback = 20);
    static bool detectVolumeSpike(const std::vector<double>& volumes,
                                  int lookback = 20,
                                  double multiplier = 1.5);

    // Local extrema over +/- window bars
    static std::vector<double> findSupportLevels(const std::vector<Candle>& candles, int window = 5);
    static std::vector<double> findResistanceLevels(const std::vector<Candle>& candles, int window = 5);

    struct SupportResistance {
        double nearest_support;
        double nearest_resistance;
        bool near_support;
        bool near_resistance;

        SupportResistance() : nearest_support(0), nearest_resistance(0),
                              near_support(false), near_resistance(false) {}
    };
    static SupportResistance findNearestLevels(const std::vector<Candle>& candles,
                                               int window = 5,
                                               double near_pct = 0.02);

    // Largest peak-to-trough decline as a positive fraction
    static double calculateMaxDrawdown(const std::vector<double>& prices);
    static std::vector<double> calculateReturns(const std::vector<double>& prices);
    // Least squares slope, value units per bar
    static double calculateLinearRegressionSlope(const std::vector<double>& values);
    // Mid-rank of `value` within `history`, 0~1
    static double percentileRank(const std::vector<double>& history, double value);

    static double calculateMean(const std::vector<double>& values);
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);

    // Throws InvalidParameterError on NaN/Inf or non-positive prices
    static void validateCandles(const std::vector<Candle>& candles);

    static IndicatorSnapshot buildSnapshot(const std::vector<Candle>& candles,
                                           const std::vector<double>& volumes,
                                           const IndicatorSettings& settings = IndicatorSettings());

private:
    static void requireLength(const std::string& indicator, size_t required, size_t actual);
    static bool isLocalMinimum(const std::vector<Candle>& candles, size_t index, int window);
    static bool isLocalMaximum(const std::vector<Candle>& candles, size_t index, int window);
};

} // namespace analytics
} // namespace tradesense
