#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include <cmath>
#include <algorithm>
#include <numeric>
#include <functional>

namespace tradesense {
namespace analytics {

namespace {

constexpr double kEpsilon = 1e-12;

double rsiFromAverages(double avg_gain, double avg_loss) {
    if (avg_loss < kEpsilon) {
        // No movement at all is neutral, pure gains saturate
        return avg_gain < kEpsilon ? 50.0 : 100.0;
    }
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double stochasticK(const std::vector<Candle>& candles, size_t end, int k_period) {
    size_t start = end + 1 - static_cast<size_t>(k_period);
    double lowest = candles[start].low;
    double highest = candles[start].high;

    for (size_t i = start; i <= end; ++i) {
        lowest = std::min(lowest, candles[i].low);
        highest = std::max(highest, candles[i].high);
    }

    if (highest - lowest > 1e-9) {
        return ((candles[end].close - lowest) / (highest - lowest)) * 100.0;
    }
    return 50.0;
}

} // namespace

void TechnicalIndicators::requireLength(const std::string& indicator, size_t required, size_t actual) {
    if (actual < required) {
        throw InsufficientDataError(indicator, required, actual);
    }
}

// RSI (Wilder's smoothing)
std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    requireLength("RSI(" + std::to_string(period) + ")", static_cast<size_t>(period) + 1, prices.size());

    std::vector<double> series;
    series.reserve(prices.size() - period);

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    // 1. Seed with the simple average of the first `period` changes
    for (int i = 1; i <= period; ++i) {
        double change = prices[i] - prices[i-1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }

    avg_gain /= period;
    avg_loss /= period;
    series.push_back(rsiFromAverages(avg_gain, avg_loss));

    // 2. Wilder smoothing to the end
    for (size_t i = period + 1; i < prices.size(); ++i) {
        double change = prices[i] - prices[i-1];
        double current_gain = (change > 0) ? change : 0.0;
        double current_loss = (change < 0) ? std::abs(change) : 0.0;

        avg_gain = ((avg_gain * (period - 1)) + current_gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + current_loss) / period;
        series.push_back(rsiFromAverages(avg_gain, avg_loss));
    }

    return series;
}

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    return calculateRSISeries(prices, period).back();
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    // signal_period + 1 MACD values are needed to compare the last two histograms
    requireLength("MACD", static_cast<size_t>(slow + signal_period), prices.size());

    MACDResult result;

    auto fast_ema_vec = calculateEMAVector(prices, fast);
    auto slow_ema_vec = calculateEMAVector(prices, slow);

    // Align both EMA series on their newest values
    std::vector<double> macd_series;
    size_t min_size = std::min(fast_ema_vec.size(), slow_ema_vec.size());
    size_t offset_fast = fast_ema_vec.size() - min_size;
    size_t offset_slow = slow_ema_vec.size() - min_size;
    macd_series.reserve(min_size);

    for (size_t i = 0; i < min_size; ++i) {
        macd_series.push_back(fast_ema_vec[offset_fast + i] - slow_ema_vec[offset_slow + i]);
    }

    auto signal_vec = calculateEMAVector(macd_series, signal_period);

    result.macd = macd_series.back();
    result.signal = signal_vec.back();
    result.histogram = result.macd - result.signal;
    result.prev_histogram = macd_series[macd_series.size() - 2] - signal_vec[signal_vec.size() - 2];

    if (result.prev_histogram <= 0.0 && result.histogram > 0.0) {
        result.crossover = Crossover::BULLISH;
    } else if (result.prev_histogram >= 0.0 && result.histogram < 0.0) {
        result.crossover = Crossover::BEARISH;
    }

    return result;
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    requireLength("BollingerBands", static_cast<size_t>(period), prices.size());

    BollingerBands result;

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateMean(recent_prices);
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (std::abs(result.middle) > kEpsilon) {
        result.bandwidth = result.width / result.middle;
    }

    if (result.width > 1e-9) {
        result.percent_b = (prices.back() - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }

    return result;
}

std::vector<double> TechnicalIndicators::calculateATRSeries(const std::vector<Candle>& candles, int period) {
    requireLength("ATR(" + std::to_string(period) + ")", static_cast<size_t>(period) + 1, candles.size());

    std::vector<double> tr_values;
    tr_values.reserve(candles.size() - 1);

    // The first true range needs the previous close
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i-1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    std::vector<double> series;
    series.reserve(tr_values.size() - period + 1);

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;
    series.push_back(atr);

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
        series.push_back(atr);
    }

    return series;
}

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    return calculateATRSeries(candles, period).back();
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    return calculateEMAVector(prices, period).back();
}

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    requireLength("EMA(" + std::to_string(period) + ")", static_cast<size_t>(period), prices.size());

    std::vector<double> ema_values;
    ema_values.reserve(prices.size() - period + 1);

    double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) ema += prices[i];
    ema /= period;

    ema_values.push_back(ema);

    for (size_t i = period; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    requireLength("SMA", static_cast<size_t>(period), prices.size());

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

TechnicalIndicators::StochasticResult TechnicalIndicators::calculateStochastic(
    const std::vector<Candle>& candles,
    int k_period,
    int d_period
) {
    // One extra %K is needed for the previous-bar %D
    requireLength("Stochastic", static_cast<size_t>(k_period + d_period), candles.size());

    StochasticResult result;

    std::vector<double> k_values;
    k_values.reserve(d_period + 1);
    size_t last = candles.size() - 1;
    for (int j = d_period; j >= 0; --j) {
        k_values.push_back(stochasticK(candles, last - j, k_period));
    }

    result.k = k_values.back();
    result.prev_k = k_values[k_values.size() - 2];

    double d_sum = 0.0;
    double prev_d_sum = 0.0;
    for (int i = 0; i < d_period; ++i) {
        prev_d_sum += k_values[i];
        d_sum += k_values[i + 1];
    }
    result.d = d_sum / d_period;
    result.prev_d = prev_d_sum / d_period;

    return result;
}

std::vector<double> TechnicalIndicators::calculateOBV(
    const std::vector<Candle>& candles,
    const std::vector<double>& volumes
) {
    if (volumes.size() != candles.size()) {
        throw InvalidParameterError("OBV", "volume series length " + std::to_string(volumes.size()) +
                                    " does not match " + std::to_string(candles.size()) + " candles");
    }
    requireLength("OBV", 1, candles.size());

    std::vector<double> obv;
    obv.reserve(candles.size());
    obv.push_back(0.0);

    for (size_t i = 1; i < candles.size(); ++i) {
        double value = obv.back();
        if (candles[i].close > candles[i-1].close) {
            value += volumes[i];
        } else if (candles[i].close < candles[i-1].close) {
            value -= volumes[i];
        }
        obv.push_back(value);
    }

    return obv;
}

double TechnicalIndicators::calculateRelativeVolume(const std::vector<double>& volumes, int lookback) {
    requireLength("VolumeSpike", static_cast<size_t>(lookback) + 1, volumes.size());

    size_t last = volumes.size() - 1;
    double sum = 0.0;
    for (size_t i = last - lookback; i < last; ++i) {
        sum += volumes[i];
    }
    double avg = sum / lookback;

    if (avg < kEpsilon) return 1.0;
    return volumes[last] / avg;
}

bool TechnicalIndicators::detectVolumeSpike(
    const std::vector<double>& volumes,
    int lookback,
    double multiplier
) {
    return calculateRelativeVolume(volumes, lookback) > multiplier;
}

std::vector<double> TechnicalIndicators::findSupportLevels(
    const std::vector<Candle>& candles,
    int window
) {
    std::vector<double> supports;
    if (candles.size() < static_cast<size_t>(window * 2 + 1)) return supports;

    for (size_t i = window; i < candles.size() - window; ++i) {
        if (isLocalMinimum(candles, i, window)) {
            supports.push_back(candles[i].low);
        }
    }

    std::sort(supports.begin(), supports.end());
    supports.erase(std::unique(supports.begin(), supports.end()), supports.end());

    return supports;
}

std::vector<double> TechnicalIndicators::findResistanceLevels(
    const std::vector<Candle>& candles,
    int window
) {
    std::vector<double> resistances;
    if (candles.size() < static_cast<size_t>(window * 2 + 1)) return resistances;

    for (size_t i = window; i < candles.size() - window; ++i) {
        if (isLocalMaximum(candles, i, window)) {
            resistances.push_back(candles[i].high);
        }
    }

    std::sort(resistances.begin(), resistances.end(), std::greater<double>());
    resistances.erase(std::unique(resistances.begin(), resistances.end()), resistances.end());

    return resistances;
}

TechnicalIndicators::SupportResistance TechnicalIndicators::findNearestLevels(
    const std::vector<Candle>& candles,
    int window,
    double near_pct
) {
    requireLength("SupportResistance", 1, candles.size());

    SupportResistance result;
    double price = candles.back().close;

    auto nearest = [price](const std::vector<double>& levels, double fallback) {
        if (levels.empty()) return fallback;
        return *std::min_element(levels.begin(), levels.end(),
                                 [price](double a, double b) {
                                     return std::abs(a - price) < std::abs(b - price);
                                 });
    };

    result.nearest_support = nearest(findSupportLevels(candles, window), price * 0.95);
    result.nearest_resistance = nearest(findResistanceLevels(candles, window), price * 1.05);

    result.near_support = std::abs(price - result.nearest_support) / price < near_pct;
    result.near_resistance = std::abs(result.nearest_resistance - price) / price < near_pct;

    return result;
}

double TechnicalIndicators::calculateMaxDrawdown(const std::vector<double>& prices) {
    requireLength("MaxDrawdown", 1, prices.size());

    double peak = prices.front();
    double max_dd = 0.0;
    for (double p : prices) {
        peak = std::max(peak, p);
        if (peak > kEpsilon) {
            max_dd = std::max(max_dd, (peak - p) / peak);
        }
    }
    return max_dd;
}

std::vector<double> TechnicalIndicators::calculateReturns(const std::vector<double>& prices) {
    requireLength("Returns", 2, prices.size());

    std::vector<double> returns;
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        returns.push_back((prices[i] - prices[i-1]) / prices[i-1]);
    }
    return returns;
}

double TechnicalIndicators::calculateLinearRegressionSlope(const std::vector<double>& values) {
    requireLength("LinearRegression", 2, values.size());

    double n = static_cast<double>(values.size());
    double x_mean = (n - 1.0) / 2.0;
    double y_mean = calculateMean(values);

    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        double dx = static_cast<double>(i) - x_mean;
        num += dx * (values[i] - y_mean);
        den += dx * dx;
    }

    return den > kEpsilon ? num / den : 0.0;
}

double TechnicalIndicators::percentileRank(const std::vector<double>& history, double value) {
    if (history.empty()) return 0.0;

    // Mid-rank so a constant history ranks at 0.5 rather than 1.0
    size_t below = 0;
    size_t equal = 0;
    for (double h : history) {
        if (h < value) ++below;
        else if (h == value) ++equal;
    }
    return (static_cast<double>(below) + 0.5 * static_cast<double>(equal)) /
           static_cast<double>(history.size());
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());

    for (const auto& candle : candles) {
        prices.push_back(candle.close);
    }

    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());

    for (const auto& candle : candles) {
        volumes.push_back(candle.volume);
    }

    return volumes;
}

void TechnicalIndicators::validateCandles(const std::vector<Candle>& candles) {
    for (size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        bool finite = std::isfinite(c.open) && std::isfinite(c.high) &&
                      std::isfinite(c.low) && std::isfinite(c.close) &&
                      std::isfinite(c.volume);
        if (!finite) {
            throw InvalidParameterError("candles", "non-finite value at index " + std::to_string(i));
        }
        if (c.close <= 0.0 || c.high <= 0.0 || c.low <= 0.0 || c.volume < 0.0) {
            throw InvalidParameterError("candles", "non-positive price or negative volume at index " +
                                        std::to_string(i));
        }
    }
}

IndicatorSnapshot TechnicalIndicators::buildSnapshot(
    const std::vector<Candle>& candles,
    const std::vector<double>& volumes,
    const IndicatorSettings& settings
) {
    requireLength("EMA(" + std::to_string(settings.ema_long) + ")", static_cast<size_t>(settings.ema_long), candles.size());

    IndicatorSnapshot snap;
    auto closes = extractClosePrices(candles);
    const size_t n = closes.size();
    const size_t lookback = std::min(static_cast<size_t>(settings.divergence_lookback), n - 1);

    snap.close = closes.back();
    double base_close = closes[n - 1 - lookback];
    snap.price_change_pct = (snap.close - base_close) / base_close;

    // EMAs
    auto ema_short = calculateEMAVector(closes, settings.ema_short);
    auto ema_medium = calculateEMAVector(closes, settings.ema_medium);
    auto ema_long = calculateEMAVector(closes, settings.ema_long);

    snap.ema_short = ema_short.back();
    snap.ema_medium = ema_medium.back();
    snap.ema_long = ema_long.back();
    snap.prev_ema_short = ema_short.size() > 1 ? ema_short[ema_short.size() - 2] : ema_short.back();
    snap.prev_ema_medium = ema_medium.size() > 1 ? ema_medium[ema_medium.size() - 2] : ema_medium.back();

    size_t slope_span = std::min(static_cast<size_t>(settings.ema_slope_lookback), ema_long.size() - 1);
    double ema_long_base = ema_long[ema_long.size() - 1 - slope_span];
    snap.ema_long_slope = ema_long_base > kEpsilon ? (snap.ema_long - ema_long_base) / ema_long_base : 0.0;

    // RSI
    auto rsi_series = calculateRSISeries(closes, settings.rsi_period);
    snap.rsi = rsi_series.back();
    size_t rsi_span = std::min(lookback, rsi_series.size() - 1);
    snap.rsi_prev = rsi_series[rsi_series.size() - 1 - rsi_span];

    // MACD
    auto macd = calculateMACD(closes, settings.macd_fast, settings.macd_slow, settings.macd_signal);
    snap.macd_line = macd.macd;
    snap.macd_signal = macd.signal;
    snap.macd_histogram = macd.histogram;
    snap.macd_prev_histogram = macd.prev_histogram;
    snap.macd_crossover = macd.crossover;

    // Stochastic
    auto stoch = calculateStochastic(candles, settings.stoch_k_period, settings.stoch_d_period);
    snap.stoch_k = stoch.k;
    snap.stoch_d = stoch.d;
    snap.stoch_prev_k = stoch.prev_k;
    snap.stoch_prev_d = stoch.prev_d;

    // Bollinger Bands
    auto bb = calculateBollingerBands(closes, settings.bollinger_period, settings.bollinger_std_mult);
    snap.bb_upper = bb.upper;
    snap.bb_middle = bb.middle;
    snap.bb_lower = bb.lower;
    snap.bb_bandwidth = bb.bandwidth;
    snap.bb_percent_b = bb.percent_b;

    // ATR vs its own trailing history
    auto atr_series = calculateATRSeries(candles, settings.atr_period);
    snap.atr = atr_series.back();
    size_t history_len = std::min(static_cast<size_t>(settings.atr_history_lookback), atr_series.size());
    std::vector<double> atr_history(atr_series.end() - history_len, atr_series.end());
    snap.atr_percentile = percentileRank(atr_history, snap.atr);
    snap.atr_history_max = *std::max_element(atr_history.begin(), atr_history.end());

    // Volume
    auto obv = calculateOBV(candles, volumes);
    snap.obv = obv.back();
    snap.obv_change = obv.back() - obv[n - 1 - lookback];
    snap.relative_volume = calculateRelativeVolume(volumes, settings.volume_lookback);
    snap.volume_spike = snap.relative_volume > settings.volume_spike_multiplier;

    // Support / Resistance
    auto sr = findNearestLevels(candles, settings.support_resistance_window, settings.near_level_pct);
    snap.nearest_support = sr.nearest_support;
    snap.nearest_resistance = sr.nearest_resistance;
    snap.near_support = sr.near_support;
    snap.near_resistance = sr.near_resistance;

    return snap;
}

// ========== Private helpers ==========

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

bool TechnicalIndicators::isLocalMinimum(
    const std::vector<Candle>& candles,
    size_t index,
    int window
) {
    double value = candles[index].low;

    for (int i = 1; i <= window; ++i) {
        if (index + i >= candles.size()) break;
        if (candles[index + i].low < value) return false;

        if (index >= static_cast<size_t>(i)) {
            if (candles[index - i].low < value) return false;
        }
    }

    return true;
}

bool TechnicalIndicators::isLocalMaximum(
    const std::vector<Candle>& candles,
    size_t index,
    int window
) {
    double value = candles[index].high;

    for (int i = 1; i <= window; ++i) {
        if (index + i >= candles.size()) break;
        if (candles[index + i].high > value) return false;

        if (index >= static_cast<size_t>(i)) {
            if (candles[index - i].high > value) return false;
        }
    }

    return true;
}

} // namespace analytics
} // namespace tradesense
