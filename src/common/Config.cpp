#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <spdlog/fmt/fmt.h>
#include <filesystem>
#include <fstream>

namespace tradesense {

namespace {

void requirePositive(const char* name, double value) {
    if (!(value > 0.0)) {
        throw InvalidParameterError(std::string("config.") + name,
                                    fmt::format("must be positive, got {}", value));
    }
}

void requireNonNegative(const char* name, double value) {
    if (!(value >= 0.0)) {
        throw InvalidParameterError(std::string("config.") + name,
                                    fmt::format("must not be negative, got {}", value));
    }
}

void requireFraction(const char* name, double value) {
    if (!(value > 0.0 && value <= 1.0)) {
        throw InvalidParameterError(std::string("config.") + name,
                                    fmt::format("must be within (0, 1], got {}", value));
    }
}

void readProfile(const nlohmann::json& j, const char* key, strategy::RegimeProfile& profile) {
    if (!j.contains(key)) {
        return;
    }
    auto& p = j[key];
    profile.confidence_threshold = p.value("confidence_threshold", profile.confidence_threshold);
    profile.position_multiplier = p.value("position_multiplier", profile.position_multiplier);
    profile.stop_loss_pct = p.value("stop_loss_pct", profile.stop_loss_pct);
    profile.take_profit_pct = p.value("take_profit_pct", profile.take_profit_pct);
    profile.trailing_stop_enabled = p.value("trailing_stop_enabled", profile.trailing_stop_enabled);
}

void validateProfile(const char* name, const strategy::RegimeProfile& profile) {
    std::string prefix = std::string("regime_profiles.") + name;
    requireFraction((prefix + ".confidence_threshold").c_str(), profile.confidence_threshold);
    requirePositive((prefix + ".position_multiplier").c_str(), profile.position_multiplier);
    requireFraction((prefix + ".stop_loss_pct").c_str(), profile.stop_loss_pct);
    requireFraction((prefix + ".take_profit_pct").c_str(), profile.take_profit_pct);
}

}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

engine::EngineConfig Config::parse(const nlohmann::json& j) {
    engine::EngineConfig cfg;

    if (j.contains("engine")) {
        auto& e = j["engine"];
        cfg.min_candles = e.value("min_candles", cfg.min_candles);
    }

    if (j.contains("preset")) {
        cfg.preset = strategy::parseRiskPreset(j["preset"].get<std::string>());
    }

    if (j.contains("weights")) {
        auto& w = j["weights"];
        cfg.synthesis.trend_weight = w.value("trend", cfg.synthesis.trend_weight);
        cfg.synthesis.momentum_weight = w.value("momentum", cfg.synthesis.momentum_weight);
        cfg.synthesis.tie_break_magnitude = w.value("tie_break_magnitude", cfg.synthesis.tie_break_magnitude);
    }

    if (j.contains("indicators")) {
        auto& s = j["indicators"];
        auto& ind = cfg.indicators;
        ind.ema_short = s.value("ema_short", ind.ema_short);
        ind.ema_medium = s.value("ema_medium", ind.ema_medium);
        ind.ema_long = s.value("ema_long", ind.ema_long);
        ind.rsi_period = s.value("rsi_period", ind.rsi_period);
        ind.macd_fast = s.value("macd_fast", ind.macd_fast);
        ind.macd_slow = s.value("macd_slow", ind.macd_slow);
        ind.macd_signal = s.value("macd_signal", ind.macd_signal);
        ind.stoch_k_period = s.value("stoch_k_period", ind.stoch_k_period);
        ind.stoch_d_period = s.value("stoch_d_period", ind.stoch_d_period);
        ind.bollinger_period = s.value("bollinger_period", ind.bollinger_period);
        ind.bollinger_std_mult = s.value("bollinger_std_mult", ind.bollinger_std_mult);
        ind.atr_period = s.value("atr_period", ind.atr_period);
        ind.atr_history_lookback = s.value("atr_history_lookback", ind.atr_history_lookback);
        ind.volume_lookback = s.value("volume_lookback", ind.volume_lookback);
        ind.volume_spike_multiplier = s.value("volume_spike_multiplier", ind.volume_spike_multiplier);
        ind.support_resistance_window = s.value("support_resistance_window", ind.support_resistance_window);
        ind.near_level_pct = s.value("near_level_pct", ind.near_level_pct);
        ind.divergence_lookback = s.value("divergence_lookback", ind.divergence_lookback);
        ind.ema_slope_lookback = s.value("ema_slope_lookback", ind.ema_slope_lookback);
    }

    if (j.contains("analyzers")) {
        auto& a = j["analyzers"];
        if (a.contains("trend")) {
            auto& t = a["trend"];
            cfg.trend.full_alignment_score = t.value("full_alignment_score", cfg.trend.full_alignment_score);
            cfg.trend.partial_alignment_score = t.value("partial_alignment_score", cfg.trend.partial_alignment_score);
            cfg.trend.slope_conflict_factor = t.value("slope_conflict_factor", cfg.trend.slope_conflict_factor);
            cfg.trend.min_slope = t.value("min_slope", cfg.trend.min_slope);
            cfg.trend.confirmed_cross_score = t.value("confirmed_cross_score", cfg.trend.confirmed_cross_score);
        }
        if (a.contains("momentum")) {
            auto& m = a["momentum"];
            cfg.momentum.rsi_overbought = m.value("rsi_overbought", cfg.momentum.rsi_overbought);
            cfg.momentum.rsi_oversold = m.value("rsi_oversold", cfg.momentum.rsi_oversold);
            cfg.momentum.rsi_scale = m.value("rsi_scale", cfg.momentum.rsi_scale);
            cfg.momentum.divergence_adjustment = m.value("divergence_adjustment", cfg.momentum.divergence_adjustment);
            cfg.momentum.macd_trend_score = m.value("macd_trend_score", cfg.momentum.macd_trend_score);
            cfg.momentum.stoch_overbought = m.value("stoch_overbought", cfg.momentum.stoch_overbought);
            cfg.momentum.stoch_oversold = m.value("stoch_oversold", cfg.momentum.stoch_oversold);
        }
        if (a.contains("volatility")) {
            auto& v = a["volatility"];
            cfg.volatility.squeeze_bandwidth = v.value("squeeze_bandwidth", cfg.volatility.squeeze_bandwidth);
            cfg.volatility.high_atr_percentile = v.value("high_atr_percentile", cfg.volatility.high_atr_percentile);
            cfg.volatility.breakout_risk_add = v.value("breakout_risk_add", cfg.volatility.breakout_risk_add);
            cfg.volatility.high_volatility_risk_add =
                v.value("high_volatility_risk_add", cfg.volatility.high_volatility_risk_add);
        }
        if (a.contains("volume")) {
            auto& v = a["volume"];
            cfg.volume.confirmation_step = v.value("confirmation_step", cfg.volume.confirmation_step);
            cfg.volume.spike_step = v.value("spike_step", cfg.volume.spike_step);
            cfg.volume.min_multiplier = v.value("min_multiplier", cfg.volume.min_multiplier);
            cfg.volume.max_multiplier = v.value("max_multiplier", cfg.volume.max_multiplier);
        }
    }

    if (j.contains("risk")) {
        auto& r = j["risk"];
        cfg.risk.volatility_weight = r.value("volatility_weight", cfg.risk.volatility_weight);
        cfg.risk.liquidity_weight = r.value("liquidity_weight", cfg.risk.liquidity_weight);
        cfg.risk.drawdown_weight = r.value("drawdown_weight", cfg.risk.drawdown_weight);
        cfg.risk.drawdown_cap = r.value("drawdown_cap", cfg.risk.drawdown_cap);
        cfg.risk.missing_orderbook_liquidity_risk =
            r.value("missing_orderbook_liquidity_risk", cfg.risk.missing_orderbook_liquidity_risk);
        cfg.risk.annualization_periods = r.value("annualization_periods", cfg.risk.annualization_periods);
    }

    if (j.contains("regime")) {
        auto& g = j["regime"];
        cfg.regime.high_volatility_percentile =
            g.value("high_volatility_percentile", cfg.regime.high_volatility_percentile);
        cfg.regime.slope_lookback = g.value("slope_lookback", cfg.regime.slope_lookback);
        cfg.regime.persistence_lookback = g.value("persistence_lookback", cfg.regime.persistence_lookback);
        cfg.regime.min_persistence = g.value("min_persistence", cfg.regime.min_persistence);
        cfg.regime.min_trend_slope = g.value("min_trend_slope", cfg.regime.min_trend_slope);
    }

    if (j.contains("defaults")) {
        auto& d = j["defaults"];
        cfg.defaults.confidence_threshold = d.value("confidence_threshold", cfg.defaults.confidence_threshold);
        cfg.defaults.position_multiplier = d.value("position_multiplier", cfg.defaults.position_multiplier);
        cfg.defaults.stop_loss_pct = d.value("stop_loss_pct", cfg.defaults.stop_loss_pct);
        cfg.defaults.take_profit_pct = d.value("take_profit_pct", cfg.defaults.take_profit_pct);
        cfg.defaults.trailing_stop_enabled = d.value("trailing_stop_enabled", cfg.defaults.trailing_stop_enabled);
    }

    if (j.contains("regime_profiles")) {
        auto& p = j["regime_profiles"];
        readProfile(p, "bull", cfg.regime_profiles.bull);
        readProfile(p, "bear", cfg.regime_profiles.bear);
        readProfile(p, "sideways", cfg.regime_profiles.sideways);
        readProfile(p, "volatile", cfg.regime_profiles.volatile_market);
    }

    validate(cfg);
    return cfg;
}

void Config::validate(const engine::EngineConfig& cfg) {
    const auto& ind = cfg.indicators;
    requirePositive("indicators.ema_short", ind.ema_short);
    requirePositive("indicators.ema_medium", ind.ema_medium);
    requirePositive("indicators.ema_long", ind.ema_long);
    if (!(ind.ema_short < ind.ema_medium && ind.ema_medium < ind.ema_long)) {
        throw InvalidParameterError("config.indicators",
                                    fmt::format("EMA periods must increase, got {}/{}/{}",
                                                ind.ema_short, ind.ema_medium, ind.ema_long));
    }
    requirePositive("indicators.rsi_period", ind.rsi_period);
    requirePositive("indicators.macd_fast", ind.macd_fast);
    requirePositive("indicators.macd_slow", ind.macd_slow);
    requirePositive("indicators.macd_signal", ind.macd_signal);
    if (ind.macd_fast >= ind.macd_slow) {
        throw InvalidParameterError("config.indicators.macd_fast", "must be below macd_slow");
    }
    requirePositive("indicators.stoch_k_period", ind.stoch_k_period);
    requirePositive("indicators.stoch_d_period", ind.stoch_d_period);
    requirePositive("indicators.bollinger_period", ind.bollinger_period);
    requirePositive("indicators.bollinger_std_mult", ind.bollinger_std_mult);
    requirePositive("indicators.atr_period", ind.atr_period);
    requirePositive("indicators.atr_history_lookback", ind.atr_history_lookback);
    requirePositive("indicators.volume_lookback", ind.volume_lookback);
    requirePositive("indicators.volume_spike_multiplier", ind.volume_spike_multiplier);
    requirePositive("indicators.support_resistance_window", ind.support_resistance_window);
    requireFraction("indicators.near_level_pct", ind.near_level_pct);
    requirePositive("indicators.divergence_lookback", ind.divergence_lookback);
    requirePositive("indicators.ema_slope_lookback", ind.ema_slope_lookback);

    if (cfg.min_candles < static_cast<size_t>(ind.ema_long)) {
        throw InvalidParameterError("config.engine.min_candles",
                                    fmt::format("{} is below the EMA({}) lookback", cfg.min_candles, ind.ema_long));
    }

    requireNonNegative("weights.trend", cfg.synthesis.trend_weight);
    requireNonNegative("weights.momentum", cfg.synthesis.momentum_weight);
    requirePositive("weights.trend + weights.momentum",
                    cfg.synthesis.trend_weight + cfg.synthesis.momentum_weight);
    requireNonNegative("weights.tie_break_magnitude", cfg.synthesis.tie_break_magnitude);

    if (cfg.momentum.rsi_oversold >= cfg.momentum.rsi_overbought) {
        throw InvalidParameterError("config.analyzers.momentum", "rsi_oversold must be below rsi_overbought");
    }
    requirePositive("analyzers.momentum.rsi_scale", cfg.momentum.rsi_scale);
    requireFraction("analyzers.volatility.high_atr_percentile", cfg.volatility.high_atr_percentile);
    if (!(cfg.volume.min_multiplier > 0.0 && cfg.volume.min_multiplier <= 1.0 &&
          cfg.volume.max_multiplier >= 1.0)) {
        throw InvalidParameterError("config.analyzers.volume", "multiplier bounds must bracket 1.0");
    }

    requireNonNegative("risk.volatility_weight", cfg.risk.volatility_weight);
    requireNonNegative("risk.liquidity_weight", cfg.risk.liquidity_weight);
    requireNonNegative("risk.drawdown_weight", cfg.risk.drawdown_weight);
    requirePositive("risk.drawdown_cap", cfg.risk.drawdown_cap);
    requireFraction("risk.missing_orderbook_liquidity_risk", cfg.risk.missing_orderbook_liquidity_risk);
    requirePositive("risk.annualization_periods", cfg.risk.annualization_periods);

    requireFraction("regime.high_volatility_percentile", cfg.regime.high_volatility_percentile);
    if (cfg.regime.slope_lookback < 2) {
        throw InvalidParameterError("config.regime.slope_lookback",
                                    fmt::format("regression needs at least 2 bars, got {}",
                                                cfg.regime.slope_lookback));
    }
    requirePositive("regime.persistence_lookback", cfg.regime.persistence_lookback);
    requireFraction("regime.min_persistence", cfg.regime.min_persistence);
    requireNonNegative("regime.min_trend_slope", cfg.regime.min_trend_slope);

    requireFraction("defaults.confidence_threshold", cfg.defaults.confidence_threshold);
    requirePositive("defaults.position_multiplier", cfg.defaults.position_multiplier);
    requireFraction("defaults.stop_loss_pct", cfg.defaults.stop_loss_pct);
    requireFraction("defaults.take_profit_pct", cfg.defaults.take_profit_pct);

    validateProfile("bull", cfg.regime_profiles.bull);
    validateProfile("bear", cfg.regime_profiles.bear);
    validateProfile("sideways", cfg.regime_profiles.sideways);
    validateProfile("volatile", cfg.regime_profiles.volatile_market);
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path = std::filesystem::absolute(path);

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {}, using defaults", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open config file: {}", config_path.string());
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config parse error in {}: {}", config_path.string(), e.what());
        return;
    }

    try {
        engine::EngineConfig parsed = parse(j);

        if (j.contains("logging")) {
            auto& l = j["logging"];
            log_level_ = l.value("level", log_level_);
            log_dir_ = l.value("dir", log_dir_);
        }

        engine_config_ = parsed;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config type error in {}: {}", config_path.string(), e.what());
        return;
    }

    LOG_INFO("Config loaded: {} (preset={}, min_candles={})",
             config_path.string(), strategy::toString(engine_config_.preset), engine_config_.min_candles);
}

} // namespace tradesense
