#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace tradesense {

class Config {
public:
    static Config& getInstance();

    // Missing file or malformed JSON: logged, defaults kept.
    // Out-of-range values or an unknown preset: InvalidParameterError.
    void load(const std::string& config_path);

    // Builds an EngineConfig from a parsed document without touching the singleton
    static engine::EngineConfig parse(const nlohmann::json& j);
    static void validate(const engine::EngineConfig& config);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

private:
    Config() = default;

    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    engine::EngineConfig engine_config_;
};

} // namespace tradesense
