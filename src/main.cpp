#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/MarketDataJson.h"
#include "engine/MarketAnalysisEngine.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace tradesense;

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::optional<std::string> log_level;
    std::optional<double> balance;
    std::optional<double> entry;
    std::optional<double> stop;
    bool pretty = false;
    std::vector<std::string> inputs;
};

void printUsage() {
    std::cerr << "Usage: tradesense [--config path] [--log-level level] [--pretty]\n"
              << "                  [--balance B [--entry P] [--stop D]] market.json...\n"
              << "\n"
              << "  --balance  account balance; enables position sizing\n"
              << "  --entry    entry price (default: last close)\n"
              << "  --stop     absolute stop distance (default: entry * regime stop_loss_pct)\n";
}

double parseNumber(const std::string& flag, const std::string& text) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::exception&) {
        throw InvalidParameterError("cli." + flag, "not a number: '" + text + "'");
    }
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw InvalidParameterError("cli." + arg, "missing value");
            }
            return argv[++i];
        };

        if (arg == "--config") {
            options.config_path = next();
        } else if (arg == "--log-level") {
            options.log_level = next();
        } else if (arg == "--balance") {
            options.balance = parseNumber(arg, next());
        } else if (arg == "--entry") {
            options.entry = parseNumber(arg, next());
        } else if (arg == "--stop") {
            options.stop = parseNumber(arg, next());
        } else if (arg == "--pretty") {
            options.pretty = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            throw InvalidParameterError("cli", "unknown option " + arg);
        } else {
            options.inputs.push_back(arg);
        }
    }

    if ((options.entry || options.stop) && !options.balance) {
        throw InvalidParameterError("cli", "--entry/--stop require --balance");
    }
    return options;
}

TradingDecision analyzeFile(const engine::MarketAnalysisEngine& engine,
                            const std::string& path,
                            const CliOptions& options) {
    MarketData data = loadMarketDataFile(path);
    TradingDecision decision = engine.decide(data);

    if (options.balance && decision.signal.action != TradeAction::HOLD) {
        risk::SizingRequest request;
        request.account_balance = *options.balance;
        request.entry_price = options.entry ? *options.entry : data.candles.back().close;
        request.stop_distance = options.stop
            ? *options.stop
            : risk::PositionSizer::stopDistanceFromPct(request.entry_price,
                                                       decision.parameters.stop_loss_pct);
        decision.position = engine.sizePosition(request, decision.parameters);
    }

    return decision;
}

nlohmann::json errorJson(const std::string& path, const std::string& stage, const std::string& message) {
    return {
        {"file", path},
        {"stage", stage},
        {"error", message}
    };
}

}

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parseArgs(argc, argv);
    } catch (const TradeSenseError& e) {
        std::cerr << e.what() << "\n";
        printUsage();
        return 2;
    }

    if (options.inputs.empty()) {
        printUsage();
        return 2;
    }

    try {
        // stdout carries only decision JSON, even before the logger is configured
        spdlog::set_default_logger(spdlog::stderr_color_mt("console"));
        if (options.log_level) {
            Logger::getInstance().setLevel(*options.log_level);
        }

        auto& config = Config::getInstance();
        config.load(options.config_path);

        Logger::getInstance().initialize(config.getLogDir(), options.log_level.value_or(config.getLogLevel()));

        const engine::MarketAnalysisEngine engine(config.getEngineConfig());
        LOG_INFO("Analyzing {} file(s), preset={}", options.inputs.size(),
                 strategy::toString(engine.config().preset));

        // One task per file; the engine is shared read-only
        std::vector<std::future<TradingDecision>> tasks;
        tasks.reserve(options.inputs.size());
        for (const auto& path : options.inputs) {
            tasks.push_back(std::async(std::launch::async, analyzeFile,
                                       std::cref(engine), path, std::cref(options)));
        }

        int exit_code = 0;
        for (size_t i = 0; i < tasks.size(); ++i) {
            const std::string& path = options.inputs[i];
            nlohmann::json out;
            try {
                out = toJson(tasks[i].get());
                out["file"] = path;
            } catch (const TradeSenseError& e) {
                LOG_ERROR("{}: {}", path, e.what());
                out = errorJson(path, e.stage(), e.what());
                if (exit_code == 0) exit_code = 2;
            } catch (const std::exception& e) {
                LOG_ERROR("{}: unexpected error: {}", path, e.what());
                out = errorJson(path, "unexpected", e.what());
                exit_code = 1;
            }
            std::cout << out.dump(options.pretty ? 2 : -1) << std::endl;
        }

        return exit_code;

    } catch (const TradeSenseError& e) {
        LOG_ERROR("Fatal [{}]: {}", e.stage(), e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}
