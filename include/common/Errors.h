#pragma once

#include <stdexcept>
#include <string>

namespace tradesense {

// Base of every error raised by the engine. stage() names the indicator or
// pipeline step that failed so a host can report it.
class TradeSenseError : public std::runtime_error {
public:
    TradeSenseError(const std::string& stage, const std::string& message)
        : std::runtime_error(stage + ": " + message)
        , stage_(stage)
    {}

    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

// Window shorter than an indicator's minimum lookback. Never retried.
class InsufficientDataError : public TradeSenseError {
public:
    InsufficientDataError(const std::string& indicator, size_t required, size_t actual)
        : TradeSenseError(indicator,
                          "requires " + std::to_string(required) +
                          " values, got " + std::to_string(actual))
        , required_(required)
        , actual_(actual)
    {}

    size_t required() const noexcept { return required_; }
    size_t actual() const noexcept { return actual_; }

private:
    size_t required_;
    size_t actual_;
};

// Contract violation: non-positive sizes, NaN/Inf prices, misaligned series.
class InvalidParameterError : public TradeSenseError {
public:
    using TradeSenseError::TradeSenseError;
};

} // namespace tradesense
