#include "strategy/StrategyConfig.h"
#include "common/Errors.h"

#include <cmath>
#include <sstream>

namespace tradepulse {
namespace strategy {

void checkRange(const ParameterRange& range, double value) {
    if (!(value >= range.min && value <= range.max)) {
        std::ostringstream oss;
        oss << "parameter '" << range.name << "' = " << value
            << " outside [" << range.min << ", " << range.max << "]";
        throw ConfigError(oss.str());
    }
}

const std::vector<ParameterRange>& parameterRanges() {
    static const std::vector<ParameterRange> ranges = {
        {"macd_fast", 8, 16, true},
        {"macd_slow", 20, 30, true},
        {"macd_signal", 7, 12, true},
        {"volume_factor", 1.0, 3.0, false},
        {"rsi_period", 10, 20, true},
        {"rsi_oversold", 20, 40, true},
        {"rsi_overbought", 60, 80, true},
        {"exit_macd_threshold", -0.001, 0.001, false},
        {"base_leverage", 5, 20, true},
        {"max_leverage", 10, 50, true},
        {"volatility_threshold", 0.02, 0.10, false},
    };
    return ranges;
}

const ParameterRange& parameterRange(const std::string& name) {
    for (const auto& r : parameterRanges()) {
        if (r.name == name) return r;
    }
    throw ConfigError("unknown parameter '" + name + "'");
}

void StrategyParameters::validate() const {
    const double doubles[] = {volume_factor, exit_macd_threshold, volatility_threshold};
    for (double v : doubles) {
        if (!std::isfinite(v)) {
            throw ConfigError("strategy parameter is not a finite number");
        }
    }

    checkRange(parameterRange("macd_fast"), macd_fast);
    checkRange(parameterRange("macd_slow"), macd_slow);
    checkRange(parameterRange("macd_signal"), macd_signal);
    checkRange(parameterRange("volume_factor"), volume_factor);
    checkRange(parameterRange("rsi_period"), rsi_period);
    checkRange(parameterRange("rsi_oversold"), rsi_oversold);
    checkRange(parameterRange("rsi_overbought"), rsi_overbought);
    checkRange(parameterRange("exit_macd_threshold"), exit_macd_threshold);
    checkRange(parameterRange("base_leverage"), base_leverage);
    checkRange(parameterRange("max_leverage"), max_leverage);
    checkRange(parameterRange("volatility_threshold"), volatility_threshold);
}

} // namespace strategy
} // namespace tradepulse
