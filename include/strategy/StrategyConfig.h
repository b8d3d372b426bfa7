#pragma once

#include <map>
#include <string>
#include <vector>

namespace tradepulse {
namespace strategy {

// Optimizer-tunable controls. Read-only during evaluation; the host swaps in
// a new instance between optimization runs.
struct StrategyParameters {
    // MACD
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;

    // Volume confirmation (volume / 20-period mean)
    double volume_factor = 1.5;

    // RSI
    int rsi_period = 14;
    int rsi_oversold = 30;
    int rsi_overbought = 70;

    double exit_macd_threshold = 0.0;

    // Leverage
    int base_leverage = 10;
    int max_leverage = 20;
    double volatility_threshold = 0.05;

    // Throws ConfigError naming the first field outside its range.
    void validate() const;
};

// Declared [min, max] of one parameter, inclusive on both ends.
struct ParameterRange {
    std::string name;
    double min;
    double max;
    bool integral;
};

const std::vector<ParameterRange>& parameterRanges();

// Throws ConfigError for an unknown name.
const ParameterRange& parameterRange(const std::string& name);

// Throws ConfigError when value is outside [range.min, range.max] or NaN.
void checkRange(const ParameterRange& range, double value);

// 최소 ROI 테이블의 한 단계: 거래 시간이 after_minutes 이상이면 ratio 적용
struct RoiStep {
    int after_minutes;
    double ratio;
};

// Static trading settings of the momentum strategy. Not tunable.
struct StrategySettings {
    std::string timeframe = "15m";
    std::string informative_timeframe = "1h";
    bool can_short = true;
    int startup_candle_count = 30;

    double stoploss = -0.10;

    bool trailing_stop = true;
    double trailing_stop_positive = 0.01;
    double trailing_stop_positive_offset = 0.02;
    bool trailing_only_offset_is_reached = true;

    std::vector<RoiStep> minimal_roi = {
        {0, 0.04},
        {30, 0.02},
        {60, 0.01},
    };

    std::map<std::string, std::string> order_types = {
        {"entry", "limit"},
        {"exit", "limit"},
        {"stoploss", "market"},
    };
    bool stoploss_on_exchange = false;

    std::map<std::string, std::string> order_time_in_force = {
        {"entry", "gtc"},
        {"exit", "gtc"},
    };

    bool use_exit_signal = true;
    bool exit_profit_only = false;
    bool ignore_roi_if_entry_signal = false;
};

} // namespace strategy
} // namespace tradepulse
