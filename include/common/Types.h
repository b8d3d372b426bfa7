#pragma once

#include <string>
#include <vector>
#include <optional>

namespace tradepulse {

using Price = double;
using Volume = double;

// 지표 값: std::nullopt = 워밍업 구간 등으로 정의되지 않은 값
using IndicatorValue = std::optional<double>;
using Series = std::vector<IndicatorValue>;
using FlagSeries = std::vector<std::optional<bool>>;

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // epoch ms

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// Host-owned trade state. Read only inside the core.
struct TradeContext {
    long long open_timestamp;       // epoch ms
    bool is_short;
    double current_profit_ratio;

    TradeContext() : open_timestamp(0), is_short(false), current_profit_ratio(0.0) {}

    TradeContext(long long opened, bool short_side, double profit)
        : open_timestamp(opened), is_short(short_side), current_profit_ratio(profit) {}
};

} // namespace tradepulse
