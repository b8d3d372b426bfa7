#pragma once

#include "common/Types.h"
#include "analytics/IndicatorEngine.h"
#include "strategy/SignalEvaluator.h"
#include "strategy/StrategyConfig.h"
#include <string>
#include <utility>
#include <vector>

namespace tradepulse {
namespace strategy {

// MACD + 거래량 확인 기반 모멘텀 전략
//
// Entry: MACD crossover confirmed by volume, price momentum, trend (EMA-20,
// ADX) and a set of overbought/oversold filters. Exit: any single opposing
// signal. Leverage scales down with recent volatility; the stop tightens in
// two profit tiers once the position is older than ten minutes.
//
// Holds only immutable configuration; every call is a pure function of its
// arguments, so one instance can serve several pairs concurrently.
class MomentumStrategy {
public:
    // Throws ConfigError if any parameter is outside its declared range.
    explicit MomentumStrategy(StrategyParameters params = StrategyParameters(),
                              StrategySettings settings = StrategySettings());

    const StrategyParameters& parameters() const { return params_; }
    const StrategySettings& settings() const { return settings_; }

    analytics::IndicatorFrame populateIndicators(const std::vector<Candle>& candles) const;
    SignalFrame populateSignals(const analytics::IndicatorFrame& frame) const;

    // populateIndicators + populateSignals
    SignalFrame analyze(const std::vector<Candle>& candles) const;

    // recent: the analyzed candle window of the pair, oldest first.
    double leverage(const std::vector<Candle>& recent,
                    double proposed_leverage,
                    double host_max_leverage) const;

    // Stop distance relative to the current rate, default = settings().stoploss.
    double customStoploss(const TradeContext& trade, long long now_ms) const;

    // ROI target active after a trade has been open for `minutes`.
    double minimalRoiFor(int trade_minutes) const;

    // (pair, informative timeframe) for each whitelisted pair.
    std::vector<std::pair<std::string, std::string>>
    informativePairs(const std::vector<std::string>& whitelist) const;

private:
    StrategyParameters params_;
    StrategySettings settings_;
};

} // namespace strategy
} // namespace tradepulse
