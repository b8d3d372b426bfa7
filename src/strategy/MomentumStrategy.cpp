#include "strategy/MomentumStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "risk/LeverageEvaluator.h"
#include "risk/StopLossEvaluator.h"
#include "common/Logger.h"
#include <algorithm>

namespace tradepulse {
namespace strategy {

MomentumStrategy::MomentumStrategy(StrategyParameters params, StrategySettings settings)
    : params_(std::move(params))
    , settings_(std::move(settings))
{
    params_.validate();

    // ROI 단계는 시간 오름차순으로 유지
    std::sort(settings_.minimal_roi.begin(), settings_.minimal_roi.end(),
              [](const RoiStep& a, const RoiStep& b) {
                  return a.after_minutes < b.after_minutes;
              });

    LOG_INFO("Momentum strategy initialized (MACD {}/{}/{}, RSI {} [{}-{}], volume x{:.2f}, "
             "leverage {}..{}, vol threshold {:.3f})",
             params_.macd_fast, params_.macd_slow, params_.macd_signal,
             params_.rsi_period, params_.rsi_oversold, params_.rsi_overbought,
             params_.volume_factor, params_.base_leverage, params_.max_leverage,
             params_.volatility_threshold);
}

analytics::IndicatorFrame MomentumStrategy::populateIndicators(
    const std::vector<Candle>& candles) const {
    return analytics::IndicatorEngine::computeIndicators(candles, params_);
}

SignalFrame MomentumStrategy::populateSignals(const analytics::IndicatorFrame& frame) const {
    return SignalEvaluator::computeSignals(frame, params_);
}

SignalFrame MomentumStrategy::analyze(const std::vector<Candle>& candles) const {
    return populateSignals(populateIndicators(candles));
}

double MomentumStrategy::leverage(const std::vector<Candle>& recent,
                                  double proposed_leverage,
                                  double host_max_leverage) const {
    return risk::LeverageEvaluator::computeLeverage(
        analytics::TechnicalIndicators::extractClosePrices(recent),
        analytics::TechnicalIndicators::extractHighPrices(recent),
        analytics::TechnicalIndicators::extractLowPrices(recent),
        params_, proposed_leverage, host_max_leverage);
}

double MomentumStrategy::customStoploss(const TradeContext& trade, long long now_ms) const {
    const double seconds_since_open = (now_ms - trade.open_timestamp) / 1000.0;
    return risk::StopLossEvaluator::computeStopDistance(
        seconds_since_open, trade.is_short, trade.current_profit_ratio, settings_.stoploss);
}

double MomentumStrategy::minimalRoiFor(int trade_minutes) const {
    if (settings_.minimal_roi.empty()) return 0.0;

    double roi = settings_.minimal_roi.front().ratio;
    for (const auto& step : settings_.minimal_roi) {
        if (step.after_minutes > trade_minutes) break;
        roi = step.ratio;
    }
    return roi;
}

std::vector<std::pair<std::string, std::string>>
MomentumStrategy::informativePairs(const std::vector<std::string>& whitelist) const {
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.reserve(whitelist.size());
    for (const auto& pair : whitelist) {
        pairs.emplace_back(pair, settings_.informative_timeframe);
    }
    return pairs;
}

} // namespace strategy
} // namespace tradepulse
