#include "strategy/SignalEvaluator.h"
#include "common/Logger.h"

namespace tradepulse {
namespace strategy {

namespace {
bool above(const IndicatorValue& v, double threshold) {
    return v && *v > threshold;
}

bool below(const IndicatorValue& v, double threshold) {
    return v && *v < threshold;
}

bool between(const IndicatorValue& v, double low, double high) {
    return v && *v > low && *v < high;
}

bool isSet(const std::optional<bool>& flag) {
    return flag.value_or(false);
}

// -80 < %R < -20 satisfies the Williams exit on both sides at once.
bool inSharedWilliamsBand(const IndicatorValue& williams_r) {
    return between(williams_r, SignalEvaluator::kWilliamsLow, SignalEvaluator::kWilliamsHigh);
}

// Long exit triggers other than Williams %R
bool longExitCore(const analytics::IndicatorFrame& f, size_t i, const StrategyParameters& p) {
    return isSet(f.macd_cross_down[i]) ||
           above(f.rsi[i], p.rsi_overbought) ||
           above(f.bb_percent[i], SignalEvaluator::kExitBbLong) ||
           above(f.stoch_k[i], SignalEvaluator::kStochHigh) ||
           above(f.stoch_d[i], SignalEvaluator::kStochHigh) ||
           above(f.cci[i], SignalEvaluator::kCciBound) ||
           below(f.price_momentum[i], -SignalEvaluator::kExitMomentum);
}

bool shortExitCore(const analytics::IndicatorFrame& f, size_t i, const StrategyParameters& p) {
    return isSet(f.macd_cross_up[i]) ||
           below(f.rsi[i], p.rsi_oversold) ||
           below(f.bb_percent[i], SignalEvaluator::kExitBbShort) ||
           below(f.stoch_k[i], SignalEvaluator::kStochLow) ||
           below(f.stoch_d[i], SignalEvaluator::kStochLow) ||
           below(f.cci[i], -SignalEvaluator::kCciBound) ||
           above(f.price_momentum[i], SignalEvaluator::kExitMomentum);
}
}

bool SignalEvaluator::longEntryAt(const analytics::IndicatorFrame& f, size_t i,
                                  const StrategyParameters& p) {
    const double close = f.candles[i].close;
    return isSet(f.macd_cross_up[i]) &&
           above(f.volume_ratio[i], p.volume_factor) &&
           above(f.price_momentum[i], kEntryMomentum) &&
           between(f.rsi[i], p.rsi_oversold, p.rsi_overbought) &&
           below(f.ema_fast[i], close) &&
           above(f.adx[i], kMinAdx) &&
           below(f.stoch_k[i], kStochHigh) &&
           below(f.stoch_d[i], kStochHigh) &&
           above(f.williams_r[i], kWilliamsHigh) &&
           below(f.cci[i], kCciBound) &&
           below(f.bb_percent[i], kEntryBbLong);
}

bool SignalEvaluator::shortEntryAt(const analytics::IndicatorFrame& f, size_t i,
                                   const StrategyParameters& p) {
    const double close = f.candles[i].close;
    return isSet(f.macd_cross_down[i]) &&
           above(f.volume_ratio[i], p.volume_factor) &&
           below(f.price_momentum[i], -kEntryMomentum) &&
           between(f.rsi[i], p.rsi_oversold, p.rsi_overbought) &&
           above(f.ema_fast[i], close) &&
           above(f.adx[i], kMinAdx) &&
           above(f.stoch_k[i], kStochLow) &&
           above(f.stoch_d[i], kStochLow) &&
           below(f.williams_r[i], kWilliamsLow) &&
           above(f.cci[i], -kCciBound) &&
           above(f.bb_percent[i], kEntryBbShort);
}

bool SignalEvaluator::longExitAt(const analytics::IndicatorFrame& f, size_t i,
                                 const StrategyParameters& p) {
    return longExitCore(f, i, p) || below(f.williams_r[i], kWilliamsHigh);
}

bool SignalEvaluator::shortExitAt(const analytics::IndicatorFrame& f, size_t i,
                                  const StrategyParameters& p) {
    return shortExitCore(f, i, p) || above(f.williams_r[i], kWilliamsLow);
}

bool SignalEvaluator::longExitFirmAt(const analytics::IndicatorFrame& f, size_t i,
                                     const StrategyParameters& p) {
    return longExitCore(f, i, p) ||
           (below(f.williams_r[i], kWilliamsHigh) && !inSharedWilliamsBand(f.williams_r[i]));
}

bool SignalEvaluator::shortExitFirmAt(const analytics::IndicatorFrame& f, size_t i,
                                      const StrategyParameters& p) {
    return shortExitCore(f, i, p) ||
           (above(f.williams_r[i], kWilliamsLow) && !inSharedWilliamsBand(f.williams_r[i]));
}

SignalFrame SignalEvaluator::computeSignals(const analytics::IndicatorFrame& frame,
                                            const StrategyParameters& params) {
    SignalFrame out;
    out.indicators = frame;

    const size_t n = frame.size();
    out.enter_long.assign(n, false);
    out.enter_short.assign(n, false);
    out.exit_long.assign(n, false);
    out.exit_short.assign(n, false);

    size_t conflicts = 0;
    for (size_t i = 0; i < n; ++i) {
        // 진입: 모든 조건 충족 (MACD 상향/하향 교차가 서로 배타적)
        out.enter_long[i] = longEntryAt(frame, i, params);
        out.enter_short[i] = shortEntryAt(frame, i, params);

        // 청산: 조건 하나만 충족해도 발생
        const bool raw_exit_long = longExitAt(frame, i, params);
        const bool raw_exit_short = shortExitAt(frame, i, params);

        if (raw_exit_long && raw_exit_short) {
            // 양쪽 모두 발생: 공유 Williams 구간만으로 발생한 쪽은 제외,
            // 둘 다 남으면 MACD 방향으로 결정 (동일/미정의 -> 둘 다 없음)
            ++conflicts;
            const bool firm_long = longExitFirmAt(frame, i, params);
            const bool firm_short = shortExitFirmAt(frame, i, params);
            if (firm_long && !firm_short) {
                out.exit_long[i] = true;
            } else if (firm_short && !firm_long) {
                out.exit_short[i] = true;
            } else if (firm_long && firm_short) {
                const auto& macd = frame.macd[i];
                const auto& signal = frame.macd_signal[i];
                if (macd && signal && *macd > *signal) {
                    out.exit_short[i] = true;
                } else if (macd && signal && *macd < *signal) {
                    out.exit_long[i] = true;
                }
            }
        } else {
            out.exit_long[i] = raw_exit_long;
            out.exit_short[i] = raw_exit_short;
        }
    }

    LOG_DEBUG("signals computed over {} candles ({} two-sided exits resolved)",
              n, conflicts);
    return out;
}

} // namespace strategy
} // namespace tradepulse
