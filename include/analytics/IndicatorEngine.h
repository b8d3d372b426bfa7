#pragma once

#include <vector>
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace tradepulse {
namespace analytics {

// 캔들 시계열 + 파생 지표 컬럼. 모든 컬럼 길이 == candles.size()
struct IndicatorFrame {
    std::vector<Candle> candles;

    // MACD
    Series macd;
    Series macd_signal;
    Series macd_hist;

    Series rsi;

    // Bollinger Bands (20, 2σ)
    Series bb_lower;
    Series bb_middle;
    Series bb_upper;
    Series bb_percent;
    Series bb_width;

    // Volume
    Series volume_mean;
    Series volume_ratio;

    // Price momentum (5 periods)
    Series price_change;
    Series price_momentum;

    Series ema_fast;    // EMA-20
    Series ema_slow;    // EMA-50

    Series adx;
    Series stoch_k;
    Series stoch_d;
    Series williams_r;
    Series cci;

    FlagSeries macd_cross_up;
    FlagSeries macd_cross_down;

    size_t size() const { return candles.size(); }
};

class IndicatorEngine {
public:
    // Longest lookback of any column (EMA-50).
    static constexpr int kLongestLookback = 50;

    static constexpr int kBollingerPeriod = 20;
    static constexpr double kBollingerStdDev = 2.0;
    static constexpr int kVolumeMeanPeriod = 20;
    static constexpr int kMomentumPeriod = 5;
    static constexpr int kEmaFastPeriod = 20;
    static constexpr int kEmaSlowPeriod = 50;
    static constexpr int kAdxPeriod = 14;
    static constexpr int kStochKPeriod = 14;
    static constexpr int kStochSlowKPeriod = 3;
    static constexpr int kStochSlowDPeriod = 3;
    static constexpr int kWilliamsPeriod = 14;
    static constexpr int kCciPeriod = 20;

    // Validates the candles (InputValidationError) and returns a frame of the
    // same length. Short series are not an error: unavailable positions stay
    // undefined.
    static IndicatorFrame computeIndicators(const std::vector<Candle>& candles,
                                            const strategy::StrategyParameters& params);
};

} // namespace analytics
} // namespace tradepulse
