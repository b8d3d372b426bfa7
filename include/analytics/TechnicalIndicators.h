#pragma once

#include <vector>
#include "common/Types.h"

namespace tradepulse {
namespace analytics {

// Technical Indicators - 전체 시계열 버전
// 모든 함수는 입력과 같은 길이의 Series를 반환하며, 룩백이 채워지기 전의
// 위치는 std::nullopt. 정의되지 않은 입력은 그대로 전파됨 (0으로 채우지 않음).
class TechnicalIndicators {
public:
    // SMA over the last `period` values; undefined if any of them is undefined.
    static Series calculateSMA(const Series& values, int period);

    // EMA seeded with the SMA of the first `period` defined values.
    // Leading undefined values are skipped; a gap after the seed ends the series.
    static Series calculateEMA(const Series& values, int period);

    // Population standard deviation over `period`, around a precomputed mean.
    // Exactly 0 when every value in the window is equal.
    static Series calculateStdDev(const Series& values, const Series& mean, int period);

    static Series rollingMax(const std::vector<double>& values, int period);
    static Series rollingMin(const std::vector<double>& values, int period);

    // values[i] / values[i - periods] - 1
    static Series percentChange(const std::vector<double>& values, int periods);

    // RSI (Wilder's Smoothing), 첫 값은 index == period
    static Series calculateRSI(const std::vector<double>& prices, int period = 14);

    struct MACDResult {
        Series macd;        // fast EMA - slow EMA
        Series signal;      // EMA of macd
        Series histogram;   // macd - signal
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerBands {
        Series upper;
        Series middle;      // SMA
        Series lower;
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // ADX (Average Directional Index) - 25 이상: 추세장
    static Series calculateADX(const std::vector<Candle>& candles, int period = 14);

    // Slow stochastic: %K = SMA(fast %K, slow_k), %D = SMA(%K, slow_d)
    struct StochasticResult {
        Series k;
        Series d;
    };
    static StochasticResult calculateStochastic(const std::vector<Candle>& candles,
                                                int k_period = 14,
                                                int slow_k_period = 3,
                                                int slow_d_period = 3);

    // Williams %R in [-100, 0]
    static Series calculateWilliamsR(const std::vector<Candle>& candles, int period = 14);

    // Commodity Channel Index on typical price, 0.015 constant.
    // Undefined when the typical price is flat over the window.
    static Series calculateCCI(const std::vector<Candle>& candles, int period = 20);

    static Series toSeries(const std::vector<double>& values);
    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
    static std::vector<double> extractHighPrices(const std::vector<Candle>& candles);
    static std::vector<double> extractLowPrices(const std::vector<Candle>& candles);
    static std::vector<double> extractVolumes(const std::vector<Candle>& candles);

private:
    static bool windowDefined(const Series& values, size_t end, int period);
    // Caller guarantees the window is defined.
    static bool windowFlat(const Series& values, size_t end, int period);
};

} // namespace analytics
} // namespace tradepulse
