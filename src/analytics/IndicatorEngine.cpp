#include "analytics/IndicatorEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Validation.h"
#include "common/Logger.h"

namespace tradepulse {
namespace analytics {

namespace {
// out[i] = a[i] / b[i] when both defined and b[i] != 0
Series ratioOf(const Series& a, const Series& b) {
    Series out(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] && b[i] && *b[i] != 0.0) {
            out[i] = *a[i] / *b[i];
        }
    }
    return out;
}

// up[i]: a crosses above b at i; down[i]: a crosses below b at i.
void crossovers(const Series& a, const Series& b, FlagSeries& up, FlagSeries& down) {
    up.assign(a.size(), std::nullopt);
    down.assign(a.size(), std::nullopt);
    for (size_t i = 1; i < a.size(); ++i) {
        if (!a[i] || !b[i] || !a[i - 1] || !b[i - 1]) continue;
        up[i] = (*a[i] > *b[i]) && (*a[i - 1] <= *b[i - 1]);
        down[i] = (*a[i] < *b[i]) && (*a[i - 1] >= *b[i - 1]);
    }
}
}

IndicatorFrame IndicatorEngine::computeIndicators(const std::vector<Candle>& candles,
                                                  const strategy::StrategyParameters& params) {
    validateCandles(candles);

    IndicatorFrame frame;
    frame.candles = candles;
    const size_t n = candles.size();

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const auto volumes = TechnicalIndicators::extractVolumes(candles);

    auto macd = TechnicalIndicators::calculateMACD(closes, params.macd_fast,
                                                   params.macd_slow, params.macd_signal);
    frame.macd = std::move(macd.macd);
    frame.macd_signal = std::move(macd.signal);
    frame.macd_hist = std::move(macd.histogram);

    frame.rsi = TechnicalIndicators::calculateRSI(closes, params.rsi_period);

    auto bands = TechnicalIndicators::calculateBollingerBands(closes, kBollingerPeriod,
                                                             kBollingerStdDev);
    frame.bb_lower = std::move(bands.lower);
    frame.bb_middle = std::move(bands.middle);
    frame.bb_upper = std::move(bands.upper);

    frame.bb_percent.resize(n);
    frame.bb_width.resize(n);
    for (size_t i = 0; i < n; ++i) {
        if (!frame.bb_upper[i] || !frame.bb_lower[i] || !frame.bb_middle[i]) continue;
        const double band = *frame.bb_upper[i] - *frame.bb_lower[i];
        if (band != 0.0) {
            frame.bb_percent[i] = (closes[i] - *frame.bb_lower[i]) / band;
        }
        if (*frame.bb_middle[i] != 0.0) {
            frame.bb_width[i] = band / *frame.bb_middle[i];
        }
    }

    const auto volume_series = TechnicalIndicators::toSeries(volumes);
    frame.volume_mean = TechnicalIndicators::calculateSMA(volume_series, kVolumeMeanPeriod);
    frame.volume_ratio = ratioOf(volume_series, frame.volume_mean);

    frame.price_change = TechnicalIndicators::percentChange(closes, kMomentumPeriod);
    frame.price_momentum = TechnicalIndicators::percentChange(closes, kMomentumPeriod);

    const auto close_series = TechnicalIndicators::toSeries(closes);
    frame.ema_fast = TechnicalIndicators::calculateEMA(close_series, kEmaFastPeriod);
    frame.ema_slow = TechnicalIndicators::calculateEMA(close_series, kEmaSlowPeriod);

    frame.adx = TechnicalIndicators::calculateADX(candles, kAdxPeriod);

    auto stoch = TechnicalIndicators::calculateStochastic(candles, kStochKPeriod,
                                                         kStochSlowKPeriod, kStochSlowDPeriod);
    frame.stoch_k = std::move(stoch.k);
    frame.stoch_d = std::move(stoch.d);

    frame.williams_r = TechnicalIndicators::calculateWilliamsR(candles, kWilliamsPeriod);
    frame.cci = TechnicalIndicators::calculateCCI(candles, kCciPeriod);

    crossovers(frame.macd, frame.macd_signal, frame.macd_cross_up, frame.macd_cross_down);

    if (n < static_cast<size_t>(kLongestLookback)) {
        LOG_DEBUG("indicator warm-up: {} candles (< {}), later columns stay undefined",
                  n, kLongestLookback);
    }
    return frame;
}

} // namespace analytics
} // namespace tradepulse
