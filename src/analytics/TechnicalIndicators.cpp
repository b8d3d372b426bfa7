#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>

namespace tradepulse {
namespace analytics {

bool TechnicalIndicators::windowDefined(const Series& values, size_t end, int period) {
    if (period <= 0 || end + 1 < static_cast<size_t>(period)) return false;
    for (size_t i = end + 1 - period; i <= end; ++i) {
        if (!values[i]) return false;
    }
    return true;
}

bool TechnicalIndicators::windowFlat(const Series& values, size_t end, int period) {
    const double first = *values[end + 1 - period];
    for (size_t i = end + 2 - period; i <= end; ++i) {
        if (*values[i] != first) return false;
    }
    return true;
}

// SMA 계산 (Simple Moving Average)
Series TechnicalIndicators::calculateSMA(const Series& values, int period) {
    Series out(values.size());
    if (period <= 0) return out;

    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        if (!windowDefined(values, i, period)) continue;

        double sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            sum += *values[j];
        }
        out[i] = sum / period;
    }
    return out;
}

// EMA 계산 (Exponential Moving Average)
Series TechnicalIndicators::calculateEMA(const Series& values, int period) {
    Series out(values.size());
    if (period <= 0) return out;

    size_t start = 0;
    while (start < values.size() && !values[start]) ++start;
    if (values.size() - start < static_cast<size_t>(period)) return out;

    // 초기 SMA (정의된 첫 period 개)
    const size_t seed_end = start + period - 1;
    if (!windowDefined(values, seed_end, period)) return out;

    double ema = 0.0;
    for (size_t i = start; i <= seed_end; ++i) ema += *values[i];
    ema /= period;
    out[seed_end] = ema;

    const double multiplier = 2.0 / (period + 1.0);
    for (size_t i = seed_end + 1; i < values.size(); ++i) {
        if (!values[i]) break;
        ema = (*values[i] - ema) * multiplier + ema;
        out[i] = ema;
    }
    return out;
}

Series TechnicalIndicators::calculateStdDev(const Series& values, const Series& mean, int period) {
    Series out(values.size());
    if (period <= 0) return out;

    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        if (!mean[i] || !windowDefined(values, i, period)) continue;

        // 횡보 구간: 평균의 반올림 오차로 0이 아닌 편차가 생기지 않도록 정확히 0
        if (windowFlat(values, i, period)) {
            out[i] = 0.0;
            continue;
        }

        const double m = *mean[i];
        double sum_sq_diff = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            sum_sq_diff += (*values[j] - m) * (*values[j] - m);
        }
        out[i] = std::sqrt(sum_sq_diff / period);
    }
    return out;
}

Series TechnicalIndicators::rollingMax(const std::vector<double>& values, int period) {
    Series out(values.size());
    if (period <= 0) return out;

    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        out[i] = *std::max_element(values.begin() + (i + 1 - period), values.begin() + i + 1);
    }
    return out;
}

Series TechnicalIndicators::rollingMin(const std::vector<double>& values, int period) {
    Series out(values.size());
    if (period <= 0) return out;

    for (size_t i = static_cast<size_t>(period) - 1; i < values.size(); ++i) {
        out[i] = *std::min_element(values.begin() + (i + 1 - period), values.begin() + i + 1);
    }
    return out;
}

Series TechnicalIndicators::percentChange(const std::vector<double>& values, int periods) {
    Series out(values.size());
    if (periods <= 0) return out;

    for (size_t i = periods; i < values.size(); ++i) {
        const double base = values[i - periods];
        if (base == 0.0) continue;
        out[i] = values[i] / base - 1.0;
    }
    return out;
}

// RSI 계산 (Wilder's Smoothing 방식)
Series TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    Series out(prices.size());
    if (period <= 0 || prices.size() <= static_cast<size_t>(period)) {
        return out;
    }

    // 100 * gain / (gain + loss) == 100 - 100 / (1 + RS); flat window -> 0
    auto rsiOf = [](double gain, double loss) {
        if (gain + loss == 0.0) return 0.0;
        return 100.0 * gain / (gain + loss);
    };

    // 1. 초기 평균 (첫 period 기간)
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss -= change;
    }
    avg_gain /= period;
    avg_loss /= period;
    out[period] = rsiOf(avg_gain, avg_loss);

    // 2. Wilder's Smoothing
    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        const double current_gain = (change > 0) ? change : 0.0;
        const double current_loss = (change < 0) ? -change : 0.0;

        avg_gain = (avg_gain * (period - 1) + current_gain) / period;
        avg_loss = (avg_loss * (period - 1) + current_loss) / period;
        out[i] = rsiOf(avg_gain, avg_loss);
    }

    return out;
}

// MACD 계산
TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;
    const auto series = toSeries(prices);
    const auto fast_ema = calculateEMA(series, fast);
    const auto slow_ema = calculateEMA(series, slow);

    result.macd.resize(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (fast_ema[i] && slow_ema[i]) {
            result.macd[i] = *fast_ema[i] - *slow_ema[i];
        }
    }

    // Signal Line = MACD 시계열의 EMA
    result.signal = calculateEMA(result.macd, signal_period);

    result.histogram.resize(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (result.macd[i] && result.signal[i]) {
            result.histogram[i] = *result.macd[i] - *result.signal[i];
        }
    }
    return result;
}

// Bollinger Bands 계산
TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerBands result;
    const auto series = toSeries(prices);

    result.middle = calculateSMA(series, period);
    const auto std_dev = calculateStdDev(series, result.middle, period);

    result.upper.resize(prices.size());
    result.lower.resize(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!result.middle[i] || !std_dev[i]) continue;
        result.upper[i] = *result.middle[i] + std_dev_mult * *std_dev[i];
        result.lower[i] = *result.middle[i] - std_dev_mult * *std_dev[i];
    }
    return result;
}

// ADX 계산
// TR/DM은 index 1부터, 첫 DX는 index period, DX 평균으로 ADX 초기값
// (index 2*period-1) 이후 Wilder 평활.
Series TechnicalIndicators::calculateADX(const std::vector<Candle>& candles, int period) {
    const size_t n = candles.size();
    Series out(n);
    if (period <= 0 || n < static_cast<size_t>(period) * 2) return out;

    std::vector<double> tr_vec(n, 0.0), dm_plus_vec(n, 0.0), dm_minus_vec(n, 0.0);
    for (size_t i = 1; i < n; ++i) {
        const double current_high = candles[i].high;
        const double current_low = candles[i].low;
        const double prev_high = candles[i - 1].high;
        const double prev_low = candles[i - 1].low;
        const double prev_close = candles[i - 1].close;

        const double tr1 = current_high - current_low;
        const double tr2 = std::abs(current_high - prev_close);
        const double tr3 = std::abs(current_low - prev_close);
        tr_vec[i] = std::max({tr1, tr2, tr3});

        const double up_move = current_high - prev_high;
        const double down_move = prev_low - current_low;
        if (up_move > down_move && up_move > 0) dm_plus_vec[i] = up_move;
        if (down_move > up_move && down_move > 0) dm_minus_vec[i] = down_move;
    }

    auto dxOf = [](double tr, double dm_plus, double dm_minus) {
        if (tr == 0.0) return 0.0;
        const double di_plus = 100.0 * dm_plus / tr;
        const double di_minus = 100.0 * dm_minus / tr;
        const double sum_di = di_plus + di_minus;
        if (sum_di == 0.0) return 0.0;
        return 100.0 * std::abs(di_plus - di_minus) / sum_di;
    };

    // TA-Lib 방식: period-1 봉 합계로 시작, index period부터 평활 적용
    double tr_smooth = 0.0, dm_plus_smooth = 0.0, dm_minus_smooth = 0.0;
    for (int i = 1; i < period; ++i) {
        tr_smooth += tr_vec[i];
        dm_plus_smooth += dm_plus_vec[i];
        dm_minus_smooth += dm_minus_vec[i];
    }

    std::vector<double> dx_vec(n, 0.0);
    for (size_t i = period; i < n; ++i) {
        tr_smooth = tr_smooth - tr_smooth / period + tr_vec[i];
        dm_plus_smooth = dm_plus_smooth - dm_plus_smooth / period + dm_plus_vec[i];
        dm_minus_smooth = dm_minus_smooth - dm_minus_smooth / period + dm_minus_vec[i];
        dx_vec[i] = dxOf(tr_smooth, dm_plus_smooth, dm_minus_smooth);
    }

    double adx = 0.0;
    for (size_t i = period; i < static_cast<size_t>(period) * 2; ++i) adx += dx_vec[i];
    adx /= period;
    out[period * 2 - 1] = adx;

    for (size_t i = static_cast<size_t>(period) * 2; i < n; ++i) {
        adx = (adx * (period - 1) + dx_vec[i]) / period;
        out[i] = adx;
    }
    return out;
}

// Stochastic Oscillator 계산
TechnicalIndicators::StochasticResult TechnicalIndicators::calculateStochastic(
    const std::vector<Candle>& candles,
    int k_period,
    int slow_k_period,
    int slow_d_period
) {
    const auto highest = rollingMax(extractHighPrices(candles), k_period);
    const auto lowest = rollingMin(extractLowPrices(candles), k_period);

    Series fast_k(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        if (!highest[i] || !lowest[i]) continue;
        const double range = *highest[i] - *lowest[i];
        if (range == 0.0) continue;   // 횡보 구간: 정의 불가
        fast_k[i] = (candles[i].close - *lowest[i]) / range * 100.0;
    }

    StochasticResult result;
    result.k = calculateSMA(fast_k, slow_k_period);
    result.d = calculateSMA(result.k, slow_d_period);
    return result;
}

Series TechnicalIndicators::calculateWilliamsR(const std::vector<Candle>& candles, int period) {
    const auto highest = rollingMax(extractHighPrices(candles), period);
    const auto lowest = rollingMin(extractLowPrices(candles), period);

    Series out(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        if (!highest[i] || !lowest[i]) continue;
        const double range = *highest[i] - *lowest[i];
        if (range == 0.0) continue;
        out[i] = (*highest[i] - candles[i].close) / range * -100.0;
    }
    return out;
}

Series TechnicalIndicators::calculateCCI(const std::vector<Candle>& candles, int period) {
    Series typical(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        typical[i] = (candles[i].high + candles[i].low + candles[i].close) / 3.0;
    }
    const auto mean = calculateSMA(typical, period);

    Series out(candles.size());
    for (size_t i = 0; i < candles.size(); ++i) {
        if (!mean[i] || windowFlat(typical, i, period)) continue;

        double mean_dev = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            mean_dev += std::abs(*typical[j] - *mean[i]);
        }
        mean_dev /= period;
        if (mean_dev == 0.0) continue;

        out[i] = (*typical[i] - *mean[i]) / (0.015 * mean_dev);
    }
    return out;
}

Series TechnicalIndicators::toSeries(const std::vector<double>& values) {
    return Series(values.begin(), values.end());
}

// Close 가격만 추출
std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) prices.push_back(candle.close);
    return prices;
}

std::vector<double> TechnicalIndicators::extractHighPrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) prices.push_back(candle.high);
    return prices;
}

std::vector<double> TechnicalIndicators::extractLowPrices(const std::vector<Candle>& candles) {
    std::vector<double> prices;
    prices.reserve(candles.size());
    for (const auto& candle : candles) prices.push_back(candle.low);
    return prices;
}

std::vector<double> TechnicalIndicators::extractVolumes(const std::vector<Candle>& candles) {
    std::vector<double> volumes;
    volumes.reserve(candles.size());
    for (const auto& candle : candles) volumes.push_back(candle.volume);
    return volumes;
}

} // namespace analytics
} // namespace tradepulse
