#include "risk/LeverageEvaluator.h"
#include "common/Validation.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tradepulse {
namespace risk {

LeverageEvaluator::Volatility LeverageEvaluator::measureVolatility(
    const std::vector<double>& closes,
    const std::vector<double>& highs,
    const std::vector<double>& lows
) {
    Volatility vol{0.0, 0.0, 0.0};
    if (closes.empty()) return vol;

    // 1. 수익률 표준편차 (표본, n-1)
    std::vector<double> returns;
    returns.reserve(closes.size());
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] == 0.0) continue;
        returns.push_back(closes[i] / closes[i - 1] - 1.0);
    }
    if (returns.size() >= 2) {
        double mean = 0.0;
        for (double r : returns) mean += r;
        mean /= returns.size();

        double sum_sq_diff = 0.0;
        for (double r : returns) sum_sq_diff += (r - mean) * (r - mean);
        vol.returns_std = std::sqrt(sum_sq_diff / (returns.size() - 1));
    }

    // 2. 최근 14봉 고저 범위 / 현재가
    const size_t span = std::min<size_t>(kRangePeriod, closes.size());
    const double highest = *std::max_element(highs.end() - span, highs.end());
    const double lowest = *std::min_element(lows.end() - span, lows.end());
    const double last_close = closes.back();
    if (last_close != 0.0) {
        vol.range_ratio = (highest - lowest) / last_close;
    } else {
        vol.range_ratio = std::numeric_limits<double>::infinity();
    }

    vol.combined = std::max(vol.returns_std, vol.range_ratio);
    return vol;
}

double LeverageEvaluator::multiplierFor(double combined_volatility, double threshold) {
    if (combined_volatility > threshold) {
        return kHighVolMultiplier;
    }
    if (combined_volatility > threshold * kMediumVolFraction) {
        return kMediumVolMultiplier;
    }
    return 1.0;
}

double LeverageEvaluator::computeLeverage(const std::vector<double>& closes,
                                          const std::vector<double>& highs,
                                          const std::vector<double>& lows,
                                          const strategy::StrategyParameters& params,
                                          double proposed_leverage,
                                          double host_max_leverage) {
    validatePriceWindow(closes, highs, lows);

    if (closes.size() < kMinHistory) {
        return std::min(proposed_leverage, static_cast<double>(params.base_leverage));
    }

    const auto vol = measureVolatility(closes, highs, lows);
    const double multiplier = multiplierFor(vol.combined, params.volatility_threshold);

    const double calculated = params.base_leverage * multiplier;
    const double upper = std::min({calculated,
                                   static_cast<double>(params.max_leverage),
                                   host_max_leverage});
    const double leverage = std::max(1.0, upper);

    LOG_DEBUG("leverage: std={:.5f} range={:.5f} combined={:.5f} x{:.2f} -> {:.2f}",
              vol.returns_std, vol.range_ratio, vol.combined, multiplier, leverage);
    return leverage;
}

} // namespace risk
} // namespace tradepulse
