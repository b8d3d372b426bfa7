#pragma once

#include <vector>
#include "strategy/StrategyConfig.h"

namespace tradepulse {
namespace risk {

// 변동성 기반 레버리지 결정 (상태 없음)
class LeverageEvaluator {
public:
    static constexpr size_t kMinHistory = 20;
    static constexpr int kRangePeriod = 14;
    static constexpr double kHighVolMultiplier = 0.5;
    static constexpr double kMediumVolMultiplier = 0.75;
    static constexpr double kMediumVolFraction = 0.7;

    struct Volatility {
        double returns_std;     // sample stdev of close-to-close returns
        double range_ratio;     // (max high - min low over 14) / last close
        double combined;        // max of the two
    };

    // Fewer than kMinHistory closes -> min(proposed, base_leverage).
    // Otherwise base_leverage scaled by the volatility tier, clamped to
    // [1, min(max_leverage, host_max_leverage)].
    // Throws InputValidationError when the three windows differ in length.
    static double computeLeverage(const std::vector<double>& closes,
                                  const std::vector<double>& highs,
                                  const std::vector<double>& lows,
                                  const strategy::StrategyParameters& params,
                                  double proposed_leverage,
                                  double host_max_leverage);

    // Range term uses the last min(14, size) bars; an empty window is all zeros.
    static Volatility measureVolatility(const std::vector<double>& closes,
                                        const std::vector<double>& highs,
                                        const std::vector<double>& lows);

    static double multiplierFor(double combined_volatility, double threshold);
};

} // namespace risk
} // namespace tradepulse
