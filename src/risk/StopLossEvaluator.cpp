#include "risk/StopLossEvaluator.h"

namespace tradepulse {
namespace risk {

double StopLossEvaluator::computeStopDistance(double seconds_since_open,
                                              bool is_short,
                                              double current_profit_ratio,
                                              double default_stop_ratio) {
    // 진입 직후 10분은 기본 손절 유지
    if (seconds_since_open < kGracePeriodSeconds) {
        return default_stop_ratio;
    }

    double magnitude = 0.0;
    if (current_profit_ratio > kHighProfit) {
        magnitude = kHighProfitStop;
    } else if (current_profit_ratio > kMediumProfit) {
        magnitude = kMediumProfitStop;
    } else {
        return default_stop_ratio;
    }

    return is_short ? magnitude : -magnitude;
}

} // namespace risk
} // namespace tradepulse
