#pragma once

namespace tradepulse {
namespace risk {

// 수익 구간별 손절 거리 (현재가 대비 비율)
// Long: 음수 (현재가 아래), Short: 양수 (현재가 위).
// 이전 손절값을 기억하지 않음 - 손절선을 올리기만 하는 것은 호스트 책임.
class StopLossEvaluator {
public:
    static constexpr double kGracePeriodSeconds = 600.0;
    static constexpr double kHighProfit = 0.02;
    static constexpr double kMediumProfit = 0.01;
    static constexpr double kHighProfitStop = 0.02;
    static constexpr double kMediumProfitStop = 0.015;

    static double computeStopDistance(double seconds_since_open,
                                      bool is_short,
                                      double current_profit_ratio,
                                      double default_stop_ratio);
};

} // namespace risk
} // namespace tradepulse
