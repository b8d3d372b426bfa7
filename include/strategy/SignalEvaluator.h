#pragma once

#include <vector>
#include "analytics/IndicatorEngine.h"
#include "strategy/StrategyConfig.h"

namespace tradepulse {
namespace strategy {

// 지표 프레임 + 포지션별 진입/청산 판단
struct SignalFrame {
    analytics::IndicatorFrame indicators;

    std::vector<bool> enter_long;
    std::vector<bool> enter_short;
    std::vector<bool> exit_long;
    std::vector<bool> exit_short;

    size_t size() const { return indicators.size(); }
};

class SignalEvaluator {
public:
    // Fixed thresholds of the rule set. Long/short pairs are intentionally
    // not all symmetric.
    static constexpr double kEntryMomentum = 0.01;
    static constexpr double kExitMomentum = 0.02;
    static constexpr double kMinAdx = 25.0;
    static constexpr double kStochHigh = 80.0;
    static constexpr double kStochLow = 20.0;
    static constexpr double kWilliamsHigh = -20.0;
    static constexpr double kWilliamsLow = -80.0;
    static constexpr double kCciBound = 100.0;
    static constexpr double kEntryBbLong = 0.8;
    static constexpr double kEntryBbShort = 0.2;
    static constexpr double kExitBbLong = 0.9;
    static constexpr double kExitBbShort = 0.1;

    // Reads only positions <= i to decide position i. The frame is copied,
    // never modified.
    static SignalFrame computeSignals(const analytics::IndicatorFrame& frame,
                                      const StrategyParameters& params);

    // Entry: every condition must hold; any undefined input -> false.
    static bool longEntryAt(const analytics::IndicatorFrame& frame, size_t i,
                            const StrategyParameters& params);
    static bool shortEntryAt(const analytics::IndicatorFrame& frame, size_t i,
                             const StrategyParameters& params);

    // Raw exit: any single defined condition fires.
    static bool longExitAt(const analytics::IndicatorFrame& frame, size_t i,
                           const StrategyParameters& params);
    static bool shortExitAt(const analytics::IndicatorFrame& frame, size_t i,
                            const StrategyParameters& params);

    // Raw exit without the Williams %R band shared by both sides
    // (kWilliamsLow < %R < kWilliamsHigh). Used when both raw exits fire.
    static bool longExitFirmAt(const analytics::IndicatorFrame& frame, size_t i,
                               const StrategyParameters& params);
    static bool shortExitFirmAt(const analytics::IndicatorFrame& frame, size_t i,
                                const StrategyParameters& params);
};

} // namespace strategy
} // namespace tradepulse
