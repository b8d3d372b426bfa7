#include "TestSupport.h"
#include "risk/LeverageEvaluator.h"
#include "common/Errors.h"

#include <cmath>
#include <iostream>

using namespace tradepulse;
using risk::LeverageEvaluator;
using strategy::StrategyParameters;

namespace {

struct Window {
    std::vector<double> closes;
    std::vector<double> highs;
    std::vector<double> lows;
};

Window flatWindow(size_t n, double close, double high, double low) {
    Window w;
    w.closes.assign(n, close);
    w.highs.assign(n, high);
    w.lows.assign(n, low);
    return w;
}

double leverageOf(const Window& w, double proposed, double host_max,
                  const StrategyParameters& params = StrategyParameters()) {
    return LeverageEvaluator::computeLeverage(w.closes, w.highs, w.lows, params,
                                              proposed, host_max);
}

void testShortHistory() {
    const auto w = flatWindow(10, 100.0, 100.0, 100.0);
    assert(test::near(leverageOf(w, 3.0, 50.0), 3.0));
    assert(test::near(leverageOf(w, 15.0, 50.0), 10.0));

    const auto nineteen = flatWindow(19, 100.0, 130.0, 70.0);
    assert(test::near(leverageOf(nineteen, 12.0, 50.0), 10.0));

    const Window empty;
    assert(test::near(leverageOf(empty, 4.0, 50.0), 4.0));

    std::cout << "  short history OK" << std::endl;
}

void testCalmMarket() {
    const auto w = flatWindow(30, 100.0, 100.0, 100.0);
    assert(test::near(leverageOf(w, 10.0, 50.0), 10.0));
    assert(test::near(leverageOf(w, 10.0, 3.0), 3.0));     // host cap
    assert(test::near(leverageOf(w, 10.0, 0.5), 1.0));     // floor of 1

    StrategyParameters capped;
    capped.base_leverage = 20;
    capped.max_leverage = 10;
    assert(test::near(leverageOf(w, 10.0, 50.0, capped), 10.0));

    // Range 3% stays below 0.7 * 5%.
    const auto quiet = flatWindow(30, 100.0, 101.5, 98.5);
    assert(test::near(leverageOf(quiet, 10.0, 50.0), 10.0));

    std::cout << "  calm market OK" << std::endl;
}

void testVolatilityTiers() {
    // Close-to-close swings of ~10% -> high tier.
    Window swing;
    for (int i = 0; i < 30; ++i) {
        const double c = (i % 2 == 0) ? 100.0 : 110.0;
        swing.closes.push_back(c);
        swing.highs.push_back(c);
        swing.lows.push_back(c);
    }
    assert(test::near(leverageOf(swing, 10.0, 50.0), 5.0));

    // Range 4% -> medium tier.
    const auto medium = flatWindow(30, 100.0, 102.0, 98.0);
    const auto vol = LeverageEvaluator::measureVolatility(medium.closes, medium.highs, medium.lows);
    assert(test::near(vol.returns_std, 0.0));
    assert(test::near(vol.range_ratio, 0.04));
    assert(test::near(vol.combined, 0.04));
    assert(test::near(leverageOf(medium, 10.0, 50.0), 7.5));

    // Exactly at the threshold is not above it.
    const auto edge = flatWindow(30, 100.0, 102.5, 97.5);
    assert(test::near(leverageOf(edge, 10.0, 50.0), 7.5));

    // Only the last 14 bars count toward the range.
    auto old_spike = flatWindow(30, 100.0, 100.0, 100.0);
    old_spike.highs[5] = 200.0;
    assert(test::near(leverageOf(old_spike, 10.0, 50.0), 10.0));
    old_spike.highs[20] = 200.0;
    assert(test::near(leverageOf(old_spike, 10.0, 50.0), 5.0));

    // A last close of zero is treated as unbounded volatility.
    auto crash = flatWindow(30, 100.0, 100.0, 100.0);
    crash.closes.back() = 0.0;
    crash.lows.back() = 0.0;
    assert(std::isinf(LeverageEvaluator::measureVolatility(crash.closes, crash.highs,
                                                           crash.lows).range_ratio));
    assert(test::near(leverageOf(crash, 10.0, 50.0), 5.0));

    assert(test::near(LeverageEvaluator::multiplierFor(0.06, 0.05), 0.5));
    assert(test::near(LeverageEvaluator::multiplierFor(0.04, 0.05), 0.75));
    assert(test::near(LeverageEvaluator::multiplierFor(0.03, 0.05), 1.0));

    std::cout << "  volatility tiers OK" << std::endl;
}

void testInvalidWindow() {
    auto w = flatWindow(30, 100.0, 101.0, 99.0);
    w.highs.pop_back();
    bool thrown = false;
    try {
        leverageOf(w, 10.0, 50.0);
    } catch (const InputValidationError&) {
        thrown = true;
    }
    assert(thrown);

    w = flatWindow(30, 100.0, 101.0, 99.0);
    w.closes[7] = std::nan("");
    thrown = false;
    try {
        leverageOf(w, 10.0, 50.0);
    } catch (const InputValidationError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  invalid window OK" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] LeverageEvaluator" << std::endl;
    testShortHistory();
    testCalmMarket();
    testVolatilityTiers();
    testInvalidWindow();
    std::cout << "[TEST] LeverageEvaluator PASSED" << std::endl;
    return 0;
}
