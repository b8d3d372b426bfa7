#include "TestSupport.h"
#include "strategy/MomentumStrategy.h"
#include "common/Errors.h"

#include <iostream>

using namespace tradepulse;
using strategy::MomentumStrategy;
using strategy::StrategyParameters;
using strategy::StrategySettings;

namespace {

void testSettings() {
    const MomentumStrategy momentum;
    const auto& s = momentum.settings();

    assert(s.timeframe == "15m");
    assert(s.informative_timeframe == "1h");
    assert(s.can_short);
    assert(s.startup_candle_count == 30);
    assert(test::near(s.stoploss, -0.10));
    assert(s.trailing_stop);
    assert(test::near(s.trailing_stop_positive, 0.01));
    assert(test::near(s.trailing_stop_positive_offset, 0.02));
    assert(s.trailing_only_offset_is_reached);
    assert(s.order_types.at("entry") == "limit");
    assert(s.order_types.at("stoploss") == "market");
    assert(s.order_time_in_force.at("exit") == "gtc");
    assert(s.use_exit_signal && !s.exit_profit_only);

    assert(momentum.parameters().macd_fast == 12);
    assert(momentum.parameters().max_leverage == 20);

    std::cout << "  settings OK" << std::endl;
}

void testInvalidParameters() {
    auto rejects = [](StrategyParameters p) {
        try {
            MomentumStrategy momentum(p);
        } catch (const ConfigError&) {
            return true;
        }
        return false;
    };

    StrategyParameters p;
    p.macd_fast = 7;
    assert(rejects(p));

    p = StrategyParameters();
    p.rsi_overbought = 81;
    assert(rejects(p));

    p = StrategyParameters();
    p.volatility_threshold = 0.2;
    assert(rejects(p));

    p = StrategyParameters();
    p.volume_factor = std::nan("");
    assert(rejects(p));

    p = StrategyParameters();
    p.exit_macd_threshold = 0.001;      // inclusive bound
    p.macd_slow = 30;
    assert(!rejects(p));

    std::cout << "  parameter validation OK" << std::endl;
}

void testMinimalRoi() {
    const MomentumStrategy momentum;
    assert(test::near(momentum.minimalRoiFor(0), 0.04));
    assert(test::near(momentum.minimalRoiFor(29), 0.04));
    assert(test::near(momentum.minimalRoiFor(30), 0.02));
    assert(test::near(momentum.minimalRoiFor(59), 0.02));
    assert(test::near(momentum.minimalRoiFor(60), 0.01));
    assert(test::near(momentum.minimalRoiFor(1000), 0.01));

    // Steps given out of order are sorted on construction.
    StrategySettings unordered;
    unordered.minimal_roi = {{60, 0.01}, {0, 0.05}, {30, 0.03}};
    const MomentumStrategy custom(StrategyParameters(), unordered);
    assert(test::near(custom.minimalRoiFor(10), 0.05));
    assert(test::near(custom.minimalRoiFor(45), 0.03));

    std::cout << "  minimal ROI OK" << std::endl;
}

void testInformativePairs() {
    const MomentumStrategy momentum;
    const auto pairs = momentum.informativePairs({"BTC/USDT", "ETH/USDT"});
    assert(pairs.size() == 2);
    assert(pairs[0].first == "BTC/USDT" && pairs[0].second == "1h");
    assert(pairs[1].first == "ETH/USDT" && pairs[1].second == "1h");
    assert(momentum.informativePairs({}).empty());

    std::cout << "  informative pairs OK" << std::endl;
}

void testCustomStoploss() {
    const MomentumStrategy momentum;
    const long long opened = 1700000000000LL;

    // 5분 경과: 기본 손절
    const TradeContext young(opened, false, 0.05);
    assert(test::near(momentum.customStoploss(young, opened + 300000LL), -0.10));

    const TradeContext winning_long(opened, false, 0.03);
    const TradeContext winning_short(opened, true, 0.03);
    assert(test::near(momentum.customStoploss(winning_long, opened + 3600000LL), -0.02));
    assert(test::near(momentum.customStoploss(winning_short, opened + 3600000LL), 0.02));

    const TradeContext medium(opened, true, 0.015);
    assert(test::near(momentum.customStoploss(medium, opened + 600000LL), 0.015));

    StrategySettings tight;
    tight.stoploss = -0.05;
    const MomentumStrategy custom(StrategyParameters(), tight);
    const TradeContext flat(opened, false, 0.0);
    assert(test::near(custom.customStoploss(flat, opened + 3600000LL), -0.05));

    std::cout << "  custom stoploss OK" << std::endl;
}

void testLeverage() {
    const MomentumStrategy momentum;

    const auto calm = test::makeLinearCandles(40, 100.0, 0.0, 0.5);
    assert(test::near(momentum.leverage(calm, 10.0, 50.0), 10.0));
    assert(test::near(momentum.leverage(calm, 10.0, 4.0), 4.0));

    const std::vector<Candle> few(calm.begin(), calm.begin() + 5);
    assert(test::near(momentum.leverage(few, 3.0, 50.0), 3.0));

    // 2% wicks on each side -> medium tier
    const auto wide = test::makeLinearCandles(40, 100.0, 0.0, 2.0);
    assert(test::near(momentum.leverage(wide, 10.0, 50.0), 7.5));

    std::cout << "  leverage OK" << std::endl;
}

void testAnalyze() {
    const MomentumStrategy momentum;
    const auto candles = test::makeRandomWalk(2137, 100, 0.004, 0.02);

    const auto out = momentum.analyze(candles);
    const auto expected = strategy::SignalEvaluator::computeSignals(
        analytics::IndicatorEngine::computeIndicators(candles, momentum.parameters()),
        momentum.parameters());

    assert(out.size() == candles.size());
    assert(out.enter_long == expected.enter_long);
    assert(out.enter_short == expected.enter_short);
    assert(out.exit_long == expected.exit_long);
    assert(out.exit_short == expected.exit_short);
    assert(out.indicators.rsi == expected.indicators.rsi);

    const auto staged = momentum.populateSignals(momentum.populateIndicators(candles));
    assert(staged.enter_long == out.enter_long);

    std::cout << "  analyze OK" << std::endl;
}

} // namespace

int main() {
    std::cout << "[TEST] MomentumStrategy" << std::endl;
    testSettings();
    testInvalidParameters();
    testMinimalRoi();
    testInformativePairs();
    testCustomStoploss();
    testLeverage();
    testAnalyze();
    std::cout << "[TEST] MomentumStrategy PASSED" << std::endl;
    return 0;
}
