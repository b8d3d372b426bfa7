#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "data/DataHistory.h"
#include "strategy/MomentumStrategy.h"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace tradepulse;

namespace {
void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <candles.csv|candles.json> [config.json]\n"
              << "  Runs the momentum strategy over the candle file and prints every\n"
              << "  candle where an entry or exit signal fired.\n";
}

std::string signalKinds(const strategy::SignalFrame& frame, size_t i) {
    std::string kinds;
    auto add = [&](bool set, const char* name) {
        if (!set) return;
        if (!kinds.empty()) kinds += "|";
        kinds += name;
    };
    add(frame.enter_long[i], "enter_long");
    add(frame.enter_short[i], "enter_short");
    add(frame.exit_long[i], "exit_long");
    add(frame.exit_short[i], "exit_short");
    return kinds;
}
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }
    const std::string candle_path = argv[1];

    Config config;
    try {
        if (argc >= 3) {
            config.load(argv[2]);
        }
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    }

    const auto candles = data::DataHistory::load(candle_path);
    if (candles.empty()) {
        LOG_ERROR("No candles loaded from {}", candle_path);
        return 1;
    }

    try {
        strategy::MomentumStrategy momentum(config.getParameters(), config.getSettings());
        const auto frame = momentum.analyze(candles);

        size_t enter_long = 0, enter_short = 0, exit_long = 0, exit_short = 0;
        std::cout << std::left << std::setw(16) << "timestamp"
                  << std::setw(14) << "close" << "signals\n";

        for (size_t i = 0; i < frame.size(); ++i) {
            enter_long += frame.enter_long[i];
            enter_short += frame.enter_short[i];
            exit_long += frame.exit_long[i];
            exit_short += frame.exit_short[i];

            const std::string kinds = signalKinds(frame, i);
            if (kinds.empty()) continue;

            const auto& c = frame.indicators.candles[i];
            std::cout << std::left << std::setw(16) << c.timestamp
                      << std::setw(14) << std::fixed << std::setprecision(4) << c.close
                      << kinds << "\n";
            Logger::getInstance().logSignal(config.getPair(), c.timestamp, kinds, c.close);
        }

        const auto& params = momentum.parameters();
        const double leverage = momentum.leverage(candles, params.base_leverage,
                                                  params.max_leverage);

        LOG_INFO("{} candles [{}]: enter_long={} enter_short={} exit_long={} exit_short={}",
                 frame.size(), config.getPair(), enter_long, enter_short, exit_long, exit_short);
        LOG_INFO("Leverage for the latest window: {:.2f}", leverage);

    } catch (const InputValidationError& e) {
        LOG_ERROR("Candle series rejected: {}", e.what());
        return 1;
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        return 2;
    }

    return 0;
}
