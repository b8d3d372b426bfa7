#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace tradepulse {

namespace {
template<typename T>
void readParam(const nlohmann::json& section, const strategy::ParameterRange& range, T& target) {
    if (!section.contains(range.name)) return;

    const auto& value = section.at(range.name);
    if (!value.is_number()) {
        throw ConfigError("parameter '" + range.name + "' must be a number");
    }
    const double v = value.get<double>();
    // 정수 변환 전에 범위 검사
    strategy::checkRange(range, v);
    if (range.integral && std::floor(v) != v) {
        throw ConfigError("parameter '" + range.name + "' must be an integer");
    }
    target = static_cast<T>(v);
}
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: config file could not be opened, using defaults." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("config parse error in " + config_path.string() + ": " + e.what());
    }

    loadFromJson(j);
    std::cout << "Config loaded: MACD " << parameters_.macd_fast << "/" << parameters_.macd_slow
              << "/" << parameters_.macd_signal << ", stoploss " << settings_.stoploss << std::endl;
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    try {
        applyJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config value has the wrong type: ") + e.what());
    }
}

void Config::applyJson(const nlohmann::json& j) {
    std::string level = log_level_;
    std::string dir = log_dir_;
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        level = l.value("level", level);
        dir = l.value("dir", dir);
    }

    std::string pair = j.value("pair", pair_);

    strategy::StrategyParameters p = parameters_;
    if (j.contains("strategy")) {
        using strategy::parameterRange;
        const auto& s = j["strategy"];
        readParam(s, parameterRange("macd_fast"), p.macd_fast);
        readParam(s, parameterRange("macd_slow"), p.macd_slow);
        readParam(s, parameterRange("macd_signal"), p.macd_signal);
        readParam(s, parameterRange("volume_factor"), p.volume_factor);
        readParam(s, parameterRange("rsi_period"), p.rsi_period);
        readParam(s, parameterRange("rsi_oversold"), p.rsi_oversold);
        readParam(s, parameterRange("rsi_overbought"), p.rsi_overbought);
        readParam(s, parameterRange("exit_macd_threshold"), p.exit_macd_threshold);
        readParam(s, parameterRange("base_leverage"), p.base_leverage);
        readParam(s, parameterRange("max_leverage"), p.max_leverage);
        readParam(s, parameterRange("volatility_threshold"), p.volatility_threshold);
    }
    p.validate();

    strategy::StrategySettings st = settings_;
    if (j.contains("risk")) {
        st.stoploss = j["risk"].value("stoploss", st.stoploss);
        if (!(st.stoploss < 0.0 && st.stoploss > -1.0)) {
            throw ConfigError("risk.stoploss must be in (-1, 0)");
        }
    }

    // 검증 통과 후에만 반영
    parameters_ = p;
    settings_ = st;
    log_level_ = level;
    log_dir_ = dir;
    pair_ = pair;
}

} // namespace tradepulse
