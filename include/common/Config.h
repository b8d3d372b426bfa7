#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "strategy/StrategyConfig.h"

namespace tradepulse {

// JSON 설정: logging / strategy 파라미터 / risk
// 없는 키는 기본값 유지, 범위를 벗어난 값은 ConfigError.
class Config {
public:
    Config() = default;

    // Missing file: defaults are kept. Unparsable file or invalid value:
    // ConfigError.
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    const strategy::StrategyParameters& getParameters() const { return parameters_; }
    const strategy::StrategySettings& getSettings() const { return settings_; }
    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::string getPair() const { return pair_; }

private:
    void applyJson(const nlohmann::json& j);

    strategy::StrategyParameters parameters_;
    strategy::StrategySettings settings_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::string pair_ = "BTC/USDT";
};

} // namespace tradepulse
