#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "backtest/BacktestConfig.h"

namespace factorsim {

// Loads, validates and serializes BacktestConfig. Configs are plain values
// injected into the engine; there is no process-wide instance.
class Config {
public:
    // Throws ConfigurationError when the file is missing, unparsable or invalid
    static backtest::BacktestConfig loadFile(const std::string& config_path);
    static backtest::BacktestConfig fromJson(const nlohmann::json& j);
    static nlohmann::json toJson(const backtest::BacktestConfig& config);

    // Throws ConfigurationError describing the first violated rule
    static void validate(const backtest::BacktestConfig& config);

    static backtest::RebalanceCadence parseCadence(const std::string& value);

private:
    static FactorWeights parseWeights(const nlohmann::json& j, const FactorWeights& defaults);
    static nlohmann::json weightsToJson(const FactorWeights& w);
    static void validateWeights(const FactorWeights& w, const std::string& label);
};

} // namespace factorsim
