#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/BacktestResult.h"
#include <nlohmann/json.hpp>
#include <string>

namespace factorsim {
namespace backtest {

class ResultWriter {
public:
    static nlohmann::json toJson(const BacktestResult& result, const BacktestConfig& config);
    static nlohmann::json metricsToJson(const analytics::PerformanceMetrics& metrics);
    static nlohmann::json tradeToJson(const TradeRecord& trade);

    // Writes result.json, trades.csv and equity_curve.csv into out_dir.
    // Throws std::runtime_error when a file cannot be written.
    static void write(const BacktestResult& result, const BacktestConfig& config, const std::string& out_dir);

    static void writeTradesCsv(const BacktestResult& result, const std::string& path);
    static void writeEquityCsv(const BacktestResult& result, const std::string& path);
};

} // namespace backtest
} // namespace factorsim
