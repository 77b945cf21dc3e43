#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace factorsim {
namespace backtest {

struct PriceRow {
    Date date;
    std::string symbol;
    Price close;
};

struct ScoreRow {
    Date date;
    std::string symbol;
    FactorScores scores;
};

class DataHistory {
public:
    // Expected format: date,symbol,close (header optional)
    static std::vector<PriceRow> loadPriceCSV(const std::string& file_path);

    // Expected format: date,symbol,fundamentals,momentum,quality,sentiment
    static std::vector<ScoreRow> loadScoreCSV(const std::string& file_path);

    // Splits one CSV line into trimmed, unquoted cells
    static std::vector<std::string> splitRow(const std::string& line);
};

} // namespace backtest
} // namespace factorsim
