#pragma once

#include "backtest/DataHistory.h"
#include "scoring/IScorer.h"
#include <map>
#include <string>
#include <vector>

namespace factorsim {
namespace scoring {

// Scorer backed by dated snapshots: score(symbol, date) is the latest
// snapshot at or before date
class ScoreTable : public IScorer {
public:
    ScoreTable() = default;
    explicit ScoreTable(const std::vector<backtest::ScoreRow>& rows);

    static ScoreTable fromCsv(const std::string& file_path);

    void add(const std::string& symbol, Date date, const FactorScores& scores);

    std::optional<FactorScores> score(const std::string& symbol, Date date) const override;

    size_t size() const;

private:
    std::map<std::string, std::map<Date, FactorScores>> snapshots_;
};

} // namespace scoring
} // namespace factorsim
