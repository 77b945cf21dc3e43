#include "scoring/ScoreTable.h"

namespace factorsim {
namespace scoring {

ScoreTable::ScoreTable(const std::vector<backtest::ScoreRow>& rows) {
    for (const auto& r : rows) {
        add(r.symbol, r.date, r.scores);
    }
}

ScoreTable ScoreTable::fromCsv(const std::string& file_path) {
    return ScoreTable(backtest::DataHistory::loadScoreCSV(file_path));
}

void ScoreTable::add(const std::string& symbol, Date date, const FactorScores& scores) {
    snapshots_[symbol][date] = scores;
}

std::optional<FactorScores> ScoreTable::score(const std::string& symbol, Date date) const {
    auto sit = snapshots_.find(symbol);
    if (sit == snapshots_.end()) {
        return std::nullopt;
    }
    auto it = sit->second.upper_bound(date);
    if (it == sit->second.begin()) {
        return std::nullopt;
    }
    --it;
    return it->second;
}

size_t ScoreTable::size() const {
    size_t n = 0;
    for (const auto& [symbol, byDate] : snapshots_) {
        n += byDate.size();
    }
    return n;
}

} // namespace scoring
} // namespace factorsim
