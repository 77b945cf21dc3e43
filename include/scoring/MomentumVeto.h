#pragma once

#include "backtest/BacktestConfig.h"
#include <string>

namespace factorsim {
namespace scoring {

// Excludes names in acute technical collapse: momentum below the hard floor,
// or weak momentum together with weak fundamentals. Exempt symbols are
// never vetoed.
class MomentumVeto {
public:
    explicit MomentumVeto(backtest::MomentumVetoConfig config);

    bool isExempt(const std::string& symbol) const;

    // Reason text when vetoed, empty otherwise
    std::string check(const std::string& symbol, const FactorScores& scores) const;
    bool vetoes(const std::string& symbol, const FactorScores& scores) const {
        return !check(symbol, scores).empty();
    }

private:
    backtest::MomentumVetoConfig config_;
};

} // namespace scoring
} // namespace factorsim
