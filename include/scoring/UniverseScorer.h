#pragma once

#include "backtest/IPriceSource.h"
#include "scoring/IScorer.h"
#include <memory>
#include <string>
#include <vector>

namespace factorsim {
namespace scoring {

struct ScoredSymbol {
    std::string symbol;
    FactorScores scores;
    double composite;
    Price price;
};

struct ScoringOutcome {
    std::vector<ScoredSymbol> scored;   // composite desc, symbol asc
    std::vector<std::string> skipped;   // no price or no score
    std::vector<std::string> notes;     // scorer failures, kept for provenance
};

// Scores a universe at one date. Per-symbol work runs concurrently in
// batches of `threads`; results are merged in universe order and then
// sorted, so the outcome does not depend on scheduling.
class UniverseScorer {
public:
    UniverseScorer(std::shared_ptr<const IScorer> scorer,
                   std::shared_ptr<const backtest::IPriceSource> prices,
                   int threads);

    ScoringOutcome scoreUniverse(const std::vector<std::string>& universe,
                                 Date date,
                                 const FactorWeights& weights) const;

    int threads() const { return threads_; }

    // Composite desc, then symbol asc
    static void rank(std::vector<ScoredSymbol>& scored);

private:
    struct Attempt {
        std::optional<ScoredSymbol> result;
        std::string skip_reason;
        bool failed = false;
    };

    Attempt scoreOne(const std::string& symbol, Date date, const FactorWeights& weights) const;

    std::shared_ptr<const IScorer> scorer_;
    std::shared_ptr<const backtest::IPriceSource> prices_;
    int threads_;
};

} // namespace scoring
} // namespace factorsim
