#include "scoring/UniverseScorer.h"
#include "scoring/MomentumVeto.h"
#include "scoring/ScoreTable.h"
#include "backtest/PriceHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

using namespace factorsim;

namespace {

// Table scorer that fails for selected symbols
class FlakyScorer : public scoring::IScorer {
public:
    explicit FlakyScorer(scoring::ScoreTable table) : table_(std::move(table)) {}

    std::optional<FactorScores> score(const std::string& symbol, Date date) const override {
        if (symbol == "FAIL") {
            throw ScoringFailure("upstream timeout");
        }
        if (symbol == "BROKEN") {
            throw std::runtime_error("bad snapshot");
        }
        if (symbol == "HUGE") {
            return FactorScores(900, 900, 900, 900);
        }
        if (symbol == "NAN") {
            const double nan = std::numeric_limits<double>::quiet_NaN();
            return FactorScores(nan, 50, 50, 50);
        }
        return table_.score(symbol, date);
    }

private:
    scoring::ScoreTable table_;
};

} // namespace

int main() {
    spdlog::set_level(spdlog::level::off);

    const std::vector<std::string> universe{"DDD", "BBB", "AAA", "CCC", "NOPRICE", "NOSCORE", "FAIL", "BROKEN"};

    auto prices = std::make_shared<backtest::PriceHistory>();
    for (const auto& symbol : universe) {
        if (symbol != "NOPRICE") prices->add(symbol, 0, 10.0);
    }

    scoring::ScoreTable table;
    table.add("AAA", 0, FactorScores(60, 60, 60, 60));
    table.add("BBB", 0, FactorScores(60, 60, 60, 60));
    table.add("CCC", 0, FactorScores(90, 80, 70, 60));
    table.add("DDD", 0, FactorScores(10, 20, 30, 40));
    table.add("NOPRICE", 0, FactorScores(99, 99, 99, 99));
    table.add("FAIL", 0, FactorScores(99, 99, 99, 99));
    table.add("BROKEN", 0, FactorScores(99, 99, 99, 99));
    auto scorer = std::make_shared<FlakyScorer>(table);

    FactorWeights weights;
    scoring::UniverseScorer sequential(scorer, prices, 1);
    scoring::UniverseScorer parallel(scorer, prices, 3);

    const auto a = sequential.scoreUniverse(universe, 5, weights);
    const auto b = parallel.scoreUniverse(universe, 5, weights);

    if (a.scored.size() != 4 || a.skipped.size() != 4) {
        std::cerr << "[TEST] expected 4 scored and 4 skipped, got " << a.scored.size() << "/" << a.skipped.size() << "\n";
        return 1;
    }
    if (a.scored[0].symbol != "CCC" || a.scored[1].symbol != "AAA" || a.scored[2].symbol != "BBB" ||
        a.scored[3].symbol != "DDD") {
        std::cerr << "[TEST] ranking should be composite desc then symbol asc\n";
        return 1;
    }
    if (std::abs(a.scored[0].composite - (0.4 * 90 + 0.3 * 80 + 0.2 * 70 + 0.1 * 60)) > 1e-9) {
        std::cerr << "[TEST] composite uses the given weights\n";
        return 1;
    }
    if (a.notes.size() != 2) {
        std::cerr << "[TEST] scorer failures should be noted, got " << a.notes.size() << "\n";
        return 1;
    }

    if (a.scored.size() != b.scored.size() || a.notes != b.notes || a.skipped != b.skipped) {
        std::cerr << "[TEST] parallel scoring changed the outcome\n";
        return 1;
    }
    for (size_t i = 0; i < a.scored.size(); ++i) {
        if (a.scored[i].symbol != b.scored[i].symbol || a.scored[i].composite != b.scored[i].composite) {
            std::cerr << "[TEST] parallel ranking differs at " << i << "\n";
            return 1;
        }
    }

    // Sub-scores outside [0, 100] are scorer failures, never ranked
    {
        prices->add("HUGE", 0, 10.0);
        prices->add("NAN", 0, 10.0);
        const auto out = parallel.scoreUniverse({"HUGE", "AAA", "NAN", "CCC"}, 5, weights);
        if (out.scored.size() != 2 || out.scored[0].symbol != "CCC" || out.scored[1].symbol != "AAA") {
            std::cerr << "[TEST] invalid scores must not enter the ranking\n";
            return 1;
        }
        if (out.notes.size() != 2 || out.notes[0].find("HUGE") == std::string::npos ||
            out.notes[1].find("NAN") == std::string::npos) {
            std::cerr << "[TEST] invalid scores should leave a note per symbol\n";
            return 1;
        }
    }

    // Momentum veto
    backtest::MomentumVetoConfig veto_config;
    scoring::MomentumVeto veto(veto_config);
    if (!veto.vetoes("XYZ", FactorScores(90, 44, 90, 90))) {
        std::cerr << "[TEST] momentum below the hard floor must be vetoed\n";
        return 1;
    }
    if (!veto.vetoes("XYZ", FactorScores(44, 49, 90, 90))) {
        std::cerr << "[TEST] weak momentum and fundamentals must be vetoed\n";
        return 1;
    }
    if (veto.vetoes("XYZ", FactorScores(46, 49, 90, 90)) || veto.vetoes("XYZ", FactorScores(10, 50, 10, 10))) {
        std::cerr << "[TEST] soft veto needs both conditions\n";
        return 1;
    }
    for (double momentum = 0.0; momentum <= 100.0; momentum += 5.0) {
        for (double fundamentals = 0.0; fundamentals <= 100.0; fundamentals += 5.0) {
            if (veto.vetoes("NVDA", FactorScores(fundamentals, momentum, 0, 0))) {
                std::cerr << "[TEST] exempt symbol vetoed at momentum " << momentum << "\n";
                return 1;
            }
        }
    }

    veto_config.enabled = false;
    if (scoring::MomentumVeto(veto_config).vetoes("XYZ", FactorScores(0, 0, 0, 0))) {
        std::cerr << "[TEST] disabled veto must not exclude\n";
        return 1;
    }

    std::cout << "[TEST] UniverseScorer PASSED\n";
    return 0;
}
