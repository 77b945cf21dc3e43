#include "scoring/UniverseScorer.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace factorsim {
namespace scoring {

namespace {

void checkScore(const char* name, double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
        throw ScoringFailure(fmt::format("{} score {} outside [0, 100]", name, value));
    }
}

void validateScores(const FactorScores& s) {
    checkScore("fundamentals", s.fundamentals);
    checkScore("momentum", s.momentum);
    checkScore("quality", s.quality);
    checkScore("sentiment", s.sentiment);
}

} // namespace

UniverseScorer::UniverseScorer(std::shared_ptr<const IScorer> scorer,
                               std::shared_ptr<const backtest::IPriceSource> prices,
                               int threads)
    : scorer_(std::move(scorer))
    , prices_(std::move(prices))
    , threads_(threads)
{
    if (threads_ <= 0) {
        threads_ = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

void UniverseScorer::rank(std::vector<ScoredSymbol>& scored) {
    std::sort(scored.begin(), scored.end(), [](const ScoredSymbol& a, const ScoredSymbol& b) {
        if (a.composite != b.composite) {
            return a.composite > b.composite;
        }
        return a.symbol < b.symbol;
    });
}

UniverseScorer::Attempt UniverseScorer::scoreOne(
    const std::string& symbol,
    Date date,
    const FactorWeights& weights
) const {
    Attempt attempt;
    try {
        const auto price = prices_->priceAt(symbol, date);
        if (!price || !(*price > 0.0)) {
            throw DataUnavailable("no price");
        }
        const auto scores = scorer_->score(symbol, date);
        if (!scores) {
            throw DataUnavailable("no score snapshot");
        }
        validateScores(*scores);
        attempt.result = ScoredSymbol{symbol, *scores, weights.composite(*scores), *price};
    } catch (const DataUnavailable& e) {
        attempt.skip_reason = e.what();
    } catch (const ScoringFailure& e) {
        attempt.skip_reason = std::string("scoring failure: ") + e.what();
        attempt.failed = true;
    } catch (const std::exception& e) {
        attempt.skip_reason = std::string("scorer error: ") + e.what();
        attempt.failed = true;
    }
    return attempt;
}

ScoringOutcome UniverseScorer::scoreUniverse(
    const std::vector<std::string>& universe,
    Date date,
    const FactorWeights& weights
) const {
    std::vector<Attempt> attempts(universe.size());

    if (threads_ <= 1) {
        for (size_t i = 0; i < universe.size(); ++i) {
            attempts[i] = scoreOne(universe[i], date, weights);
        }
    } else {
        const size_t batch = static_cast<size_t>(threads_);
        for (size_t start = 0; start < universe.size(); start += batch) {
            const size_t end = std::min(universe.size(), start + batch);
            std::vector<std::future<Attempt>> futures;
            futures.reserve(end - start);
            for (size_t i = start; i < end; ++i) {
                futures.push_back(std::async(std::launch::async,
                    [this, &universe, i, date, &weights]() {
                        return scoreOne(universe[i], date, weights);
                    }));
            }
            for (size_t i = start; i < end; ++i) {
                attempts[i] = futures[i - start].get();
            }
        }
    }

    ScoringOutcome outcome;
    const std::string day = utils::DateUtils::format(date);
    for (size_t i = 0; i < universe.size(); ++i) {
        auto& a = attempts[i];
        if (a.result) {
            outcome.scored.push_back(std::move(*a.result));
            continue;
        }
        outcome.skipped.push_back(universe[i]);
        if (a.failed) {
            LOG_WARN("{} skipped on {}: {}", universe[i], day, a.skip_reason);
            outcome.notes.push_back(day + " " + universe[i] + ": " + a.skip_reason);
        } else {
            LOG_DEBUG("{} skipped on {}: {}", universe[i], day, a.skip_reason);
        }
    }

    rank(outcome.scored);
    return outcome;
}

} // namespace scoring
} // namespace factorsim
