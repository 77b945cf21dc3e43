#pragma once

#include "backtest/BacktestConfig.h"
#include "backtest/PriceHistory.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace factorsim {
namespace analytics {

enum class MarketTrend { BULL, BEAR, SIDEWAYS };
enum class VolatilityRegime { HIGH, NORMAL, LOW };

std::string toString(MarketTrend trend);
std::string toString(VolatilityRegime volatility);

struct RegimeSnapshot {
    MarketTrend trend = MarketTrend::SIDEWAYS;
    VolatilityRegime volatility = VolatilityRegime::NORMAL;
    std::optional<FactorWeights> weights;   // absent -> use static weights
    std::optional<int> stock_count;         // absent -> configured top_n
    double cash_allocation = 0.0;           // share of value held back from investing
    double returns_20d = 0.0;
    double returns_60d = 0.0;
    double volatility_20d = 0.0;            // annualized
    std::string description;

    // "BULL_NORMAL" etc., the key of the adaptive weight table
    std::string label() const { return toString(trend) + "_" + toString(volatility); }
};

// Regime collaborator; consulted only when adaptive weighting is enabled
class IRegimeProvider {
public:
    virtual ~IRegimeProvider() = default;

    virtual std::optional<RegimeSnapshot> regimeAt(Date date) const = 0;
};

// Classifies the market from a benchmark's closes known at the date:
// trend by a 3-of-4 vote (price vs MA50, MA50 vs MA200, 60d return,
// 20d return vs +/-5%), volatility from annualized 20d realized vol.
class RegimeDetector : public IRegimeProvider {
public:
    static constexpr size_t MIN_OBSERVATIONS = 200;

    RegimeDetector(std::shared_ptr<const backtest::PriceHistory> prices,
                   std::string benchmark_symbol,
                   backtest::AdaptiveWeightsConfig adaptive);

    std::optional<RegimeSnapshot> regimeAt(Date date) const override;

    // Closes oldest first; nothing when fewer than MIN_OBSERVATIONS
    std::optional<RegimeSnapshot> analyze(const std::vector<Price>& closes) const;

private:
    static double mean(const std::vector<Price>& closes, size_t window);
    static MarketTrend detectTrend(double price, double ma50, double ma200,
                                   double returns_20d, double returns_60d);
    static VolatilityRegime detectVolatility(double volatility_20d);

    std::optional<FactorWeights> lookupWeights(const RegimeSnapshot& snapshot) const;
    std::optional<backtest::RegimeProfile> lookupProfile(const RegimeSnapshot& snapshot) const;

    std::shared_ptr<const backtest::PriceHistory> prices_;
    std::string benchmark_symbol_;
    backtest::AdaptiveWeightsConfig adaptive_;
};

} // namespace analytics
} // namespace factorsim
