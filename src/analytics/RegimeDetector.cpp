#include "analytics/RegimeDetector.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include <numeric>
#include <algorithm>
#include <cmath>

namespace factorsim {
namespace analytics {

namespace {
constexpr double VOL_HIGH_THRESHOLD = 0.25;
constexpr double VOL_LOW_THRESHOLD = 0.15;
constexpr double STRONG_MOVE_20D = 0.05;
constexpr double TRADING_DAYS_PER_YEAR = 252.0;
}

std::string toString(MarketTrend trend) {
    switch (trend) {
        case MarketTrend::BULL: return "BULL";
        case MarketTrend::BEAR: return "BEAR";
        case MarketTrend::SIDEWAYS: return "SIDEWAYS";
    }
    return "SIDEWAYS";
}

std::string toString(VolatilityRegime volatility) {
    switch (volatility) {
        case VolatilityRegime::HIGH: return "HIGH";
        case VolatilityRegime::NORMAL: return "NORMAL";
        case VolatilityRegime::LOW: return "LOW";
    }
    return "NORMAL";
}

RegimeDetector::RegimeDetector(std::shared_ptr<const backtest::PriceHistory> prices,
                               std::string benchmark_symbol,
                               backtest::AdaptiveWeightsConfig adaptive)
    : prices_(std::move(prices))
    , benchmark_symbol_(std::move(benchmark_symbol))
    , adaptive_(std::move(adaptive))
{}

std::optional<RegimeSnapshot> RegimeDetector::regimeAt(Date date) const {
    if (!prices_) {
        return std::nullopt;
    }
    const auto closes = prices_->closesUpTo(benchmark_symbol_, date, MIN_OBSERVATIONS);
    auto snapshot = analyze(closes);
    if (!snapshot) {
        LOG_DEBUG("Regime on {}: insufficient {} history ({} closes)",
                  utils::DateUtils::format(date), benchmark_symbol_, closes.size());
    }
    return snapshot;
}

std::optional<RegimeSnapshot> RegimeDetector::analyze(const std::vector<Price>& closes) const {
    if (closes.size() < MIN_OBSERVATIONS) {
        return std::nullopt;
    }

    const size_t n = closes.size();
    const double current_price = closes.back();
    const double ma50 = mean(closes, 50);
    const double ma200 = mean(closes, 200);

    RegimeSnapshot snapshot;
    snapshot.returns_20d = current_price / closes[n - 20] - 1.0;
    snapshot.returns_60d = current_price / closes[n - 60] - 1.0;

    // Sample std of the last 20 daily returns, annualized
    std::vector<double> returns;
    for (size_t i = n - 20; i < n; ++i) {
        returns.push_back(closes[i] / closes[i - 1] - 1.0);
    }
    const double avg = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double var = 0.0;
    for (double r : returns) {
        var += (r - avg) * (r - avg);
    }
    var /= static_cast<double>(returns.size() - 1);
    snapshot.volatility_20d = std::sqrt(var) * std::sqrt(TRADING_DAYS_PER_YEAR);

    snapshot.trend = detectTrend(current_price, ma50, ma200, snapshot.returns_20d, snapshot.returns_60d);
    snapshot.volatility = detectVolatility(snapshot.volatility_20d);
    snapshot.weights = lookupWeights(snapshot);
    if (const auto profile = lookupProfile(snapshot)) {
        snapshot.stock_count = profile->stock_count;
        snapshot.cash_allocation = profile->cash_allocation;
    }
    snapshot.description = fmt::format("{} (20d {:.1f}%, 60d {:.1f}%, vol {:.1f}%, cash {:.0f}%)",
                                       snapshot.label(), snapshot.returns_20d * 100.0,
                                       snapshot.returns_60d * 100.0, snapshot.volatility_20d * 100.0,
                                       snapshot.cash_allocation * 100.0);
    return snapshot;
}

double RegimeDetector::mean(const std::vector<Price>& closes, size_t window) {
    window = std::min(window, closes.size());
    if (window == 0) return 0.0;
    return std::accumulate(closes.end() - window, closes.end(), 0.0) / static_cast<double>(window);
}

MarketTrend RegimeDetector::detectTrend(double price, double ma50, double ma200,
                                        double returns_20d, double returns_60d) {
    int bull = 0;
    if (price > ma50) ++bull;
    if (ma50 > ma200) ++bull;
    if (returns_60d > 0.0) ++bull;
    if (returns_20d > STRONG_MOVE_20D) ++bull;

    int bear = 0;
    if (price < ma50) ++bear;
    if (ma50 < ma200) ++bear;
    if (returns_60d < 0.0) ++bear;
    if (returns_20d < -STRONG_MOVE_20D) ++bear;

    if (bull >= 3) return MarketTrend::BULL;
    if (bear >= 3) return MarketTrend::BEAR;
    return MarketTrend::SIDEWAYS;
}

VolatilityRegime RegimeDetector::detectVolatility(double volatility_20d) {
    if (volatility_20d > VOL_HIGH_THRESHOLD) return VolatilityRegime::HIGH;
    if (volatility_20d < VOL_LOW_THRESHOLD) return VolatilityRegime::LOW;
    return VolatilityRegime::NORMAL;
}

std::optional<FactorWeights> RegimeDetector::lookupWeights(const RegimeSnapshot& snapshot) const {
    auto it = adaptive_.regimes.find(snapshot.label());
    if (it != adaptive_.regimes.end()) {
        return it->second;
    }
    // Trend-only entry ("BULL") covers every volatility level
    it = adaptive_.regimes.find(toString(snapshot.trend));
    if (it != adaptive_.regimes.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<backtest::RegimeProfile> RegimeDetector::lookupProfile(const RegimeSnapshot& snapshot) const {
    auto it = adaptive_.profiles.find(snapshot.label());
    if (it == adaptive_.profiles.end()) {
        it = adaptive_.profiles.find(toString(snapshot.trend));
    }
    if (it == adaptive_.profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace analytics
} // namespace factorsim
