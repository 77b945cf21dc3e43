#include "analytics/RegimeDetector.h"
#include "common/Logger.h"

#include <cmath>
#include <iostream>
#include <memory>

using namespace factorsim;
using factorsim::analytics::MarketTrend;
using factorsim::analytics::RegimeDetector;
using factorsim::analytics::VolatilityRegime;

namespace {
std::vector<Price> geometric(size_t n, double start, double growth) {
    std::vector<Price> closes;
    double p = start;
    for (size_t i = 0; i < n; ++i) {
        closes.push_back(p);
        p *= growth;
    }
    return closes;
}
}

int main() {
    spdlog::set_level(spdlog::level::off);

    backtest::AdaptiveWeightsConfig adaptive;
    adaptive.enabled = true;
    FactorWeights bull_low;
    bull_low.fundamentals = 0.25;
    bull_low.momentum = 0.45;
    bull_low.quality = 0.20;
    bull_low.sentiment = 0.10;
    FactorWeights bear;
    bear.fundamentals = 0.40;
    bear.momentum = 0.10;
    bear.quality = 0.40;
    bear.sentiment = 0.10;
    adaptive.regimes["BULL_LOW"] = bull_low;
    adaptive.regimes["BEAR"] = bear;

    RegimeDetector detector(nullptr, "SPY", adaptive);

    if (detector.analyze(geometric(199, 100.0, 1.001))) {
        std::cerr << "[TEST] fewer than 200 closes should give no regime\n";
        return 1;
    }

    const auto up = detector.analyze(geometric(250, 100.0, 1.001));
    if (!up || up->trend != MarketTrend::BULL || up->volatility != VolatilityRegime::LOW) {
        std::cerr << "[TEST] steady rise should be BULL_LOW\n";
        return 1;
    }
    if (up->label() != "BULL_LOW" || !up->weights || std::abs(up->weights->momentum - 0.45) > 1e-12) {
        std::cerr << "[TEST] BULL_LOW weights not selected\n";
        return 1;
    }

    const auto down = detector.analyze(geometric(250, 100.0, 0.999));
    if (!down || down->trend != MarketTrend::BEAR) {
        std::cerr << "[TEST] steady decline should be BEAR\n";
        return 1;
    }
    if (!down->weights || std::abs(down->weights->quality - 0.40) > 1e-12) {
        std::cerr << "[TEST] trend-only entry should cover BEAR_LOW\n";
        return 1;
    }

    std::vector<Price> choppy;
    for (size_t i = 0; i < 250; ++i) {
        choppy.push_back(i % 2 == 0 ? 100.0 : 103.0);
    }
    const auto volatile_market = detector.analyze(choppy);
    if (!volatile_market || volatile_market->volatility != VolatilityRegime::HIGH) {
        std::cerr << "[TEST] 3% daily swings should be HIGH volatility\n";
        return 1;
    }
    // Flat moving averages split the vote
    if (volatile_market->trend != MarketTrend::SIDEWAYS || volatile_market->weights) {
        std::cerr << "[TEST] SIDEWAYS_HIGH has no table entry and should fall back to static weights\n";
        return 1;
    }

    // Portfolio shape from the profile table
    if (!up->stock_count || *up->stock_count != 20 || up->cash_allocation != 0.0) {
        std::cerr << "[TEST] BULL_LOW profile should hold 20 names fully invested\n";
        return 1;
    }
    if (!volatile_market->stock_count || *volatile_market->stock_count != 15 ||
        std::abs(volatile_market->cash_allocation - 0.15) > 1e-12) {
        std::cerr << "[TEST] SIDEWAYS_HIGH profile wrong\n";
        return 1;
    }
    {
        auto bear_only = adaptive;
        bear_only.profiles = {{"BEAR", {8, 0.25}}};
        RegimeDetector coarse(nullptr, "SPY", bear_only);
        const auto bear_low = coarse.analyze(geometric(250, 100.0, 0.999));
        const auto bull = coarse.analyze(geometric(250, 100.0, 1.001));
        if (!bear_low || !bear_low->stock_count || *bear_low->stock_count != 8 ||
            std::abs(bear_low->cash_allocation - 0.25) > 1e-12) {
            std::cerr << "[TEST] trend-only profile should cover BEAR_LOW\n";
            return 1;
        }
        if (!bull || bull->stock_count || bull->cash_allocation != 0.0) {
            std::cerr << "[TEST] regime without a profile keeps top_n and no cash\n";
            return 1;
        }
    }

    // Point-in-time lookup through the price history
    auto prices = std::make_shared<backtest::PriceHistory>();
    const auto series = geometric(260, 300.0, 1.001);
    for (size_t i = 0; i < series.size(); ++i) {
        prices->add("SPY", static_cast<Date>(i), series[i]);
    }
    RegimeDetector from_history(prices, "SPY", adaptive);
    if (from_history.regimeAt(150)) {
        std::cerr << "[TEST] only 151 closes are known on day 150\n";
        return 1;
    }
    const auto snapshot = from_history.regimeAt(259);
    if (!snapshot || snapshot->trend != MarketTrend::BULL) {
        std::cerr << "[TEST] regimeAt should classify the benchmark history\n";
        return 1;
    }

    std::cout << "[TEST] RegimeDetector PASSED\n";
    return 0;
}
