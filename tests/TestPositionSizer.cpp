#include "portfolio/PositionSizer.h"
#include "common/Logger.h"

#include <cmath>
#include <iostream>

using namespace factorsim;
using factorsim::portfolio::ConvictionTier;
using factorsim::portfolio::PositionSizer;

int main() {
    spdlog::set_level(spdlog::level::off);

    backtest::ConvictionTiers tiers;
    PositionSizer sizer(tiers);

    if (sizer.classify(80.0, 80.0) != ConvictionTier::HIGH ||
        sizer.classify(80.0, 60.0) != ConvictionTier::MEDIUM ||
        sizer.classify(60.0, 95.0) != ConvictionTier::MEDIUM ||
        sizer.classify(55.0, 95.0) != ConvictionTier::LOW ||
        sizer.classify(70.0, 90.0) != ConvictionTier::MEDIUM) {
        std::cerr << "[TEST] tier classification wrong\n";
        return 1;
    }

    const auto weights = sizer.weightsFor({
        {"HIGH1", 80.0, 80.0},
        {"MED1", 60.0, 40.0},
        {"LOW1", 40.0, 40.0}
    });
    if (weights.size() != 3) {
        std::cerr << "[TEST] expected three weights\n";
        return 1;
    }
    double sum = 0.0;
    for (const auto& [symbol, w] : weights) sum += w;
    if (std::abs(sum - 1.0) > 1e-12) {
        std::cerr << "[TEST] weights must sum to 1, got " << sum << "\n";
        return 1;
    }
    if (std::abs(weights.at("HIGH1") - 0.5) > 1e-12 ||
        std::abs(weights.at("MED1") - 0.04 / 0.12) > 1e-12 ||
        std::abs(weights.at("LOW1") - 0.02 / 0.12) > 1e-12) {
        std::cerr << "[TEST] tier weights not proportional to base weights\n";
        return 1;
    }

    // Order of candidates is kept
    const auto sized = sizer.size({{"B", 40.0, 40.0}, {"A", 90.0, 90.0}});
    if (sized.size() != 2 || sized[0].symbol != "B" || sized[1].tier != ConvictionTier::HIGH) {
        std::cerr << "[TEST] size() reordered candidates\n";
        return 1;
    }

    // Invested fraction below one
    PositionSizer partial(tiers, 0.9);
    double partial_sum = 0.0;
    for (const auto& [symbol, w] : partial.weightsFor({{"A", 90.0, 90.0}, {"B", 90.0, 90.0}})) {
        partial_sum += w;
        if (std::abs(w - 0.45) > 1e-12) {
            std::cerr << "[TEST] equal tiers should split evenly\n";
            return 1;
        }
    }
    if (std::abs(partial_sum - 0.9) > 1e-12) {
        std::cerr << "[TEST] weights should sum to the invested fraction\n";
        return 1;
    }

    if (!sizer.weightsFor({}).empty()) {
        std::cerr << "[TEST] empty selection should give no weights\n";
        return 1;
    }

    // Configured thresholds, not constants
    backtest::ConvictionTiers custom;
    custom.medium_score = 30.0;
    custom.low_weight = 0.01;
    PositionSizer custom_sizer(custom);
    if (custom_sizer.classify(40.0, 10.0) != ConvictionTier::MEDIUM || custom_sizer.baseWeight(ConvictionTier::LOW) != 0.01) {
        std::cerr << "[TEST] custom tiers ignored\n";
        return 1;
    }

    std::cout << "[TEST] PositionSizer PASSED\n";
    return 0;
}
