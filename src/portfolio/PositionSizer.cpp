#include "portfolio/PositionSizer.h"
#include "common/Logger.h"

#include <algorithm>

namespace factorsim {
namespace portfolio {

std::string toString(ConvictionTier tier) {
    switch (tier) {
        case ConvictionTier::HIGH: return "HIGH";
        case ConvictionTier::MEDIUM: return "MED";
        case ConvictionTier::LOW: return "LOW";
    }
    return "LOW";
}

PositionSizer::PositionSizer(backtest::ConvictionTiers tiers, double invested_fraction)
    : tiers_(tiers)
    , invested_fraction_(std::clamp(invested_fraction, 0.0, 1.0))
{}

ConvictionTier PositionSizer::classify(double composite_score, double quality_score) const {
    if (composite_score > tiers_.high_score && quality_score > tiers_.high_quality) {
        return ConvictionTier::HIGH;
    }
    if (composite_score > tiers_.medium_score) {
        return ConvictionTier::MEDIUM;
    }
    return ConvictionTier::LOW;
}

double PositionSizer::baseWeight(ConvictionTier tier) const {
    switch (tier) {
        case ConvictionTier::HIGH: return tiers_.high_weight;
        case ConvictionTier::MEDIUM: return tiers_.medium_weight;
        case ConvictionTier::LOW: return tiers_.low_weight;
    }
    return tiers_.low_weight;
}

std::vector<SizedPosition> PositionSizer::size(const std::vector<SizingCandidate>& candidates) const {
    std::vector<SizedPosition> out;
    out.reserve(candidates.size());

    double total = 0.0;
    int high = 0, medium = 0, low = 0;
    for (const auto& c : candidates) {
        const ConvictionTier tier = classify(c.composite_score, c.quality_score);
        const double base = baseWeight(tier);
        total += base;
        out.push_back(SizedPosition{c.symbol, tier, base, 0.0});

        if (tier == ConvictionTier::HIGH) ++high;
        else if (tier == ConvictionTier::MEDIUM) ++medium;
        else ++low;
    }

    if (total > 0.0) {
        for (auto& p : out) {
            p.weight = p.base_weight / total * invested_fraction_;
        }
    }

    if (!out.empty()) {
        LOG_DEBUG("Position sizing: HIGH={} MED={} LOW={}", high, medium, low);
    }
    return out;
}

std::map<std::string, double> PositionSizer::weightsFor(const std::vector<SizingCandidate>& candidates) const {
    std::map<std::string, double> weights;
    for (const auto& p : size(candidates)) {
        weights[p.symbol] = p.weight;
    }
    return weights;
}

} // namespace portfolio
} // namespace factorsim
