#pragma once

#include "backtest/BacktestConfig.h"
#include <map>
#include <string>
#include <vector>

namespace factorsim {
namespace portfolio {

enum class ConvictionTier { HIGH, MEDIUM, LOW };

std::string toString(ConvictionTier tier);

struct SizingCandidate {
    std::string symbol;
    double composite_score;
    double quality_score;
};

struct SizedPosition {
    std::string symbol;
    ConvictionTier tier;
    double base_weight;
    double weight;     // normalized
};

// Conviction-tier sizing: each selected symbol gets its tier's base weight,
// then the set is normalized to invested_fraction.
class PositionSizer {
public:
    explicit PositionSizer(backtest::ConvictionTiers tiers, double invested_fraction = 1.0);

    ConvictionTier classify(double composite_score, double quality_score) const;
    double baseWeight(ConvictionTier tier) const;

    // Preserves candidate order
    std::vector<SizedPosition> size(const std::vector<SizingCandidate>& candidates) const;
    std::map<std::string, double> weightsFor(const std::vector<SizingCandidate>& candidates) const;

private:
    backtest::ConvictionTiers tiers_;
    double invested_fraction_;
};

} // namespace portfolio
} // namespace factorsim
