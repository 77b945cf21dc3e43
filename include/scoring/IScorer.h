#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace factorsim {
namespace scoring {

// Point-in-time factor scorer. Returns nothing when no snapshot is knowable
// as of date; may throw ScoringFailure or DataUnavailable. Called
// concurrently for different symbols of the same date.
class IScorer {
public:
    virtual ~IScorer() = default;

    virtual std::optional<FactorScores> score(const std::string& symbol, Date date) const = 0;
};

} // namespace scoring
} // namespace factorsim
