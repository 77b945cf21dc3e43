#include "scoring/MomentumVeto.h"

#include <spdlog/fmt/fmt.h>

namespace factorsim {
namespace scoring {

MomentumVeto::MomentumVeto(backtest::MomentumVetoConfig config)
    : config_(std::move(config))
{}

bool MomentumVeto::isExempt(const std::string& symbol) const {
    return config_.exemptions.count(symbol) > 0;
}

std::string MomentumVeto::check(const std::string& symbol, const FactorScores& scores) const {
    if (!config_.enabled || isExempt(symbol)) {
        return {};
    }
    if (scores.momentum < config_.hard_floor) {
        return fmt::format("momentum {:.1f} < {:.1f}", scores.momentum, config_.hard_floor);
    }
    if (scores.momentum < config_.soft_momentum && scores.fundamentals < config_.soft_fundamentals) {
        return fmt::format("momentum {:.1f} < {:.1f} and fundamentals {:.1f} < {:.1f}",
                           scores.momentum, config_.soft_momentum,
                           scores.fundamentals, config_.soft_fundamentals);
    }
    return {};
}

} // namespace scoring
} // namespace factorsim
