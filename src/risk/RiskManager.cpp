#include "risk/RiskManager.h"
#include "common/Logger.h"

#include <algorithm>

namespace factorsim {
namespace risk {

RiskManager::RiskManager(backtest::RiskLimits limits)
    : limits_(limits)
{}

double RiskManager::staticStopPct(double quality_score) const {
    if (quality_score > limits_.high_quality_threshold) {
        return limits_.high_quality_stop_pct;
    }
    if (quality_score >= limits_.medium_quality_threshold) {
        return limits_.medium_quality_stop_pct;
    }
    return limits_.low_quality_stop_pct;
}

StopLevels RiskManager::stopLevels(const portfolio::Position& position) const {
    StopLevels levels;
    levels.static_stop_pct = staticStopPct(position.quality_score);
    levels.static_trigger = position.entry_price * (1.0 - levels.static_stop_pct);
    levels.trailing_active = position.highest_price > position.entry_price;
    levels.trailing_trigger = 0.0;

    if (levels.trailing_active) {
        const Price from_peak = position.highest_price * (1.0 - limits_.trailing_stop_pct);
        levels.trailing_trigger = std::max(from_peak, levels.static_trigger);
    }
    return levels;
}

std::optional<ExitReason> RiskManager::evaluate(
    const portfolio::Position& position,
    Price current_price
) const {
    if (!(current_price > 0.0) || !(position.entry_price > 0.0)) {
        return std::nullopt;
    }

    const StopLevels levels = stopLevels(position);

    if (levels.trailing_active && current_price < levels.trailing_trigger) {
        LOG_DEBUG("{} trailing stop: price {:.2f} < trigger {:.2f} (peak {:.2f})",
                  position.symbol, current_price, levels.trailing_trigger, position.highest_price);
        return ExitReason::TRAILING_STOP;
    }

    if (current_price < levels.static_trigger) {
        LOG_DEBUG("{} stop loss: price {:.2f} < trigger {:.2f} ({:.0f}% tier)",
                  position.symbol, current_price, levels.static_trigger, levels.static_stop_pct * 100.0);
        return ExitReason::STOP_LOSS;
    }

    return std::nullopt;
}

} // namespace risk
} // namespace factorsim
