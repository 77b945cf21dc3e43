#pragma once

#include "backtest/BacktestConfig.h"
#include "portfolio/Ledger.h"
#include <optional>

namespace factorsim {
namespace risk {

// Stop trigger prices for one position at its current peak
struct StopLevels {
    double static_stop_pct;     // tier-dependent loss allowed from entry
    Price static_trigger;       // entry * (1 - static_stop_pct)
    Price trailing_trigger;     // max(peak * (1 - trailing), static_trigger); 0 until peak > entry
    bool trailing_active;
};

// Per-position stop rules: a quality-tiered static stop from entry and a
// trailing stop from the highest observed price. Stateless; the peak lives
// on the Position.
class RiskManager {
public:
    explicit RiskManager(backtest::RiskLimits limits);

    const backtest::RiskLimits& limits() const { return limits_; }

    // 30% / 20% / 10% by default for quality > 70 / >= 50 / below
    double staticStopPct(double quality_score) const;

    StopLevels stopLevels(const portfolio::Position& position) const;

    // First rule breached at current_price, or nothing if the position is held.
    // The trailing stop is checked first: once the peak is above entry its
    // trigger is never below the static one.
    std::optional<ExitReason> evaluate(const portfolio::Position& position, Price current_price) const;

private:
    backtest::RiskLimits limits_;
};

} // namespace risk
} // namespace factorsim
