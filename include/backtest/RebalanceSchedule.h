#pragma once

#include "backtest/BacktestConfig.h"
#include <vector>

namespace factorsim {
namespace backtest {

class RebalanceSchedule {
public:
    // Dates from start while <= end. Month steps keep the start day of month,
    // clamped to the month length.
    static std::vector<Date> generate(Date start, Date end, RebalanceCadence cadence);

    // Each date moved to the first trading day on or after it. Dates past the
    // last trading day are dropped and dates that land on the same day merge.
    static std::vector<Date> snapToTradingDays(const std::vector<Date>& dates,
                                               const std::vector<Date>& trading_days);

    // Sorted union of trading days and rebalance dates
    static std::vector<Date> eventDays(const std::vector<Date>& trading_days,
                                       const std::vector<Date>& rebalance_dates);
};

} // namespace backtest
} // namespace factorsim
