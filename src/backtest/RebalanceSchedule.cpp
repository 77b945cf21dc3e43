#include "backtest/RebalanceSchedule.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <iterator>

namespace factorsim {
namespace backtest {

std::vector<Date> RebalanceSchedule::generate(Date start, Date end, RebalanceCadence cadence) {
    std::vector<Date> dates;
    if (start > end) {
        return dates;
    }

    int year = 0, month = 0, anchor_day = 0;
    utils::DateUtils::toCivil(start, year, month, anchor_day);

    int step = 0;
    for (Date d = start; d <= end;) {
        dates.push_back(d);
        ++step;
        switch (cadence) {
            case RebalanceCadence::WEEKLY:
                d = start + 7LL * step;
                break;
            case RebalanceCadence::MONTHLY:
                d = utils::DateUtils::addMonths(start, step, anchor_day);
                break;
            case RebalanceCadence::QUARTERLY:
                d = utils::DateUtils::addMonths(start, 3 * step, anchor_day);
                break;
        }
    }
    return dates;
}

std::vector<Date> RebalanceSchedule::snapToTradingDays(const std::vector<Date>& dates,
                                                       const std::vector<Date>& trading_days) {
    std::vector<Date> calendar(trading_days);
    std::sort(calendar.begin(), calendar.end());

    std::vector<Date> out;
    for (Date d : dates) {
        auto it = std::lower_bound(calendar.begin(), calendar.end(), d);
        if (it == calendar.end()) continue;
        if (out.empty() || out.back() != *it) {
            out.push_back(*it);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<Date> RebalanceSchedule::eventDays(const std::vector<Date>& trading_days,
                                               const std::vector<Date>& rebalance_dates) {
    std::vector<Date> a(trading_days);
    std::vector<Date> b(rebalance_dates);
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());

    std::vector<Date> out;
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace backtest
} // namespace factorsim
