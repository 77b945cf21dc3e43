#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace factorsim {
namespace backtest {

// Point-in-time price collaborator. Implementations must only return prices
// knowable as of the requested date and be safe to call from several threads.
class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    virtual std::optional<Price> priceAt(const std::string& symbol, Date date) const = 0;

    // Days on which prices are published, within [from, to].
    // Defaults to every calendar day.
    virtual std::vector<Date> tradingDays(Date from, Date to) const {
        std::vector<Date> days;
        for (Date d = from; d <= to; ++d) {
            days.push_back(d);
        }
        return days;
    }
};

} // namespace backtest
} // namespace factorsim
