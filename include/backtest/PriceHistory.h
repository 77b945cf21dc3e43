#pragma once

#include "backtest/DataHistory.h"
#include "backtest/IPriceSource.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace factorsim {
namespace backtest {

// In-memory close history. priceAt returns the last close at or before the
// requested date, never a later one.
class PriceHistory : public IPriceSource {
public:
    PriceHistory() = default;
    explicit PriceHistory(const std::vector<PriceRow>& rows);

    static PriceHistory fromCsv(const std::string& file_path);

    // Later adds for the same (symbol, date) overwrite earlier ones
    void add(const std::string& symbol, Date date, Price close);

    std::optional<Price> priceAt(const std::string& symbol, Date date) const override;
    std::vector<Date> tradingDays(Date from, Date to) const override;

    // Up to `count` most recent closes at or before date, oldest first
    std::vector<Price> closesUpTo(const std::string& symbol, Date date, size_t count) const;

    bool hasSymbol(const std::string& symbol) const { return series_.count(symbol) > 0; }
    std::vector<std::string> symbols() const;
    size_t size() const;

private:
    std::map<std::string, std::map<Date, Price>> series_;
    std::set<Date> calendar_;
};

} // namespace backtest
} // namespace factorsim
