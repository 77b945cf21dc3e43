#include "backtest/PriceHistory.h"

namespace factorsim {
namespace backtest {

PriceHistory::PriceHistory(const std::vector<PriceRow>& rows) {
    for (const auto& r : rows) {
        add(r.symbol, r.date, r.close);
    }
}

PriceHistory PriceHistory::fromCsv(const std::string& file_path) {
    return PriceHistory(DataHistory::loadPriceCSV(file_path));
}

void PriceHistory::add(const std::string& symbol, Date date, Price close) {
    series_[symbol][date] = close;
    calendar_.insert(date);
}

std::optional<Price> PriceHistory::priceAt(const std::string& symbol, Date date) const {
    auto sit = series_.find(symbol);
    if (sit == series_.end()) {
        return std::nullopt;
    }
    const auto& closes = sit->second;
    auto it = closes.upper_bound(date);
    if (it == closes.begin()) {
        return std::nullopt;
    }
    --it;
    return it->second;
}

std::vector<Date> PriceHistory::tradingDays(Date from, Date to) const {
    std::vector<Date> days;
    for (auto it = calendar_.lower_bound(from); it != calendar_.end() && *it <= to; ++it) {
        days.push_back(*it);
    }
    return days;
}

std::vector<Price> PriceHistory::closesUpTo(const std::string& symbol, Date date, size_t count) const {
    std::vector<Price> out;
    auto sit = series_.find(symbol);
    if (sit == series_.end() || count == 0) {
        return out;
    }
    const auto& closes = sit->second;
    auto end = closes.upper_bound(date);
    auto begin = end;
    while (begin != closes.begin() && out.size() < count) {
        --begin;
        out.push_back(begin->second);
    }
    return std::vector<Price>(out.rbegin(), out.rend());
}

std::vector<std::string> PriceHistory::symbols() const {
    std::vector<std::string> out;
    for (const auto& [symbol, closes] : series_) {
        out.push_back(symbol);
    }
    return out;
}

size_t PriceHistory::size() const {
    size_t n = 0;
    for (const auto& [symbol, closes] : series_) {
        n += closes.size();
    }
    return n;
}

} // namespace backtest
} // namespace factorsim
