#pragma once

#include "backtest/BacktestConfig.h"
#include <map>
#include <optional>
#include <string>

namespace factorsim {
namespace risk {

struct StopRecord {
    std::string symbol;
    Date stop_date;
    double fundamentals_at_stop;
};

// Gates the re-purchase of symbols that were recently stopped out
class ReentryTracker {
public:
    explicit ReentryTracker(backtest::ReentryConfig config);

    // Replaces any earlier record for the symbol
    void recordStop(const std::string& symbol, Date date, double fundamentals_score);

    bool canRebuy(const std::string& symbol, double current_fundamentals, Date as_of) const;

    // Record still within the lookback window at as_of
    std::optional<StopRecord> activeRecord(const std::string& symbol, Date as_of) const;

    // Drops records older than the lookback window
    void expire(Date as_of);

    size_t size() const { return records_.size(); }

private:
    backtest::ReentryConfig config_;
    std::map<std::string, StopRecord> records_;
};

} // namespace risk
} // namespace factorsim
