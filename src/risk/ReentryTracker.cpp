#include "risk/ReentryTracker.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

namespace factorsim {
namespace risk {

ReentryTracker::ReentryTracker(backtest::ReentryConfig config)
    : config_(config)
{}

void ReentryTracker::recordStop(const std::string& symbol, Date date, double fundamentals_score) {
    records_[symbol] = StopRecord{symbol, date, fundamentals_score};
    LOG_INFO("{} stop recorded on {} (fundamentals {:.1f})",
             symbol, utils::DateUtils::format(date), fundamentals_score);
}

std::optional<StopRecord> ReentryTracker::activeRecord(const std::string& symbol, Date as_of) const {
    auto it = records_.find(symbol);
    if (it == records_.end()) {
        return std::nullopt;
    }
    if (as_of - it->second.stop_date > config_.lookback_days) {
        return std::nullopt;
    }
    return it->second;
}

bool ReentryTracker::canRebuy(const std::string& symbol, double current_fundamentals, Date as_of) const {
    if (!activeRecord(symbol, as_of)) {
        return true;
    }
    return current_fundamentals > config_.threshold;
}

void ReentryTracker::expire(Date as_of) {
    for (auto it = records_.begin(); it != records_.end();) {
        if (as_of - it->second.stop_date > config_.lookback_days) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace risk
} // namespace factorsim
