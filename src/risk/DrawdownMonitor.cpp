#include "risk/DrawdownMonitor.h"
#include "common/Logger.h"

namespace factorsim {
namespace risk {

DrawdownMonitor::DrawdownMonitor(double max_drawdown)
    : max_drawdown_(max_drawdown)
    , peak_(0.0)
    , last_value_(0.0)
    , defensive_(false)
    , defensive_entries_(0)
{}

double DrawdownMonitor::currentDrawdown() const {
    if (peak_ <= 0.0) {
        return 0.0;
    }
    return (peak_ - last_value_) / peak_;
}

DrawdownAction DrawdownMonitor::update(Amount value) {
    last_value_ = value;
    if (value > peak_) {
        peak_ = value;
    }

    const double drawdown = currentDrawdown();

    if (!defensive_ && drawdown > max_drawdown_) {
        defensive_ = true;
        ++defensive_entries_;
        LOG_WARN("Portfolio drawdown {:.2f}% exceeds limit {:.2f}%, entering defensive mode",
                 drawdown * 100.0, max_drawdown_ * 100.0);
        return DrawdownAction::ENTER_DEFENSIVE;
    }

    if (defensive_ && drawdown <= max_drawdown_) {
        defensive_ = false;
        LOG_INFO("Portfolio drawdown recovered to {:.2f}%, leaving defensive mode", drawdown * 100.0);
        return DrawdownAction::EXIT_DEFENSIVE;
    }

    return DrawdownAction::NONE;
}

} // namespace risk
} // namespace factorsim
