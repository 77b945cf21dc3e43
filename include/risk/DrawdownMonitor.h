#pragma once

#include "common/Types.h"

namespace factorsim {
namespace risk {

enum class DrawdownAction {
    NONE,
    ENTER_DEFENSIVE,   // limit breached: de-risk once
    EXIT_DEFENSIVE     // recovered within the limit
};

// Portfolio-level drawdown guard measured against the running peak value
class DrawdownMonitor {
public:
    explicit DrawdownMonitor(double max_drawdown);

    // Feed the latest portfolio value; returns the state transition, if any
    DrawdownAction update(Amount value);

    double currentDrawdown() const;
    Amount peak() const { return peak_; }
    bool isDefensive() const { return defensive_; }
    int defensiveEntries() const { return defensive_entries_; }

private:
    double max_drawdown_;
    Amount peak_;
    Amount last_value_;
    bool defensive_;
    int defensive_entries_;
};

} // namespace risk
} // namespace factorsim
