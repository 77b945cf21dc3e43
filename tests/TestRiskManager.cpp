#include "risk/RiskManager.h"
#include "common/Logger.h"

#include <iostream>

using namespace factorsim;
using factorsim::portfolio::Position;
using factorsim::risk::RiskManager;

namespace {
Position makePosition(Price entry, double quality) {
    Position pos;
    pos.symbol = "XYZ";
    pos.shares = 10.0;
    pos.entry_price = entry;
    pos.highest_price = entry;
    pos.last_price = entry;
    pos.quality_score = quality;
    return pos;
}
}

int main() {
    spdlog::set_level(spdlog::level::off);

    backtest::RiskLimits limits;
    RiskManager risk(limits);

    if (risk.staticStopPct(85.0) != 0.30 || risk.staticStopPct(70.0) != 0.20 ||
        risk.staticStopPct(50.0) != 0.20 || risk.staticStopPct(49.9) != 0.10) {
        std::cerr << "[TEST] quality tiers wrong\n";
        return 1;
    }

    // Path 100 -> 140 -> 110 on a 30% static / 20% trailing position
    {
        Position pos = makePosition(100.0, 80.0);
        if (risk.evaluate(pos, 100.0)) {
            std::cerr << "[TEST] no stop expected at entry\n";
            return 1;
        }
        pos.observePrice(140.0);
        if (risk.evaluate(pos, 140.0)) {
            std::cerr << "[TEST] no stop expected at the peak\n";
            return 1;
        }
        pos.observePrice(110.0);
        const auto reason = risk.evaluate(pos, 110.0);
        if (!reason || *reason != ExitReason::TRAILING_STOP) {
            std::cerr << "[TEST] 110 after a 140 peak should hit the trailing stop\n";
            return 1;
        }
        if (risk.evaluate(pos, 113.0)) {
            std::cerr << "[TEST] 113 is above the 112 trailing trigger\n";
            return 1;
        }
    }

    // Static stops measured from entry
    {
        const Position low = makePosition(100.0, 30.0);
        const auto reason = risk.evaluate(low, 89.0);
        if (!reason || *reason != ExitReason::STOP_LOSS) {
            std::cerr << "[TEST] low quality should stop at -10%\n";
            return 1;
        }
        const Position high = makePosition(100.0, 90.0);
        if (risk.evaluate(high, 71.0)) {
            std::cerr << "[TEST] high quality tolerates -29%\n";
            return 1;
        }
        const auto high_reason = risk.evaluate(high, 69.0);
        if (!high_reason || *high_reason != ExitReason::STOP_LOSS) {
            std::cerr << "[TEST] high quality should stop beyond -30%\n";
            return 1;
        }
    }

    // Once the peak is above entry the trailing trigger is never below the static one
    for (double quality : {20.0, 60.0, 90.0}) {
        for (double peak = 100.5; peak < 400.0; peak *= 1.07) {
            Position pos = makePosition(100.0, quality);
            pos.observePrice(peak);
            const auto levels = risk.stopLevels(pos);
            if (!levels.trailing_active || levels.trailing_trigger < levels.static_trigger) {
                std::cerr << "[TEST] trailing trigger below static at peak " << peak << "\n";
                return 1;
            }
        }
    }

    // Trailing stop inactive while the peak equals entry
    {
        const Position pos = makePosition(100.0, 60.0);
        if (risk.stopLevels(pos).trailing_active) {
            std::cerr << "[TEST] trailing stop should wait for a new peak\n";
            return 1;
        }
    }

    std::cout << "[TEST] RiskManager PASSED\n";
    return 0;
}
