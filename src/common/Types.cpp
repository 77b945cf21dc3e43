#include "common/Types.h"

namespace factorsim {

std::string toString(TradeAction action) {
    return action == TradeAction::BUY ? "BUY" : "SELL";
}

std::string toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::REBALANCE_EXIT: return "rebalance_exit";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TRAILING_STOP: return "trailing_stop";
        case ExitReason::REGIME_REDUCTION: return "regime_reduction";
    }
    return "unknown";
}

} // namespace factorsim
