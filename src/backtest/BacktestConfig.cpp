#include "backtest/BacktestConfig.h"

namespace factorsim {
namespace backtest {

std::string toString(RebalanceCadence cadence) {
    switch (cadence) {
        case RebalanceCadence::WEEKLY: return "weekly";
        case RebalanceCadence::MONTHLY: return "monthly";
        case RebalanceCadence::QUARTERLY: return "quarterly";
    }
    return "monthly";
}

} // namespace backtest
} // namespace factorsim
