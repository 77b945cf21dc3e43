#pragma once

#include "analytics/PerformanceAnalyzer.h"
#include "portfolio/Ledger.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace factorsim {
namespace backtest {

// One execution. Exit fields are set for sells only.
struct TradeRecord {
    Date date = 0;
    TradeAction action = TradeAction::BUY;
    std::string symbol;
    Shares shares = 0.0;
    Price price = 0.0;
    Amount notional = 0.0;
    Amount transaction_cost = 0.0;
    double composite_score = 0.0;
    int rank = 0;                 // 1-based rank at the rebalance, 0 outside one
    std::string tier;             // conviction tier, buys only

    Price entry_price = 0.0;
    Date entry_date = 0;
    int holding_days = 0;
    Amount pnl = 0.0;
    double pnl_pct = 0.0;
    std::optional<ExitReason> exit_reason;
    std::string detail;
};

struct RebalanceRecord {
    Date date = 0;
    std::vector<std::string> selected;          // rank order
    std::map<std::string, double> scores;       // composite of each selected symbol
    std::map<std::string, double> target_weights;
    double average_score = 0.0;
    std::string regime;                          // "STATIC" when weights are not adaptive
    FactorWeights weights;
    int target_count = 0;                        // portfolio size after the regime cap
    double cash_allocation = 0.0;                // regime or drawdown cash share, whichever is larger
    int scored = 0;
    int skipped = 0;
    int vetoed = 0;
    int reentry_blocked = 0;
    int buys = 0;
    int sells = 0;
    Amount portfolio_value = 0.0;
};

struct Provenance {
    std::string engine_version;
    std::string data_provider;
    std::map<std::string, std::string> data_limitations;
    std::string estimated_bias_impact;
    std::vector<std::string> scoring_notes;      // scorer failures, one per symbol/date
};

struct OpenPosition {
    std::string symbol;
    Shares shares = 0.0;
    Price entry_price = 0.0;
    Date entry_date = 0;
    Price last_price = 0.0;
    Amount market_value = 0.0;
};

struct BacktestResult {
    Date start_date = 0;
    Date end_date = 0;
    Date last_processed_date = 0;

    Curve equity_curve;
    Curve buy_and_hold_curve;    // equal-weight universe, no costs
    Curve market_curve;          // market benchmark scaled to initial capital

    std::vector<TradeRecord> trades;
    std::vector<RebalanceRecord> rebalances;
    std::vector<portfolio::ClosedTrade> closed_trades;
    std::vector<OpenPosition> open_positions;
    Amount final_cash = 0.0;
    int defensive_entries = 0;
    Amount total_transaction_costs = 0.0;

    analytics::PerformanceMetrics metrics;
    std::vector<analytics::PerformerScore> best_performers;
    std::vector<analytics::PerformerScore> worst_performers;

    Provenance provenance;
    bool truncated = false;
    std::string truncation_reason;
};

} // namespace backtest
} // namespace factorsim
