#pragma once

#include "common/Types.h"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace factorsim {
namespace backtest {

enum class RebalanceCadence {
    WEEKLY,
    MONTHLY,
    QUARTERLY
};

std::string toString(RebalanceCadence cadence);

// Quality-tiered static stop plus trailing stop and portfolio drawdown guard
struct RiskLimits {
    double high_quality_threshold = 70.0;    // quality > threshold
    double medium_quality_threshold = 50.0;  // quality >= threshold
    double high_quality_stop_pct = 0.30;
    double medium_quality_stop_pct = 0.20;
    double low_quality_stop_pct = 0.10;
    double trailing_stop_pct = 0.20;         // measured from highest observed price
    double max_portfolio_drawdown = 0.12;
    double drawdown_cash_fraction = 0.50;    // share of exposure liquidated on breach
    double score_deterioration_points = 20.0; // composite drop since entry; 0 disables
};

struct MomentumVetoConfig {
    bool enabled = true;
    double hard_floor = 45.0;               // momentum < floor -> veto
    double soft_momentum = 50.0;            // momentum < soft AND
    double soft_fundamentals = 45.0;        // fundamentals < soft -> veto
    std::set<std::string> exemptions{"AAPL", "MSFT", "GOOGL", "NVDA", "AMZN", "META", "TSLA"};
};

struct ReentryConfig {
    double threshold = 65.0;   // fundamentals must exceed this while a stop record is live
    int lookback_days = 90;
};

struct ConvictionTiers {
    double high_score = 70.0;     // composite > high_score AND quality > high_quality
    double high_quality = 70.0;
    double medium_score = 55.0;   // composite > medium_score
    double high_weight = 0.06;
    double medium_weight = 0.04;
    double low_weight = 0.02;
};

// Portfolio shape for a regime: how many names to hold and how much to keep in cash
struct RegimeProfile {
    int stock_count = 10;
    double cash_allocation = 0.0;
};

struct AdaptiveWeightsConfig {
    bool enabled = false;
    // "TREND_VOLATILITY" (e.g. "BULL_NORMAL") or "TREND" -> weight vector
    std::map<std::string, FactorWeights> regimes;
    // Same keys -> profile; stock_count is capped at top_n
    std::map<std::string, RegimeProfile> profiles{
        {"BULL_LOW", {20, 0.0}},
        {"BULL_NORMAL", {20, 0.0}},
        {"BULL_HIGH", {15, 0.10}},
        {"BEAR_HIGH", {12, 0.40}},
        {"BEAR", {15, 0.25}},
        {"SIDEWAYS_HIGH", {15, 0.15}},
        {"SIDEWAYS", {18, 0.05}}
    };
};

struct BacktestConfig {
    Date start_date = 0;
    Date end_date = 0;
    std::vector<std::string> universe;
    RebalanceCadence cadence = RebalanceCadence::MONTHLY;
    int top_n = 10;
    double initial_capital = 100000.0;
    double transaction_cost = 0.001;     // applied to notional traded
    double cash_buffer_pct = 0.005;      // never invested, absorbs costs
    double risk_free_rate = 0.02;
    double periods_per_year = 252.0;
    int scoring_threads = 0;             // 0 = hardware concurrency, 1 = sequential

    FactorWeights weights;
    AdaptiveWeightsConfig adaptive_weights;
    RiskLimits risk;
    MomentumVetoConfig momentum_veto;
    ReentryConfig reentry;
    ConvictionTiers sizing;

    std::string market_benchmark_symbol = "SPY";
    std::string engine_version = "2.1";
    std::string data_provider = "PriceHistory/ScoreTable";
    std::map<std::string, std::string> data_limitations{
        {"fundamentals", "Uses current financial statements (look-ahead bias)"},
        {"sentiment", "Uses current analyst ratings (look-ahead bias)"},
        {"momentum", "Uses historical prices (accurate)"},
        {"quality", "Uses historical prices + current fundamentals (partial look-ahead bias)"}
    };
    std::string estimated_bias_impact =
        "Results may be optimistic by 5-10% due to look-ahead bias in fundamentals/sentiment";
};

} // namespace backtest
} // namespace factorsim
