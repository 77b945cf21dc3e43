#pragma once

#include "portfolio/Ledger.h"
#include <map>
#include <string>
#include <vector>

namespace factorsim {
namespace analytics {

struct TradeStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;
    double total_holding_days = 0.0;
    std::map<std::string, int> exits_by_reason;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
    double averageHoldingDays() const {
        return (trades > 0) ? (total_holding_days / static_cast<double>(trades)) : 0.0;
    }
};

struct PerformanceMetrics {
    double initial_value = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;
    double cagr = 0.0;
    double volatility = 0.0;              // annualized
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown = 0.0;            // positive fraction
    int max_drawdown_duration = 0;        // periods under water
    double calmar_ratio = 0.0;
    double alpha = 0.0;                   // annualized
    double beta = 0.0;
    double information_ratio = 0.0;
    double win_rate = 0.0;                // share of positive periodic returns
    double profit_factor = 0.0;           // over periodic returns
    double benchmark_return = 0.0;        // buy-and-hold universe
    double market_return = 0.0;           // market index
    double outperformance_vs_benchmark = 0.0;
    double outperformance_vs_market = 0.0;
    int periods = 0;
    TradeStats trade_stats;
};

struct PerformerScore {
    std::string symbol;
    double average_score;
    int appearances;
};

class PerformanceAnalyzer {
public:
    PerformanceAnalyzer(double risk_free_rate, double periods_per_year);

    // regression_curve drives alpha/beta and the information ratio; it is the
    // market curve when available, else the buy-and-hold curve
    PerformanceMetrics analyze(
        const Curve& equity_curve,
        const std::vector<portfolio::ClosedTrade>& trades,
        const Curve& buy_and_hold_curve,
        const Curve& market_curve
    ) const;

    static std::vector<double> periodicReturns(const Curve& curve);
    static double totalReturn(const Curve& curve);
    double cagr(const Curve& curve) const;
    static void maxDrawdown(const Curve& curve, double& max_drawdown, int& duration);
    static TradeStats tradeStats(const std::vector<portfolio::ClosedTrade>& trades);

    // Symbols ordered by average rebalance score, best first
    static std::vector<PerformerScore> rankByAverageScore(
        const std::map<std::string, std::vector<double>>& scores);

private:
    // Returns of a and b over consecutive dates present in both curves
    static void alignedReturns(const Curve& a, const Curve& b,
                               std::vector<double>& ra, std::vector<double>& rb);

    void regress(const Curve& equity, const Curve& reference, PerformanceMetrics& m) const;

    double risk_free_rate_;
    double periods_per_year_;
};

} // namespace analytics
} // namespace factorsim
