#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backtest/BacktestConfig.h"
#include "backtest/BacktestResult.h"
#include "backtest/IPriceSource.h"
#include "analytics/RegimeDetector.h"
#include "portfolio/Ledger.h"
#include "portfolio/PositionSizer.h"
#include "risk/DrawdownMonitor.h"
#include "risk/ReentryTracker.h"
#include "risk/RiskManager.h"
#include "scoring/IScorer.h"
#include "scoring/MomentumVeto.h"
#include "scoring/UniverseScorer.h"

namespace factorsim {
namespace backtest {

// Walks the event calendar (trading days plus rebalance dates) in date order.
// Rebalance dates run regime -> score -> veto -> re-entry -> rank -> size ->
// execute; every event day then runs the stop checks and the drawdown guard
// and records the portfolio value. The ledger is only touched from run().
class BacktestEngine {
public:
    BacktestEngine(
        BacktestConfig config,
        std::shared_ptr<const IPriceSource> prices,
        std::shared_ptr<const scoring::IScorer> scorer,
        std::shared_ptr<const analytics::IRegimeProvider> regime = nullptr
    );

    // Throws ConfigurationError before the first simulated date
    BacktestResult run();

    // Both are checked before each rebalance date; the result is then truncated
    void requestCancel() { cancel_requested_.store(true); }
    void setDeadline(std::chrono::steady_clock::time_point deadline) { deadline_ = deadline; }

    const BacktestConfig& config() const { return config_; }

private:
    void reset();

    void rebalance(Date date, BacktestResult& result);
    void processPriceTick(Date date, BacktestResult& result);
    void checkDrawdown(Date date, Amount value, BacktestResult& result);
    void updateBenchmarks(Date date, BacktestResult& result);

    // Weights, portfolio size and cash share for one rebalance date
    struct RebalancePlan {
        FactorWeights weights;
        std::string regime;
        int top_n = 0;
        double cash_allocation = 0.0;
    };

    RebalancePlan planFor(Date date) const;
    double fundamentalsForStop(const std::string& symbol, Date date) const;
    double lastComposite(const std::string& symbol) const;
    std::optional<std::string> cancellationReason() const;

    void recordBuy(const portfolio::BuyFill& fill, Date date, double composite, int rank,
                   const std::string& tier, BacktestResult& result);
    void recordSell(const portfolio::SellFill& fill, Date date, double composite, int rank,
                    const std::string& detail, BacktestResult& result);

    portfolio::Ledger::PriceLookup lookupAt(Date date) const;
    void finalize(BacktestResult& result) const;

    BacktestConfig config_;
    std::shared_ptr<const IPriceSource> prices_;
    std::shared_ptr<const scoring::IScorer> scorer_;
    std::shared_ptr<const analytics::IRegimeProvider> regime_;

    // Per-run state
    std::unique_ptr<portfolio::Ledger> ledger_;
    std::unique_ptr<risk::RiskManager> risk_manager_;
    std::unique_ptr<risk::ReentryTracker> reentry_;
    std::unique_ptr<risk::DrawdownMonitor> drawdown_;
    std::unique_ptr<scoring::MomentumVeto> veto_;
    std::unique_ptr<scoring::UniverseScorer> universe_scorer_;

    std::map<std::string, scoring::ScoredSymbol> last_scored_;  // latest successful score per symbol
    std::map<std::string, std::vector<double>> selected_scores_;

    // Buy-and-hold and market benchmarks
    bool benchmarks_started_ = false;
    std::map<std::string, Shares> buy_and_hold_shares_;
    Amount buy_and_hold_cash_ = 0.0;
    std::optional<Price> market_base_;

    std::atomic<bool> cancel_requested_{false};
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace backtest
} // namespace factorsim
