#include "backtest/BacktestEngine.h"
#include "backtest/RebalanceSchedule.h"
#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>
#include <set>

namespace factorsim {
namespace backtest {

namespace {
// Remaining position value below this is closed instead of partially reduced
constexpr Amount MIN_POSITION_VALUE = 1.0;
constexpr size_t PERFORMER_COUNT = 10;

std::string day(Date date) {
    return utils::DateUtils::format(date);
}
}

BacktestEngine::BacktestEngine(
    BacktestConfig config,
    std::shared_ptr<const IPriceSource> prices,
    std::shared_ptr<const scoring::IScorer> scorer,
    std::shared_ptr<const analytics::IRegimeProvider> regime
)
    : config_(std::move(config))
    , prices_(std::move(prices))
    , scorer_(std::move(scorer))
    , regime_(std::move(regime))
{}

void BacktestEngine::reset() {
    ledger_ = std::make_unique<portfolio::Ledger>(config_.initial_capital, config_.transaction_cost);
    risk_manager_ = std::make_unique<risk::RiskManager>(config_.risk);
    reentry_ = std::make_unique<risk::ReentryTracker>(config_.reentry);
    drawdown_ = std::make_unique<risk::DrawdownMonitor>(config_.risk.max_portfolio_drawdown);
    veto_ = std::make_unique<scoring::MomentumVeto>(config_.momentum_veto);
    universe_scorer_ = std::make_unique<scoring::UniverseScorer>(scorer_, prices_, config_.scoring_threads);

    last_scored_.clear();
    selected_scores_.clear();
    benchmarks_started_ = false;
    buy_and_hold_shares_.clear();
    buy_and_hold_cash_ = 0.0;
    market_base_.reset();
}

BacktestResult BacktestEngine::run() {
    Config::validate(config_);
    if (!prices_) {
        throw ConfigurationError("no price source");
    }
    if (!scorer_) {
        throw ConfigurationError("no scorer");
    }
    if (config_.adaptive_weights.enabled && !regime_) {
        LOG_WARN("Adaptive weights enabled without a regime provider, using static weights");
    }

    reset();

    BacktestResult result;
    result.start_date = config_.start_date;
    result.end_date = config_.end_date;
    result.provenance.engine_version = config_.engine_version;
    result.provenance.data_provider = config_.data_provider;
    result.provenance.data_limitations = config_.data_limitations;
    result.provenance.estimated_bias_impact = config_.estimated_bias_impact;

    const auto trading_days = prices_->tradingDays(config_.start_date, config_.end_date);
    const auto rebalance_dates = RebalanceSchedule::snapToTradingDays(
        RebalanceSchedule::generate(config_.start_date, config_.end_date, config_.cadence), trading_days);
    const auto events = RebalanceSchedule::eventDays(trading_days, rebalance_dates);
    const std::set<Date> rebalance_set(rebalance_dates.begin(), rebalance_dates.end());

    LOG_INFO("Starting backtest {} -> {}: {} symbols, {} rebalances ({}), {} event days",
             day(config_.start_date), day(config_.end_date), config_.universe.size(),
             rebalance_dates.size(), toString(config_.cadence), events.size());

    for (Date date : events) {
        if (rebalance_set.count(date)) {
            if (auto reason = cancellationReason()) {
                result.truncated = true;
                result.truncation_reason = *reason;
                LOG_WARN("Backtest truncated before {}: {}", day(date), *reason);
                break;
            }
            rebalance(date, result);
        }
        processPriceTick(date, result);
        result.last_processed_date = date;
    }

    finalize(result);

    LOG_INFO("Backtest completed: final value {:.2f}, {} trades, {} rebalances{}",
             result.metrics.final_value, result.trades.size(), result.rebalances.size(),
             result.truncated ? " (truncated)" : "");
    return result;
}

std::optional<std::string> BacktestEngine::cancellationReason() const {
    if (cancel_requested_.load()) {
        return std::string("cancellation requested");
    }
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
        return std::string("deadline exceeded");
    }
    return std::nullopt;
}

portfolio::Ledger::PriceLookup BacktestEngine::lookupAt(Date date) const {
    const IPriceSource* prices = prices_.get();
    return [prices, date](const std::string& symbol) {
        return prices->priceAt(symbol, date);
    };
}

BacktestEngine::RebalancePlan BacktestEngine::planFor(Date date) const {
    RebalancePlan plan;
    plan.weights = config_.weights;
    plan.regime = "STATIC";
    plan.top_n = config_.top_n;
    plan.cash_allocation = 0.0;
    if (!config_.adaptive_weights.enabled || !regime_) {
        return plan;
    }

    try {
        const auto snapshot = regime_->regimeAt(date);
        if (!snapshot) {
            plan.regime = "UNKNOWN";
            return plan;
        }
        plan.regime = snapshot->label();
        if (snapshot->weights) {
            plan.weights = *snapshot->weights;
        }
        if (snapshot->stock_count) {
            plan.top_n = std::clamp(*snapshot->stock_count, 1, config_.top_n);
        }
        plan.cash_allocation = std::clamp(snapshot->cash_allocation, 0.0, 1.0);
        LOG_INFO("Regime on {}: {} -> {} names, {:.0f}% cash{}", day(date), snapshot->description,
                 plan.top_n, plan.cash_allocation * 100.0,
                 snapshot->weights ? "" : " (no weight entry, using static weights)");
    } catch (const std::exception& e) {
        LOG_WARN("Regime lookup failed on {}: {}", day(date), e.what());
        plan.regime = "UNKNOWN";
    }
    return plan;
}

double BacktestEngine::fundamentalsForStop(const std::string& symbol, Date date) const {
    try {
        if (const auto scores = scorer_->score(symbol, date)) {
            return scores->fundamentals;
        }
    } catch (const std::exception& e) {
        LOG_WARN("{} score unavailable at stop on {}: {}", symbol, day(date), e.what());
    }
    auto it = last_scored_.find(symbol);
    return it != last_scored_.end() ? it->second.scores.fundamentals : 0.0;
}

double BacktestEngine::lastComposite(const std::string& symbol) const {
    auto it = last_scored_.find(symbol);
    return it != last_scored_.end() ? it->second.composite : 0.0;
}

void BacktestEngine::rebalance(Date date, BacktestResult& result) {
    const RebalancePlan plan = planFor(date);

    RebalanceRecord record;
    record.date = date;
    record.weights = plan.weights;
    record.regime = plan.regime;
    record.target_count = plan.top_n;

    // The more conservative of the regime and drawdown cash shares
    record.cash_allocation = plan.cash_allocation;
    if (drawdown_->isDefensive() && config_.risk.drawdown_cash_fraction > record.cash_allocation) {
        record.cash_allocation = config_.risk.drawdown_cash_fraction;
        LOG_WARN("Defensive mode on {}: drawdown {:.2f}%, holding {:.0f}% in cash",
                 day(date), drawdown_->currentDrawdown() * 100.0, record.cash_allocation * 100.0);
    }

    auto outcome = universe_scorer_->scoreUniverse(config_.universe, date, record.weights);
    record.scored = static_cast<int>(outcome.scored.size());
    record.skipped = static_cast<int>(outcome.skipped.size());
    for (auto& note : outcome.notes) {
        result.provenance.scoring_notes.push_back(std::move(note));
    }

    std::map<std::string, const scoring::ScoredSymbol*> by_symbol;
    for (const auto& s : outcome.scored) {
        last_scored_[s.symbol] = s;
        by_symbol[s.symbol] = &s;
    }

    // Score deterioration exit
    std::set<std::string> deteriorated;
    if (config_.risk.score_deterioration_points > 0.0) {
        for (const auto& symbol : ledger_->heldSymbols()) {
            auto it = by_symbol.find(symbol);
            if (it == by_symbol.end()) continue;
            const auto* pos = ledger_->position(symbol);
            const double drop = pos->entry_score - it->second->composite;
            if (drop > config_.risk.score_deterioration_points) {
                deteriorated.insert(symbol);
                const std::string detail = fmt::format("score deteriorated {:.1f} -> {:.1f}",
                                                       pos->entry_score, it->second->composite);
                LOG_INFO("{} {}", symbol, detail);
                const auto fill = ledger_->sell(symbol, it->second->price, date, ExitReason::REBALANCE_EXIT);
                recordSell(fill, date, it->second->composite, 0, detail, result);
                ++record.sells;
            }
        }
    }

    // Veto, re-entry and ranking
    std::vector<const scoring::ScoredSymbol*> survivors;
    for (const auto& s : outcome.scored) {
        if (deteriorated.count(s.symbol)) continue;

        const std::string veto_reason = veto_->check(s.symbol, s.scores);
        if (!veto_reason.empty()) {
            ++record.vetoed;
            LOG_INFO("{} vetoed on {}: {}", s.symbol, day(date), veto_reason);
            continue;
        }
        if (!reentry_->canRebuy(s.symbol, s.scores.fundamentals, date)) {
            ++record.reentry_blocked;
            LOG_INFO("{} re-entry blocked on {}: fundamentals {:.1f} <= {:.1f}",
                     s.symbol, day(date), s.scores.fundamentals, config_.reentry.threshold);
            continue;
        }
        survivors.push_back(&s);
    }

    const size_t n = std::min(survivors.size(), static_cast<size_t>(plan.top_n));
    std::vector<const scoring::ScoredSymbol*> target(survivors.begin(), survivors.begin() + n);

    if (target.empty()) {
        LOG_WARN("No eligible symbols on {} ({} scored, {} skipped), keeping current portfolio",
                 day(date), record.scored, record.skipped);
        record.portfolio_value = ledger_->markToMarket(lookupAt(date));
        result.rebalances.push_back(std::move(record));
        return;
    }

    std::vector<portfolio::SizingCandidate> candidates;
    std::map<std::string, int> rank_of;
    double score_sum = 0.0;
    for (size_t i = 0; i < target.size(); ++i) {
        const auto* s = target[i];
        candidates.push_back(portfolio::SizingCandidate{s->symbol, s->composite, s->scores.quality});
        rank_of[s->symbol] = static_cast<int>(i + 1);
        record.selected.push_back(s->symbol);
        record.scores[s->symbol] = s->composite;
        selected_scores_[s->symbol].push_back(s->composite);
        score_sum += s->composite;
    }
    record.average_score = score_sum / static_cast<double>(target.size());

    const portfolio::PositionSizer sizer(config_.sizing, 1.0 - record.cash_allocation);
    const auto sized = sizer.size(candidates);

    // Exits: held but not in the target. A smaller regime portfolio is a reduction.
    const auto held = ledger_->heldSymbols();
    const bool regime_reduction = static_cast<size_t>(plan.top_n) < held.size();
    for (const auto& symbol : held) {
        if (rank_of.count(symbol)) continue;
        const auto price = prices_->priceAt(symbol, date);
        if (!price) {
            LOG_WARN("{} rebalance exit deferred on {}: no price", symbol, day(date));
            continue;
        }
        auto it = by_symbol.find(symbol);
        const double composite = it != by_symbol.end() ? it->second->composite : lastComposite(symbol);
        const ExitReason reason = regime_reduction ? ExitReason::REGIME_REDUCTION : ExitReason::REBALANCE_EXIT;
        const std::string detail = regime_reduction
            ? fmt::format("regime {} holds {} names", plan.regime, plan.top_n)
            : std::string("not in target");
        const auto fill = ledger_->sell(symbol, *price, date, reason);
        recordSell(fill, date, composite, 0, detail, result);
        ++record.sells;
    }

    // Entries: in the target but not held, in rank order, within what is left
    // of the invested share after the positions already held
    const auto lookup = lookupAt(date);
    const Amount value = ledger_->markToMarket(lookup);
    const Amount investable = value * (1.0 - config_.cash_buffer_pct);
    const Amount reserve = value * config_.cash_buffer_pct;
    Amount budget = investable * (1.0 - record.cash_allocation) - ledger_->positionsValue(lookup);

    for (size_t i = 0; i < sized.size(); ++i) {
        const auto& p = sized[i];
        record.target_weights[p.symbol] = p.weight;
        if (ledger_->hasPosition(p.symbol)) continue;

        const auto* s = target[i];
        const Amount outlay = std::min(investable * p.weight, budget);
        if (outlay < MIN_POSITION_VALUE) {
            LOG_INFO("{} buy skipped on {}: investment budget used up", s->symbol, day(date));
            continue;
        }
        const auto fill = ledger_->buy(s->symbol, s->price, outlay, reserve,
                                       date, s->composite, s->scores.quality);
        if (!fill) {
            LOG_WARN("{} buy skipped on {}: nothing fundable", s->symbol, day(date));
            continue;
        }
        budget -= fill->notional + fill->transaction_cost;
        recordBuy(*fill, date, s->composite, rank_of[s->symbol], portfolio::toString(p.tier), result);
        ++record.buys;
    }

    record.portfolio_value = ledger_->markToMarket(lookup);
    LOG_INFO("Rebalance {} [{}]: {} selected (avg score {:.1f}), {} buys, {} sells, {:.0f}% cash target, value {:.2f}",
             day(date), record.regime, record.selected.size(), record.average_score,
             record.buys, record.sells, record.cash_allocation * 100.0, record.portfolio_value);
    result.rebalances.push_back(std::move(record));
}

void BacktestEngine::processPriceTick(Date date, BacktestResult& result) {
    reentry_->expire(date);

    for (const auto& symbol : ledger_->heldSymbols()) {
        const auto price = prices_->priceAt(symbol, date);
        if (!price) continue;

        ledger_->observePrice(symbol, *price);
        const auto* pos = ledger_->position(symbol);
        const auto reason = risk_manager_->evaluate(*pos, *price);
        if (!reason) continue;

        const double fundamentals = fundamentalsForStop(symbol, date);
        const std::string detail = fmt::format("peak {:.2f}, entry {:.2f}", pos->highest_price, pos->entry_price);
        LOG_WARN("{} {} on {} at {:.2f} ({})", symbol, toString(*reason), day(date), *price, detail);

        const auto fill = ledger_->sell(symbol, *price, date, *reason);
        recordSell(fill, date, lastComposite(symbol), 0, detail, result);
        reentry_->recordStop(symbol, date, fundamentals);
    }

    const auto lookup = lookupAt(date);
    checkDrawdown(date, ledger_->markToMarket(lookup), result);

    const Amount positions_value = ledger_->positionsValue(lookup);
    ledger_->recordValue(date, ledger_->cash() + positions_value, positions_value);
    updateBenchmarks(date, result);
}

void BacktestEngine::checkDrawdown(Date date, Amount value, BacktestResult& result) {
    const auto action = drawdown_->update(value);
    if (action != risk::DrawdownAction::ENTER_DEFENSIVE) {
        return;
    }

    const double fraction = config_.risk.drawdown_cash_fraction;
    const std::string detail = fmt::format("portfolio drawdown {:.2f}% > {:.2f}%",
                                           drawdown_->currentDrawdown() * 100.0,
                                           config_.risk.max_portfolio_drawdown * 100.0);

    for (const auto& symbol : ledger_->heldSymbols()) {
        const auto price = prices_->priceAt(symbol, date);
        if (!price) continue;

        const auto* pos = ledger_->position(symbol);
        const Amount remaining = pos->shares * (1.0 - fraction) * *price;
        const double sell_fraction = remaining < MIN_POSITION_VALUE ? 1.0 : fraction;

        const auto fill = ledger_->sell(symbol, *price, date, ExitReason::REGIME_REDUCTION, sell_fraction);
        recordSell(fill, date, lastComposite(symbol), 0, detail, result);
    }
}

void BacktestEngine::updateBenchmarks(Date date, BacktestResult& result) {
    if (!benchmarks_started_) {
        std::vector<std::pair<std::string, Price>> priced;
        for (const auto& symbol : config_.universe) {
            if (auto p = prices_->priceAt(symbol, date)) {
                if (*p > 0.0) priced.emplace_back(symbol, *p);
            }
        }
        if (priced.empty()) {
            return;
        }
        const Amount slice = config_.initial_capital / static_cast<double>(priced.size());
        for (const auto& [symbol, price] : priced) {
            buy_and_hold_shares_[symbol] = slice / price;
        }
        buy_and_hold_cash_ = 0.0;
        if (auto m = prices_->priceAt(config_.market_benchmark_symbol, date)) {
            if (*m > 0.0) market_base_ = *m;
        }
        benchmarks_started_ = true;
    }

    Amount bh = buy_and_hold_cash_;
    for (const auto& [symbol, shares] : buy_and_hold_shares_) {
        if (auto p = prices_->priceAt(symbol, date)) {
            bh += shares * *p;
        }
    }
    result.buy_and_hold_curve.emplace_back(date, bh);

    if (market_base_) {
        if (auto m = prices_->priceAt(config_.market_benchmark_symbol, date)) {
            result.market_curve.emplace_back(date, config_.initial_capital * (*m / *market_base_));
        }
    }
}

void BacktestEngine::recordBuy(const portfolio::BuyFill& fill, Date date, double composite, int rank,
                               const std::string& tier, BacktestResult& result) {
    TradeRecord t;
    t.date = date;
    t.action = TradeAction::BUY;
    t.symbol = fill.symbol;
    t.shares = fill.shares;
    t.price = fill.price;
    t.notional = fill.notional;
    t.transaction_cost = fill.transaction_cost;
    t.composite_score = composite;
    t.rank = rank;
    t.tier = tier;
    if (fill.scaled_down) {
        t.detail = "scaled down to available cash";
    }

    LOG_INFO("BUY {} {:.4f} @ {:.2f} (notional {:.2f}, cost {:.2f}, score {:.1f}, rank {}, {})",
             t.symbol, t.shares, t.price, t.notional, t.transaction_cost, composite, rank, tier);
    Logger::getInstance().logTrade(day(date), t.symbol, "BUY", t.price, t.shares, 0.0, "entry");
    result.trades.push_back(std::move(t));
}

void BacktestEngine::recordSell(const portfolio::SellFill& fill, Date date, double composite, int rank,
                                const std::string& detail, BacktestResult& result) {
    TradeRecord t;
    t.date = date;
    t.action = TradeAction::SELL;
    t.symbol = fill.symbol;
    t.shares = fill.shares;
    t.price = fill.price;
    t.notional = fill.notional;
    t.transaction_cost = fill.transaction_cost;
    t.composite_score = composite;
    t.rank = rank;
    t.entry_price = fill.trade.entry_price;
    t.entry_date = fill.trade.entry_date;
    t.holding_days = fill.trade.holding_days;
    t.pnl = fill.trade.pnl;
    t.pnl_pct = fill.trade.pnl_pct;
    t.exit_reason = fill.trade.exit_reason;
    t.detail = detail;

    const std::string reason = toString(fill.trade.exit_reason);
    LOG_INFO("SELL {} {:.4f} @ {:.2f} ({}, pnl {:.2f} / {:.2f}%, held {}d)",
             t.symbol, t.shares, t.price, reason, t.pnl, t.pnl_pct * 100.0, t.holding_days);
    Logger::getInstance().logTrade(day(date), t.symbol, "SELL", t.price, t.shares, t.pnl, reason);
    result.trades.push_back(std::move(t));
}

void BacktestEngine::finalize(BacktestResult& result) const {
    for (const auto& v : ledger_->valueHistory()) {
        result.equity_curve.emplace_back(v.date, v.value);
    }
    result.closed_trades = ledger_->closedTrades();
    result.final_cash = ledger_->cash();
    result.defensive_entries = drawdown_->defensiveEntries();
    result.total_transaction_costs = ledger_->totalTransactionCosts();

    for (const auto& [symbol, pos] : ledger_->positions()) {
        OpenPosition open;
        open.symbol = symbol;
        open.shares = pos.shares;
        open.entry_price = pos.entry_price;
        open.entry_date = pos.entry_date;
        open.last_price = pos.last_price;
        open.market_value = pos.shares * pos.last_price;
        result.open_positions.push_back(open);
    }

    analytics::PerformanceAnalyzer analyzer(config_.risk_free_rate, config_.periods_per_year);
    result.metrics = analyzer.analyze(result.equity_curve, result.closed_trades,
                                      result.buy_and_hold_curve, result.market_curve);
    if (result.equity_curve.empty()) {
        result.metrics.initial_value = config_.initial_capital;
        result.metrics.final_value = ledger_->cash();
    }

    const auto ranked = analytics::PerformanceAnalyzer::rankByAverageScore(selected_scores_);
    const size_t count = std::min(PERFORMER_COUNT, ranked.size());
    result.best_performers.assign(ranked.begin(), ranked.begin() + count);
    result.worst_performers.assign(ranked.rbegin(), ranked.rbegin() + count);
}

} // namespace backtest
} // namespace factorsim
