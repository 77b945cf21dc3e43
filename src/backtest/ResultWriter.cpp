#include "backtest/ResultWriter.h"
#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace factorsim {
namespace backtest {

namespace {

std::string day(Date date) {
    return utils::DateUtils::format(date);
}

nlohmann::json curveToJson(const Curve& curve) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : curve) {
        arr.push_back({{"date", day(p.date)}, {"value", p.value}});
    }
    return arr;
}

nlohmann::json performersToJson(const std::vector<analytics::PerformerScore>& performers) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : performers) {
        arr.push_back({
            {"symbol", p.symbol},
            {"average_score", p.average_score},
            {"appearances", p.appearances}
        });
    }
    return arr;
}

std::ofstream openForWrite(const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("failed to open for writing: " + path);
    }
    return out;
}

} // namespace

nlohmann::json ResultWriter::metricsToJson(const analytics::PerformanceMetrics& m) {
    nlohmann::json exits = nlohmann::json::object();
    for (const auto& [reason, count] : m.trade_stats.exits_by_reason) {
        exits[reason] = count;
    }
    return {
        {"initial_value", m.initial_value},
        {"final_value", m.final_value},
        {"total_return", m.total_return},
        {"cagr", m.cagr},
        {"volatility", m.volatility},
        {"sharpe_ratio", m.sharpe_ratio},
        {"sortino_ratio", m.sortino_ratio},
        {"max_drawdown", m.max_drawdown},
        {"max_drawdown_duration", m.max_drawdown_duration},
        {"calmar_ratio", m.calmar_ratio},
        {"alpha", m.alpha},
        {"beta", m.beta},
        {"information_ratio", m.information_ratio},
        {"win_rate", m.win_rate},
        {"profit_factor", m.profit_factor},
        {"benchmark_return", m.benchmark_return},
        {"market_return", m.market_return},
        {"outperformance_vs_benchmark", m.outperformance_vs_benchmark},
        {"outperformance_vs_market", m.outperformance_vs_market},
        {"periods", m.periods},
        {"trade_stats", {
            {"closed_trades", m.trade_stats.trades},
            {"winning_trades", m.trade_stats.wins},
            {"win_rate", m.trade_stats.winRate()},
            {"profit_factor", m.trade_stats.profitFactor()},
            {"net_profit", m.trade_stats.net_profit},
            {"average_holding_days", m.trade_stats.averageHoldingDays()},
            {"exits_by_reason", exits}
        }}
    };
}

nlohmann::json ResultWriter::tradeToJson(const TradeRecord& t) {
    nlohmann::json j = {
        {"date", day(t.date)},
        {"action", toString(t.action)},
        {"symbol", t.symbol},
        {"shares", t.shares},
        {"price", t.price},
        {"notional", t.notional},
        {"transaction_cost", t.transaction_cost},
        {"composite_score", t.composite_score},
        {"rank", t.rank}
    };
    if (!t.tier.empty()) {
        j["tier"] = t.tier;
    }
    if (t.action == TradeAction::SELL) {
        j["entry_price"] = t.entry_price;
        j["entry_date"] = day(t.entry_date);
        j["holding_days"] = t.holding_days;
        j["pnl"] = t.pnl;
        j["pnl_pct"] = t.pnl_pct;
        j["exit_reason"] = t.exit_reason ? toString(*t.exit_reason) : "";
    }
    if (!t.detail.empty()) {
        j["detail"] = t.detail;
    }
    return j;
}

nlohmann::json ResultWriter::toJson(const BacktestResult& result, const BacktestConfig& config) {
    nlohmann::json j;
    j["start_date"] = day(result.start_date);
    j["end_date"] = day(result.end_date);
    j["last_processed_date"] = day(result.last_processed_date);
    j["truncated"] = result.truncated;
    if (result.truncated) {
        j["truncation_reason"] = result.truncation_reason;
    }

    j["metrics"] = metricsToJson(result.metrics);
    j["final_cash"] = result.final_cash;
    j["defensive_entries"] = result.defensive_entries;
    j["total_transaction_costs"] = result.total_transaction_costs;

    j["equity_curve"] = curveToJson(result.equity_curve);
    j["buy_and_hold_curve"] = curveToJson(result.buy_and_hold_curve);
    j["market_curve"] = curveToJson(result.market_curve);

    j["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        j["trades"].push_back(tradeToJson(t));
    }

    j["rebalances"] = nlohmann::json::array();
    for (const auto& r : result.rebalances) {
        j["rebalances"].push_back({
            {"date", day(r.date)},
            {"selected", r.selected},
            {"scores", r.scores},
            {"target_weights", r.target_weights},
            {"average_score", r.average_score},
            {"regime", r.regime},
            {"weights", {
                {"fundamentals", r.weights.fundamentals},
                {"momentum", r.weights.momentum},
                {"quality", r.weights.quality},
                {"sentiment", r.weights.sentiment}
            }},
            {"target_count", r.target_count},
            {"cash_allocation", r.cash_allocation},
            {"scored", r.scored},
            {"skipped", r.skipped},
            {"vetoed", r.vetoed},
            {"reentry_blocked", r.reentry_blocked},
            {"buys", r.buys},
            {"sells", r.sells},
            {"portfolio_value", r.portfolio_value}
        });
    }

    j["open_positions"] = nlohmann::json::array();
    for (const auto& p : result.open_positions) {
        j["open_positions"].push_back({
            {"symbol", p.symbol},
            {"shares", p.shares},
            {"entry_price", p.entry_price},
            {"entry_date", day(p.entry_date)},
            {"last_price", p.last_price},
            {"market_value", p.market_value}
        });
    }

    j["best_performers"] = performersToJson(result.best_performers);
    j["worst_performers"] = performersToJson(result.worst_performers);

    j["provenance"] = {
        {"engine_version", result.provenance.engine_version},
        {"data_provider", result.provenance.data_provider},
        {"data_limitations", result.provenance.data_limitations},
        {"estimated_bias_impact", result.provenance.estimated_bias_impact},
        {"scoring_notes", result.provenance.scoring_notes}
    };
    j["config"] = Config::toJson(config);
    return j;
}

void ResultWriter::writeTradesCsv(const BacktestResult& result, const std::string& path) {
    auto out = openForWrite(path);
    out << "date,action,symbol,shares,price,notional,transaction_cost,composite_score,rank,"
           "entry_price,entry_date,holding_days,pnl,pnl_pct,exit_reason,detail\n";
    for (const auto& t : result.trades) {
        const bool sell = t.action == TradeAction::SELL;
        out << day(t.date) << ',' << toString(t.action) << ',' << t.symbol << ','
            << std::fixed << std::setprecision(6) << t.shares << ','
            << std::setprecision(4) << t.price << ','
            << std::setprecision(2) << t.notional << ',' << t.transaction_cost << ','
            << t.composite_score << ',' << t.rank << ',';
        if (sell) {
            out << std::setprecision(4) << t.entry_price << ',' << day(t.entry_date) << ','
                << t.holding_days << ',' << std::setprecision(2) << t.pnl << ','
                << std::setprecision(4) << t.pnl_pct << ','
                << (t.exit_reason ? toString(*t.exit_reason) : "");
        } else {
            out << ",,,,,";
        }
        out << ",\"" << t.detail << "\"\n";
    }
}

void ResultWriter::writeEquityCsv(const BacktestResult& result, const std::string& path) {
    auto out = openForWrite(path);
    out << "date,value\n";
    for (const auto& p : result.equity_curve) {
        out << day(p.date) << ',' << std::fixed << std::setprecision(2) << p.value << '\n';
    }
}

void ResultWriter::write(const BacktestResult& result, const BacktestConfig& config, const std::string& out_dir) {
    std::filesystem::create_directories(out_dir);
    const std::filesystem::path dir(out_dir);

    {
        auto out = openForWrite((dir / "result.json").string());
        out << toJson(result, config).dump(2) << "\n";
    }
    writeTradesCsv(result, (dir / "trades.csv").string());
    writeEquityCsv(result, (dir / "equity_curve.csv").string());

    LOG_INFO("Results written to {}", dir.string());
}

} // namespace backtest
} // namespace factorsim
