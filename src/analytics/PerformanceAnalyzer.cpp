#include "analytics/PerformanceAnalyzer.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace factorsim {
namespace analytics {

namespace {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double sampleStd(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    const double m = mean(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return std::sqrt(ss / static_cast<double>(v.size() - 1));
}

} // namespace

PerformanceAnalyzer::PerformanceAnalyzer(double risk_free_rate, double periods_per_year)
    : risk_free_rate_(risk_free_rate)
    , periods_per_year_(periods_per_year > 0.0 ? periods_per_year : 252.0)
{}

std::vector<double> PerformanceAnalyzer::periodicReturns(const Curve& curve) {
    std::vector<double> out;
    for (size_t i = 1; i < curve.size(); ++i) {
        const double prev = curve[i - 1].value;
        if (prev > 0.0) {
            out.push_back(curve[i].value / prev - 1.0);
        }
    }
    return out;
}

double PerformanceAnalyzer::totalReturn(const Curve& curve) {
    if (curve.size() < 2 || curve.front().value <= 0.0) return 0.0;
    return curve.back().value / curve.front().value - 1.0;
}

double PerformanceAnalyzer::cagr(const Curve& curve) const {
    if (curve.size() < 2 || curve.front().value <= 0.0 || curve.back().value <= 0.0) return 0.0;
    const double years = utils::DateUtils::yearsBetween(curve.front().date, curve.back().date);
    if (years <= 0.0) return 0.0;
    return std::pow(curve.back().value / curve.front().value, 1.0 / years) - 1.0;
}

void PerformanceAnalyzer::maxDrawdown(const Curve& curve, double& max_drawdown, int& duration) {
    max_drawdown = 0.0;
    duration = 0;
    double peak = 0.0;
    int under_water = 0;
    for (const auto& p : curve) {
        if (p.value >= peak) {
            peak = p.value;
            under_water = 0;
            continue;
        }
        ++under_water;
        duration = std::max(duration, under_water);
        if (peak > 0.0) {
            max_drawdown = std::max(max_drawdown, (peak - p.value) / peak);
        }
    }
}

TradeStats PerformanceAnalyzer::tradeStats(const std::vector<portfolio::ClosedTrade>& trades) {
    TradeStats stats;
    for (const auto& t : trades) {
        ++stats.trades;
        stats.net_profit += t.pnl;
        stats.total_holding_days += t.holding_days;
        if (t.pnl > 0.0) {
            ++stats.wins;
            stats.gross_profit += t.pnl;
        } else {
            stats.gross_loss_abs += -t.pnl;
        }
        ++stats.exits_by_reason[toString(t.exit_reason)];
    }
    return stats;
}

void PerformanceAnalyzer::alignedReturns(const Curve& a, const Curve& b,
                                         std::vector<double>& ra, std::vector<double>& rb) {
    std::map<Date, double> b_by_date;
    for (const auto& p : b) b_by_date[p.date] = p.value;

    const CurvePoint* prev_a = nullptr;
    double prev_b = 0.0;
    for (const auto& p : a) {
        auto it = b_by_date.find(p.date);
        if (it == b_by_date.end()) continue;
        if (prev_a && prev_a->value > 0.0 && prev_b > 0.0) {
            ra.push_back(p.value / prev_a->value - 1.0);
            rb.push_back(it->second / prev_b - 1.0);
        }
        prev_a = &p;
        prev_b = it->second;
    }
}

void PerformanceAnalyzer::regress(const Curve& equity, const Curve& reference, PerformanceMetrics& m) const {
    std::vector<double> rp, rb;
    alignedReturns(equity, reference, rp, rb);
    if (rp.size() < 2) return;

    const double rf = risk_free_rate_ / periods_per_year_;
    std::vector<double> ep, eb, active;
    for (size_t i = 0; i < rp.size(); ++i) {
        ep.push_back(rp[i] - rf);
        eb.push_back(rb[i] - rf);
        active.push_back(rp[i] - rb[i]);
    }

    const double mp = mean(ep);
    const double mb = mean(eb);
    double cov = 0.0, var = 0.0;
    for (size_t i = 0; i < ep.size(); ++i) {
        cov += (ep[i] - mp) * (eb[i] - mb);
        var += (eb[i] - mb) * (eb[i] - mb);
    }
    if (var > 1e-18) {
        m.beta = cov / var;
        m.alpha = (mp - m.beta * mb) * periods_per_year_;
    }

    const double tracking = sampleStd(active) * std::sqrt(periods_per_year_);
    if (tracking > 1e-12) {
        m.information_ratio = mean(active) * periods_per_year_ / tracking;
    }
}

PerformanceMetrics PerformanceAnalyzer::analyze(
    const Curve& equity_curve,
    const std::vector<portfolio::ClosedTrade>& trades,
    const Curve& buy_and_hold_curve,
    const Curve& market_curve
) const {
    PerformanceMetrics m;
    m.trade_stats = tradeStats(trades);
    if (equity_curve.empty()) {
        return m;
    }

    m.initial_value = equity_curve.front().value;
    m.final_value = equity_curve.back().value;
    m.total_return = totalReturn(equity_curve);
    m.cagr = cagr(equity_curve);

    const auto returns = periodicReturns(equity_curve);
    m.periods = static_cast<int>(returns.size());

    const double annual_mean = mean(returns) * periods_per_year_;
    m.volatility = sampleStd(returns) * std::sqrt(periods_per_year_);
    if (m.volatility > 1e-12) {
        m.sharpe_ratio = (annual_mean - risk_free_rate_) / m.volatility;
    }

    double downside_sq = 0.0;
    double gains = 0.0, losses = 0.0;
    int positive = 0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sq += r * r;
            losses += -r;
        } else if (r > 0.0) {
            gains += r;
            ++positive;
        }
    }
    if (!returns.empty()) {
        const double downside = std::sqrt(downside_sq / returns.size()) * std::sqrt(periods_per_year_);
        if (downside > 1e-12) {
            m.sortino_ratio = (annual_mean - risk_free_rate_) / downside;
        }
        m.win_rate = static_cast<double>(positive) / returns.size();
    }
    m.profit_factor = (losses > 1e-12) ? gains / losses : 0.0;

    maxDrawdown(equity_curve, m.max_drawdown, m.max_drawdown_duration);
    if (m.max_drawdown > 1e-12) {
        m.calmar_ratio = m.cagr / m.max_drawdown;
    }

    m.benchmark_return = totalReturn(buy_and_hold_curve);
    m.market_return = totalReturn(market_curve);
    m.outperformance_vs_benchmark = m.total_return - m.benchmark_return;
    m.outperformance_vs_market = m.total_return - m.market_return;

    regress(equity_curve, market_curve.size() >= 2 ? market_curve : buy_and_hold_curve, m);

    LOG_INFO("Performance: return {:.2f}%, CAGR {:.2f}%, Sharpe {:.2f}, MDD {:.2f}%",
             m.total_return * 100.0, m.cagr * 100.0, m.sharpe_ratio, m.max_drawdown * 100.0);
    return m;
}

std::vector<PerformerScore> PerformanceAnalyzer::rankByAverageScore(
    const std::map<std::string, std::vector<double>>& scores
) {
    std::vector<PerformerScore> out;
    for (const auto& [symbol, values] : scores) {
        if (values.empty()) continue;
        out.push_back(PerformerScore{symbol, mean(values), static_cast<int>(values.size())});
    }
    std::sort(out.begin(), out.end(), [](const PerformerScore& a, const PerformerScore& b) {
        if (a.average_score != b.average_score) {
            return a.average_score > b.average_score;
        }
        return a.symbol < b.symbol;
    });
    return out;
}

} // namespace analytics
} // namespace factorsim
