#include "analytics/PerformanceAnalyzer.h"
#include "common/Logger.h"

#include <cmath>
#include <iostream>

using namespace factorsim;
using factorsim::analytics::PerformanceAnalyzer;

namespace {
bool near(double a, double b, double tol) {
    return std::abs(a - b) <= tol;
}

Curve makeCurve(const std::vector<double>& values) {
    Curve c;
    for (size_t i = 0; i < values.size(); ++i) {
        c.emplace_back(static_cast<Date>(i), values[i]);
    }
    return c;
}
}

int main() {
    spdlog::set_level(spdlog::level::off);

    PerformanceAnalyzer analyzer(0.0, 252.0);

    // CAGR over calendar years
    {
        Curve two_years;
        two_years.emplace_back(0, 100.0);
        two_years.emplace_back(730, 121.0);
        if (!near(analyzer.cagr(two_years), 0.10, 1e-3)) {
            std::cerr << "[TEST] CAGR " << analyzer.cagr(two_years) << " != ~0.10\n";
            return 1;
        }
    }

    // Drawdown, win rate, profit factor, outperformance
    {
        const Curve equity = makeCurve({100.0, 120.0, 90.0, 95.0, 130.0});
        const Curve bench = makeCurve({100.0, 102.0, 104.0, 106.0, 110.0});
        const auto m = analyzer.analyze(equity, {}, bench, {});

        if (!near(m.max_drawdown, 0.25, 1e-12) || m.max_drawdown_duration != 2) {
            std::cerr << "[TEST] max drawdown " << m.max_drawdown << " / " << m.max_drawdown_duration << "\n";
            return 1;
        }
        if (!near(m.calmar_ratio / (m.cagr / 0.25), 1.0, 1e-9)) {
            std::cerr << "[TEST] Calmar should be CAGR / max drawdown\n";
            return 1;
        }
        if (!near(m.total_return, 0.30, 1e-12) || !near(m.outperformance_vs_benchmark, 0.20, 1e-12)) {
            std::cerr << "[TEST] outperformance vs buy-and-hold wrong\n";
            return 1;
        }
        if (!near(m.win_rate, 0.75, 1e-12) || m.periods != 4) {
            std::cerr << "[TEST] win rate of periodic returns wrong\n";
            return 1;
        }
        const double gains = 0.2 + (95.0 / 90.0 - 1.0) + (130.0 / 95.0 - 1.0);
        if (!near(m.profit_factor, gains / 0.25, 1e-9)) {
            std::cerr << "[TEST] profit factor wrong\n";
            return 1;
        }
        if (!(m.sortino_ratio > m.sharpe_ratio) || !(m.volatility > 0.0)) {
            std::cerr << "[TEST] one loss in four periods should favour Sortino over Sharpe\n";
            return 1;
        }
    }

    // Flat equity: no volatility, no ratios
    {
        const auto m = analyzer.analyze(makeCurve({100.0, 100.0, 100.0}), {}, {}, {});
        if (m.volatility != 0.0 || m.sharpe_ratio != 0.0 || m.max_drawdown != 0.0) {
            std::cerr << "[TEST] flat curve should have zero risk metrics\n";
            return 1;
        }
    }

    // Alpha/beta against a reference moving at half the speed
    {
        const std::vector<double> bench_returns{0.01, -0.02, 0.015, 0.005, -0.01, 0.02};
        std::vector<double> bench{100.0}, equity{100.0};
        for (double r : bench_returns) {
            bench.push_back(bench.back() * (1.0 + r));
            equity.push_back(equity.back() * (1.0 + 2.0 * r));
        }
        const auto m = analyzer.analyze(makeCurve(equity), {}, makeCurve(bench), {});
        if (!near(m.beta, 2.0, 1e-9) || !near(m.alpha, 0.0, 1e-9)) {
            std::cerr << "[TEST] beta " << m.beta << " alpha " << m.alpha << "\n";
            return 1;
        }

        // Market curve takes precedence for the regression when present
        const auto with_market = analyzer.analyze(makeCurve(equity), {}, makeCurve(equity), makeCurve(bench));
        if (!near(with_market.beta, 2.0, 1e-9)) {
            std::cerr << "[TEST] regression should use the market curve\n";
            return 1;
        }
    }

    // Closed-trade statistics
    {
        portfolio::ClosedTrade win;
        win.pnl = 100.0;
        win.holding_days = 10;
        win.exit_reason = ExitReason::REBALANCE_EXIT;
        portfolio::ClosedTrade loss;
        loss.pnl = -50.0;
        loss.holding_days = 20;
        loss.exit_reason = ExitReason::STOP_LOSS;

        const auto stats = PerformanceAnalyzer::tradeStats({win, loss});
        if (stats.trades != 2 || stats.wins != 1 || !near(stats.profitFactor(), 2.0, 1e-12) ||
            !near(stats.averageHoldingDays(), 15.0, 1e-12) || stats.exits_by_reason.at("stop_loss") != 1) {
            std::cerr << "[TEST] trade stats wrong\n";
            return 1;
        }
    }

    // Best/worst performers by average score
    {
        const auto ranked = PerformanceAnalyzer::rankByAverageScore({
            {"C", {50.0}},
            {"B", {85.0}},
            {"A", {80.0, 90.0}}
        });
        if (ranked.size() != 3 || ranked[0].symbol != "A" || ranked[1].symbol != "B" ||
            ranked[2].symbol != "C" || ranked[0].appearances != 2) {
            std::cerr << "[TEST] performer ranking wrong\n";
            return 1;
        }
    }

    std::cout << "[TEST] PerformanceAnalyzer PASSED\n";
    return 0;
}
