#include "common/Logger.h"
#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "backtest/PriceHistory.h"
#include "backtest/ResultWriter.h"
#include "analytics/RegimeDetector.h"
#include "scoring/ScoreTable.h"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace factorsim;

// Global engine instance (Ctrl+C cancellation)
backtest::BacktestEngine* g_engine = nullptr;

void signalHandler(int signal) {
    if (signal == SIGINT && g_engine) {
        g_engine->requestCancel();
    }
}

namespace {

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string prices_path;
    std::string scores_path;
    std::string out_dir = "results";
    std::string log_dir;
    std::string log_level = "info";
    double deadline_seconds = 0.0;
};

void printUsage() {
    std::cout
        << "Usage: factorsim --config <file> --prices <csv> --scores <csv>\n"
        << "                 [--out <dir>] [--log-dir <dir>] [--log-level <level>]\n"
        << "                 [--deadline-seconds <n>]\n";
}

// Returns false when the arguments are unusable
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--config") {
            if (!next(opts.config_path)) return false;
        } else if (arg == "--prices") {
            if (!next(opts.prices_path)) return false;
        } else if (arg == "--scores") {
            if (!next(opts.scores_path)) return false;
        } else if (arg == "--out") {
            if (!next(opts.out_dir)) return false;
        } else if (arg == "--log-dir") {
            if (!next(opts.log_dir)) return false;
        } else if (arg == "--log-level") {
            if (!next(opts.log_level)) return false;
        } else if (arg == "--deadline-seconds") {
            std::string value;
            if (!next(value)) return false;
            try {
                opts.deadline_seconds = std::stod(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid --deadline-seconds value: " << value << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return !opts.prices_path.empty() && !opts.scores_path.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    try {
        const std::string log_dir = opts.log_dir.empty()
            ? utils::PathUtils::getLogsDir().string()
            : opts.log_dir;
        Logger::getInstance().initialize(log_dir, opts.log_level);

        const auto config = Config::loadFile(opts.config_path);

        auto prices = std::make_shared<backtest::PriceHistory>(
            backtest::PriceHistory::fromCsv(utils::PathUtils::resolveRelativePath(opts.prices_path).string()));
        auto scores = std::make_shared<scoring::ScoreTable>(
            scoring::ScoreTable::fromCsv(utils::PathUtils::resolveRelativePath(opts.scores_path).string()));

        std::shared_ptr<analytics::IRegimeProvider> regime;
        if (config.adaptive_weights.enabled) {
            if (!prices->hasSymbol(config.market_benchmark_symbol)) {
                LOG_WARN("No prices for benchmark {}, regime detection will fall back to static weights",
                         config.market_benchmark_symbol);
            }
            regime = std::make_shared<analytics::RegimeDetector>(
                prices, config.market_benchmark_symbol, config.adaptive_weights);
        }

        backtest::BacktestEngine engine(config, prices, scores, regime);
        if (opts.deadline_seconds > 0.0) {
            engine.setDeadline(std::chrono::steady_clock::now() +
                std::chrono::milliseconds(static_cast<long long>(opts.deadline_seconds * 1000.0)));
        }

        g_engine = &engine;
        std::signal(SIGINT, signalHandler);
        const auto result = engine.run();
        std::signal(SIGINT, SIG_DFL);
        g_engine = nullptr;

        backtest::ResultWriter::write(result, config, opts.out_dir);

        const auto& m = result.metrics;
        std::cout << "\nBacktest result" << (result.truncated ? " (truncated: " + result.truncation_reason + ")" : "") << "\n";
        std::cout << "---------------------------------------------\n";
        std::cout << "Final value:     " << m.final_value << "\n";
        std::cout << "Total return:    " << (m.total_return * 100.0) << "%\n";
        std::cout << "CAGR:            " << (m.cagr * 100.0) << "%\n";
        std::cout << "Sharpe:          " << m.sharpe_ratio << "\n";
        std::cout << "Max drawdown:    " << (m.max_drawdown * 100.0) << "%\n";
        std::cout << "Trades:          " << result.trades.size() << "\n";
        std::cout << "vs buy-and-hold: " << (m.outperformance_vs_benchmark * 100.0) << "%\n";
        std::cout << "Results:         " << opts.out_dir << "\n";
        return 0;
    } catch (const ConfigurationError& e) {
        g_engine = nullptr;
        LOG_ERROR("{}", e.what());
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        g_engine = nullptr;
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
