#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace factorsim;

namespace {

nlohmann::json baseConfig() {
    return {
        {"backtest", {
            {"start_date", "2023-01-01"},
            {"end_date", "2023-12-31"},
            {"universe", {"aapl", " MSFT ", "JPM", "AAPL"}},
            {"rebalance_frequency", "Quarterly"},
            {"top_n", 2}
        }}
    };
}

// Returns true when fromJson rejects the document with ConfigurationError
bool rejects(const nlohmann::json& j) {
    try {
        Config::fromJson(j);
    } catch (const ConfigurationError& e) {
        std::cout << "[TEST] rejected as expected: " << e.what() << "\n";
        return true;
    }
    return false;
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    const auto config = Config::fromJson(baseConfig());

    // Symbols are trimmed, upper-cased and de-duplicated in order
    if (config.universe.size() != 3 || config.universe[0] != "AAPL" || config.universe[1] != "MSFT") {
        std::cerr << "[TEST] universe not normalized\n";
        return 1;
    }
    if (config.cadence != backtest::RebalanceCadence::QUARTERLY) {
        std::cerr << "[TEST] cadence should be quarterly\n";
        return 1;
    }
    if (config.start_date != utils::DateUtils::fromCivil(2023, 1, 1)) {
        std::cerr << "[TEST] start_date parsed incorrectly\n";
        return 1;
    }

    // Documented defaults
    if (std::abs(config.weights.fundamentals - 0.40) > 1e-12 || std::abs(config.weights.sentiment - 0.10) > 1e-12) {
        std::cerr << "[TEST] default weights wrong\n";
        return 1;
    }
    if (std::abs(config.risk.trailing_stop_pct - 0.20) > 1e-12 ||
        std::abs(config.risk.max_portfolio_drawdown - 0.12) > 1e-12) {
        std::cerr << "[TEST] default risk limits wrong\n";
        return 1;
    }
    if (config.reentry.lookback_days != 90 || std::abs(config.reentry.threshold - 65.0) > 1e-12) {
        std::cerr << "[TEST] default re-entry config wrong\n";
        return 1;
    }
    if (config.momentum_veto.exemptions.count("NVDA") == 0 || config.momentum_veto.exemptions.size() != 7) {
        std::cerr << "[TEST] default exemptions wrong\n";
        return 1;
    }
    if (std::abs(config.transaction_cost - 0.001) > 1e-12 || std::abs(config.cash_buffer_pct - 0.005) > 1e-12) {
        std::cerr << "[TEST] default cost/buffer wrong\n";
        return 1;
    }

    if (std::abs(config.risk.score_deterioration_points - 20.0) > 1e-12) {
        std::cerr << "[TEST] score deterioration exit should default to 20 points\n";
        return 1;
    }
    {
        const auto& profiles = config.adaptive_weights.profiles;
        auto it = profiles.find("BEAR_HIGH");
        if (profiles.size() != 7 || it == profiles.end() || it->second.stock_count != 12 ||
            std::abs(it->second.cash_allocation - 0.40) > 1e-12) {
            std::cerr << "[TEST] default regime profiles wrong\n";
            return 1;
        }
    }

    // Serialized config loads back to the same values
    const auto reloaded = Config::fromJson(Config::toJson(config));
    if (reloaded.universe != config.universe || reloaded.top_n != config.top_n ||
        reloaded.cadence != config.cadence || reloaded.end_date != config.end_date) {
        std::cerr << "[TEST] toJson/fromJson mismatch\n";
        return 1;
    }

    {
        auto j = baseConfig();
        j["weights"] = {{"fundamentals", 0.5}, {"momentum", 0.3}, {"quality", 0.2}, {"sentiment", 0.1}};
        if (!rejects(j)) {
            std::cerr << "[TEST] weights summing to 1.1 should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["weights"] = {{"fundamentals", 1.2}, {"momentum", -0.2}, {"quality", 0.0}, {"sentiment", 0.0}};
        if (!rejects(j)) {
            std::cerr << "[TEST] negative weight should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["backtest"]["top_n"] = 4;
        if (!rejects(j)) {
            std::cerr << "[TEST] top_n above universe size should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["backtest"]["start_date"] = "2024-01-01";
        if (!rejects(j)) {
            std::cerr << "[TEST] inverted date range should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["backtest"]["end_date"] = "2023-02-30";
        if (!rejects(j)) {
            std::cerr << "[TEST] invalid date should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["backtest"]["rebalance_frequency"] = "daily";
        if (!rejects(j)) {
            std::cerr << "[TEST] unknown cadence should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["risk"] = {{"trailing_stop_pct", 1.5}};
        if (!rejects(j)) {
            std::cerr << "[TEST] trailing stop outside (0,1) should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["adaptive_weights"] = {{"enabled", true},
                                 {"regimes", {{"BULL", {{"fundamentals", 0.9}, {"momentum", 0.9}}}}}};
        if (!rejects(j)) {
            std::cerr << "[TEST] malformed adaptive weights should be rejected\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["adaptive_weights"] = {{"enabled", true},
                                 {"profiles", {{"BEAR", {{"stock_count", 5}, {"cash_allocation", 1.0}}}}}};
        if (!rejects(j)) {
            std::cerr << "[TEST] regime profile holding everything in cash should be rejected\n";
            return 1;
        }
        j["adaptive_weights"]["profiles"]["BEAR"] = {{"stock_count", 5}, {"cash_allocation", 0.3}};
        const auto custom = Config::fromJson(j);
        if (custom.adaptive_weights.profiles.size() != 1 ||
            custom.adaptive_weights.profiles.at("BEAR").stock_count != 5) {
            std::cerr << "[TEST] configured profiles should replace the defaults\n";
            return 1;
        }
    }
    {
        auto j = baseConfig();
        j["backtest"]["top_n"] = "ten";
        if (!rejects(j)) {
            std::cerr << "[TEST] non-numeric top_n should be rejected\n";
            return 1;
        }
    }

    // File loading
    const auto path = std::filesystem::temp_directory_path() / "factorsim_test_config.json";
    {
        std::ofstream out(path);
        out << baseConfig().dump(2);
    }
    const auto from_file = Config::loadFile(path.string());
    if (from_file.universe.size() != 3) {
        std::cerr << "[TEST] loadFile returned wrong universe\n";
        return 1;
    }
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool parse_error = false;
    try {
        Config::loadFile(path.string());
    } catch (const ConfigurationError&) {
        parse_error = true;
    }
    if (!parse_error) {
        std::cerr << "[TEST] unparsable file should raise ConfigurationError\n";
        return 1;
    }
    std::filesystem::remove(path);

    bool missing_error = false;
    try {
        Config::loadFile("does/not/exist.json");
    } catch (const ConfigurationError&) {
        missing_error = true;
    }
    if (!missing_error) {
        std::cerr << "[TEST] missing file should raise ConfigurationError\n";
        return 1;
    }

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
