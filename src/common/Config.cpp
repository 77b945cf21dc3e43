#include "common/Config.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>

namespace factorsim {

namespace {
constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeSymbol(std::string symbol) {
    symbol = trimCopy(symbol);
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

Date parseDateField(const nlohmann::json& section, const char* key) {
    if (!section.contains(key)) {
        throw ConfigurationError(std::string("missing '") + key + "'");
    }
    try {
        return utils::DateUtils::parse(section.at(key).get<std::string>());
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("invalid '") + key + "': " + e.what());
    }
}

bool isFraction(double v) {
    return v > 0.0 && v < 1.0;
}
}

backtest::RebalanceCadence Config::parseCadence(const std::string& value) {
    std::string v = trimCopy(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "weekly") return backtest::RebalanceCadence::WEEKLY;
    if (v == "monthly") return backtest::RebalanceCadence::MONTHLY;
    if (v == "quarterly") return backtest::RebalanceCadence::QUARTERLY;
    throw ConfigurationError("unknown rebalance cadence '" + value + "'");
}

FactorWeights Config::parseWeights(const nlohmann::json& j, const FactorWeights& defaults) {
    FactorWeights w;
    w.fundamentals = j.value("fundamentals", defaults.fundamentals);
    w.momentum = j.value("momentum", defaults.momentum);
    w.quality = j.value("quality", defaults.quality);
    w.sentiment = j.value("sentiment", defaults.sentiment);
    return w;
}

nlohmann::json Config::weightsToJson(const FactorWeights& w) {
    return {
        {"fundamentals", w.fundamentals},
        {"momentum", w.momentum},
        {"quality", w.quality},
        {"sentiment", w.sentiment}
    };
}

backtest::BacktestConfig Config::loadFile(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    LOG_INFO("Config file: {}", config_path.string());

    if (!std::filesystem::exists(config_path)) {
        throw ConfigurationError("config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("config parse error: ") + e.what());
    }

    auto config = fromJson(j);
    LOG_INFO("Config loaded: {} symbols, top_n={}, cadence={}, cost={}",
             config.universe.size(), config.top_n, backtest::toString(config.cadence),
             config.transaction_cost);
    return config;
}

backtest::BacktestConfig Config::fromJson(const nlohmann::json& j) {
    backtest::BacktestConfig config;

    try {
        if (!j.contains("backtest")) {
            throw ConfigurationError("missing 'backtest' section");
        }
        const auto& b = j.at("backtest");
        config.start_date = parseDateField(b, "start_date");
        config.end_date = parseDateField(b, "end_date");

        if (b.contains("universe")) {
            std::set<std::string> seen;
            for (const auto& entry : b.at("universe")) {
                const std::string symbol = normalizeSymbol(entry.get<std::string>());
                if (symbol.empty() || !seen.insert(symbol).second) {
                    continue;
                }
                config.universe.push_back(symbol);
            }
        }

        config.cadence = parseCadence(b.value("rebalance_frequency", std::string("monthly")));
        config.top_n = b.value("top_n", config.top_n);
        config.initial_capital = b.value("initial_capital", config.initial_capital);
        config.transaction_cost = b.value("transaction_cost", config.transaction_cost);
        config.cash_buffer_pct = b.value("cash_buffer_pct", config.cash_buffer_pct);
        config.risk_free_rate = b.value("risk_free_rate", config.risk_free_rate);
        config.periods_per_year = b.value("periods_per_year", config.periods_per_year);
        config.scoring_threads = b.value("scoring_threads", config.scoring_threads);
        config.market_benchmark_symbol = normalizeSymbol(
            b.value("market_benchmark", config.market_benchmark_symbol));
        config.engine_version = b.value("engine_version", config.engine_version);
        config.data_provider = b.value("data_provider", config.data_provider);

        if (j.contains("weights")) {
            config.weights = parseWeights(j.at("weights"), config.weights);
        }

        if (j.contains("adaptive_weights")) {
            const auto& a = j.at("adaptive_weights");
            config.adaptive_weights.enabled = a.value("enabled", false);
            if (a.contains("regimes")) {
                for (const auto& [label, weights] : a.at("regimes").items()) {
                    config.adaptive_weights.regimes[label] = parseWeights(weights, config.weights);
                }
            }
            if (a.contains("profiles")) {
                config.adaptive_weights.profiles.clear();
                for (const auto& [label, profile] : a.at("profiles").items()) {
                    backtest::RegimeProfile p;
                    p.stock_count = profile.value("stock_count", p.stock_count);
                    p.cash_allocation = profile.value("cash_allocation", p.cash_allocation);
                    config.adaptive_weights.profiles[label] = p;
                }
            }
        }

        if (j.contains("risk")) {
            const auto& r = j.at("risk");
            auto& limits = config.risk;
            limits.high_quality_threshold = r.value("high_quality_threshold", limits.high_quality_threshold);
            limits.medium_quality_threshold = r.value("medium_quality_threshold", limits.medium_quality_threshold);
            limits.high_quality_stop_pct = r.value("high_quality_stop_pct", limits.high_quality_stop_pct);
            limits.medium_quality_stop_pct = r.value("medium_quality_stop_pct", limits.medium_quality_stop_pct);
            limits.low_quality_stop_pct = r.value("low_quality_stop_pct", limits.low_quality_stop_pct);
            limits.trailing_stop_pct = r.value("trailing_stop_pct", limits.trailing_stop_pct);
            limits.max_portfolio_drawdown = r.value("max_portfolio_drawdown", limits.max_portfolio_drawdown);
            limits.drawdown_cash_fraction = r.value("drawdown_cash_fraction", limits.drawdown_cash_fraction);
            limits.score_deterioration_points =
                r.value("score_deterioration_points", limits.score_deterioration_points);
        }

        if (j.contains("momentum_veto")) {
            const auto& m = j.at("momentum_veto");
            auto& veto = config.momentum_veto;
            veto.enabled = m.value("enabled", veto.enabled);
            veto.hard_floor = m.value("hard_floor", veto.hard_floor);
            veto.soft_momentum = m.value("soft_momentum", veto.soft_momentum);
            veto.soft_fundamentals = m.value("soft_fundamentals", veto.soft_fundamentals);
            if (m.contains("exemptions")) {
                veto.exemptions.clear();
                for (const auto& symbol : m.at("exemptions")) {
                    veto.exemptions.insert(normalizeSymbol(symbol.get<std::string>()));
                }
            }
        }

        if (j.contains("reentry")) {
            const auto& r = j.at("reentry");
            config.reentry.threshold = r.value("threshold", config.reentry.threshold);
            config.reentry.lookback_days = r.value("lookback_days", config.reentry.lookback_days);
        }

        if (j.contains("sizing")) {
            const auto& s = j.at("sizing");
            auto& tiers = config.sizing;
            tiers.high_score = s.value("high_score", tiers.high_score);
            tiers.high_quality = s.value("high_quality", tiers.high_quality);
            tiers.medium_score = s.value("medium_score", tiers.medium_score);
            tiers.high_weight = s.value("high_weight", tiers.high_weight);
            tiers.medium_weight = s.value("medium_weight", tiers.medium_weight);
            tiers.low_weight = s.value("low_weight", tiers.low_weight);
        }

        if (j.contains("data_limitations")) {
            config.data_limitations.clear();
            for (const auto& [factor, note] : j.at("data_limitations").items()) {
                config.data_limitations[factor] = note.get<std::string>();
            }
        }
        if (j.contains("estimated_bias_impact")) {
            config.estimated_bias_impact = j.at("estimated_bias_impact").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("malformed config value: ") + e.what());
    }

    validate(config);
    return config;
}

nlohmann::json Config::toJson(const backtest::BacktestConfig& config) {
    nlohmann::json j;
    j["backtest"] = {
        {"start_date", utils::DateUtils::format(config.start_date)},
        {"end_date", utils::DateUtils::format(config.end_date)},
        {"universe", config.universe},
        {"rebalance_frequency", backtest::toString(config.cadence)},
        {"top_n", config.top_n},
        {"initial_capital", config.initial_capital},
        {"transaction_cost", config.transaction_cost},
        {"cash_buffer_pct", config.cash_buffer_pct},
        {"risk_free_rate", config.risk_free_rate},
        {"periods_per_year", config.periods_per_year},
        {"scoring_threads", config.scoring_threads},
        {"market_benchmark", config.market_benchmark_symbol},
        {"engine_version", config.engine_version},
        {"data_provider", config.data_provider}
    };
    j["weights"] = weightsToJson(config.weights);

    nlohmann::json regimes = nlohmann::json::object();
    for (const auto& [label, weights] : config.adaptive_weights.regimes) {
        regimes[label] = weightsToJson(weights);
    }
    nlohmann::json profiles = nlohmann::json::object();
    for (const auto& [label, profile] : config.adaptive_weights.profiles) {
        profiles[label] = {
            {"stock_count", profile.stock_count},
            {"cash_allocation", profile.cash_allocation}
        };
    }
    j["adaptive_weights"] = {
        {"enabled", config.adaptive_weights.enabled},
        {"regimes", regimes},
        {"profiles", profiles}
    };

    const auto& r = config.risk;
    j["risk"] = {
        {"high_quality_threshold", r.high_quality_threshold},
        {"medium_quality_threshold", r.medium_quality_threshold},
        {"high_quality_stop_pct", r.high_quality_stop_pct},
        {"medium_quality_stop_pct", r.medium_quality_stop_pct},
        {"low_quality_stop_pct", r.low_quality_stop_pct},
        {"trailing_stop_pct", r.trailing_stop_pct},
        {"max_portfolio_drawdown", r.max_portfolio_drawdown},
        {"drawdown_cash_fraction", r.drawdown_cash_fraction},
        {"score_deterioration_points", r.score_deterioration_points}
    };

    const auto& m = config.momentum_veto;
    j["momentum_veto"] = {
        {"enabled", m.enabled},
        {"hard_floor", m.hard_floor},
        {"soft_momentum", m.soft_momentum},
        {"soft_fundamentals", m.soft_fundamentals},
        {"exemptions", std::vector<std::string>(m.exemptions.begin(), m.exemptions.end())}
    };

    j["reentry"] = {
        {"threshold", config.reentry.threshold},
        {"lookback_days", config.reentry.lookback_days}
    };

    const auto& s = config.sizing;
    j["sizing"] = {
        {"high_score", s.high_score},
        {"high_quality", s.high_quality},
        {"medium_score", s.medium_score},
        {"high_weight", s.high_weight},
        {"medium_weight", s.medium_weight},
        {"low_weight", s.low_weight}
    };

    j["data_limitations"] = config.data_limitations;
    j["estimated_bias_impact"] = config.estimated_bias_impact;
    return j;
}

void Config::validateWeights(const FactorWeights& w, const std::string& label) {
    if (!w.isNonNegative()) {
        throw ConfigurationError(label + " weights must be non-negative");
    }
    if (std::fabs(w.sum() - 1.0) > WEIGHT_SUM_TOLERANCE) {
        throw ConfigurationError(label + " weights must sum to 1.0 (got " + std::to_string(w.sum()) + ")");
    }
}

void Config::validate(const backtest::BacktestConfig& config) {
    if (config.start_date >= config.end_date) {
        throw ConfigurationError("start_date " + utils::DateUtils::format(config.start_date) +
                                 " must be before end_date " + utils::DateUtils::format(config.end_date));
    }
    if (config.universe.empty()) {
        throw ConfigurationError("universe is empty");
    }
    if (config.top_n < 1) {
        throw ConfigurationError("top_n must be at least 1");
    }
    if (static_cast<size_t>(config.top_n) > config.universe.size()) {
        throw ConfigurationError("top_n (" + std::to_string(config.top_n) +
                                 ") exceeds universe size (" + std::to_string(config.universe.size()) + ")");
    }
    if (!(config.initial_capital > 0.0)) {
        throw ConfigurationError("initial_capital must be positive");
    }
    if (config.transaction_cost < 0.0 || config.transaction_cost >= 1.0) {
        throw ConfigurationError("transaction_cost must be in [0, 1)");
    }
    if (config.cash_buffer_pct < 0.0 || config.cash_buffer_pct >= 1.0) {
        throw ConfigurationError("cash_buffer_pct must be in [0, 1)");
    }
    if (!(config.periods_per_year > 0.0)) {
        throw ConfigurationError("periods_per_year must be positive");
    }

    validateWeights(config.weights, "factor");
    for (const auto& [label, weights] : config.adaptive_weights.regimes) {
        validateWeights(weights, "adaptive '" + label + "'");
    }
    for (const auto& [label, profile] : config.adaptive_weights.profiles) {
        if (profile.stock_count < 1) {
            throw ConfigurationError("regime profile '" + label + "' stock_count must be at least 1");
        }
        if (profile.cash_allocation < 0.0 || profile.cash_allocation >= 1.0) {
            throw ConfigurationError("regime profile '" + label + "' cash_allocation must be in [0, 1)");
        }
    }

    const auto& r = config.risk;
    if (!isFraction(r.high_quality_stop_pct) || !isFraction(r.medium_quality_stop_pct) ||
        !isFraction(r.low_quality_stop_pct) || !isFraction(r.trailing_stop_pct)) {
        throw ConfigurationError("stop percentages must be in (0, 1)");
    }
    if (!isFraction(r.max_portfolio_drawdown)) {
        throw ConfigurationError("max_portfolio_drawdown must be in (0, 1)");
    }
    if (r.drawdown_cash_fraction <= 0.0 || r.drawdown_cash_fraction > 1.0) {
        throw ConfigurationError("drawdown_cash_fraction must be in (0, 1]");
    }
    if (r.medium_quality_threshold > r.high_quality_threshold) {
        throw ConfigurationError("medium_quality_threshold must not exceed high_quality_threshold");
    }
    if (r.score_deterioration_points < 0.0) {
        throw ConfigurationError("score_deterioration_points must be non-negative");
    }

    if (config.reentry.lookback_days < 0) {
        throw ConfigurationError("reentry lookback_days must be non-negative");
    }

    const auto& s = config.sizing;
    if (s.high_weight <= 0.0 || s.medium_weight <= 0.0 || s.low_weight <= 0.0) {
        throw ConfigurationError("conviction tier weights must be positive");
    }
}

} // namespace factorsim
