#include "backtest/DataHistory.h"
#include <cmath>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "common/DateUtils.h"
#include "common/Logger.h"

namespace factorsim {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string normalizeSymbol(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool isDataRow(const std::vector<std::string>& row) {
    return !row.empty() && !row[0].empty() && std::isdigit(static_cast<unsigned char>(row[0][0]));
}

double parseScore(const std::string& cell) {
    const double v = std::stod(cell);
    if (!std::isfinite(v) || v < 0.0 || v > 100.0) {
        throw std::out_of_range("score outside [0, 100]: " + cell);
    }
    return v;
}

std::ifstream openOrThrow(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw std::runtime_error("failed to open CSV file: " + file_path);
    }
    return file;
}

} // namespace

std::vector<std::string> DataHistory::splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

std::vector<PriceRow> DataHistory::loadPriceCSV(const std::string& file_path) {
    std::vector<PriceRow> rows;
    std::ifstream file = openOrThrow(file_path);

    std::string line;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        const auto row = splitRow(line);
        if (row.size() < 3 || !isDataRow(row)) {
            // Header or malformed row.
            continue;
        }

        try {
            PriceRow r;
            r.date = utils::DateUtils::parse(row[0]);
            r.symbol = normalizeSymbol(row[1]);
            r.close = std::stod(row[2]);
            if (r.symbol.empty() || !std::isfinite(r.close) || !(r.close > 0.0)) {
                throw std::invalid_argument("empty symbol or invalid close");
            }
            rows.push_back(r);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing price row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} price rows from {} ({} skipped)", rows.size(), file_path, skipped);
    return rows;
}

std::vector<ScoreRow> DataHistory::loadScoreCSV(const std::string& file_path) {
    std::vector<ScoreRow> rows;
    std::ifstream file = openOrThrow(file_path);

    std::string line;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        const auto row = splitRow(line);
        if (row.size() < 6 || !isDataRow(row)) {
            continue;
        }

        try {
            ScoreRow r;
            r.date = utils::DateUtils::parse(row[0]);
            r.symbol = normalizeSymbol(row[1]);
            r.scores = FactorScores(parseScore(row[2]), parseScore(row[3]),
                                    parseScore(row[4]), parseScore(row[5]));
            if (r.symbol.empty()) {
                throw std::invalid_argument("empty symbol");
            }
            rows.push_back(r);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Error parsing score row: {} - {}", line, e.what());
        }
    }

    LOG_INFO("Loaded {} score rows from {} ({} skipped)", rows.size(), file_path, skipped);
    return rows;
}

} // namespace backtest
} // namespace factorsim
