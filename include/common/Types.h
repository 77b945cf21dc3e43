#pragma once

#include <optional>
#include <string>
#include <vector>

namespace factorsim {

// Calendar day number, days since 1970-01-01 (see common/DateUtils.h)
using Date = long long;
using Price = double;
using Shares = double;
using Amount = double;

enum class TradeAction { BUY, SELL };

enum class ExitReason {
    REBALANCE_EXIT,
    STOP_LOSS,
    TRAILING_STOP,
    REGIME_REDUCTION
};

std::string toString(TradeAction action);
std::string toString(ExitReason reason);

// Point-in-time factor sub-scores, each in [0, 100]
struct FactorScores {
    double fundamentals;
    double momentum;
    double quality;
    double sentiment;

    FactorScores() : fundamentals(0), momentum(0), quality(0), sentiment(0) {}

    FactorScores(double f, double m, double q, double s)
        : fundamentals(f), momentum(m), quality(q), sentiment(s) {}
};

struct FactorWeights {
    double fundamentals = 0.40;
    double momentum = 0.30;
    double quality = 0.20;
    double sentiment = 0.10;

    double sum() const { return fundamentals + momentum + quality + sentiment; }

    bool isNonNegative() const {
        return fundamentals >= 0.0 && momentum >= 0.0 && quality >= 0.0 && sentiment >= 0.0;
    }

    double composite(const FactorScores& s) const {
        return fundamentals * s.fundamentals
             + momentum * s.momentum
             + quality * s.quality
             + sentiment * s.sentiment;
    }
};

// (date, value) sample of a value series
struct CurvePoint {
    Date date;
    double value;

    CurvePoint() : date(0), value(0) {}
    CurvePoint(Date d, double v) : date(d), value(v) {}
};

using Curve = std::vector<CurvePoint>;

} // namespace factorsim
