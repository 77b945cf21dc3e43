#pragma once

#include "common/Types.h"
#include <string>

namespace factorsim {
namespace utils {

class DateUtils {
public:
    // Days since 1970-01-01 for a proleptic Gregorian date
    static Date fromCivil(int year, int month, int day);
    static void toCivil(Date date, int& year, int& month, int& day);

    // "YYYY-MM-DD"; throws std::invalid_argument on malformed input
    static Date parse(const std::string& text);
    static std::string format(Date date);

    // Calendar month stepping anchored on anchor_day (clamped to month length)
    static Date addMonths(Date date, int months, int anchor_day);

    static int daysInMonth(int year, int month);
    static double yearsBetween(Date from, Date to) { return static_cast<double>(to - from) / 365.25; }
};

} // namespace utils
} // namespace factorsim
