#include "common/DateUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace factorsim {
namespace utils {

// Civil calendar conversions after H. Hinnant's days_from_civil / civil_from_days
Date DateUtils::fromCivil(int year, int month, int day) {
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void DateUtils::toCivil(Date date, int& year, int& month, int& day) {
    const long long z = date + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

int DateUtils::daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

Date DateUtils::parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("malformed date: '" + text + "'");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("malformed date: '" + text + "'");
        }
    }

    const int year = std::stoi(text.substr(0, 4));
    const int month = std::stoi(text.substr(5, 2));
    const int day = std::stoi(text.substr(8, 2));
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw std::invalid_argument("invalid calendar date: '" + text + "'");
    }
    return fromCivil(year, month, day);
}

std::string DateUtils::format(Date date) {
    int y = 0, m = 0, d = 0;
    toCivil(date, y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", y, m, d);
    return buffer;
}

Date DateUtils::addMonths(Date date, int months, int anchor_day) {
    int y = 0, m = 0, d = 0;
    toCivil(date, y, m, d);
    int total = (y * 12 + (m - 1)) + months;
    y = total / 12;
    m = total % 12 + 1;
    const int day = std::min(anchor_day, daysInMonth(y, m));
    return fromCivil(y, m, day);
}

} // namespace utils
} // namespace factorsim
