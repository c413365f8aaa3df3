/**
 * @file CalendarDate.cpp
 * @brief Implementation of CalendarDate.
 */

#include "domain/CalendarDate.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace jobledger::domain {

namespace {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

std::optional<int> ParseNumber(const std::string& field, size_t maxDigits) {
    if (field.empty() || field.size() > maxDigits) return std::nullopt;
    int value = 0;
    for (char c : field) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

CalendarDate::CalendarDate(int year, unsigned month, unsigned day)
    : m_year(year), m_month(month), m_day(day) {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        throw std::invalid_argument("Invalid calendar date");
    }
}

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text) {
    std::vector<std::string> fields;
    std::stringstream ss(text);
    std::string field;
    while (std::getline(ss, field, '/')) {
        fields.push_back(field);
    }
    if (fields.size() != 3 || text.back() == '/') return std::nullopt;

    auto month = ParseNumber(fields[0], 2);
    auto day = ParseNumber(fields[1], 2);
    auto year = ParseNumber(fields[2], 4);
    if (!month || !day || !year || fields[2].size() != 4) return std::nullopt;

    if (*year < 1 || *month < 1 || *month > 12 || *day < 1) return std::nullopt;
    if (static_cast<unsigned>(*day) > DaysInMonth(*year, static_cast<unsigned>(*month))) return std::nullopt;

    return CalendarDate(*year, static_cast<unsigned>(*month), static_cast<unsigned>(*day));
}

CalendarDate CalendarDate::ParseOrThrow(const std::string& text) {
    auto date = Parse(text);
    if (!date) {
        throw std::invalid_argument("Date must be in MM/DD/YYYY format: '" + text + "'");
    }
    return *date;
}

CalendarDate CalendarDate::Today() {
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm = ToLocalTime(tt);
    return CalendarDate(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
}

std::string CalendarDate::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02u/%02u/%04d", m_month, m_day, m_year);
    return buffer;
}

long CalendarDate::daysSince(const CalendarDate& from) const {
    return serial() - from.serial();
}

// Days since 1970-01-01 (civil-from-days inverse).
long CalendarDate::serial() const {
    const long y = static_cast<long>(m_year) - (m_month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long mp = (static_cast<long>(m_month) + 9) % 12;
    const long doy = (153 * mp + 2) / 5 + static_cast<long>(m_day) - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace jobledger::domain
