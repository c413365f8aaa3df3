/**
 * @file CalendarDate.hpp
 * @brief Value Object for the MM/DD/YYYY dates carried by projects.
 */

#pragma once

#include <optional>
#include <string>

namespace jobledger::domain {

/**
 * @class CalendarDate
 * @brief A proleptic Gregorian calendar day.
 *
 * Due dates are persisted as "MM/DD/YYYY" strings; every comparison goes
 * through this type so strings are never compared lexicographically.
 */
class CalendarDate {
public:

    CalendarDate(int year, unsigned month, unsigned day);

    /**
     * @brief Parses "MM/DD/YYYY". Single digit months and days ("1/1/2020") are accepted.
     * @return std::nullopt if the text is not a valid calendar date.
     */
    static std::optional<CalendarDate> Parse(const std::string& text);

    /** @brief Like Parse but throws std::invalid_argument on bad input. */
    static CalendarDate ParseOrThrow(const std::string& text);

    /** @brief The current local date. */
    static CalendarDate Today();

    int year() const { return m_year; }
    unsigned month() const { return m_month; }
    unsigned day() const { return m_day; }

    /** @brief Zero padded "MM/DD/YYYY". */
    std::string toString() const;

    /** @brief Signed number of days from @p from to this date. */
    long daysSince(const CalendarDate& from) const;

    bool operator==(const CalendarDate& other) const { return serial() == other.serial(); }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const { return serial() < other.serial(); }

private:
    long serial() const;

    int m_year;
    unsigned m_month;
    unsigned m_day;
};

} // namespace jobledger::domain
