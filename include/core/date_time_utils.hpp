#pragma once

#include "core/extraction_types.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief A date found in free text together with its position
 */
struct DateMatch
{
    CalendarDate date;
    size_t position = 0;
    std::string text;
};

/**
 * @brief A clock time found in free text
 */
struct TimeMatch
{
    int minutes = 0;      // minutes since midnight
    bool next_day = false; // trailing "+1" marker
    size_t position = 0;

    std::string toString() const;
};

class DateTimeUtils
{
public:
    /**
     * @brief Today's date in local time
     */
    static CalendarDate today();

    /**
     * @brief Days since 1970-01-01 for a valid date
     */
    static long daysSinceEpoch(const CalendarDate &date);

    static CalendarDate fromDaysSinceEpoch(long days);

    /**
     * @brief Resolve a day-of-year to the calendar date closest to `reference`
     *
     * Candidate years are the reference year and its two neighbours; a day of
     * year that does not exist in a candidate year (366 outside leap years)
     * removes that candidate.
     *
     * @param day_of_year 1..366
     * @param reference Date the result should be closest to
     * @return std::nullopt if no candidate year accepts the day
     */
    static std::optional<CalendarDate> resolveDayOfYear(int day_of_year, const CalendarDate &reference);

    /**
     * @brief Parse a single date string in any supported layout
     *
     * Supported: ISO (2026-01-14), day/month/year with a four digit year
     * (14/01/2026, 14.01.2026) and compact month abbreviation (14JAN26,
     * 14 JAN 2026). Numeric layouts with two digit years are rejected.
     */
    static std::optional<CalendarDate> parseDate(const std::string &text);

    /**
     * @brief Find every valid date in upper-cased free text, in text order
     */
    static std::vector<DateMatch> findDates(const std::string &text);

    /**
     * @brief Find every valid HH:MM clock time in a line, in text order
     */
    static std::vector<TimeMatch> findTimes(const std::string &line);

    /**
     * @brief Parse "HH:MM" (24h) into minutes since midnight
     */
    static std::optional<int> parseClock(const std::string &text);

    static std::string formatClock(int minutes);

    static int monthFromAbbreviation(const std::string &abbreviation);
};
