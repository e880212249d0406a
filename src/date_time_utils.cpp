#include "core/date_time_utils.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <regex>

namespace
{
    const std::regex &compactDatePattern()
    {
        static const std::regex pattern(
            R"(\b(\d{1,2})\s*[-/.]?\s*(JAN|FEB|MAR|APR|MAY|JUN|JUL|AUG|SEP|OCT|NOV|DEC)\s*[-/.]?\s*(\d{4}|\d{2})\b)");
        return pattern;
    }

    const std::regex &isoDatePattern()
    {
        static const std::regex pattern(R"(\b(\d{4})[-/.](\d{1,2})[-/.](\d{1,2})\b)");
        return pattern;
    }

    const std::regex &numericDatePattern()
    {
        static const std::regex pattern(R"(\b(\d{1,2})[-/.](\d{1,2})[-/.](\d{2,4})\b)");
        return pattern;
    }

    const std::regex &timePattern()
    {
        static const std::regex pattern(R"(\b(\d{1,2}):(\d{2})\b(\s*\+\s*1\b)?)");
        return pattern;
    }

    bool overlaps(const std::vector<DateMatch> &matches, size_t position, size_t length)
    {
        for (const auto &m : matches)
        {
            size_t end = m.position + m.text.size();
            if (position < end && m.position < position + length)
                return true;
        }
        return false;
    }
}

std::string TimeMatch::toString() const
{
    return DateTimeUtils::formatClock(minutes);
}

CalendarDate DateTimeUtils::today()
{
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    return CalendarDate(local_tm.tm_year + 1900, local_tm.tm_mon + 1, local_tm.tm_mday);
}

long DateTimeUtils::daysSinceEpoch(const CalendarDate &date)
{
    // Civil-from-days inverse over the proleptic Gregorian calendar
    long y = date.year - (date.month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long mp = (date.month + 9) % 12;
    long doy = (153 * mp + 2) / 5 + date.day - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate DateTimeUtils::fromDaysSinceEpoch(long days)
{
    days += 719468;
    long era = (days >= 0 ? days : days - 146096) / 146097;
    long doe = days - era * 146097;
    long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long y = yoe + era * 400;
    long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long mp = (5 * doy + 2) / 153;
    int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    return CalendarDate(static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d);
}

std::optional<CalendarDate> DateTimeUtils::resolveDayOfYear(int day_of_year, const CalendarDate &reference)
{
    if (day_of_year < 1 || day_of_year > 366 || !reference.isValid())
        return std::nullopt;

    const long reference_days = daysSinceEpoch(reference);
    std::optional<CalendarDate> best;
    long best_distance = 0;

    for (int year = reference.year - 1; year <= reference.year + 1; ++year)
    {
        long first = daysSinceEpoch(CalendarDate(year, 1, 1));
        CalendarDate candidate = fromDaysSinceEpoch(first + day_of_year - 1);
        if (candidate.year != year)
            continue;

        long distance = std::labs(daysSinceEpoch(candidate) - reference_days);
        if (!best || distance < best_distance)
        {
            best = candidate;
            best_distance = distance;
        }
    }
    return best;
}

int DateTimeUtils::monthFromAbbreviation(const std::string &abbreviation)
{
    static const char *months[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                   "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
    const std::string upper = TextUtils::toUpper(abbreviation);
    for (int i = 0; i < 12; ++i)
    {
        if (upper == months[i])
            return i + 1;
    }
    return 0;
}

std::vector<DateMatch> DateTimeUtils::findDates(const std::string &text)
{
    std::vector<DateMatch> matches;

    for (auto it = std::sregex_iterator(text.begin(), text.end(), compactDatePattern());
         it != std::sregex_iterator(); ++it)
    {
        const auto &m = *it;
        int day = std::stoi(m[1].str());
        int month = monthFromAbbreviation(m[2].str());
        int year = std::stoi(m[3].str());
        if (m[3].length() == 2)
            year += 2000;
        CalendarDate date(year, month, day);
        if (date.isValid())
            matches.push_back({date, static_cast<size_t>(m.position(0)), m.str(0)});
    }

    for (auto it = std::sregex_iterator(text.begin(), text.end(), isoDatePattern());
         it != std::sregex_iterator(); ++it)
    {
        const auto &m = *it;
        CalendarDate date(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
        size_t position = static_cast<size_t>(m.position(0));
        if (date.isValid() && !overlaps(matches, position, m.length(0)))
            matches.push_back({date, position, m.str(0)});
    }

    for (auto it = std::sregex_iterator(text.begin(), text.end(), numericDatePattern());
         it != std::sregex_iterator(); ++it)
    {
        const auto &m = *it;
        size_t position = static_cast<size_t>(m.position(0));
        if (m[3].length() != 4 || overlaps(matches, position, m.length(0)))
            continue;

        int day = std::stoi(m[1].str());
        int month = std::stoi(m[2].str());
        if (month > 12 && day <= 12)
            std::swap(day, month);
        CalendarDate date(std::stoi(m[3].str()), month, day);
        if (date.isValid())
            matches.push_back({date, position, m.str(0)});
    }

    std::sort(matches.begin(), matches.end(),
              [](const DateMatch &a, const DateMatch &b)
              { return a.position < b.position; });
    return matches;
}

std::optional<CalendarDate> DateTimeUtils::parseDate(const std::string &text)
{
    auto matches = findDates(TextUtils::toUpper(TextUtils::trim(text)));
    if (matches.empty())
        return std::nullopt;
    return matches.front().date;
}

std::vector<TimeMatch> DateTimeUtils::findTimes(const std::string &line)
{
    std::vector<TimeMatch> times;
    for (auto it = std::sregex_iterator(line.begin(), line.end(), timePattern());
         it != std::sregex_iterator(); ++it)
    {
        const auto &m = *it;
        int hours = std::stoi(m[1].str());
        int minutes = std::stoi(m[2].str());
        if (hours > 23 || minutes > 59)
            continue;

        TimeMatch match;
        match.minutes = hours * 60 + minutes;
        match.next_day = m[3].matched;
        match.position = static_cast<size_t>(m.position(0));
        times.push_back(match);
    }
    return times;
}

std::optional<int> DateTimeUtils::parseClock(const std::string &text)
{
    static const std::regex pattern(R"(^\s*(\d{1,2}):(\d{2})\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, pattern))
        return std::nullopt;
    int hours = std::stoi(m[1].str());
    int minutes = std::stoi(m[2].str());
    if (hours > 23 || minutes > 59)
        return std::nullopt;
    return hours * 60 + minutes;
}

std::string DateTimeUtils::formatClock(int minutes)
{
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", (minutes / 60) % 24, minutes % 60);
    return buffer;
}
