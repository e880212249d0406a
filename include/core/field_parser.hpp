#pragma once

#include "core/airport_database.hpp"
#include "core/extraction_types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Keyword lists, blocklists and proximity settings for OCR text parsing
 *
 * Keyword categories: flight, from, to, date, time, gate, seat, passenger,
 * booking, boarding, departure_time, arrival_time.
 */
struct FieldParserConfig
{
    std::map<std::string, std::vector<std::string>> keywords;
    std::set<std::string> airport_blocklist;
    std::set<std::string> name_blocklist;
    std::set<std::string> booking_ignore_words;
    std::set<std::string> name_titles;
    int keyword_window_lines = 4;
    int min_flight_duration_minutes = 45;
    int status_bar_lines = 2;

    static FieldParserConfig defaults();

    /**
     * @brief Defaults overridden by an `ocr` configuration section
     *
     * Reads `keywords.<category>`, `blocklists.airport_codes`,
     * `blocklists.name_words`, `blocklists.booking_words`, `blocklists.titles`,
     * `keyword_window_lines`, `min_flight_duration_minutes` and `status_bar_lines`.
     * Missing or mistyped entries keep their default.
     */
    static FieldParserConfig fromJson(const nlohmann::json &ocr_section);

    const std::vector<std::string> &keywordsFor(const std::string &category) const;
};

/**
 * @brief A parsed text field together with its confidence
 */
struct ScoredValue
{
    std::string value;
    double confidence = 0.0;
};

struct AirportFields
{
    std::optional<ScoredValue> departure;
    std::optional<ScoredValue> arrival;
};

struct TimeFields
{
    std::optional<ScoredValue> departure;
    std::optional<ScoredValue> arrival;
    std::optional<ScoredValue> boarding;
};

struct DateField
{
    CalendarDate date;
    double confidence = 0.0;
};

struct NameField
{
    Passenger passenger;
    double confidence = 0.0;
};

/**
 * @brief Turns recognized boarding pass text into a scored candidate
 *
 * All finders expect upper-cased lines. Keyword matches are whole-word and
 * a keyword is considered near a value when the value sits on the keyword's
 * line or within `keyword_window_lines` lines below it.
 */
class FieldParser
{
public:
    static constexpr double FLIGHT_KNOWN_CARRIER_CONFIDENCE = 0.9;
    static constexpr double FLIGHT_CONFIDENCE = 0.7;
    static constexpr double AIRPORT_KEYWORD_CONFIDENCE = 0.85;
    static constexpr double AIRPORT_POSITIONAL_CONFIDENCE = 0.6;
    static constexpr double DATE_KEYWORD_CONFIDENCE = 0.85;
    static constexpr double DATE_CONFIDENCE = 0.8;
    static constexpr double TIME_CONFIDENCE = 0.7;
    static constexpr double NAME_KEYWORD_CONFIDENCE = 0.8;
    static constexpr double NAME_CONFIDENCE = 0.6;
    static constexpr double BOOKING_KEYWORD_CONFIDENCE = 0.7;
    static constexpr double BOOKING_CONFIDENCE = 0.5;
    static constexpr double SEAT_KEYWORD_CONFIDENCE = 0.9;
    static constexpr double SEAT_CONFIDENCE = 0.6;

    FieldParser(const FieldParserConfig &config, const AirportLookup &airports);

    /**
     * @brief Parse raw OCR text into an OCR candidate
     *
     * The candidate always carries one flight segment and one passenger entry
     * (possibly empty); only fields that were found appear in its confidence map.
     */
    ExtractionCandidate parse(const std::string &raw_text) const;

    std::optional<ScoredValue> findFlightNumber(const std::vector<std::string> &lines) const;
    AirportFields findAirports(const std::vector<std::string> &lines) const;
    std::optional<DateField> findDate(const std::vector<std::string> &lines) const;
    TimeFields findTimes(const std::vector<std::string> &lines) const;
    std::optional<NameField> findPassengerName(const std::vector<std::string> &lines) const;
    std::optional<ScoredValue> findBookingReference(const std::vector<std::string> &lines,
                                                    const std::string &flight_number,
                                                    const Passenger &passenger) const;
    std::optional<ScoredValue> findSeat(const std::vector<std::string> &lines) const;

    /**
     * @brief Three letters, not blocklisted and present in the airport dataset
     */
    bool isAcceptedAirportCode(const std::string &code) const;

private:
    /**
     * @brief Indices of lines within the proximity window of a keyword of `category`
     */
    std::vector<size_t> linesNearKeyword(const std::vector<std::string> &lines, const std::string &category) const;
    bool lineHasKeyword(const std::string &line, const std::string &category) const;

    std::vector<std::string> airportCodesInLine(const std::string &line) const;
    std::optional<Passenger> nameFromLine(const std::string &line) const;
    std::optional<Passenger> validateName(const std::string &surname, const std::string &first_name) const;

    FieldParserConfig config_;
    const AirportLookup &airports_;
};
