#pragma once

#include "core/airport_database.hpp"
#include "core/extraction_types.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Mandatory items of one leg of an IATA Bar Coded Boarding Pass
 */
struct BcbpLeg
{
    std::string booking_reference;
    std::string from_airport;
    std::string to_airport;
    std::string carrier;
    std::string flight_number; // numeric part without leading zeros, plus optional suffix
    int day_of_year = 0;
    char compartment = ' ';
    std::string seat; // "12A", empty when not assigned
    std::string check_in_sequence;
    char passenger_status = ' ';
    int conditional_size = 0;
};

/**
 * @brief Decoded mandatory section of a BCBP payload
 */
struct BcbpPayload
{
    char format_code = 'M';
    int number_of_legs = 0;
    std::string last_name;
    std::string first_name;
    char electronic_ticket = ' ';
    std::vector<BcbpLeg> legs;
};

/**
 * @brief Fixed-offset parser for IATA BCBP payloads
 *
 * Layout of the mandatory header (offsets are zero based):
 *   0      format code 'M'
 *   1      number of legs
 *   2-21   passenger name LAST/FIRST, space padded
 *   22     electronic ticket indicator
 * followed per leg by a 37 character block:
 *   +0  booking reference (7)     +7  from (3)       +10 to (3)
 *   +13 carrier (3)               +16 flight (5)     +21 julian date (3)
 *   +24 compartment (1)           +25 seat (4)       +29 check-in seq (5)
 *   +34 passenger status (1)      +35 conditional section size (2, hex)
 * The next leg starts after the conditional section of the previous one.
 */
class BcbpParser
{
public:
    static constexpr size_t HEADER_SIZE = 23;
    static constexpr size_t LEG_SIZE = 37;

    static constexpr double FIELD_CONFIDENCE = 0.95;
    static constexpr double SEAT_CONFIDENCE = 0.9;
    static constexpr double DATE_CONFIDENCE = 0.85;

    /**
     * @param airports Dataset used to validate the airport codes of each leg
     * @param reference_date Date used to resolve the year of the julian flight date
     */
    BcbpParser(const AirportLookup &airports, const CalendarDate &reference_date);

    /**
     * @brief Parse the mandatory section of a payload
     * @return std::nullopt when any mandatory item is malformed
     */
    static std::optional<BcbpPayload> parse(const std::string &payload);

    /**
     * @brief Convert a parsed payload into a scored extraction candidate
     * @param payload Parsed payload
     * @param symbology Barcode format name, e.g. "PDF417"
     * @param raw_text Original payload text
     */
    ExtractionCandidate buildCandidate(const BcbpPayload &payload, const std::string &symbology,
                                       const std::string &raw_text) const;

private:
    static std::optional<BcbpLeg> parseLeg(const std::string &payload, size_t offset);

    const AirportLookup &airports_;
    CalendarDate reference_date_;
};
