#include "core/bcbp_parser.hpp"
#include "core/airline_directory.hpp"
#include "core/date_time_utils.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <regex>

namespace
{
    std::string stripLeadingZeros(const std::string &digits)
    {
        size_t first = digits.find_first_not_of('0');
        if (first == std::string::npos)
            return "0";
        return digits.substr(first);
    }

    bool isHexDigit(char c)
    {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }
}

BcbpParser::BcbpParser(const AirportLookup &airports, const CalendarDate &reference_date)
    : airports_(airports), reference_date_(reference_date)
{
}

std::optional<BcbpPayload> BcbpParser::parse(const std::string &payload)
{
    if (payload.size() < HEADER_SIZE + LEG_SIZE)
        return std::nullopt;

    BcbpPayload result;
    result.format_code = payload[0];
    if (result.format_code != 'M')
        return std::nullopt;

    if (!std::isdigit(static_cast<unsigned char>(payload[1])))
        return std::nullopt;
    result.number_of_legs = payload[1] - '0';
    if (result.number_of_legs < 1 || result.number_of_legs > 4)
        return std::nullopt;

    const std::string name = TextUtils::trim(payload.substr(2, 20));
    if (!TextUtils::hasAlpha(name))
        return std::nullopt;
    size_t slash = name.find('/');
    if (slash == std::string::npos)
    {
        result.last_name = name;
    }
    else
    {
        result.last_name = TextUtils::trim(name.substr(0, slash));
        result.first_name = TextUtils::trim(name.substr(slash + 1));
    }
    if (result.last_name.empty())
        return std::nullopt;

    result.electronic_ticket = payload[22];

    size_t offset = HEADER_SIZE;
    for (int i = 0; i < result.number_of_legs; ++i)
    {
        auto leg = parseLeg(payload, offset);
        if (!leg)
            return std::nullopt;

        offset += LEG_SIZE + static_cast<size_t>(leg->conditional_size);
        result.legs.push_back(*leg);

        // Later legs must start inside the payload
        bool last_leg = (i + 1 == result.number_of_legs);
        if (!last_leg && offset + LEG_SIZE > payload.size())
            return std::nullopt;
    }

    return result;
}

std::optional<BcbpLeg> BcbpParser::parseLeg(const std::string &payload, size_t offset)
{
    if (offset + LEG_SIZE > payload.size())
        return std::nullopt;

    static const std::regex flight_pattern(R"(^(\d{1,4})([A-Z]?)$)");
    static const std::regex seat_pattern(R"(^(\d{1,3})([A-Z])$)");

    BcbpLeg leg;

    leg.booking_reference = TextUtils::trim(payload.substr(offset, 7));
    if (!TextUtils::isAlnum(leg.booking_reference))
        return std::nullopt;

    leg.from_airport = payload.substr(offset + 7, 3);
    leg.to_airport = payload.substr(offset + 10, 3);
    if (!TextUtils::isAllAlpha(leg.from_airport) || !TextUtils::isAllAlpha(leg.to_airport))
        return std::nullopt;

    leg.carrier = TextUtils::trim(payload.substr(offset + 13, 3));
    if (leg.carrier.size() < 2 || !TextUtils::isAlnum(leg.carrier) || !TextUtils::hasAlpha(leg.carrier))
        return std::nullopt;

    std::smatch match;
    const std::string flight = TextUtils::trim(payload.substr(offset + 16, 5));
    if (!std::regex_match(flight, match, flight_pattern))
        return std::nullopt;
    leg.flight_number = stripLeadingZeros(match[1].str()) + match[2].str();

    const std::string julian = payload.substr(offset + 21, 3);
    if (!TextUtils::isAllDigits(julian))
        return std::nullopt;
    leg.day_of_year = std::stoi(julian);
    if (leg.day_of_year < 1 || leg.day_of_year > 366)
        return std::nullopt;

    leg.compartment = payload[offset + 24];
    if (!std::isalpha(static_cast<unsigned char>(leg.compartment)))
        return std::nullopt;

    const std::string seat = TextUtils::trim(payload.substr(offset + 25, 4));
    if (!seat.empty())
    {
        if (!std::regex_match(seat, match, seat_pattern))
            return std::nullopt;
        leg.seat = stripLeadingZeros(match[1].str()) + match[2].str();
    }

    leg.check_in_sequence = TextUtils::trim(payload.substr(offset + 29, 5));
    leg.passenger_status = payload[offset + 34];

    const std::string size_field = payload.substr(offset + 35, 2);
    if (!isHexDigit(size_field[0]) || !isHexDigit(size_field[1]))
        return std::nullopt;
    leg.conditional_size = std::stoi(size_field, nullptr, 16);

    return leg;
}

ExtractionCandidate BcbpParser::buildCandidate(const BcbpPayload &payload, const std::string &symbology,
                                               const std::string &raw_text) const
{
    ExtractionCandidate candidate;
    candidate.method = ExtractionMethod::barcode(symbology);
    candidate.raw_text = raw_text;

    bool departure_valid = false;
    bool arrival_valid = false;
    bool date_resolved = false;
    bool seat_present = false;
    bool carrier_known = false;

    for (size_t i = 0; i < payload.legs.size(); ++i)
    {
        const BcbpLeg &leg = payload.legs[i];
        FlightSegment segment;
        segment.flight_number = leg.carrier + leg.flight_number;
        segment.airline = AirlineDirectory::carrierName(leg.carrier);

        if (airports_.isValidAirportCode(leg.from_airport))
        {
            segment.departure_airport = leg.from_airport;
        }
        else
        {
            candidate.warnings.push_back("Barcode departure airport '" + leg.from_airport + "' is not a known airport");
        }

        if (airports_.isValidAirportCode(leg.to_airport))
        {
            segment.arrival_airport = leg.to_airport;
        }
        else
        {
            candidate.warnings.push_back("Barcode arrival airport '" + leg.to_airport + "' is not a known airport");
        }

        segment.flight_date = DateTimeUtils::resolveDayOfYear(leg.day_of_year, reference_date_);
        if (!leg.seat.empty())
            segment.seat = leg.seat;

        if (i == 0)
        {
            departure_valid = !segment.departure_airport.empty();
            arrival_valid = !segment.arrival_airport.empty();
            date_resolved = segment.flight_date.has_value();
            seat_present = segment.seat.has_value();
            carrier_known = segment.airline.has_value();
        }
        candidate.flight_segments.push_back(segment);
    }

    Passenger passenger;
    passenger.first_name = payload.first_name;
    passenger.last_name = payload.last_name;
    candidate.passengers.push_back(passenger);

    if (!payload.legs.empty())
        candidate.booking_reference = payload.legs.front().booking_reference;

    candidate.field_confidence[FieldNames::FLIGHT_NUMBER] = FIELD_CONFIDENCE;
    candidate.field_confidence[FieldNames::PASSENGER_NAME] = FIELD_CONFIDENCE;
    candidate.field_confidence[FieldNames::BOOKING_REFERENCE] = FIELD_CONFIDENCE;
    if (carrier_known)
        candidate.field_confidence[FieldNames::AIRLINE] = FIELD_CONFIDENCE;
    if (departure_valid)
        candidate.field_confidence[FieldNames::DEPARTURE_AIRPORT] = FIELD_CONFIDENCE;
    if (arrival_valid)
        candidate.field_confidence[FieldNames::ARRIVAL_AIRPORT] = FIELD_CONFIDENCE;
    if (date_resolved)
        candidate.field_confidence[FieldNames::FLIGHT_DATE] = DATE_CONFIDENCE;
    if (seat_present)
        candidate.field_confidence[FieldNames::SEAT_NUMBER] = SEAT_CONFIDENCE;

    if (!candidate.flight_segments.empty())
    {
        Logger::debug("BCBP payload parsed: " + std::to_string(payload.legs.size()) + " leg(s), first flight " +
                      candidate.flight_segments.front().flight_number);
    }
    return candidate;
}
