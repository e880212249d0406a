#include "core/ai_extractor.hpp"
#include "core/airline_directory.hpp"
#include "core/date_time_utils.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <regex>
#include <set>

namespace
{
    const std::set<std::string> &segmentKeys()
    {
        static const std::set<std::string> keys = {
            "flightNumber", "airline", "departureAirport", "arrivalAirport", "flightDate",
            "departureTime", "arrivalTime", "boardingTime", "seat"};
        return keys;
    }

    const std::set<std::string> &passengerKeys()
    {
        static const std::set<std::string> keys = {"firstName", "lastName"};
        return keys;
    }

    nlohmann::json nullableString()
    {
        return {{"type", nlohmann::json::array({"string", "null"})}};
    }

    std::string validateObject(const nlohmann::json &value, const std::set<std::string> &allowed, const std::string &where)
    {
        if (!value.is_object())
            return where + " is not an object";
        for (auto it = value.begin(); it != value.end(); ++it)
        {
            if (allowed.count(it.key()) == 0)
                return where + " has unexpected member '" + it.key() + "'";
            if (!it.value().is_null() && !it.value().is_string())
                return where + "." + it.key() + " must be a string or null";
        }
        return "";
    }

    // Present, non-blank string member
    std::optional<std::string> stringMember(const nlohmann::json &object, const std::string &key)
    {
        auto it = object.find(key);
        if (it == object.end() || !it->is_string())
            return std::nullopt;
        std::string value = TextUtils::collapseSpaces(TextUtils::trim(it->get<std::string>()));
        if (value.empty())
            return std::nullopt;
        return value;
    }

    // Model replies sometimes fence JSON text in markdown code blocks
    std::string stripCodeFence(const std::string &text)
    {
        std::string trimmed = TextUtils::trim(text);
        if (trimmed.rfind("```", 0) != 0)
            return trimmed;
        size_t first_newline = trimmed.find('\n');
        size_t closing = trimmed.rfind("```");
        if (first_newline == std::string::npos || closing <= first_newline)
            return trimmed;
        return TextUtils::trim(trimmed.substr(first_newline + 1, closing - first_newline - 1));
    }
}

AiStructuredExtractor::AiStructuredExtractor(const AirportLookup &airports) : airports_(airports)
{
}

nlohmann::json AiStructuredExtractor::outputSchema()
{
    nlohmann::json segment_properties;
    for (const auto &key : segmentKeys())
        segment_properties[key] = nullableString();

    nlohmann::json passenger_properties;
    for (const auto &key : passengerKeys())
        passenger_properties[key] = nullableString();

    return {
        {"type", "object"},
        {"additionalProperties", false},
        {"required", {"flightSegments", "passengers", "bookingReference"}},
        {"properties",
         {{"flightSegments",
           {{"type", "array"},
            {"items", {{"type", "object"}, {"additionalProperties", false}, {"properties", segment_properties}}}}},
          {"passengers",
           {{"type", "array"},
            {"items", {{"type", "object"}, {"additionalProperties", false}, {"properties", passenger_properties}}}}},
          {"bookingReference", nullableString()}}}};
}

std::string AiStructuredExtractor::buildPrompt(const nlohmann::json &schema)
{
    std::string prompt =
        "You are reading a photo, screenshot or scan of an airline boarding pass.\n"
        "Extract the flight and passenger data and answer with a single JSON object that follows this schema:\n" +
        schema.dump(2) +
        "\n\nRules:\n"
        "- Airport codes are three letter IATA codes (e.g. FRA, JFK).\n"
        "- flightNumber is the carrier code followed by the number, without spaces (e.g. LH1234).\n"
        "- flightDate is YYYY-MM-DD. Times are 24 hour HH:MM.\n"
        "- boardingTime is the boarding or gate closing time, never the arrival time.\n"
        "- seat is row and letter (e.g. 12A).\n"
        "- Copy passenger names exactly as printed and keep the spaces inside multi-word names. Examples:\n"
        "  \"DUENAS SANABRIA/DIANA LORENA\" -> firstName \"Diana Lorena\", lastName \"Dueñas Sanabria\"\n"
        "  \"VAN DER BERG/JAN\" -> firstName \"Jan\", lastName \"van der Berg\"\n"
        "  \"VON MUELLER/HANS\" -> firstName \"Hans\", lastName \"von Müller\"\n"
        "  \"DE LA CRUZ/MARIE\" -> firstName \"Marie\", lastName \"de la Cruz\"\n"
        "  \"SMITH-JONES/ANNA\" -> firstName \"Anna\", lastName \"Smith-Jones\"\n"
        "  \"DUBOIS/JEAN-PIERRE\" -> firstName \"Jean-Pierre\", lastName \"Dubois\"\n"
        "- Do not include titles such as MR, MRS or MS in names.\n"
        "- Use null for every field that is not present on the boarding pass. Do not guess.\n"
        "- Answer with JSON only, no explanations.\n";
    return prompt;
}

std::optional<nlohmann::json> AiStructuredExtractor::unwrapEnvelope(const nlohmann::json &body, std::string &error)
{
    nlohmann::json current = body;

    if (current.is_string())
    {
        try
        {
            current = nlohmann::json::parse(stripCodeFence(current.get<std::string>()));
        }
        catch (const nlohmann::json::parse_error &e)
        {
            error = std::string("reply is not JSON: ") + e.what();
            return std::nullopt;
        }
    }

    if (!current.is_object())
    {
        error = "reply is not a JSON object";
        return std::nullopt;
    }

    if (current.contains("candidates"))
    {
        try
        {
            const auto &text = current.at("candidates").at(0).at("content").at("parts").at(0).at("text");
            current = nlohmann::json::parse(stripCodeFence(text.get<std::string>()));
        }
        catch (const nlohmann::json::exception &e)
        {
            error = std::string("malformed candidates envelope: ") + e.what();
            return std::nullopt;
        }
    }
    else if (current.contains("result"))
    {
        current = current.at("result");
        if (current.is_string())
            return unwrapEnvelope(current, error);
    }

    if (!current.is_object())
    {
        error = "structured payload is not a JSON object";
        return std::nullopt;
    }
    return current;
}

std::string AiStructuredExtractor::validateSchema(const nlohmann::json &data)
{
    if (!data.is_object())
        return "payload is not an object";

    static const std::set<std::string> top_level = {"flightSegments", "passengers", "bookingReference"};
    for (auto it = data.begin(); it != data.end(); ++it)
    {
        if (top_level.count(it.key()) == 0)
            return "unexpected member '" + it.key() + "'";
    }

    if (!data.contains("flightSegments") || !data["flightSegments"].is_array())
        return "flightSegments must be an array";
    if (!data.contains("passengers") || !data["passengers"].is_array())
        return "passengers must be an array";
    if (data.contains("bookingReference") && !data["bookingReference"].is_null() &&
        !data["bookingReference"].is_string())
        return "bookingReference must be a string or null";

    for (size_t i = 0; i < data["flightSegments"].size(); ++i)
    {
        std::string violation = validateObject(data["flightSegments"][i], segmentKeys(),
                                               "flightSegments[" + std::to_string(i) + "]");
        if (!violation.empty())
            return violation;
    }
    for (size_t i = 0; i < data["passengers"].size(); ++i)
    {
        std::string violation = validateObject(data["passengers"][i], passengerKeys(),
                                               "passengers[" + std::to_string(i) + "]");
        if (!violation.empty())
            return violation;
    }
    return "";
}

std::optional<std::string> AiStructuredExtractor::normalizeFlightNumber(const std::string &value) const
{
    static const std::regex pattern(R"(^([A-Z0-9]{2})0*(\d{1,4})([A-Z]?)$)");

    std::string compact;
    for (char c : TextUtils::toUpper(value))
    {
        if (c != ' ' && c != '-')
            compact += c;
    }

    std::smatch m;
    if (!std::regex_match(compact, m, pattern) || !TextUtils::hasAlpha(m[1].str()))
        return std::nullopt;
    return m[1].str() + m[2].str() + m[3].str();
}

StrategyOutcome AiStructuredExtractor::interpret(const AiServiceResponse &response) const
{
    if (!response.success)
    {
        return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED,
                                          response.timed_out ? "timeout" : "service error",
                                          response.error_message);
    }

    std::string error;
    auto data = unwrapEnvelope(response.body, error);
    if (!data)
        return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, "schema mismatch", error);

    std::string violation = validateSchema(*data);
    if (!violation.empty())
    {
        Logger::warn("AI reply rejected: " + violation);
        return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, "schema mismatch", violation);
    }

    static const std::regex seat_pattern(R"(^0*(\d{1,3})([A-Z])$)");
    static const std::regex booking_pattern(R"(^[A-Z0-9]{5,7}$)");

    ExtractionCandidate candidate;
    candidate.method = ExtractionMethod::aiStructured();
    candidate.raw_text = data->dump();

    for (const auto &item : (*data)["flightSegments"])
    {
        FlightSegment segment;
        std::string prefix = "AI segment " + std::to_string(candidate.flight_segments.size() + 1) + ": ";

        if (auto flight = stringMember(item, "flightNumber"))
        {
            if (auto normalized = normalizeFlightNumber(*flight))
                segment.flight_number = *normalized;
            else
                candidate.warnings.push_back(prefix + "dropped malformed flight number '" + *flight + "'");
        }

        segment.airline = stringMember(item, "airline");
        if (!segment.airline && segment.flight_number.size() >= 2)
            segment.airline = AirlineDirectory::carrierName(segment.flight_number.substr(0, 2));

        auto airportMember = [&](const std::string &key) -> std::string
        {
            auto code = stringMember(item, key);
            if (!code)
                return "";
            std::string upper = TextUtils::toUpper(*code);
            if (!airports_.isValidAirportCode(upper))
            {
                candidate.warnings.push_back(prefix + "dropped unknown airport code '" + *code + "'");
                return "";
            }
            return upper;
        };
        segment.departure_airport = airportMember("departureAirport");
        segment.arrival_airport = airportMember("arrivalAirport");

        if (auto date_text = stringMember(item, "flightDate"))
        {
            segment.flight_date = DateTimeUtils::parseDate(*date_text);
            if (!segment.flight_date)
                candidate.warnings.push_back(prefix + "dropped malformed flight date '" + *date_text + "'");
        }

        auto clockMember = [&](const std::string &key) -> std::optional<std::string>
        {
            auto text = stringMember(item, key);
            if (!text)
                return std::nullopt;
            auto minutes = DateTimeUtils::parseClock(*text);
            if (!minutes)
            {
                candidate.warnings.push_back(prefix + "dropped malformed " + key + " '" + *text + "'");
                return std::nullopt;
            }
            return DateTimeUtils::formatClock(*minutes);
        };
        segment.departure_time = clockMember("departureTime");
        segment.arrival_time = clockMember("arrivalTime");
        segment.boarding_time = clockMember("boardingTime");

        if (auto seat = stringMember(item, "seat"))
        {
            std::string upper = TextUtils::toUpper(*seat);
            std::smatch m;
            if (std::regex_match(upper, m, seat_pattern) && std::stoi(m[1].str()) > 0)
                segment.seat = m[1].str() + m[2].str();
            else
                candidate.warnings.push_back(prefix + "dropped malformed seat '" + *seat + "'");
        }

        bool has_any = !segment.flight_number.empty() || !segment.departure_airport.empty() ||
                       !segment.arrival_airport.empty() || segment.flight_date.has_value();
        if (has_any)
            candidate.flight_segments.push_back(segment);
    }

    for (const auto &item : (*data)["passengers"])
    {
        Passenger passenger;
        passenger.first_name = stringMember(item, "firstName").value_or("");
        passenger.last_name = stringMember(item, "lastName").value_or("");
        if (!passenger.empty())
            candidate.passengers.push_back(passenger);
    }

    if (auto booking = stringMember(*data, "bookingReference"))
    {
        std::string upper = TextUtils::toUpper(*booking);
        if (std::regex_match(upper, booking_pattern))
            candidate.booking_reference = upper;
        else
            candidate.warnings.push_back("AI: dropped malformed booking reference '" + *booking + "'");
    }

    if (!candidate.flight_segments.empty())
    {
        const FlightSegment &first = candidate.flight_segments.front();
        if (!first.flight_number.empty())
            candidate.field_confidence[FieldNames::FLIGHT_NUMBER] = FIELD_CONFIDENCE;
        if (first.airline)
            candidate.field_confidence[FieldNames::AIRLINE] = FIELD_CONFIDENCE;
        if (!first.departure_airport.empty())
            candidate.field_confidence[FieldNames::DEPARTURE_AIRPORT] = FIELD_CONFIDENCE;
        if (!first.arrival_airport.empty())
            candidate.field_confidence[FieldNames::ARRIVAL_AIRPORT] = FIELD_CONFIDENCE;
        if (first.flight_date)
            candidate.field_confidence[FieldNames::FLIGHT_DATE] = FIELD_CONFIDENCE;
        if (first.departure_time)
            candidate.field_confidence[FieldNames::DEPARTURE_TIME] = FIELD_CONFIDENCE;
        if (first.arrival_time)
            candidate.field_confidence[FieldNames::ARRIVAL_TIME] = FIELD_CONFIDENCE;
        if (first.boarding_time)
            candidate.field_confidence[FieldNames::BOARDING_TIME] = FIELD_CONFIDENCE;
        if (first.seat)
            candidate.field_confidence[FieldNames::SEAT_NUMBER] = FIELD_CONFIDENCE;
    }
    if (!candidate.passengers.empty())
        candidate.field_confidence[FieldNames::PASSENGER_NAME] = FIELD_CONFIDENCE;
    if (candidate.booking_reference)
        candidate.field_confidence[FieldNames::BOOKING_REFERENCE] = FIELD_CONFIDENCE;

    if (candidate.field_confidence.empty())
        return StrategyOutcome::ofFailure(ExtractionStrategy::AI_STRUCTURED, "no fields extracted");

    Logger::debug("AI reply accepted with " + std::to_string(candidate.fieldCount()) + " fields");
    return StrategyOutcome::ofCandidate(candidate);
}
