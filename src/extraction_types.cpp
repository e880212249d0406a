#include "core/extraction_types.hpp"
#include <cstdio>

namespace
{
    bool isLeapYear(int year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    template <typename T>
    nlohmann::json optionalToJson(const std::optional<T> &value)
    {
        if (!value)
            return nullptr;
        return *value;
    }
}

bool CalendarDate::isValid() const
{
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1900 || year > 2999 || month < 1 || month > 12 || day < 1)
        return false;
    int max_day = days_in_month[month - 1];
    if (month == 2 && isLeapYear(year))
        max_day = 29;
    return day <= max_day;
}

std::string CalendarDate::toIso() const
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

nlohmann::json FlightSegment::toJson() const
{
    nlohmann::json j;
    j["flightNumber"] = flight_number;
    j["airline"] = optionalToJson(airline);
    j["departureAirport"] = departure_airport.empty() ? nlohmann::json(nullptr) : nlohmann::json(departure_airport);
    j["arrivalAirport"] = arrival_airport.empty() ? nlohmann::json(nullptr) : nlohmann::json(arrival_airport);
    j["flightDate"] = flight_date ? nlohmann::json(flight_date->toIso()) : nlohmann::json(nullptr);
    j["departureTime"] = optionalToJson(departure_time);
    j["arrivalTime"] = optionalToJson(arrival_time);
    j["boardingTime"] = optionalToJson(boarding_time);
    j["seat"] = optionalToJson(seat);
    return j;
}

nlohmann::json Passenger::toJson() const
{
    return {{"firstName", first_name}, {"lastName", last_name}};
}

ExtractionMethod ExtractionMethod::barcode(const std::string &format)
{
    ExtractionMethod method;
    method.strategy = ExtractionStrategy::BARCODE;
    method.barcode_format = format;
    return method;
}

ExtractionMethod ExtractionMethod::aiStructured()
{
    ExtractionMethod method;
    method.strategy = ExtractionStrategy::AI_STRUCTURED;
    return method;
}

ExtractionMethod ExtractionMethod::ocr()
{
    return ExtractionMethod();
}

std::string ExtractionMethod::toString() const
{
    if (strategy == ExtractionStrategy::BARCODE)
        return "barcode:" + barcode_format;
    return strategyName(strategy);
}

int ExtractionMethod::priority() const
{
    switch (strategy)
    {
    case ExtractionStrategy::BARCODE:
        return 3;
    case ExtractionStrategy::AI_STRUCTURED:
        return 2;
    case ExtractionStrategy::OCR:
        return 1;
    }
    return 0;
}

std::string strategyName(ExtractionStrategy strategy)
{
    switch (strategy)
    {
    case ExtractionStrategy::BARCODE:
        return "barcode";
    case ExtractionStrategy::AI_STRUCTURED:
        return "ai_structured";
    case ExtractionStrategy::OCR:
        return "ocr";
    }
    return "unknown";
}

nlohmann::json ExtractionResult::toJson() const
{
    nlohmann::json j;
    j["success"] = success;
    j["method"] = method ? nlohmann::json(method->toString()) : nlohmann::json(nullptr);

    j["flightSegments"] = nlohmann::json::array();
    for (const auto &segment : flight_segments)
        j["flightSegments"].push_back(segment.toJson());

    j["passengers"] = nlohmann::json::array();
    for (const auto &passenger : passengers)
        j["passengers"].push_back(passenger.toJson());

    j["bookingReference"] = optionalToJson(booking_reference);
    j["fieldConfidence"] = field_confidence;
    j["overallConfidence"] = overall_confidence;
    j["warnings"] = warnings;
    j["errors"] = errors;
    j["rawText"] = raw_text;
    j["processingTimeMs"] = processing_time_ms;
    return j;
}

size_t ExtractionCandidate::fieldCount() const
{
    size_t count = 0;
    for (const auto &[field, confidence] : field_confidence)
    {
        if (confidence > 0.0)
            ++count;
    }
    return count;
}

size_t ExtractionCandidate::recognizedFieldCount() const
{
    size_t count = 0;
    for (const auto &[field, confidence] : field_confidence)
    {
        if (confidence > 0.0 && field != FieldNames::AIRLINE)
            ++count;
    }
    return count;
}

double ExtractionCandidate::averageFieldConfidence() const
{
    double sum = 0.0;
    size_t count = 0;
    for (const auto &[field, confidence] : field_confidence)
    {
        if (confidence > 0.0 && field != FieldNames::AIRLINE)
        {
            sum += confidence;
            ++count;
        }
    }
    return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

double ExtractionCandidate::confidenceOf(const std::string &field) const
{
    auto it = field_confidence.find(field);
    return it == field_confidence.end() ? 0.0 : it->second;
}
