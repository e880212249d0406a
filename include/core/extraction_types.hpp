#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Field names used as keys of the per-field confidence map
 */
struct FieldNames
{
    static constexpr const char *FLIGHT_NUMBER = "flight_number";
    static constexpr const char *AIRLINE = "airline";
    static constexpr const char *DEPARTURE_AIRPORT = "departure_airport";
    static constexpr const char *ARRIVAL_AIRPORT = "arrival_airport";
    static constexpr const char *FLIGHT_DATE = "flight_date";
    static constexpr const char *DEPARTURE_TIME = "departure_time";
    static constexpr const char *ARRIVAL_TIME = "arrival_time";
    static constexpr const char *BOARDING_TIME = "boarding_time";
    static constexpr const char *SEAT_NUMBER = "seat_number";
    static constexpr const char *PASSENGER_NAME = "passenger_name";
    static constexpr const char *BOOKING_REFERENCE = "booking_reference";
};

using FieldConfidence = std::map<std::string, double>;

/**
 * @brief Calendar date without time zone
 */
struct CalendarDate
{
    int year = 0;
    int month = 0;
    int day = 0;

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    bool isValid() const;
    std::string toIso() const;

    bool operator==(const CalendarDate &other) const
    {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate &other) const { return !(*this == other); }
};

/**
 * @brief One flight leg of an itinerary
 */
struct FlightSegment
{
    std::string flight_number;
    std::optional<std::string> airline;
    std::string departure_airport;
    std::string arrival_airport;
    std::optional<CalendarDate> flight_date;
    std::optional<std::string> departure_time; // HH:MM, 24h
    std::optional<std::string> arrival_time;
    std::optional<std::string> boarding_time;
    std::optional<std::string> seat;

    nlohmann::json toJson() const;
};

struct Passenger
{
    std::string first_name;
    std::string last_name;

    bool empty() const { return first_name.empty() && last_name.empty(); }
    nlohmann::json toJson() const;
};

enum class ExtractionStrategy
{
    BARCODE,
    AI_STRUCTURED,
    OCR
};

/**
 * @brief Tagged identification of the strategy that produced a result
 *
 * Serialized as "barcode:<format>", "ai_structured" or "ocr".
 */
struct ExtractionMethod
{
    ExtractionStrategy strategy = ExtractionStrategy::OCR;
    std::string barcode_format;

    static ExtractionMethod barcode(const std::string &format);
    static ExtractionMethod aiStructured();
    static ExtractionMethod ocr();

    std::string toString() const;

    /**
     * @brief Tie-break rank: barcode > AI > OCR
     */
    int priority() const;
};

std::string strategyName(ExtractionStrategy strategy);

/**
 * @brief Input of a single extraction call
 *
 * A zero timeout means "use the configured default".
 */
struct ExtractionRequest
{
    std::vector<uint8_t> data;
    std::string media_type;
    std::chrono::milliseconds timeout{0};
    std::shared_ptr<std::atomic<bool>> cancel_flag;

    bool isCancelled() const
    {
        return cancel_flag && cancel_flag->load();
    }
};

/**
 * @brief Output record of a single extraction call
 */
struct ExtractionResult
{
    bool success = false;
    std::optional<ExtractionMethod> method;
    std::vector<FlightSegment> flight_segments;
    std::vector<Passenger> passengers;
    std::optional<std::string> booking_reference;
    FieldConfidence field_confidence;
    double overall_confidence = 0.0;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::string raw_text;
    long long processing_time_ms = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Result produced by one strategy before scoring and merge
 */
struct ExtractionCandidate
{
    ExtractionMethod method;
    std::vector<FlightSegment> flight_segments;
    std::vector<Passenger> passengers;
    std::optional<std::string> booking_reference;
    FieldConfidence field_confidence;
    double overall_confidence = 0.0;
    std::vector<std::string> warnings;
    std::string raw_text;

    /**
     * @brief Number of fields with a non-zero confidence
     */
    size_t fieldCount() const;

    /**
     * @brief Like fieldCount(), without fields derived from another field (airline)
     */
    size_t recognizedFieldCount() const;

    /**
     * @brief Mean confidence of the fields counted by recognizedFieldCount()
     */
    double averageFieldConfidence() const;

    double confidenceOf(const std::string &field) const;
};
