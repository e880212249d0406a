#pragma once

#include "core/airport_database.hpp"
#include "core/strategy_outcome.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Raw reply of an AI extractor service call
 */
struct AiServiceResponse
{
    bool success = false;
    std::string error_message;
    bool timed_out = false;
    nlohmann::json body;
};

/**
 * @brief External generative model that turns an image into structured JSON
 */
class AiExtractorService
{
public:
    virtual ~AiExtractorService() = default;

    /**
     * @brief Request structured data for one image
     * @param image Encoded image bytes
     * @param mime_type Media type of `image`
     * @param schema JSON schema the reply must follow
     * @param timeout Hard limit for the whole call
     */
    virtual AiServiceResponse extractStructured(const std::vector<uint8_t> &image,
                                                const std::string &mime_type,
                                                const nlohmann::json &schema,
                                                std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Prompt, schema and strict validation for AI-structured extraction
 */
class AiStructuredExtractor
{
public:
    static constexpr double FIELD_CONFIDENCE = 0.9;

    explicit AiStructuredExtractor(const AirportLookup &airports);

    /**
     * @brief Output schema: flight segments, passengers and booking reference
     */
    static nlohmann::json outputSchema();

    /**
     * @brief Instruction text sent alongside the image
     *
     * Embeds the schema and worked name examples so multi-word surnames,
     * particles and hyphenated names keep their internal spacing.
     */
    static std::string buildPrompt(const nlohmann::json &schema);

    /**
     * @brief Extract the structured object from a service reply
     *
     * Accepts the object itself, an object wrapped in `result`, or JSON text
     * inside a `candidates[0].content.parts[0].text` envelope.
     *
     * @param error Set to the reason when nothing could be unwrapped
     */
    static std::optional<nlohmann::json> unwrapEnvelope(const nlohmann::json &body, std::string &error);

    /**
     * @brief Check the structural shape of an unwrapped object
     * @return Empty string when valid, otherwise the first violation
     */
    static std::string validateSchema(const nlohmann::json &data);

    /**
     * @brief Unwrap, validate and convert a service reply into a candidate
     *
     * Schema violations are strategy failures. Individual values that fail
     * format or dataset checks are dropped with a warning.
     */
    StrategyOutcome interpret(const AiServiceResponse &response) const;

private:
    std::optional<std::string> normalizeFlightNumber(const std::string &value) const;

    const AirportLookup &airports_;
};
