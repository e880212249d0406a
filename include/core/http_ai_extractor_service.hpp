#pragma once

#include "core/ai_extractor.hpp"
#include <string>

struct AiServiceSettings
{
    std::string endpoint = "https://generativelanguage.googleapis.com";
    std::string path = "/v1beta/models/{model}:generateContent";
    std::string api_key;
    std::string api_key_header = "x-goog-api-key";
    std::string model = "gemini-2.0-flash";
};

/**
 * @brief Generative-model extractor reached over HTTPS with cpp-httplib
 *
 * Posts the prompt and the base64 image as one generateContent request and
 * returns the decoded JSON reply unmodified; unwrapping is left to
 * AiStructuredExtractor.
 */
class HttpAiExtractorService : public AiExtractorService
{
public:
    explicit HttpAiExtractorService(const AiServiceSettings &settings);

    AiServiceResponse extractStructured(const std::vector<uint8_t> &image,
                                        const std::string &mime_type,
                                        const nlohmann::json &schema,
                                        std::chrono::milliseconds timeout) override;

    static nlohmann::json buildRequestBody(const std::vector<uint8_t> &image,
                                           const std::string &mime_type,
                                           const nlohmann::json &schema);

    static std::string base64Encode(const std::vector<uint8_t> &data);

    /**
     * @brief Request path with `{model}` substituted
     */
    std::string resolvedPath() const;

private:
    AiServiceSettings settings_;
};
