#include "core/http_ai_extractor_service.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <openssl/evp.h>

HttpAiExtractorService::HttpAiExtractorService(const AiServiceSettings &settings) : settings_(settings)
{
}

std::string HttpAiExtractorService::base64Encode(const std::vector<uint8_t> &data)
{
    if (data.empty())
        return "";

    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]), data.data(),
                                  static_cast<int>(data.size()));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

nlohmann::json HttpAiExtractorService::buildRequestBody(const std::vector<uint8_t> &image,
                                                        const std::string &mime_type,
                                                        const nlohmann::json &schema)
{
    nlohmann::json text_part = {{"text", AiStructuredExtractor::buildPrompt(schema)}};
    nlohmann::json image_part = {{"inline_data", {{"mime_type", mime_type}, {"data", base64Encode(image)}}}};

    return {
        {"contents", nlohmann::json::array({{{"role", "user"}, {"parts", nlohmann::json::array({text_part, image_part})}}})},
        {"generationConfig", {{"temperature", 0}, {"response_mime_type", "application/json"}}}};
}

std::string HttpAiExtractorService::resolvedPath() const
{
    std::string path = settings_.path;
    const std::string placeholder = "{model}";
    size_t pos = path.find(placeholder);
    if (pos != std::string::npos)
        path.replace(pos, placeholder.size(), settings_.model);
    return path;
}

AiServiceResponse HttpAiExtractorService::extractStructured(const std::vector<uint8_t> &image,
                                                            const std::string &mime_type,
                                                            const nlohmann::json &schema,
                                                            std::chrono::milliseconds timeout)
{
    AiServiceResponse response;

    if (settings_.endpoint.empty())
    {
        response.error_message = "AI endpoint not configured";
        return response;
    }
    if (timeout.count() <= 0)
    {
        response.timed_out = true;
        response.error_message = "no time left for the AI call";
        return response;
    }

    httplib::Client client(settings_.endpoint);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    httplib::Headers headers;
    if (!settings_.api_key.empty())
        headers.emplace(settings_.api_key_header, settings_.api_key);

    std::string body = buildRequestBody(image, mime_type, schema).dump();
    std::string path = resolvedPath();

    Logger::debug("Posting " + std::to_string(body.size()) + " bytes to " + settings_.endpoint + path);
    auto started = std::chrono::steady_clock::now();
    auto result = client.Post(path, headers, body, "application/json");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (!result)
    {
        response.error_message = httplib::to_string(result.error());
        response.timed_out = elapsed >= timeout;
        Logger::warn("AI request failed after " + std::to_string(elapsed.count()) + " ms: " + response.error_message);
        return response;
    }

    if (result->status != 200)
    {
        response.error_message = "HTTP " + std::to_string(result->status);
        Logger::warn("AI request returned " + response.error_message);
        return response;
    }

    try
    {
        response.body = nlohmann::json::parse(result->body);
        response.success = true;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        response.error_message = std::string("invalid JSON reply: ") + e.what();
        Logger::warn(response.error_message);
    }
    return response;
}
