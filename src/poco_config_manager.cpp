#include "core/poco_config_manager.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::error("Cannot open configuration file: " + path);
        return false;
    }

    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid configuration file " + path + ": " + e.displayText());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (node.is_array())
        {
            for (size_t i = 0; i < node.size(); ++i)
                apply(prefix + "[" + std::to_string(i) + "]", node[i]);
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

// Pipeline configuration getters
std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getAirportDatabasePath() const
{
    return getString("airports.database_path", "data/airports.json");
}

int PocoConfigManager::getDefaultTimeoutMs() const
{
    return getInt("pipeline.default_timeout_ms", 60000);
}

int PocoConfigManager::getMaxProcessingThreads() const
{
    return getInt("pipeline.max_processing_threads", 4);
}

bool PocoConfigManager::isAiEnabled() const
{
    return getBool("ai.enabled", false);
}

bool PocoConfigManager::isOcrEnabled() const
{
    return getBool("ocr.enabled", true);
}

// Configuration validation
bool PocoConfigManager::validateConfig() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isKnownLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    if (getInt("input.max_bytes", 1) <= 0)
    {
        Logger::error("input.max_bytes must be positive");
        return false;
    }

    int dpi = getInt("input.pdf_render_dpi", 200);
    if (dpi < 36 || dpi > 1200)
    {
        Logger::error("Invalid input.pdf_render_dpi: " + std::to_string(dpi));
        return false;
    }

    if (getDefaultTimeoutMs() <= 0)
    {
        Logger::error("pipeline.default_timeout_ms must be positive");
        return false;
    }

    int threads = getMaxProcessingThreads();
    if (threads <= 0 || threads > 256)
    {
        Logger::error("Invalid pipeline.max_processing_threads: " + std::to_string(threads));
        return false;
    }

    double min_confidence = getDouble("ai.min_confidence", 0.6);
    if (min_confidence < 0.0 || min_confidence > 1.0)
    {
        Logger::error("ai.min_confidence must be within [0, 1]");
        return false;
    }

    if (getInt("ai.warning_threshold", 900) > getInt("ai.monthly_limit", 999))
    {
        Logger::warn("ai.warning_threshold is above ai.monthly_limit; the warning alert will never fire");
    }

    return true;
}

nlohmann::json PocoConfigManager::getSection(const std::string &prefix) const
{
    nlohmann::json current = getAll();
    for (const auto &key : TextUtils::split(prefix, '.'))
    {
        if (current.contains(key) && current[key].is_object())
            current = current[key];
        else
            return nlohmann::json::object();
    }
    return current;
}

// Utility methods
void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();

    cfg_->setString("log_level", "INFO");

    // Input defaults
    cfg_->setInt("input.max_bytes", 10 * 1024 * 1024);
    cfg_->setInt("input.pdf_render_dpi", 200);

    // Pipeline defaults
    cfg_->setInt("pipeline.default_timeout_ms", 60000);
    cfg_->setInt("pipeline.max_processing_threads", 4);

    // Barcode defaults
    cfg_->setBool("barcode.enabled", true);
    cfg_->setBool("barcode.try_harder", true);

    // AI extractor defaults
    cfg_->setBool("ai.enabled", false);
    cfg_->setString("ai.endpoint", "https://generativelanguage.googleapis.com");
    cfg_->setString("ai.path", "/v1beta/models/{model}:generateContent");
    cfg_->setString("ai.api_key", "");
    cfg_->setString("ai.api_key_header", "x-goog-api-key");
    cfg_->setString("ai.model", "gemini-2.0-flash");
    cfg_->setInt("ai.timeout_ms", 45000);
    cfg_->setDouble("ai.min_confidence", 0.6);
    cfg_->setString("ai.quota_key", "ai_extraction");
    cfg_->setInt("ai.monthly_limit", 999);
    cfg_->setInt("ai.warning_threshold", 900);

    // OCR defaults; keyword lists and blocklists default in FieldParserConfig
    cfg_->setBool("ocr.enabled", true);
    cfg_->setString("ocr.language", "eng");
    cfg_->setString("ocr.tessdata_path", "");
    cfg_->setInt("ocr.min_fields", 3);
    cfg_->setInt("ocr.upscale_below_px", 1200);
    cfg_->setDouble("ocr.upscale_factor", 2.0);
    cfg_->setInt("ocr.keyword_window_lines", 4);
    cfg_->setInt("ocr.min_flight_duration_minutes", 45);
    cfg_->setInt("ocr.status_bar_lines", 2);

    cfg_->setString("airports.database_path", "data/airports.json");
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}
