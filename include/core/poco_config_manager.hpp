#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    double getDouble(const std::string &key, double def = 0.0) const;

    // Pipeline configuration getters
    std::string getLogLevel() const;
    std::string getAirportDatabasePath() const;
    int getDefaultTimeoutMs() const;
    int getMaxProcessingThreads() const;
    bool isAiEnabled() const;
    bool isOcrEnabled() const;

    // Configuration validation
    bool validateConfig() const;

    /**
     * @brief One configuration section (e.g. "ocr", "ai") as JSON; empty object when absent
     */
    nlohmann::json getSection(const std::string &prefix) const;

    // Utility methods
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
