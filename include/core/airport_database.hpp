#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct AirportInfo
{
    std::string iata;
    std::string icao;
    std::string name;
    std::string city;
    std::string country;
};

/**
 * @brief Reference airport dataset used to validate extracted airport codes
 */
class AirportLookup
{
public:
    virtual ~AirportLookup() = default;

    virtual bool isValidAirportCode(const std::string &code) const = 0;
    virtual std::optional<AirportInfo> lookup(const std::string &code) const = 0;
};

/**
 * @brief In-memory airport dataset loaded from a JSON array
 *
 * Each element carries `iata`, `icao`, `name`, `city` and `country`. Elements
 * without a three letter IATA code are skipped.
 */
class AirportDatabase : public AirportLookup
{
public:
    AirportDatabase() = default;

    /**
     * @brief Load the dataset from a JSON file, replacing current entries
     * @return false if the file is missing or malformed (current entries are kept)
     */
    bool loadFromFile(const std::string &path);

    /**
     * @brief Load the dataset from an already parsed JSON array
     * @return false if `airports` is not an array
     */
    bool loadFromJson(const nlohmann::json &airports);

    bool isValidAirportCode(const std::string &code) const override;
    std::optional<AirportInfo> lookup(const std::string &code) const override;

    /**
     * @brief Ranked search by IATA/ICAO code, city, airport name and country
     */
    std::vector<AirportInfo> search(const std::string &query, size_t limit = 10) const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, AirportInfo> airports_;
};
