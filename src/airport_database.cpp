#include "core/airport_database.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <fstream>

namespace
{
    std::string toLower(const std::string &text)
    {
        std::string result = text;
        std::transform(result.begin(), result.end(), result.begin(), ::tolower);
        return result;
    }

    bool startsWith(const std::string &text, const std::string &prefix)
    {
        return text.compare(0, prefix.size(), prefix) == 0;
    }
}

bool AirportDatabase::loadFromFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::error("Airport database file not found: " + path);
        return false;
    }

    try
    {
        nlohmann::json airports = nlohmann::json::parse(in);
        return loadFromJson(airports);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Error loading airport database " + path + ": " + std::string(e.what()));
        return false;
    }
}

bool AirportDatabase::loadFromJson(const nlohmann::json &airports)
{
    if (!airports.is_array())
    {
        Logger::error("Airport database must be a JSON array");
        return false;
    }

    std::map<std::string, AirportInfo> loaded;
    for (const auto &entry : airports)
    {
        if (!entry.is_object())
            continue;

        AirportInfo info;
        info.iata = TextUtils::toUpper(entry.value("iata", ""));
        if (info.iata.size() != 3 || !TextUtils::isAllAlpha(info.iata))
            continue;

        auto optionalString = [&entry](const char *key)
        {
            auto it = entry.find(key);
            return (it != entry.end() && it->is_string()) ? it->get<std::string>() : std::string();
        };
        info.icao = optionalString("icao");
        info.name = optionalString("name");
        info.city = optionalString("city");
        info.country = optionalString("country");
        loaded[info.iata] = info;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    airports_ = std::move(loaded);
    Logger::info("Loaded " + std::to_string(airports_.size()) + " airports from database");
    return true;
}

bool AirportDatabase::isValidAirportCode(const std::string &code) const
{
    if (code.size() != 3)
        return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return airports_.count(TextUtils::toUpper(code)) > 0;
}

std::optional<AirportInfo> AirportDatabase::lookup(const std::string &code) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = airports_.find(TextUtils::toUpper(code));
    if (it == airports_.end())
        return std::nullopt;
    return it->second;
}

std::vector<AirportInfo> AirportDatabase::search(const std::string &query, size_t limit) const
{
    const std::string trimmed = TextUtils::trim(query);
    if (trimmed.size() < 2)
        return {};

    const std::string query_upper = TextUtils::toUpper(trimmed);
    const std::string query_lower = toLower(trimmed);

    std::vector<std::pair<int, AirportInfo>> scored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[iata, airport] : airports_)
        {
            int score = 0;

            if (iata == query_upper)
                score += 100;
            else if (startsWith(iata, query_upper))
                score += 80;

            const std::string icao = TextUtils::toUpper(airport.icao);
            if (!icao.empty() && icao == query_upper)
                score += 90;
            else if (!icao.empty() && startsWith(icao, query_upper))
                score += 70;

            const std::string city = toLower(airport.city);
            if (city.find(query_lower) != std::string::npos)
            {
                if (city == query_lower)
                    score += 60;
                else if (startsWith(city, query_lower))
                    score += 50;
                else
                    score += 30;
            }

            const std::string name = toLower(airport.name);
            if (name.find(query_lower) != std::string::npos)
                score += startsWith(name, query_lower) ? 40 : 20;

            if (toLower(airport.country).find(query_lower) != std::string::npos)
                score += 10;

            if (score > 0)
                scored.emplace_back(score, airport);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto &a, const auto &b)
                     { return a.first > b.first; });

    std::vector<AirportInfo> results;
    for (const auto &entry : scored)
    {
        if (results.size() >= limit)
            break;
        results.push_back(entry.second);
    }
    return results;
}

size_t AirportDatabase::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return airports_.size();
}
