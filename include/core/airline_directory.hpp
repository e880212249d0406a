#pragma once

#include <optional>
#include <string>

/**
 * @brief Lookup of operating carrier names by two letter IATA designator
 */
class AirlineDirectory
{
public:
    static bool isKnownCarrier(const std::string &code);
    static std::optional<std::string> carrierName(const std::string &code);
};
