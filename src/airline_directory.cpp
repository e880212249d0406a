#include "core/airline_directory.hpp"
#include "core/text_utils.hpp"
#include <map>

namespace
{
    const std::map<std::string, std::string> &knownCarriers()
    {
        static const std::map<std::string, std::string> carriers = {
            {"AA", "American Airlines"}, {"AC", "Air Canada"}, {"AF", "Air France"},
            {"AV", "Avianca"}, {"AY", "Finnair"}, {"AZ", "ITA Airways"},
            {"BA", "British Airways"}, {"CX", "Cathay Pacific"}, {"DL", "Delta"},
            {"EI", "Aer Lingus"}, {"EK", "Emirates"}, {"EY", "Etihad"},
            {"FR", "Ryanair"}, {"IB", "Iberia"}, {"JJ", "LATAM"},
            {"JL", "Japan Airlines"}, {"KE", "Korean Air"}, {"KL", "KLM"},
            {"LA", "LATAM"}, {"LH", "Lufthansa"}, {"LO", "LOT Polish"},
            {"LX", "Swiss"}, {"NH", "ANA"}, {"OS", "Austrian"},
            {"QF", "Qantas"}, {"QR", "Qatar Airways"}, {"SK", "SAS"},
            {"SQ", "Singapore Airlines"}, {"SU", "Aeroflot"}, {"TK", "Turkish"},
            {"TP", "TAP Portugal"}, {"U2", "easyJet"}, {"UA", "United"},
            {"UX", "Air Europa"}, {"VS", "Virgin Atlantic"}, {"VY", "Vueling"},
            {"W6", "Wizz Air"}, {"WN", "Southwest"}};
        return carriers;
    }
}

bool AirlineDirectory::isKnownCarrier(const std::string &code)
{
    return knownCarriers().count(TextUtils::toUpper(TextUtils::trim(code))) > 0;
}

std::optional<std::string> AirlineDirectory::carrierName(const std::string &code)
{
    const auto &carriers = knownCarriers();
    auto it = carriers.find(TextUtils::toUpper(TextUtils::trim(code)));
    if (it == carriers.end())
        return std::nullopt;
    return it->second;
}
