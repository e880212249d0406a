#include "core/field_parser.hpp"
#include "core/airline_directory.hpp"
#include "core/date_time_utils.hpp"
#include "core/text_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <regex>

namespace
{
    std::vector<std::string> upperAll(const std::vector<std::string> &words)
    {
        std::vector<std::string> result;
        result.reserve(words.size());
        for (const auto &word : words)
            result.push_back(TextUtils::toUpper(TextUtils::trim(word)));
        return result;
    }

    std::set<std::string> upperSet(const std::vector<std::string> &words)
    {
        auto upper = upperAll(words);
        return std::set<std::string>(upper.begin(), upper.end());
    }

    std::vector<std::string> stringArray(const nlohmann::json &node)
    {
        std::vector<std::string> result;
        if (!node.is_array())
            return result;
        for (const auto &item : node)
        {
            if (item.is_string())
                result.push_back(item.get<std::string>());
        }
        return result;
    }

    std::string stripLeadingZeros(const std::string &digits)
    {
        size_t first = digits.find_first_not_of('0');
        if (first == std::string::npos)
            return "0";
        return digits.substr(first);
    }

    std::string join(const std::vector<std::string> &tokens)
    {
        std::string result;
        for (const auto &token : tokens)
        {
            if (!result.empty())
                result += ' ';
            result += token;
        }
        return result;
    }

    // Letters (including UTF-8 multi-byte sequences), hyphen, apostrophe and a trailing dot
    bool isNameToken(const std::string &token)
    {
        bool has_letter = false;
        for (size_t i = 0; i < token.size(); ++i)
        {
            unsigned char c = static_cast<unsigned char>(token[i]);
            if (std::isalpha(c) || c >= 0x80)
            {
                has_letter = true;
                continue;
            }
            if (c == '-' || c == '\'')
                continue;
            if (c == '.' && i + 1 == token.size())
                continue;
            return false;
        }
        return has_letter;
    }

    std::string withoutTrailingDot(const std::string &token)
    {
        if (!token.empty() && token.back() == '.')
            return token.substr(0, token.size() - 1);
        return token;
    }

    std::vector<std::string> whitespaceTokens(const std::string &text)
    {
        std::vector<std::string> tokens;
        std::string current;
        for (char ch : text)
        {
            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                if (!current.empty())
                    tokens.push_back(current);
                current.clear();
            }
            else
            {
                current += ch;
            }
        }
        if (!current.empty())
            tokens.push_back(current);
        return tokens;
    }

    struct LineTime
    {
        TimeMatch time;
        size_t line = 0;
    };
}

FieldParserConfig FieldParserConfig::defaults()
{
    FieldParserConfig config;
    config.keywords = {
        {"flight", {"FLIGHT", "FLUG", "VOL", "VUELO", "VOLO", "FLT"}},
        {"from", {"FROM", "DEPARTURE", "DEP", "VON", "DEPART", "ORIGIN", "DPRT", "ABFLUG"}},
        {"to", {"TO", "ARRIVAL", "ARR", "NACH", "DEST", "DESTINATION", "ARVL", "ANKUNFT", "ZIEL"}},
        {"date", {"DATE", "DATUM", "FECHA", "DATA"}},
        {"time", {"TIME", "ZEIT", "HORA", "ORA"}},
        {"gate", {"GATE", "TOR", "PUERTA", "PORTA", "FLUGSTEIG"}},
        {"seat", {"SEAT", "SITZ", "SITZPLATZ", "ASIENTO", "POSTO", "PLACE"}},
        {"passenger", {"PASSENGER", "PASSAGIER", "PASAJERO", "PASSEGGERO", "NAME", "PAX"}},
        {"booking", {"BOOKING", "BUCHUNG", "BUCHUNGSCODE", "RESERVA", "PRENOTAZIONE", "PNR", "CONFIRMATION", "CONF"}},
        {"boarding", {"BOARDING", "BOARD", "BRD", "EINSTIEG", "CLOSE", "CLOSES", "SCHLIESST"}},
        {"departure_time", {"DEP", "DEPARTURE", "DEPARTS", "DEPART", "STD", "ETD", "ABFLUG", "SALIDA"}},
        {"arrival_time", {"ARR", "ARRIVAL", "ARRIVES", "STA", "ETA", "ANKUNFT", "LLEGADA"}}};

    config.airport_blocklist = {
        "THE", "AND", "FOR", "ARE", "BUT", "NOT", "YOU", "ALL", "CAN", "HAD", "HER", "WAS", "ONE", "OUR", "OUT",
        "DEP", "ARR", "STD", "STA", "ETD", "ETA", "ROW", "SEQ", "REF", "PNR", "MSG", "TAX", "FEE", "BAG",
        "BRD", "GTE", "FLT", "PAX", "CLS", "CLA", "ECO", "BUS", "FST", "GRP", "SEC", "PRN", "TKT", "PRE",
        "GAP", "AIR", "VON", "NACH",
        "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC",
        "DOE", "JON", "DAN", "TOM", "PAT", "LEO", "SAM", "JIM", "TIM", "RON", "BEN", "MAX", "RAY"};

    config.name_blocklist = {
        "PASSAGIER", "PASSENGER", "NAME", "KLASSE", "CLASS", "STATUS", "ECONOMY", "BUSINESS", "FIRST",
        "BOARDING", "PASS", "TICKET", "FLIGHT", "GRP", "SITZ", "SEAT", "PRE", "SEC", "NO", "GATE",
        "ZONE", "GROUP", "FROM", "TO", "DATE", "BOOKING", "PNR", "AIRLINES", "AIRWAYS"};

    config.booking_ignore_words = {
        "DATUM", "FLIGHT", "BOARD", "CLASS", "SEAT", "GATE", "ENTRY", "GROUP", "ZONE",
        "START", "FIRST", "PRIOR", "ECONO", "BUSIN", "WORLD", "MILES", "EXTRA", "TOTAL",
        "TAXES", "FARES", "PHONE", "EMAIL", "STATUS", "MEMBER", "SHORT", "LABEL", "INDEX",
        "PRINT", "CHECK", "PASS", "NAME", "DATE", "TIME", "FROM", "DEST",
        "SYDNEY", "PARIS", "MADRID", "LONDON", "ROME", "BERLIN", "MUNICH", "MUNCHEN",
        "BARAJAS", "HEATHROW", "GATWICK", "KENNEDY", "NEWARK", "ORLY", "KLASSE", "TERMINAL"};

    config.name_titles = {"MR", "MRS", "MS", "MISS", "MSTR", "DR", "HERR", "FRAU"};
    return config;
}

FieldParserConfig FieldParserConfig::fromJson(const nlohmann::json &ocr_section)
{
    FieldParserConfig config = defaults();
    if (!ocr_section.is_object())
        return config;

    auto keywords = ocr_section.find("keywords");
    if (keywords != ocr_section.end() && keywords->is_object())
    {
        for (auto it = keywords->begin(); it != keywords->end(); ++it)
        {
            auto words = stringArray(it.value());
            if (!words.empty())
                config.keywords[it.key()] = upperAll(words);
        }
    }

    auto blocklists = ocr_section.find("blocklists");
    if (blocklists != ocr_section.end() && blocklists->is_object())
    {
        auto apply = [&blocklists](const char *key, std::set<std::string> &target)
        {
            auto node = blocklists->find(key);
            if (node != blocklists->end())
            {
                auto words = stringArray(*node);
                if (!words.empty())
                    target = upperSet(words);
            }
        };
        apply("airport_codes", config.airport_blocklist);
        apply("name_words", config.name_blocklist);
        apply("booking_words", config.booking_ignore_words);
        apply("titles", config.name_titles);
    }

    auto readInt = [&ocr_section](const char *key, int &target)
    {
        auto node = ocr_section.find(key);
        if (node != ocr_section.end() && node->is_number_integer() && node->get<int>() >= 0)
            target = node->get<int>();
    };
    readInt("keyword_window_lines", config.keyword_window_lines);
    readInt("min_flight_duration_minutes", config.min_flight_duration_minutes);
    readInt("status_bar_lines", config.status_bar_lines);
    return config;
}

const std::vector<std::string> &FieldParserConfig::keywordsFor(const std::string &category) const
{
    static const std::vector<std::string> empty;
    auto it = keywords.find(category);
    return it == keywords.end() ? empty : it->second;
}

FieldParser::FieldParser(const FieldParserConfig &config, const AirportLookup &airports)
    : config_(config), airports_(airports)
{
}

bool FieldParser::lineHasKeyword(const std::string &line, const std::string &category) const
{
    return TextUtils::containsAnyWord(line, config_.keywordsFor(category));
}

std::vector<size_t> FieldParser::linesNearKeyword(const std::vector<std::string> &lines, const std::string &category) const
{
    std::set<size_t> indices;
    const size_t window = static_cast<size_t>(config_.keyword_window_lines);
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (!lineHasKeyword(lines[i], category))
            continue;
        for (size_t j = i; j < lines.size() && j <= i + window; ++j)
            indices.insert(j);
    }
    return std::vector<size_t>(indices.begin(), indices.end());
}

bool FieldParser::isAcceptedAirportCode(const std::string &code) const
{
    if (code.size() != 3 || !TextUtils::isAllAlpha(code))
        return false;
    const std::string upper = TextUtils::toUpper(code);
    if (config_.airport_blocklist.count(upper) > 0)
        return false;
    return airports_.isValidAirportCode(upper);
}

std::vector<std::string> FieldParser::airportCodesInLine(const std::string &line) const
{
    static const std::regex pattern(R"(\b([A-Z]{3})\b)");
    std::vector<std::string> codes;
    for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it)
    {
        const std::string code = (*it)[1].str();
        if (isAcceptedAirportCode(code))
            codes.push_back(code);
    }
    return codes;
}

std::optional<ScoredValue> FieldParser::findFlightNumber(const std::vector<std::string> &lines) const
{
    static const std::regex pattern(R"(\b([A-Z0-9]{2})\s?(\d{1,4}[A-Z]?)\b)");

    struct Hit
    {
        std::string code;
        std::string number;
        bool near_keyword;
    };
    std::vector<Hit> hits;

    auto near = linesNearKeyword(lines, "flight");
    for (size_t i = 0; i < lines.size(); ++i)
    {
        const std::string &line = lines[i];
        // "GATE B22" is a gate, not a flight
        if (lineHasKeyword(line, "gate") && !lineHasKeyword(line, "flight"))
            continue;

        bool near_keyword = std::binary_search(near.begin(), near.end(), i);
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            const std::string code = (*it)[1].str();
            if (!TextUtils::hasAlpha(code))
                continue;
            std::string number = (*it)[2].str();
            size_t digits_end = number.find_first_not_of("0123456789");
            std::string digits = number.substr(0, digits_end);
            std::string suffix = digits_end == std::string::npos ? "" : number.substr(digits_end);
            hits.push_back({code, stripLeadingZeros(digits) + suffix, near_keyword});
        }
    }

    if (hits.empty())
        return std::nullopt;

    auto pick = [&hits](bool want_known, bool want_near) -> const Hit *
    {
        for (const auto &hit : hits)
        {
            if (want_known && !AirlineDirectory::isKnownCarrier(hit.code))
                continue;
            if (want_near && !hit.near_keyword)
                continue;
            return &hit;
        }
        return nullptr;
    };

    const Hit *chosen = pick(true, true);
    if (!chosen)
        chosen = pick(true, false);
    if (chosen)
        return ScoredValue{chosen->code + chosen->number, FLIGHT_KNOWN_CARRIER_CONFIDENCE};

    chosen = pick(false, true);
    if (!chosen)
        chosen = &hits.front();
    return ScoredValue{chosen->code + chosen->number, FLIGHT_CONFIDENCE};
}

AirportFields FieldParser::findAirports(const std::vector<std::string> &lines) const
{
    AirportFields result;
    const size_t window = static_cast<size_t>(config_.keyword_window_lines);

    for (size_t i = 0; i < lines.size(); ++i)
    {
        bool from_line = !result.departure && lineHasKeyword(lines[i], "from");
        bool to_line = !result.arrival && lineHasKeyword(lines[i], "to");
        if (!from_line && !to_line)
            continue;

        for (size_t j = i; j < lines.size() && j <= i + window; ++j)
        {
            auto codes = airportCodesInLine(lines[j]);
            if (codes.empty())
                continue;
            if (from_line)
                result.departure = ScoredValue{codes.front(), AIRPORT_KEYWORD_CONFIDENCE};
            if (to_line)
                result.arrival = ScoredValue{codes.back(), AIRPORT_KEYWORD_CONFIDENCE};
            break;
        }
    }

    if (result.departure && result.arrival && result.departure->value == result.arrival->value)
        result.arrival.reset();

    if (result.departure && result.arrival)
        return result;

    std::vector<std::string> all_codes;
    for (const auto &line : lines)
    {
        for (const auto &code : airportCodesInLine(line))
        {
            if (std::find(all_codes.begin(), all_codes.end(), code) == all_codes.end())
                all_codes.push_back(code);
        }
    }

    if (!result.departure && !result.arrival)
    {
        if (all_codes.size() >= 2)
        {
            result.departure = ScoredValue{all_codes[0], AIRPORT_POSITIONAL_CONFIDENCE};
            result.arrival = ScoredValue{all_codes[1], AIRPORT_POSITIONAL_CONFIDENCE};
        }
        return result;
    }

    const std::string known = result.departure ? result.departure->value : result.arrival->value;
    for (const auto &code : all_codes)
    {
        if (code == known)
            continue;
        if (!result.departure)
            result.departure = ScoredValue{code, AIRPORT_POSITIONAL_CONFIDENCE};
        else
            result.arrival = ScoredValue{code, AIRPORT_POSITIONAL_CONFIDENCE};
        break;
    }
    return result;
}

std::optional<DateField> FieldParser::findDate(const std::vector<std::string> &lines) const
{
    auto near_date = linesNearKeyword(lines, "date");
    auto near_departure = linesNearKeyword(lines, "departure_time");
    std::vector<size_t> preferred;
    std::set_union(near_date.begin(), near_date.end(), near_departure.begin(), near_departure.end(),
                   std::back_inserter(preferred));

    for (size_t index : preferred)
    {
        auto dates = DateTimeUtils::findDates(lines[index]);
        if (!dates.empty())
            return DateField{dates.front().date, DATE_KEYWORD_CONFIDENCE};
    }

    for (const auto &line : lines)
    {
        auto dates = DateTimeUtils::findDates(line);
        if (!dates.empty())
            return DateField{dates.front().date, DATE_CONFIDENCE};
    }
    return std::nullopt;
}

TimeFields FieldParser::findTimes(const std::vector<std::string> &lines) const
{
    TimeFields result;
    std::optional<LineTime> departure;
    std::optional<LineTime> arrival;
    std::optional<LineTime> boarding;
    std::set<size_t> labelled_lines;

    auto labelLine = [&](size_t i) -> const std::string &
    {
        const std::string &line = lines[i];
        bool labelled = lineHasKeyword(line, "boarding") || lineHasKeyword(line, "gate") ||
                        lineHasKeyword(line, "departure_time") || lineHasKeyword(line, "arrival_time");
        // Labels printed on the line above a row of times
        if (!labelled && i > 0 && DateTimeUtils::findTimes(lines[i - 1]).empty())
            return lines[i - 1];
        return line;
    };

    // First pass: times next to a label
    for (size_t i = 0; i < lines.size(); ++i)
    {
        auto times = DateTimeUtils::findTimes(lines[i]);
        if (times.empty())
            continue;

        const std::string &label = labelLine(i);
        bool is_boarding = lineHasKeyword(label, "boarding") || lineHasKeyword(label, "gate");
        bool is_departure = lineHasKeyword(label, "departure_time");
        bool is_arrival = lineHasKeyword(label, "arrival_time");
        if (!is_boarding && !is_departure && !is_arrival)
            continue;

        labelled_lines.insert(i);
        size_t next = 0;
        if (is_boarding && !boarding)
            boarding = LineTime{times[next++], i};
        if (is_departure && !departure && next < times.size())
            departure = LineTime{times[next++], i};
        if (is_arrival && !arrival && next < times.size())
            arrival = LineTime{times.back(), i};
    }

    // Second pass: positional candidates below the phone status bar
    if (!departure || !arrival)
    {
        std::vector<LineTime> pool;
        for (size_t i = static_cast<size_t>(config_.status_bar_lines); i < lines.size(); ++i)
        {
            if (labelled_lines.count(i) > 0)
                continue;
            auto times = DateTimeUtils::findTimes(lines[i]);
            if (times.empty())
                continue;

            bool is_boarding = lineHasKeyword(lines[i], "boarding") || lineHasKeyword(lines[i], "gate");
            for (const auto &time : times)
            {
                if (is_boarding)
                {
                    if (!boarding)
                        boarding = LineTime{time, i};
                    continue;
                }
                pool.push_back(LineTime{time, i});
            }
        }

        size_t next = 0;
        if (!departure && next < pool.size())
            departure = pool[next++];
        if (!arrival && next < pool.size())
            arrival = pool[next];
    }

    if (departure && arrival)
    {
        int departure_minutes = departure->time.minutes;
        int arrival_minutes = arrival->time.minutes + (arrival->time.next_day ? 24 * 60 : 0);
        if (arrival_minutes - departure_minutes < config_.min_flight_duration_minutes)
        {
            Logger::debug("Discarding arrival " + arrival->time.toString() + ": less than " +
                          std::to_string(config_.min_flight_duration_minutes) + " minutes after departure " +
                          departure->time.toString());
            arrival.reset();
        }
    }

    if (departure)
        result.departure = ScoredValue{departure->time.toString(), TIME_CONFIDENCE};
    if (arrival)
        result.arrival = ScoredValue{arrival->time.toString(), TIME_CONFIDENCE};
    if (boarding)
        result.boarding = ScoredValue{boarding->time.toString(), TIME_CONFIDENCE};
    return result;
}

std::optional<Passenger> FieldParser::validateName(const std::string &surname, const std::string &first_name) const
{
    if (surname.size() < 2 || first_name.size() < 2)
        return std::nullopt;

    const std::string full = surname + " " + first_name;
    if (TextUtils::containsWord(full, "AIRLINES") || TextUtils::containsWord(full, "AIRWAYS"))
        return std::nullopt;

    // "FRA/JFK" is a route, not a name
    if (isAcceptedAirportCode(surname) || isAcceptedAirportCode(first_name))
        return std::nullopt;

    Passenger passenger;
    passenger.last_name = surname;
    passenger.first_name = first_name;
    return passenger;
}

std::optional<Passenger> FieldParser::nameFromLine(const std::string &line) const
{
    // SURNAME/FIRST and "SURNAME, FIRST"
    size_t pos = line.find_first_of("/,");
    while (pos != std::string::npos)
    {
        size_t next = line.find_first_of("/,", pos + 1);
        const std::string left = line.substr(0, pos);
        const std::string right = line.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);

        // Surname: trailing name tokens before the separator
        std::vector<std::string> surname;
        auto left_tokens = whitespaceTokens(left);
        for (auto it = left_tokens.rbegin(); it != left_tokens.rend(); ++it)
        {
            const std::string token = withoutTrailingDot(*it);
            if (!isNameToken(*it) || config_.name_blocklist.count(token) > 0 || config_.name_titles.count(token) > 0)
                break;
            surname.insert(surname.begin(), *it);
        }

        // First name: leading name tokens after it, titles in front skipped
        std::vector<std::string> first;
        bool leading = true;
        for (const auto &raw : whitespaceTokens(right))
        {
            const std::string token = withoutTrailingDot(raw);
            if (config_.name_titles.count(token) > 0)
            {
                if (leading)
                    continue;
                break;
            }
            if (!isNameToken(raw) || config_.name_blocklist.count(token) > 0)
                break;
            first.push_back(raw);
            leading = false;
        }

        auto passenger = validateName(join(surname), join(first));
        if (passenger)
            return passenger;
        pos = next;
    }
    return std::nullopt;
}

std::optional<NameField> FieldParser::findPassengerName(const std::vector<std::string> &lines) const
{
    for (size_t index : linesNearKeyword(lines, "passenger"))
    {
        auto passenger = nameFromLine(lines[index]);
        if (passenger)
            return NameField{*passenger, NAME_KEYWORD_CONFIDENCE};
    }

    for (const auto &line : lines)
    {
        auto passenger = nameFromLine(line);
        if (passenger)
            return NameField{*passenger, NAME_CONFIDENCE};
    }
    return std::nullopt;
}

std::optional<ScoredValue> FieldParser::findBookingReference(const std::vector<std::string> &lines,
                                                             const std::string &flight_number,
                                                             const Passenger &passenger) const
{
    static const std::regex pattern(R"(\b([A-Z0-9]{5,6})\b)");

    auto isKeyword = [this](const std::string &word)
    {
        for (const auto &[category, words] : config_.keywords)
        {
            if (std::find(words.begin(), words.end(), word) != words.end())
                return true;
        }
        return false;
    };

    auto acceptable = [&](const std::string &match)
    {
        if (config_.booking_ignore_words.count(match) > 0 || config_.name_blocklist.count(match) > 0)
            return false;
        if (TextUtils::isAllDigits(match) || isKeyword(match))
            return false;
        return true;
    };

    for (size_t index : linesNearKeyword(lines, "booking"))
    {
        const std::string &line = lines[index];
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            const std::string match = (*it)[1].str();
            if (acceptable(match))
                return ScoredValue{match, BOOKING_KEYWORD_CONFIDENCE};
        }
    }

    const std::string name_text = TextUtils::toUpper(passenger.last_name + " " + passenger.first_name);
    for (const auto &line : lines)
    {
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            const std::string match = (*it)[1].str();
            if (!acceptable(match))
                continue;
            if (!flight_number.empty() && flight_number.find(match) != std::string::npos)
                continue;
            if (TextUtils::containsWord(name_text, match))
                continue;
            std::set<char> distinct(match.begin(), match.end());
            if (distinct.size() <= 2)
                continue;
            return ScoredValue{match, BOOKING_CONFIDENCE};
        }
    }
    return std::nullopt;
}

std::optional<ScoredValue> FieldParser::findSeat(const std::vector<std::string> &lines) const
{
    static const std::regex pattern(R"(\b0*(\d{1,2})\s?([A-K])\b)");

    auto firstSeat = [](const std::string &line) -> std::optional<std::string>
    {
        for (auto it = std::sregex_iterator(line.begin(), line.end(), pattern); it != std::sregex_iterator(); ++it)
        {
            int row = std::stoi((*it)[1].str());
            if (row >= 1)
                return std::to_string(row) + (*it)[2].str();
        }
        return std::nullopt;
    };

    for (size_t index : linesNearKeyword(lines, "seat"))
    {
        auto seat = firstSeat(lines[index]);
        if (seat)
            return ScoredValue{*seat, SEAT_KEYWORD_CONFIDENCE};
    }

    for (const auto &line : lines)
    {
        if (lineHasKeyword(line, "gate") || lineHasKeyword(line, "boarding"))
            continue;
        auto seat = firstSeat(line);
        if (seat)
            return ScoredValue{*seat, SEAT_CONFIDENCE};
    }
    return std::nullopt;
}

ExtractionCandidate FieldParser::parse(const std::string &raw_text) const
{
    ExtractionCandidate candidate;
    candidate.method = ExtractionMethod::ocr();
    candidate.raw_text = raw_text;

    const auto lines = TextUtils::splitLines(TextUtils::toUpper(raw_text));
    FlightSegment segment;
    Passenger passenger;

    if (auto flight = findFlightNumber(lines))
    {
        segment.flight_number = flight->value;
        candidate.field_confidence[FieldNames::FLIGHT_NUMBER] = flight->confidence;
        segment.airline = AirlineDirectory::carrierName(flight->value.substr(0, 2));
        if (segment.airline)
            candidate.field_confidence[FieldNames::AIRLINE] = flight->confidence;
    }

    auto airports = findAirports(lines);
    if (airports.departure)
    {
        segment.departure_airport = airports.departure->value;
        candidate.field_confidence[FieldNames::DEPARTURE_AIRPORT] = airports.departure->confidence;
    }
    if (airports.arrival)
    {
        segment.arrival_airport = airports.arrival->value;
        candidate.field_confidence[FieldNames::ARRIVAL_AIRPORT] = airports.arrival->confidence;
    }

    if (auto date = findDate(lines))
    {
        segment.flight_date = date->date;
        candidate.field_confidence[FieldNames::FLIGHT_DATE] = date->confidence;
    }

    auto times = findTimes(lines);
    if (times.departure)
    {
        segment.departure_time = times.departure->value;
        candidate.field_confidence[FieldNames::DEPARTURE_TIME] = times.departure->confidence;
    }
    if (times.arrival)
    {
        segment.arrival_time = times.arrival->value;
        candidate.field_confidence[FieldNames::ARRIVAL_TIME] = times.arrival->confidence;
    }
    if (times.boarding)
    {
        segment.boarding_time = times.boarding->value;
        candidate.field_confidence[FieldNames::BOARDING_TIME] = times.boarding->confidence;
    }

    if (auto name = findPassengerName(lines))
    {
        passenger = name->passenger;
        candidate.field_confidence[FieldNames::PASSENGER_NAME] = name->confidence;
    }

    if (auto booking = findBookingReference(lines, segment.flight_number, passenger))
    {
        candidate.booking_reference = booking->value;
        candidate.field_confidence[FieldNames::BOOKING_REFERENCE] = booking->confidence;
    }

    if (auto seat = findSeat(lines))
    {
        segment.seat = seat->value;
        candidate.field_confidence[FieldNames::SEAT_NUMBER] = seat->confidence;
    }

    candidate.flight_segments.push_back(segment);
    candidate.passengers.push_back(passenger);
    return candidate;
}
