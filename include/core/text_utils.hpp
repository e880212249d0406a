#pragma once

#include <string>
#include <vector>

/**
 * @brief String helpers shared by the payload and text parsers
 */
class TextUtils
{
public:
    static std::string toUpper(const std::string &text);
    static std::string trim(const std::string &text);

    /**
     * @brief Collapse runs of whitespace into single spaces and trim the ends
     */
    static std::string collapseSpaces(const std::string &text);

    static std::vector<std::string> splitLines(const std::string &text);
    static std::vector<std::string> split(const std::string &text, char delimiter);

    /**
     * @brief Check whether `word` occurs in `text` bounded by non-alphanumeric characters
     *
     * Both arguments are compared case-insensitively.
     */
    static bool containsWord(const std::string &text, const std::string &word);

    static bool containsAnyWord(const std::string &text, const std::vector<std::string> &words);

    static bool isAllAlpha(const std::string &text);
    static bool isAllDigits(const std::string &text);
    static bool isAlnum(const std::string &text);
    static bool hasDigit(const std::string &text);
    static bool hasAlpha(const std::string &text);
};
