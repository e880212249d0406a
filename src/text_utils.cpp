#include "core/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

std::string TextUtils::toUpper(const std::string &text)
{
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string TextUtils::trim(const std::string &text)
{
    const char *whitespace = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string TextUtils::collapseSpaces(const std::string &text)
{
    std::string result;
    bool pending_space = false;
    for (unsigned char c : text)
    {
        if (std::isspace(c))
        {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space)
        {
            result += ' ';
            pending_space = false;
        }
        result += static_cast<char>(c);
    }
    return result;
}

std::vector<std::string> TextUtils::splitLines(const std::string &text)
{
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> TextUtils::split(const std::string &text, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(text);
    std::string token;
    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }
    return tokens;
}

bool TextUtils::containsWord(const std::string &text, const std::string &word)
{
    if (word.empty())
        return false;

    const std::string haystack = toUpper(text);
    const std::string needle = toUpper(word);
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos)
    {
        bool left_ok = pos == 0 || !std::isalnum(static_cast<unsigned char>(haystack[pos - 1]));
        size_t after = pos + needle.size();
        bool right_ok = after >= haystack.size() || !std::isalnum(static_cast<unsigned char>(haystack[after]));
        if (left_ok && right_ok)
            return true;
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

bool TextUtils::containsAnyWord(const std::string &text, const std::vector<std::string> &words)
{
    return std::any_of(words.begin(), words.end(),
                       [&text](const std::string &word)
                       { return containsWord(text, word); });
}

bool TextUtils::isAllAlpha(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c)
                                        { return std::isalpha(c); });
}

bool TextUtils::isAllDigits(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c)
                                        { return std::isdigit(c); });
}

bool TextUtils::isAlnum(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c)
                                        { return std::isalnum(c); });
}

bool TextUtils::hasDigit(const std::string &text)
{
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c)
                       { return std::isdigit(c); });
}

bool TextUtils::hasAlpha(const std::string &text)
{
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c)
                       { return std::isalpha(c); });
}
