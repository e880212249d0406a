#pragma once

#include <stdexcept>
#include <string>

enum class FatalInputKind
{
    EMPTY,
    TOO_LARGE,
    UNSUPPORTED_MEDIA_TYPE,
    UNREADABLE
};

/**
 * @brief Thrown for malformed input before any strategy runs
 */
class FatalInputError : public std::runtime_error
{
public:
    FatalInputError(FatalInputKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    FatalInputKind kind() const { return kind_; }

    static std::string kindName(FatalInputKind kind)
    {
        switch (kind)
        {
        case FatalInputKind::EMPTY:
            return "empty";
        case FatalInputKind::TOO_LARGE:
            return "too_large";
        case FatalInputKind::UNSUPPORTED_MEDIA_TYPE:
            return "unsupported_media_type";
        case FatalInputKind::UNREADABLE:
            return "unreadable";
        }
        return "unknown";
    }

private:
    FatalInputKind kind_;
};
