#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace chainsink::parse
{
    struct ParseError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN         = 0U,

            INVALID_VALUE   = 1U,
            OUT_OF_RANGE    = 2U,
            TYPE_MISMATCH   = 3U,
            UNSUPPORTED_VERSION = 4U
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, ParseError>;
}

template <>
struct std::formatter<chainsink::parse::ParseError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::parse::ParseError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::parse::ParseError::Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);
            case chainsink::parse::ParseError::Kind::OUT_OF_RANGE : return formatter<string>::format("Out of range", ctx);
            case chainsink::parse::ParseError::Kind::TYPE_MISMATCH : return formatter<string>::format("Type mismatch", ctx);
            case chainsink::parse::ParseError::Kind::UNSUPPORTED_VERSION : return formatter<string>::format("Unsupported version", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
