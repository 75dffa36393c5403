#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>

namespace chainsink::store
{
    struct StoreError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            CONNECTION,
            QUERY,
            CONSTRAINT,
            MISSING_BLOCK,
            POOL_CLOSED
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, StoreError>;

    /**
     * @brief Connection level failures may succeed on a fresh connection.
     */
    inline bool isTransient(const StoreError & error)
    {
        return error.kind == StoreError::Kind::CONNECTION;
    }
}

template <>
struct std::formatter<chainsink::store::StoreError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::store::StoreError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::store::StoreError::Kind::CONNECTION : return formatter<string>::format("Connection error", ctx);
            case chainsink::store::StoreError::Kind::QUERY : return formatter<string>::format("Query error", ctx);
            case chainsink::store::StoreError::Kind::CONSTRAINT : return formatter<string>::format("Constraint violation", ctx);
            case chainsink::store::StoreError::Kind::MISSING_BLOCK : return formatter<string>::format("Missing block", ctx);
            case chainsink::store::StoreError::Kind::POOL_CLOSED : return formatter<string>::format("Pool closed", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
