#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <vector>

#include "records.hpp"

namespace chainsink::codec
{
    struct DecodeError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            MALFORMED_PAYLOAD,
            UNKNOWN_VERSION,
            UNSUPPORTED_CALL
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    /**
     * @brief Extrinsics and events of one block. Block hash and height are filled in by the caller.
     */
    struct DecodedBody
    {
        std::vector<chain::ExtrinsicRecord> extrinsics;
        std::vector<chain::EventRecord> events;
    };

    class ICodec
    {
    public:
        virtual ~ICodec() = default;

        virtual std::expected<DecodedBody, DecodeError> decode(const Bytes & payload, std::uint32_t schema_version) const = 0;
    };
}

template <>
struct std::formatter<chainsink::codec::DecodeError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::codec::DecodeError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::codec::DecodeError::Kind::MALFORMED_PAYLOAD : return formatter<string>::format("Malformed payload", ctx);
            case chainsink::codec::DecodeError::Kind::UNKNOWN_VERSION : return formatter<string>::format("Unknown schema version", ctx);
            case chainsink::codec::DecodeError::Kind::UNSUPPORTED_CALL : return formatter<string>::format("Unsupported call", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
