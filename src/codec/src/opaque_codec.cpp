#include "opaque_codec.hpp"

#include <nlohmann/json.hpp>

namespace chainsink::codec
{
    using json = nlohmann::json;

    std::expected<DecodedBody, DecodeError> OpaqueCodec::decode(const Bytes & payload, std::uint32_t schema_version) const
    {
        const json parsed = json::parse(payload.begin(), payload.end(), nullptr, false);
        if(parsed.is_discarded() || !parsed.is_array())
        {
            return std::unexpected(DecodeError{DecodeError::Kind::MALFORMED_PAYLOAD, "payload is not a JSON array"});
        }

        DecodedBody body;
        body.extrinsics.reserve(parsed.size());

        std::uint32_t index = 0;
        for(const json & extrinsic : parsed)
        {
            if(!extrinsic.is_string() || !utils::fromHex(extrinsic.get<std::string>()))
            {
                return std::unexpected(DecodeError{DecodeError::Kind::MALFORMED_PAYLOAD,
                    std::format("extrinsic {} is not a hex string", index)});
            }

            chain::ExtrinsicRecord record;
            record.index = index++;
            record.module = "opaque";
            record.call_name = "raw";
            record.args = json{
                {"bytes", extrinsic.get<std::string>()},
                {"schema_version", schema_version}
            };
            body.extrinsics.push_back(std::move(record));
        }

        return body;
    }
}
