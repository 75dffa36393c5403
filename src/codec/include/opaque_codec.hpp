#pragma once

#include "codec_interface.hpp"

namespace chainsink::codec
{
    /**
     * @brief Records extrinsics without interpreting them.
     *
     * Expects the payload produced by `chain::RpcChainClient`: a JSON array of hex encoded
     * extrinsics. Each one becomes an `opaque`/`raw` call whose args hold the hex bytes and the
     * schema version. No events are produced.
     */
    class OpaqueCodec final : public ICodec
    {
    public:
        std::expected<DecodedBody, DecodeError> decode(const Bytes & payload, std::uint32_t schema_version) const override;
    };
}
