#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace chainsink::chain
{
    /**
     * @brief Undecoded block as handed out by the chain client.
     */
    struct RawBlock
    {
        Bytes hash;
        Bytes parent_hash;
        std::uint64_t height = 0;
        Bytes state_root;
        Bytes extrinsics_root;
        Bytes payload;
    };

    struct RuntimeVersion
    {
        std::uint32_t spec_version = 0;
        Bytes metadata;
    };

    struct StorageChange
    {
        Bytes key;
        // nullopt encodes a deletion
        std::optional<Bytes> value;
    };

    /**
     * @brief Key/value changes produced by executing one block.
     *
     * `is_full` marks a complete state snapshot instead of an incremental diff.
     */
    struct StorageDelta
    {
        std::uint64_t height = 0;
        Bytes block_hash;
        bool is_full = false;
        std::vector<StorageChange> changes;
    };

    struct BlockRecord
    {
        Bytes hash;
        Bytes parent_hash;
        std::uint64_t height = 0;
        Bytes state_root;
        Bytes extrinsics_root;
        std::uint32_t schema_version = 0;
        std::optional<Bytes> payload;
    };

    struct ExtrinsicRecord
    {
        Bytes block_hash;
        std::uint64_t height = 0;
        std::uint32_t index = 0;
        std::string module;
        std::string call_name;
        std::optional<Bytes> signature;
        nlohmann::json args;
    };

    struct EventRecord
    {
        Bytes block_hash;
        std::uint64_t height = 0;
        std::uint32_t index = 0;
        std::string module;
        std::string event_name;
        nlohmann::json parameters;
    };

    struct DecodedBlock
    {
        BlockRecord block;
        std::vector<ExtrinsicRecord> extrinsics;
        std::vector<EventRecord> events;
    };
}
