#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "parser.hpp"

namespace chainsink::notify
{
    struct ChangeEvent
    {
        std::string table;
        std::string action = "INSERT";
        // block height for chain data, version for metadata
        std::uint64_t key = 0;

        bool operator==(const ChangeEvent &) const = default;
    };

    ChangeEvent inserted(std::string_view table, std::uint64_t key);
}

namespace chainsink::parse
{
    /**
     * @brief `{"table": ..., "action": ..., "key": ...}`
     */
    template<>
    Result<json> parseToJson(notify::ChangeEvent event, use_json_t);

    template<>
    Result<notify::ChangeEvent> parseFromJson(json json, use_json_t);
}
