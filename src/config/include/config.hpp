#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace chainsink::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;

        std::string database_url = "postgres://localhost:5432/chainsink";
        std::string rpc_url = "http://localhost:9933";

        // connection pool ceiling, also the number of database threads
        std::size_t pool_size = 8;
        std::size_t decode_workers = 4;
        std::size_t recovery_workers = 2;

        // upper bound on heights handed out by the gap detector per round
        std::uint64_t max_block_load = 1000;
        // PostgreSQL rejects statements with more than 65535 bind parameters
        std::size_t max_statement_params = 65535;
        std::uint64_t gap_window = 10000;

        std::uint64_t start_height = 0;
        // 0 means backfill down to start_height
        std::uint64_t backfill_depth = 0;

        std::uint64_t task_timeout_ms = 20000;
        std::uint32_t fetch_retries = 3;
        std::uint64_t fetch_backoff_ms = 200;

        std::uint32_t max_task_attempts = 5;
        std::uint64_t backoff_base_ms = 1000;
        std::uint64_t backoff_max_ms = 300000;

        std::uint64_t poll_interval_ms = 5000;

        bool storage_indexing = true;
        std::string notify_channel = "table_update";
    };

    struct ConfigError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            FILE_NOT_FOUND,
            PARSE_ERROR,
            INVALID_VALUE
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    /**
     * @brief Fills a config from a JSON object. Missing keys keep their defaults.
     *
     * @param json Object with the same keys as the `Config` fields.
     * @param cfg Config to update, usually default constructed.
     */
    std::expected<Config, ConfigError> configFromJson(const nlohmann::json & json, Config cfg = {});

    /**
     * @brief Loads a JSON config file and applies the `DATABASE_URL` environment override.
     */
    std::expected<Config, ConfigError> loadConfig(const std::filesystem::path & path, Config cfg = {});

    std::expected<void, ConfigError> validate(const Config & cfg);
}

template <>
struct std::formatter<chainsink::config::ConfigError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::config::ConfigError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::config::ConfigError::Kind::FILE_NOT_FOUND : return formatter<string>::format("File not found", ctx);
            case chainsink::config::ConfigError::Kind::PARSE_ERROR : return formatter<string>::format("Parse error", ctx);
            case chainsink::config::ConfigError::Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
