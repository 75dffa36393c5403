#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "statement.hpp"

namespace chainsink::config
{
    using json = nlohmann::json;

    namespace
    {
        template<class T>
        bool _readUnsigned(const json & input, const char * key, T & out)
        {
            if(!input.contains(key))
            {
                return true;
            }

            if(!input[key].is_number_unsigned())
            {
                return false;
            }

            const auto value = input[key].get<std::uint64_t>();
            if(value > std::numeric_limits<T>::max())
            {
                return false;
            }

            out = static_cast<T>(value);
            return true;
        }

        bool _readString(const json & input, const char * key, std::string & out)
        {
            if(!input.contains(key))
            {
                return true;
            }

            if(!input[key].is_string())
            {
                return false;
            }

            out = input[key].get<std::string>();
            return true;
        }
    }

    std::expected<Config, ConfigError> configFromJson(const json & input, Config cfg)
    {
        if(!input.is_object())
        {
            return std::unexpected(ConfigError{ConfigError::Kind::PARSE_ERROR, "config root must be an object"});
        }

        const auto invalid = [](const char * key)
        {
            return std::unexpected(ConfigError{ConfigError::Kind::INVALID_VALUE, std::format("invalid value for `{}`", key)});
        };

        if(!_readString(input, "database_url", cfg.database_url)) return invalid("database_url");
        if(!_readString(input, "rpc_url", cfg.rpc_url)) return invalid("rpc_url");
        if(!_readString(input, "notify_channel", cfg.notify_channel)) return invalid("notify_channel");

        if(!_readUnsigned(input, "pool_size", cfg.pool_size)) return invalid("pool_size");
        if(!_readUnsigned(input, "decode_workers", cfg.decode_workers)) return invalid("decode_workers");
        if(!_readUnsigned(input, "recovery_workers", cfg.recovery_workers)) return invalid("recovery_workers");
        if(!_readUnsigned(input, "max_block_load", cfg.max_block_load)) return invalid("max_block_load");
        if(!_readUnsigned(input, "max_statement_params", cfg.max_statement_params)) return invalid("max_statement_params");
        if(!_readUnsigned(input, "gap_window", cfg.gap_window)) return invalid("gap_window");
        if(!_readUnsigned(input, "start_height", cfg.start_height)) return invalid("start_height");
        if(!_readUnsigned(input, "backfill_depth", cfg.backfill_depth)) return invalid("backfill_depth");
        if(!_readUnsigned(input, "task_timeout_ms", cfg.task_timeout_ms)) return invalid("task_timeout_ms");
        if(!_readUnsigned(input, "fetch_retries", cfg.fetch_retries)) return invalid("fetch_retries");
        if(!_readUnsigned(input, "fetch_backoff_ms", cfg.fetch_backoff_ms)) return invalid("fetch_backoff_ms");
        if(!_readUnsigned(input, "max_task_attempts", cfg.max_task_attempts)) return invalid("max_task_attempts");
        if(!_readUnsigned(input, "backoff_base_ms", cfg.backoff_base_ms)) return invalid("backoff_base_ms");
        if(!_readUnsigned(input, "backoff_max_ms", cfg.backoff_max_ms)) return invalid("backoff_max_ms");
        if(!_readUnsigned(input, "poll_interval_ms", cfg.poll_interval_ms)) return invalid("poll_interval_ms");

        if(input.contains("storage_indexing"))
        {
            if(!input["storage_indexing"].is_boolean()) return invalid("storage_indexing");
            cfg.storage_indexing = input["storage_indexing"].get<bool>();
        }

        if(input.contains("logs_path"))
        {
            if(!input["logs_path"].is_string()) return invalid("logs_path");
            cfg.logs_path = input["logs_path"].get<std::string>();
        }

        if(const auto valid = validate(cfg); !valid)
        {
            return std::unexpected(valid.error());
        }

        return cfg;
    }

    std::expected<Config, ConfigError> loadConfig(const std::filesystem::path & path, Config cfg)
    {
        if(!std::filesystem::exists(path))
        {
            return std::unexpected(ConfigError{ConfigError::Kind::FILE_NOT_FOUND, path.string()});
        }

        std::ifstream input(path);
        if(!input.is_open())
        {
            return std::unexpected(ConfigError{ConfigError::Kind::FILE_NOT_FOUND, path.string()});
        }

        json parsed;
        try
        {
            parsed = json::parse(input);
        }
        catch(const std::exception & e)
        {
            return std::unexpected(ConfigError{ConfigError::Kind::PARSE_ERROR, e.what()});
        }

        auto cfg_res = configFromJson(parsed, std::move(cfg));
        if(!cfg_res)
        {
            return cfg_res;
        }

        if(const char * database_url = std::getenv("DATABASE_URL"); database_url != nullptr && *database_url != '\0')
        {
            spdlog::debug("Using DATABASE_URL from environment");
            cfg_res->database_url = database_url;
        }

        return cfg_res;
    }

    std::expected<void, ConfigError> validate(const Config & cfg)
    {
        if(cfg.pool_size == 0 || cfg.decode_workers == 0 || cfg.recovery_workers == 0)
        {
            return std::unexpected(ConfigError{ConfigError::Kind::INVALID_VALUE, "worker and pool counts must be positive"});
        }

        if(cfg.max_statement_params < store::MAX_ROW_WIDTH)
        {
            return std::unexpected(ConfigError{ConfigError::Kind::INVALID_VALUE,
                std::format("max_statement_params must be at least {}", store::MAX_ROW_WIDTH)});
        }

        if(cfg.max_task_attempts == 0)
        {
            return std::unexpected(ConfigError{ConfigError::Kind::INVALID_VALUE, "max_task_attempts must be positive"});
        }

        if(cfg.database_url.empty())
        {
            return std::unexpected(ConfigError{ConfigError::Kind::INVALID_VALUE, "database_url is empty"});
        }

        return {};
    }
}
