#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>

#include <asio.hpp>

#include "records.hpp"

namespace chainsink::chain
{
    struct ChainError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            NOT_FOUND,
            TRANSPORT,
            MALFORMED,
            EXECUTION,
            UNSUPPORTED
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    /**
     * @brief Transient errors are worth retrying, the rest are answers.
     */
    bool isTransient(const ChainError & error);

    class IChainClient
    {
    public:
        virtual ~IChainClient() = default;

        virtual asio::awaitable<std::expected<std::uint64_t, ChainError>> canonicalHeight() = 0;

        virtual asio::awaitable<std::expected<RawBlock, ChainError>> fetchBlock(std::uint64_t height) = 0;

        /**
         * @brief Re-executes the block at `height` and returns the storage diff it produced.
         */
        virtual asio::awaitable<std::expected<StorageDelta, ChainError>> executeBlock(std::uint64_t height) = 0;

        /**
         * @brief Full state snapshot at `height`.
         */
        virtual asio::awaitable<std::expected<StorageDelta, ChainError>> fullStorage(std::uint64_t height) = 0;

        virtual asio::awaitable<std::expected<RuntimeVersion, ChainError>> runtimeVersion(std::uint64_t height) = 0;

        /**
         * @brief False when `executeBlock` and `fullStorage` can never succeed on this client.
         */
        virtual bool executesBlocks() const = 0;
    };
}

template <>
struct std::formatter<chainsink::chain::ChainError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::chain::ChainError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::chain::ChainError::Kind::NOT_FOUND : return formatter<string>::format("Not found", ctx);
            case chainsink::chain::ChainError::Kind::TRANSPORT : return formatter<string>::format("Transport error", ctx);
            case chainsink::chain::ChainError::Kind::MALFORMED : return formatter<string>::format("Malformed response", ctx);
            case chainsink::chain::ChainError::Kind::EXECUTION : return formatter<string>::format("Execution error", ctx);
            case chainsink::chain::ChainError::Kind::UNSUPPORTED : return formatter<string>::format("Unsupported", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
