#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <asio.hpp>

#include "chain_interface.hpp"
#include "codec_interface.hpp"
#include "version_resolver.hpp"

namespace chainsink::decode
{
    struct DecodeConfig
    {
        std::size_t workers = 4;
        std::uint32_t fetch_retries = 3;
        std::chrono::milliseconds fetch_backoff = std::chrono::milliseconds(200);
        std::chrono::milliseconds task_timeout = std::chrono::milliseconds(20000);
    };

    struct DecodeFailure
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            FETCH,
            DECODE,
            TIMEOUT
        };

        std::uint64_t height = 0;
        Kind kind = Kind::UNKNOWN;
        std::string message = "";
        // permanent failures get an error record, the others stay gaps for the next round
        bool permanent = false;
    };

    struct DecodeReport
    {
        // ascending by height
        std::vector<chain::DecodedBlock> blocks;
        std::vector<DecodeFailure> failures;
        // set when a height has no known schema; nothing after it was decoded
        std::optional<version::ResolveError> fatal;
    };

    /**
     * @brief Fetches and decodes blocks on a dedicated pool of `workers` threads.
     *
     * Never writes to the store.
     */
    class DecodeWorkerPool
    {
    public:
        DecodeWorkerPool(chain::IChainClient & chain, const codec::ICodec & codec, const version::VersionResolver & resolver, DecodeConfig cfg);

        ~DecodeWorkerPool();

        DecodeWorkerPool(const DecodeWorkerPool &) = delete;
        DecodeWorkerPool & operator=(const DecodeWorkerPool &) = delete;

        asio::awaitable<DecodeReport> decode(std::vector<std::uint64_t> heights);

    private:
        struct Batch;

        using HeightOutcome = std::variant<chain::DecodedBlock, DecodeFailure, version::ResolveError>;

        asio::awaitable<void> worker(std::shared_ptr<Batch> batch);

        asio::awaitable<HeightOutcome> decodeHeight(std::uint64_t height);

        asio::awaitable<std::expected<chain::RawBlock, DecodeFailure>> fetchWithRetry(std::uint64_t height);

        chain::IChainClient & _chain;
        const codec::ICodec & _codec;
        const version::VersionResolver & _resolver;
        DecodeConfig _cfg;

        asio::thread_pool _threads;
    };
}

template <>
struct std::formatter<chainsink::decode::DecodeFailure::Kind> : std::formatter<std::string> {
    auto format(const chainsink::decode::DecodeFailure::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::decode::DecodeFailure::Kind::FETCH : return formatter<string>::format("fetch", ctx);
            case chainsink::decode::DecodeFailure::Kind::DECODE : return formatter<string>::format("decode", ctx);
            case chainsink::decode::DecodeFailure::Kind::TIMEOUT : return formatter<string>::format("timeout", ctx);

            default:  return formatter<string>::format("unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
