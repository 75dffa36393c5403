#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <string>

#include <asio.hpp>

#include "config.hpp"
#include "chain_interface.hpp"
#include "codec_interface.hpp"
#include "write_coordinator.hpp"
#include "version_resolver.hpp"
#include "gap_detector.hpp"
#include "decode_pool.hpp"
#include "recovery_queue.hpp"

namespace chainsink::archive
{
    struct PipelineError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            SCHEMA,
            STORE
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    struct RoundReport
    {
        std::uint64_t canonical_height = 0;
        std::size_t versions_added = 0;
        std::size_t block_gaps = 0;
        std::size_t blocks_committed = 0;
        std::size_t decode_failures = 0;
        std::size_t storage_queued = 0;
        recovery::RoundSummary recovery = {};

        // nothing was found to do, the caller may sleep
        bool idle() const;
    };

    /**
     * @brief Drives the indexing rounds.
     *
     * Each round discovers runtime upgrades, asks the gap detector for missing heights, decodes
     * and commits block gaps, queues storage recovery and runs one recovery round. Chain errors
     * end the round early; a missing schema or an unreachable store end the pipeline.
     *
     * Storage indexing is switched off when the chain client cannot execute blocks, since every
     * recovery task would fail on its first attempt.
     */
    class Pipeline
    {
    public:
        Pipeline(const config::Config & cfg, chain::IChainClient & chain, const codec::ICodec & codec, write::WriteCoordinator & coordinator);

        Pipeline(const Pipeline &) = delete;
        Pipeline & operator=(const Pipeline &) = delete;

        /**
         * @brief Migrates the schema, loads breakpoints and returns interrupted tasks to pending.
         */
        asio::awaitable<std::expected<void, PipelineError>> start();

        asio::awaitable<std::expected<RoundReport, PipelineError>> runRound();

        /**
         * @brief `start` followed by at most `rounds` rounds.
         *
         * @return number of rounds run.
         */
        asio::awaitable<std::expected<std::size_t, PipelineError>> runRounds(std::size_t rounds);

        /**
         * @brief `start` followed by rounds until a fatal error.
         */
        asio::awaitable<std::expected<void, PipelineError>> run();

        const version::VersionResolver & resolver() const;

        recovery::RecoveryQueue & recoveryQueue();

        bool indexesStorage() const;

    private:
        asio::awaitable<std::expected<std::size_t, PipelineError>> commitDecoded(decode::DecodeReport report, RoundReport & round);

        const config::Config & _cfg;
        chain::IChainClient & _chain;
        write::WriteCoordinator & _coordinator;
        const bool _storage_indexing;

        version::VersionResolver _resolver;
        gap::GapDetector _gaps;
        decode::DecodeWorkerPool _decoder;
        recovery::RecoveryQueue _recovery;
    };
}

template <>
struct std::formatter<chainsink::archive::PipelineError::Kind> : std::formatter<std::string> {
    auto format(const chainsink::archive::PipelineError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case chainsink::archive::PipelineError::Kind::SCHEMA : return formatter<string>::format("Schema error", ctx);
            case chainsink::archive::PipelineError::Kind::STORE : return formatter<string>::format("Store error", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
