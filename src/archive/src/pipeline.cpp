#include "pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <vector>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace chainsink::archive
{
    namespace
    {
        PipelineError _storeFailure(const store::StoreError & error)
        {
            return PipelineError{PipelineError::Kind::STORE, std::format("{}: {}", error.kind, error.message)};
        }

        bool _storageIndexing(const config::Config & cfg, const chain::IChainClient & chain)
        {
            if(!cfg.storage_indexing)
            {
                return false;
            }

            if(!chain.executesBlocks())
            {
                spdlog::error("Chain client cannot execute blocks, storage indexing is disabled; "
                    "set `storage_indexing` to false to silence this");
                return false;
            }
            return true;
        }

        gap::GapConfig _gapConfig(const config::Config & cfg, bool storage)
        {
            return gap::GapConfig{
                .start_height = cfg.start_height,
                .backfill_depth = cfg.backfill_depth,
                .window = cfg.gap_window,
                .storage = storage
            };
        }

        decode::DecodeConfig _decodeConfig(const config::Config & cfg)
        {
            return decode::DecodeConfig{
                .workers = cfg.decode_workers,
                .fetch_retries = cfg.fetch_retries,
                .fetch_backoff = std::chrono::milliseconds(cfg.fetch_backoff_ms),
                .task_timeout = std::chrono::milliseconds(cfg.task_timeout_ms)
            };
        }

        recovery::RecoveryConfig _recoveryConfig(const config::Config & cfg)
        {
            return recovery::RecoveryConfig{
                .workers = cfg.recovery_workers,
                .task_timeout = std::chrono::milliseconds(cfg.task_timeout_ms),
                .retry = recovery::RetryPolicy{
                    .max_attempts = cfg.max_task_attempts,
                    .backoff_base = std::chrono::milliseconds(cfg.backoff_base_ms),
                    .backoff_max = std::chrono::milliseconds(cfg.backoff_max_ms)
                }
            };
        }
    }

    bool RoundReport::idle() const
    {
        return block_gaps == 0 && storage_queued == 0 && recovery.claimed == 0 && recovery.requeued == 0;
    }

    Pipeline::Pipeline(const config::Config & cfg, chain::IChainClient & chain, const codec::ICodec & codec, write::WriteCoordinator & coordinator)
    :   _cfg(cfg),
        _chain(chain),
        _coordinator(coordinator),
        _storage_indexing(_storageIndexing(cfg, chain)),
        _gaps(coordinator, _gapConfig(cfg, _storage_indexing)),
        _decoder(chain, codec, _resolver, _decodeConfig(cfg)),
        _recovery(chain, coordinator, _recoveryConfig(cfg))
    {
    }

    const version::VersionResolver & Pipeline::resolver() const
    {
        return _resolver;
    }

    recovery::RecoveryQueue & Pipeline::recoveryQueue()
    {
        return _recovery;
    }

    bool Pipeline::indexesStorage() const
    {
        return _storage_indexing;
    }

    asio::awaitable<std::expected<void, PipelineError>> Pipeline::start()
    {
        if(const auto migrated = co_await _coordinator.migrate(); !migrated)
        {
            co_return std::unexpected(_storeFailure(migrated.error()));
        }

        const auto loaded = co_await _resolver.refresh(_coordinator);
        if(!loaded)
        {
            co_return std::unexpected(PipelineError{PipelineError::Kind::STORE, loaded.error().message});
        }
        spdlog::info("Loaded {} schema breakpoints", *loaded);

        if(_storage_indexing)
        {
            if(const auto reset = co_await _recovery.recoverInterrupted(); !reset)
            {
                co_return std::unexpected(_storeFailure(reset.error()));
            }
        }

        co_return std::expected<void, PipelineError>{};
    }

    asio::awaitable<std::expected<std::size_t, PipelineError>> Pipeline::commitDecoded(decode::DecodeReport report, RoundReport & round)
    {
        round.decode_failures = report.failures.size();

        std::vector<store::BlockErrorRecord> errors;
        for(const decode::DecodeFailure & failure : report.failures)
        {
            if(!failure.permanent)
            {
                continue;
            }
            errors.push_back(store::BlockErrorRecord{
                .height = failure.height,
                .kind = std::format("{}", failure.kind),
                .message = failure.message,
                .recorded_at = store::now()
            });
        }

        if(!errors.empty())
        {
            const auto recorded = co_await _coordinator.recordBlockErrors(std::move(errors));
            if(!recorded)
            {
                co_return std::unexpected(_storeFailure(recorded.error()));
            }
        }

        std::vector<recovery::RecoveryJob> jobs;
        std::size_t committed = 0;

        const std::size_t chunk = std::max<std::size_t>(1, _cfg.max_block_load);
        for(std::size_t offset = 0; offset < report.blocks.size(); offset += chunk)
        {
            const std::size_t end = std::min(report.blocks.size(), offset + chunk);
            std::vector<chain::DecodedBlock> batch(
                std::make_move_iterator(report.blocks.begin() + offset),
                std::make_move_iterator(report.blocks.begin() + end));

            if(_storage_indexing)
            {
                for(const chain::DecodedBlock & decoded : batch)
                {
                    // nothing precedes the first indexed block, capture its whole state
                    if(decoded.block.height == _cfg.start_height)
                    {
                        jobs.push_back(recovery::makeFullStorageJob(decoded.block.height));
                    }
                    else
                    {
                        jobs.push_back(recovery::makeExecuteBlockJob(decoded.block.height, decoded.block.hash));
                    }
                }
            }

            const std::size_t count = batch.size();
            const auto summary = co_await _coordinator.commitBlocks(std::move(batch));
            if(!summary)
            {
                co_return std::unexpected(_storeFailure(summary.error()));
            }
            committed += count;
        }

        if(!jobs.empty())
        {
            const auto queued = co_await _recovery.enqueue(std::move(jobs));
            if(!queued)
            {
                co_return std::unexpected(_storeFailure(queued.error()));
            }
            round.storage_queued += queued->rows_inserted;
        }

        co_return committed;
    }

    asio::awaitable<std::expected<RoundReport, PipelineError>> Pipeline::runRound()
    {
        RoundReport round;

        const auto canonical = co_await _chain.canonicalHeight();
        if(!canonical)
        {
            spdlog::warn("Cannot read canonical height: {}", canonical.error().message);
            co_return round;
        }
        round.canonical_height = *canonical;

        if(*canonical < _cfg.start_height)
        {
            spdlog::debug("Chain at {} has not reached start height {}", *canonical, _cfg.start_height);
            co_return round;
        }

        const auto discovered = co_await _resolver.discover(_chain, _coordinator, _cfg.start_height, *canonical);
        if(!discovered)
        {
            if(discovered.error().kind == version::ResolveError::Kind::CHAIN)
            {
                spdlog::warn("Runtime version discovery failed: {}", discovered.error().message);
                co_return round;
            }
            co_return std::unexpected(PipelineError{
                discovered.error().kind == version::ResolveError::Kind::STORE ? PipelineError::Kind::STORE : PipelineError::Kind::SCHEMA,
                discovered.error().message});
        }
        round.versions_added = *discovered;

        const auto gaps = co_await _gaps.detect(*canonical, _cfg.max_block_load);
        if(!gaps)
        {
            co_return std::unexpected(_storeFailure(gaps.error()));
        }
        round.block_gaps = gaps->block_gaps.size();

        if(!gaps->failed_storage.empty())
        {
            spdlog::warn("{} heights have permanently failed storage recovery, first at {}",
                gaps->failed_storage.size(), gaps->failed_storage.front());
        }

        if(!gaps->block_gaps.empty())
        {
            spdlog::info("Decoding {} blocks from {} to {}",
                gaps->block_gaps.size(), gaps->block_gaps.front(), gaps->block_gaps.back());

            decode::DecodeReport report = co_await _decoder.decode(gaps->block_gaps);
            std::optional<version::ResolveError> fatal = std::move(report.fatal);

            const auto committed = co_await commitDecoded(std::move(report), round);
            if(!committed)
            {
                co_return std::unexpected(committed.error());
            }
            round.blocks_committed = *committed;

            if(fatal)
            {
                co_return std::unexpected(PipelineError{PipelineError::Kind::SCHEMA, fatal->message});
            }
        }

        if(!_storage_indexing)
        {
            co_return round;
        }

        if(!gaps->storage_gaps.empty())
        {
            std::vector<recovery::RecoveryJob> jobs;
            jobs.reserve(gaps->storage_gaps.size());
            for(const std::uint64_t height : gaps->storage_gaps)
            {
                jobs.push_back(height == _cfg.start_height ? recovery::makeFullStorageJob(height) : recovery::makeExecuteBlockJob(height));
            }

            const auto queued = co_await _recovery.enqueue(std::move(jobs));
            if(!queued)
            {
                co_return std::unexpected(_storeFailure(queued.error()));
            }
            round.storage_queued += queued->rows_inserted;
        }

        const auto recovered = co_await _recovery.runOnce();
        if(!recovered)
        {
            co_return std::unexpected(_storeFailure(recovered.error()));
        }
        round.recovery = *recovered;

        co_return round;
    }

    asio::awaitable<std::expected<std::size_t, PipelineError>> Pipeline::runRounds(std::size_t rounds)
    {
        if(const auto started = co_await start(); !started)
        {
            co_return std::unexpected(started.error());
        }

        for(std::size_t i = 0; i < rounds; ++i)
        {
            const auto round = co_await runRound();
            if(!round)
            {
                co_return std::unexpected(round.error());
            }
        }
        co_return rounds;
    }

    asio::awaitable<std::expected<void, PipelineError>> Pipeline::run()
    {
        if(const auto started = co_await start(); !started)
        {
            co_return std::unexpected(started.error());
        }

        spdlog::info("Indexing from height {} ({} decode workers, {} recovery workers)",
            _cfg.start_height, _cfg.decode_workers, _cfg.recovery_workers);

        for(;;)
        {
            const auto round = co_await runRound();
            if(!round)
            {
                spdlog::error("Indexing stopped: {}: {}", round.error().kind, round.error().message);
                co_return std::unexpected(round.error());
            }

            if(round->idle())
            {
                co_await utils::sleepFor(std::chrono::milliseconds(_cfg.poll_interval_ms));
            }
        }
    }
}
