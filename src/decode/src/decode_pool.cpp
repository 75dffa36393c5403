#include "decode_pool.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/parallel_group.hpp>

#include <spdlog/spdlog.h>

#include "utils.hpp"

using namespace asio::experimental::awaitable_operators;

namespace chainsink::decode
{
    struct DecodeWorkerPool::Batch
    {
        std::vector<std::uint64_t> heights;
        std::atomic<std::size_t> next = 0;
        std::atomic<bool> stop = false;

        std::mutex mutex;
        DecodeReport report;
    };

    DecodeWorkerPool::DecodeWorkerPool(chain::IChainClient & chain, const codec::ICodec & codec, const version::VersionResolver & resolver, DecodeConfig cfg)
    : _chain(chain), _codec(codec), _resolver(resolver), _cfg(std::move(cfg)),
        _threads(std::max<std::size_t>(1, _cfg.workers))
    {
    }

    DecodeWorkerPool::~DecodeWorkerPool()
    {
        _threads.join();
    }

    asio::awaitable<std::expected<chain::RawBlock, DecodeFailure>> DecodeWorkerPool::fetchWithRetry(std::uint64_t height)
    {
        for(std::uint32_t attempt = 0;; ++attempt)
        {
            auto raw = co_await _chain.fetchBlock(height);
            if(raw)
            {
                co_return std::move(*raw);
            }

            const chain::ChainError & error = raw.error();
            if(!chain::isTransient(error))
            {
                co_return std::unexpected(DecodeFailure{height, DecodeFailure::Kind::FETCH,
                    std::format("{}: {}", error.kind, error.message), true});
            }

            if(attempt >= _cfg.fetch_retries)
            {
                co_return std::unexpected(DecodeFailure{height, DecodeFailure::Kind::FETCH,
                    std::format("gave up after {} attempts: {}", attempt + 1, error.message), false});
            }

            const auto delay = utils::exponentialBackoff(attempt + 1, _cfg.fetch_backoff, _cfg.fetch_backoff * 16);
            spdlog::debug("Fetch of block {} failed ({}), retrying in {}ms", height, error.message, delay.count());
            co_await utils::sleepFor(delay);
        }
    }

    asio::awaitable<DecodeWorkerPool::HeightOutcome> DecodeWorkerPool::decodeHeight(std::uint64_t height)
    {
        auto raw = co_await fetchWithRetry(height);
        if(!raw)
        {
            co_return raw.error();
        }

        const auto version = _resolver.resolve(height);
        if(!version)
        {
            co_return version.error();
        }

        auto body = _codec.decode(raw->payload, *version);
        if(!body)
        {
            co_return DecodeFailure{height, DecodeFailure::Kind::DECODE,
                std::format("{}: {}", body.error().kind, body.error().message), true};
        }

        chain::DecodedBlock decoded;
        decoded.block = chain::BlockRecord{
            .hash = raw->hash,
            .parent_hash = std::move(raw->parent_hash),
            .height = height,
            .state_root = std::move(raw->state_root),
            .extrinsics_root = std::move(raw->extrinsics_root),
            .schema_version = *version,
            .payload = std::move(raw->payload)
        };

        decoded.extrinsics = std::move(body->extrinsics);
        for(chain::ExtrinsicRecord & extrinsic : decoded.extrinsics)
        {
            extrinsic.block_hash = raw->hash;
            extrinsic.height = height;
        }

        decoded.events = std::move(body->events);
        for(chain::EventRecord & event : decoded.events)
        {
            event.block_hash = raw->hash;
            event.height = height;
        }

        co_return decoded;
    }

    asio::awaitable<void> DecodeWorkerPool::worker(std::shared_ptr<Batch> batch)
    {
        const auto executor = co_await asio::this_coro::executor;

        while(!batch->stop.load())
        {
            const std::size_t index = batch->next.fetch_add(1);
            if(index >= batch->heights.size())
            {
                break;
            }
            const std::uint64_t height = batch->heights[index];

            asio::steady_timer deadline(executor, _cfg.task_timeout);
            auto outcome = co_await (decodeHeight(height) || deadline.async_wait(asio::use_awaitable));

            std::lock_guard lock(batch->mutex);
            if(outcome.index() == 1)
            {
                spdlog::warn("Decoding block {} timed out after {}ms", height, _cfg.task_timeout.count());
                batch->report.failures.push_back(DecodeFailure{height, DecodeFailure::Kind::TIMEOUT, "timed out", false});
                continue;
            }

            HeightOutcome & result = std::get<0>(outcome);
            if(auto * decoded = std::get_if<chain::DecodedBlock>(&result))
            {
                batch->report.blocks.push_back(std::move(*decoded));
            }
            else if(auto * failure = std::get_if<DecodeFailure>(&result))
            {
                spdlog::warn("Skipping block {} ({} failure): {}", height, failure->kind, failure->message);
                batch->report.failures.push_back(std::move(*failure));
            }
            else
            {
                auto & fatal = std::get<version::ResolveError>(result);
                spdlog::error("No schema for block {}: {}", height, fatal.message);
                if(!batch->report.fatal)
                {
                    batch->report.fatal = std::move(fatal);
                }
                batch->stop.store(true);
            }
        }
    }

    asio::awaitable<DecodeReport> DecodeWorkerPool::decode(std::vector<std::uint64_t> heights)
    {
        if(heights.empty())
        {
            co_return DecodeReport{};
        }

        auto batch = std::make_shared<Batch>();
        batch->heights = std::move(heights);

        const std::size_t workers = std::min(std::max<std::size_t>(1, _cfg.workers), batch->heights.size());

        using WorkerOp = decltype(asio::co_spawn(_threads, worker(batch), asio::deferred));
        std::vector<WorkerOp> ops;
        ops.reserve(workers);
        for(std::size_t i = 0; i < workers; ++i)
        {
            ops.push_back(asio::co_spawn(_threads, worker(batch), asio::deferred));
        }

        auto [order, exceptions] = co_await asio::experimental::make_parallel_group(std::move(ops)).async_wait(
            asio::experimental::wait_for_all(),
            asio::use_awaitable);

        for(const std::exception_ptr & e : exceptions)
        {
            if(e)
            {
                std::rethrow_exception(e);
            }
        }

        DecodeReport report = std::move(batch->report);
        std::ranges::sort(report.blocks, {}, [](const chain::DecodedBlock & decoded){ return decoded.block.height; });
        std::ranges::sort(report.failures, {}, &DecodeFailure::height);

        spdlog::debug("Decoded {} blocks, {} failures", report.blocks.size(), report.failures.size());
        co_return report;
    }
}
