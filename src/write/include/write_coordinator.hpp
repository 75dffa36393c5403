#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "records.hpp"
#include "store.hpp"
#include "change_notifier.hpp"

namespace chainsink::write
{
    struct WriteConfig
    {
        // connection ceiling and database thread count
        std::size_t pool_size = 8;
        std::size_t max_statement_params = 65535;
        // attempts for work that failed on a broken connection
        std::uint32_t connection_retries = 3;
        std::chrono::milliseconds retry_backoff = std::chrono::milliseconds(100);
    };

    struct CommitSummary
    {
        std::size_t statements = 0;
        std::size_t rows_inserted = 0;

        CommitSummary & operator+=(const CommitSummary & other);
    };

    /**
     * @brief Sole owner of the store connections and sole writer of chain data.
     *
     * Every call borrows a pooled connection on a dedicated thread pool of `pool_size` threads,
     * so concurrent producers queue here instead of opening connections of their own.
     * Batches are split into statements that stay under `max_statement_params` bound parameters;
     * within a commit, block rows always precede the rows that reference them.
     */
    class WriteCoordinator
    {
    public:
        WriteCoordinator(store::ConnectionFactory factory, WriteConfig cfg, notify::ChangeNotifier * notifier = nullptr);

        ~WriteCoordinator();

        WriteCoordinator(const WriteCoordinator &) = delete;
        WriteCoordinator & operator=(const WriteCoordinator &) = delete;

        /**
         * @brief Runs `fn` on a pooled connection, off the calling executor.
         */
        template<class T>
        asio::awaitable<store::Result<T>> query(std::function<store::Result<T>(store::IConnection &)> fn)
        {
            co_return co_await asio::co_spawn(_db_threads,
                [this, fn = std::move(fn)]() -> asio::awaitable<store::Result<T>>
                {
                    co_return withConnection<T>(fn);
                },
                asio::use_awaitable);
        }

        asio::awaitable<store::Result<void>> migrate();

        /**
         * @brief Inserts blocks, then their extrinsics, then their events, in one transaction.
         */
        asio::awaitable<store::Result<CommitSummary>> commitBlocks(std::vector<chain::DecodedBlock> blocks);

        /**
         * @brief Inserts the storage rows of `delta` and marks `completed` done, in one transaction.
         *
         * Fails with `MISSING_BLOCK` when no block row exists at the delta height.
         */
        asio::awaitable<store::Result<CommitSummary>> commitStorage(chain::StorageDelta delta, std::optional<store::TaskRecord> completed = std::nullopt);

        asio::awaitable<store::Result<CommitSummary>> commitMetadata(std::uint32_t version, std::uint64_t first_height, Bytes metadata);

        asio::awaitable<store::Result<CommitSummary>> recordBlockErrors(std::vector<store::BlockErrorRecord> errors);

        asio::awaitable<store::Result<CommitSummary>> enqueueTasks(std::vector<store::TaskRecord> tasks);

        asio::awaitable<store::Result<std::vector<store::TaskRecord>>> claimTasks(std::size_t limit, store::Timestamp at);

        asio::awaitable<store::Result<void>> updateTask(store::TaskRecord task);

        asio::awaitable<store::Result<std::size_t>> requeueDueTasks(store::Timestamp at);

        asio::awaitable<store::Result<std::size_t>> resetRunningTasks();

        asio::awaitable<store::Result<void>> notify(std::string channel, std::string payload);

        const store::ConnectionPool & pool() const;

        std::size_t statementsIssued() const;

    private:
        template<class T>
        store::Result<T> withConnection(const std::function<store::Result<T>(store::IConnection &)> & fn);

        store::Result<CommitSummary> runStatements(store::IConnection & connection, std::vector<store::InsertStatement> statements);

        void publish(std::vector<notify::ChangeEvent> events);

        WriteConfig _cfg;
        store::ConnectionPool _pool;
        asio::thread_pool _db_threads;
        notify::ChangeNotifier * _notifier;

        std::atomic<std::size_t> _statements = 0;
    };

    /**
     * @brief Row builders, one statement per table. Exposed for tests.
     */
    store::InsertStatement blockStatement(const std::vector<chain::DecodedBlock> & blocks);
    store::InsertStatement extrinsicStatement(const std::vector<chain::DecodedBlock> & blocks);
    store::InsertStatement eventStatement(const std::vector<chain::DecodedBlock> & blocks);
    store::InsertStatement storageStatement(const chain::StorageDelta & delta, const Bytes & block_hash);

    template<class T>
    store::Result<T> WriteCoordinator::withConnection(const std::function<store::Result<T>(store::IConnection &)> & fn)
    {
        const std::uint32_t attempts = std::max<std::uint32_t>(1, _cfg.connection_retries);

        store::Result<T> result = std::unexpected(store::StoreError{store::StoreError::Kind::CONNECTION, "no attempt made"});
        for(std::uint32_t attempt = 1; attempt <= attempts; ++attempt)
        {
            auto connection = _pool.acquire();
            if(!connection)
            {
                result = std::unexpected(connection.error());
            }
            else
            {
                result = fn(**connection);
                if(result || !store::isTransient(result.error()))
                {
                    return result;
                }
                connection->invalidate();
            }

            if(!store::isTransient(result.error()) || attempt == attempts)
            {
                break;
            }

            spdlog::warn("Store connection failed (attempt {}/{}): {}", attempt, attempts, result.error().message);
            std::this_thread::sleep_for(utils::exponentialBackoff(attempt, _cfg.retry_backoff, _cfg.retry_backoff * 10));
        }
        return result;
    }
}
