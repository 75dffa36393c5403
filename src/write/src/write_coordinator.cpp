#include "write_coordinator.hpp"

#include <utility>

#include <absl/container/flat_hash_set.h>

namespace chainsink::write
{
    using store::InsertStatement;
    using store::Result;
    using store::StoreError;
    using store::Value;

    namespace
    {
        Value _optionalBytes(const std::optional<Bytes> & value)
        {
            if(!value)
            {
                return std::monostate{};
            }
            return *value;
        }

        Value _optionalString(const std::optional<std::string> & value)
        {
            if(!value)
            {
                return std::monostate{};
            }
            return *value;
        }

        template<class F>
        auto _inTransaction(store::IConnection & connection, F && fn) -> decltype(fn())
        {
            if(auto begun = connection.begin(); !begun)
            {
                return std::unexpected(begun.error());
            }

            auto result = fn();
            if(!result)
            {
                if(auto rolled_back = connection.rollback(); !rolled_back)
                {
                    spdlog::error("Rollback failed: {}", rolled_back.error().message);
                }
                return result;
            }

            if(auto committed = connection.commit(); !committed)
            {
                return std::unexpected(committed.error());
            }
            return result;
        }

        std::vector<notify::ChangeEvent> _heightEvents(std::string_view table, const absl::flat_hash_set<std::uint64_t> & heights)
        {
            std::vector<std::uint64_t> sorted(heights.begin(), heights.end());
            std::ranges::sort(sorted);

            std::vector<notify::ChangeEvent> events;
            events.reserve(sorted.size());
            for(const std::uint64_t height : sorted)
            {
                events.push_back(notify::inserted(table, height));
            }
            return events;
        }
    }

    CommitSummary & CommitSummary::operator+=(const CommitSummary & other)
    {
        statements += other.statements;
        rows_inserted += other.rows_inserted;
        return *this;
    }

    InsertStatement blockStatement(const std::vector<chain::DecodedBlock> & blocks)
    {
        InsertStatement statement{
            .table = std::string(store::table::BLOCKS),
            .columns = {"hash", "parent_hash", "height", "state_root", "extrinsics_root", "schema_version", "payload"},
            .rows = {}
        };
        statement.rows.reserve(blocks.size());

        for(const chain::DecodedBlock & decoded : blocks)
        {
            const chain::BlockRecord & block = decoded.block;
            statement.rows.push_back({
                block.hash,
                block.parent_hash,
                block.height,
                block.state_root,
                block.extrinsics_root,
                static_cast<std::uint64_t>(block.schema_version),
                _optionalBytes(block.payload)
            });
        }
        return statement;
    }

    InsertStatement extrinsicStatement(const std::vector<chain::DecodedBlock> & blocks)
    {
        InsertStatement statement{
            .table = std::string(store::table::EXTRINSICS),
            .columns = {"block_hash", "height", "idx", "module", "call_name", "signature", "args"},
            .rows = {}
        };

        for(const chain::DecodedBlock & decoded : blocks)
        {
            for(const chain::ExtrinsicRecord & extrinsic : decoded.extrinsics)
            {
                statement.rows.push_back({
                    extrinsic.block_hash,
                    extrinsic.height,
                    static_cast<std::uint64_t>(extrinsic.index),
                    extrinsic.module,
                    extrinsic.call_name,
                    _optionalBytes(extrinsic.signature),
                    extrinsic.args
                });
            }
        }
        return statement;
    }

    InsertStatement eventStatement(const std::vector<chain::DecodedBlock> & blocks)
    {
        InsertStatement statement{
            .table = std::string(store::table::EVENTS),
            .columns = {"block_hash", "height", "idx", "module", "event_name", "parameters"},
            .rows = {}
        };

        for(const chain::DecodedBlock & decoded : blocks)
        {
            for(const chain::EventRecord & event : decoded.events)
            {
                statement.rows.push_back({
                    event.block_hash,
                    event.height,
                    static_cast<std::uint64_t>(event.index),
                    event.module,
                    event.event_name,
                    event.parameters
                });
            }
        }
        return statement;
    }

    InsertStatement storageStatement(const chain::StorageDelta & delta, const Bytes & block_hash)
    {
        InsertStatement statement{
            .table = std::string(store::table::STORAGE),
            .columns = {"height", "block_hash", "is_full", "key", "value"},
            .rows = {}
        };
        statement.rows.reserve(delta.changes.size());

        for(const chain::StorageChange & change : delta.changes)
        {
            statement.rows.push_back({
                delta.height,
                block_hash,
                delta.is_full,
                change.key,
                _optionalBytes(change.value)
            });
        }
        return statement;
    }

    WriteCoordinator::WriteCoordinator(store::ConnectionFactory factory, WriteConfig cfg, notify::ChangeNotifier * notifier)
    : _cfg(std::move(cfg)),
        _pool(std::move(factory), _cfg.pool_size),
        _db_threads(_cfg.pool_size),
        _notifier(notifier)
    {
    }

    WriteCoordinator::~WriteCoordinator()
    {
        _db_threads.join();
        _pool.close();
    }

    const store::ConnectionPool & WriteCoordinator::pool() const
    {
        return _pool;
    }

    std::size_t WriteCoordinator::statementsIssued() const
    {
        return _statements.load();
    }

    void WriteCoordinator::publish(std::vector<notify::ChangeEvent> events)
    {
        if(_notifier != nullptr && !events.empty())
        {
            _notifier->publish(std::move(events));
        }
    }

    Result<CommitSummary> WriteCoordinator::runStatements(store::IConnection & connection, std::vector<InsertStatement> statements)
    {
        CommitSummary summary;
        for(InsertStatement & statement : statements)
        {
            for(const InsertStatement & part : store::splitStatement(std::move(statement), _cfg.max_statement_params))
            {
                const auto inserted = connection.insert(part);
                if(!inserted)
                {
                    spdlog::debug("Insert into {} failed: {}", part.table, inserted.error().message);
                    return std::unexpected(inserted.error());
                }

                ++summary.statements;
                ++_statements;
                summary.rows_inserted += *inserted;

                spdlog::debug("Inserted {}/{} rows into {} ({} params)", *inserted, part.rows.size(), part.table, part.parameterCount());
            }
        }
        return summary;
    }

    asio::awaitable<Result<void>> WriteCoordinator::migrate()
    {
        co_return co_await query<void>([](store::IConnection & connection)
        {
            return connection.migrate();
        });
    }

    asio::awaitable<Result<CommitSummary>> WriteCoordinator::commitBlocks(std::vector<chain::DecodedBlock> blocks)
    {
        if(blocks.empty())
        {
            co_return CommitSummary{};
        }

        // per table inserted counts decide which notifications fire
        struct Outcome
        {
            CommitSummary summary;
            std::size_t blocks = 0;
            std::size_t extrinsics = 0;
            std::size_t events = 0;
        };

        auto outcome = co_await query<Outcome>([this, &blocks](store::IConnection & connection) -> Result<Outcome>
        {
            return _inTransaction(connection, [&]() -> Result<Outcome>
            {
                Outcome out;

                auto block_rows = runStatements(connection, {blockStatement(blocks)});
                if(!block_rows) return std::unexpected(block_rows.error());
                out.blocks = block_rows->rows_inserted;
                out.summary += *block_rows;

                auto extrinsic_rows = runStatements(connection, {extrinsicStatement(blocks)});
                if(!extrinsic_rows) return std::unexpected(extrinsic_rows.error());
                out.extrinsics = extrinsic_rows->rows_inserted;
                out.summary += *extrinsic_rows;

                auto event_rows = runStatements(connection, {eventStatement(blocks)});
                if(!event_rows) return std::unexpected(event_rows.error());
                out.events = event_rows->rows_inserted;
                out.summary += *event_rows;

                return out;
            });
        });

        if(!outcome)
        {
            spdlog::error("Block commit of {} blocks failed: {}", blocks.size(), outcome.error().message);
            co_return std::unexpected(outcome.error());
        }

        absl::flat_hash_set<std::uint64_t> block_heights;
        absl::flat_hash_set<std::uint64_t> extrinsic_heights;
        absl::flat_hash_set<std::uint64_t> event_heights;
        for(const chain::DecodedBlock & decoded : blocks)
        {
            block_heights.insert(decoded.block.height);
            if(!decoded.extrinsics.empty()) extrinsic_heights.insert(decoded.block.height);
            if(!decoded.events.empty()) event_heights.insert(decoded.block.height);
        }

        std::vector<notify::ChangeEvent> events;
        if(outcome->blocks > 0)
        {
            auto block_events = _heightEvents(store::table::BLOCKS, block_heights);
            events.insert(events.end(), block_events.begin(), block_events.end());
        }
        if(outcome->extrinsics > 0)
        {
            auto extrinsic_events = _heightEvents(store::table::EXTRINSICS, extrinsic_heights);
            events.insert(events.end(), extrinsic_events.begin(), extrinsic_events.end());
        }
        if(outcome->events > 0)
        {
            auto event_events = _heightEvents(store::table::EVENTS, event_heights);
            events.insert(events.end(), event_events.begin(), event_events.end());
        }
        publish(std::move(events));

        spdlog::info("Committed {} blocks ({} rows, {} statements)", blocks.size(), outcome->summary.rows_inserted, outcome->summary.statements);
        co_return outcome->summary;
    }

    asio::awaitable<Result<CommitSummary>> WriteCoordinator::commitStorage(chain::StorageDelta delta, std::optional<store::TaskRecord> completed)
    {
        const auto summary = co_await query<CommitSummary>([this, &delta, &completed](store::IConnection & connection) -> Result<CommitSummary>
        {
            return _inTransaction(connection, [&]() -> Result<CommitSummary>
            {
                const auto stored_hash = connection.blockHash(delta.height);
                if(!stored_hash)
                {
                    return std::unexpected(stored_hash.error());
                }

                if(!stored_hash->has_value())
                {
                    return std::unexpected(StoreError{StoreError::Kind::MISSING_BLOCK,
                        std::format("no block row at height {}", delta.height)});
                }

                if(!delta.block_hash.empty() && delta.block_hash != **stored_hash)
                {
                    return std::unexpected(StoreError{StoreError::Kind::MISSING_BLOCK,
                        std::format("block at height {} has a different hash than the storage delta", delta.height)});
                }

                auto inserted = runStatements(connection, {storageStatement(delta, **stored_hash)});
                if(!inserted)
                {
                    return std::unexpected(inserted.error());
                }

                if(completed)
                {
                    store::TaskRecord done = *completed;
                    done.status = store::TaskStatus::DONE;
                    done.next_run_at.reset();
                    done.last_error.reset();

                    if(auto updated = connection.updateTask(done); !updated)
                    {
                        return std::unexpected(updated.error());
                    }
                }
                return *inserted;
            });
        });

        if(!summary)
        {
            co_return std::unexpected(summary.error());
        }

        if(summary->rows_inserted > 0)
        {
            publish({notify::inserted(store::table::STORAGE, delta.height)});
        }

        spdlog::debug("Committed storage at height {} ({} rows)", delta.height, summary->rows_inserted);
        co_return *summary;
    }

    asio::awaitable<Result<CommitSummary>> WriteCoordinator::commitMetadata(std::uint32_t version, std::uint64_t first_height, Bytes metadata)
    {
        InsertStatement statement{
            .table = std::string(store::table::METADATA),
            .columns = {"version", "first_height", "meta"},
            .rows = {{static_cast<std::uint64_t>(version), first_height, std::move(metadata)}}
        };

        const auto summary = co_await query<CommitSummary>([this, &statement](store::IConnection & connection)
        {
            return runStatements(connection, {statement});
        });

        if(summary && summary->rows_inserted > 0)
        {
            spdlog::info("Stored metadata for runtime version {} (first height {})", version, first_height);
            publish({notify::inserted(store::table::METADATA, version)});
        }
        co_return summary;
    }

    asio::awaitable<Result<CommitSummary>> WriteCoordinator::recordBlockErrors(std::vector<store::BlockErrorRecord> errors)
    {
        if(errors.empty())
        {
            co_return CommitSummary{};
        }

        InsertStatement statement{
            .table = std::string(store::table::BLOCK_ERRORS),
            .columns = {"height", "kind", "message", "recorded_at"},
            .rows = {},
            .conflict_columns = {"height"},
            .update_columns = {"kind", "message", "recorded_at"}
        };

        for(store::BlockErrorRecord & error : errors)
        {
            statement.rows.push_back({
                error.height,
                std::move(error.kind),
                std::move(error.message),
                static_cast<std::uint64_t>(error.recorded_at.time_since_epoch().count())
            });
        }

        co_return co_await query<CommitSummary>([this, &statement](store::IConnection & connection)
        {
            return runStatements(connection, {statement});
        });
    }

    asio::awaitable<Result<CommitSummary>> WriteCoordinator::enqueueTasks(std::vector<store::TaskRecord> tasks)
    {
        if(tasks.empty())
        {
            co_return CommitSummary{};
        }

        InsertStatement statement{
            .table = std::string(store::table::RECOVERY_TASKS),
            .columns = {"target_height", "status", "attempt_count", "payload"},
            .rows = {},
            .conflict_columns = {"target_height"}
        };

        for(store::TaskRecord & task : tasks)
        {
            statement.rows.push_back({
                task.target_height,
                std::string(store::toString(task.status)),
                static_cast<std::uint64_t>(task.attempt_count),
                std::move(task.payload)
            });
        }

        co_return co_await query<CommitSummary>([this, &statement](store::IConnection & connection)
        {
            return runStatements(connection, {statement});
        });
    }

    asio::awaitable<Result<std::vector<store::TaskRecord>>> WriteCoordinator::claimTasks(std::size_t limit, store::Timestamp at)
    {
        co_return co_await query<std::vector<store::TaskRecord>>([limit, at](store::IConnection & connection)
        {
            return connection.claimTasks(limit, at);
        });
    }

    asio::awaitable<Result<void>> WriteCoordinator::updateTask(store::TaskRecord task)
    {
        co_return co_await query<void>([&task](store::IConnection & connection)
        {
            return connection.updateTask(task);
        });
    }

    asio::awaitable<Result<std::size_t>> WriteCoordinator::requeueDueTasks(store::Timestamp at)
    {
        co_return co_await query<std::size_t>([at](store::IConnection & connection)
        {
            return connection.requeueDueTasks(at);
        });
    }

    asio::awaitable<Result<std::size_t>> WriteCoordinator::resetRunningTasks()
    {
        co_return co_await query<std::size_t>([](store::IConnection & connection)
        {
            return connection.resetRunningTasks();
        });
    }

    asio::awaitable<Result<void>> WriteCoordinator::notify(std::string channel, std::string payload)
    {
        co_return co_await query<void>([&channel, &payload](store::IConnection & connection)
        {
            return connection.notify(channel, payload);
        });
    }
}
