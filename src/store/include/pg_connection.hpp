#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <libpq-fe.h>

#include "connection.hpp"

namespace chainsink::store
{
    /**
     * @brief `IConnection` over libpq.
     *
     * All parameters travel in text format; binary columns are sent and read as `\x` hex.
     */
    class PgConnection final : public IConnection
    {
    public:
        static Result<std::unique_ptr<IConnection>> connect(const std::string & database_url);

        ~PgConnection() override;

        PgConnection(const PgConnection &) = delete;
        PgConnection & operator=(const PgConnection &) = delete;

        Result<void> migrate() override;

        Result<void> begin() override;
        Result<void> commit() override;
        Result<void> rollback() override;

        Result<std::size_t> insert(const InsertStatement & statement) override;

        Result<std::vector<std::uint64_t>> blockHeights(std::uint64_t from, std::uint64_t to) override;

        Result<std::optional<Bytes>> blockHash(std::uint64_t height) override;

        Result<std::vector<std::uint64_t>> storageHeights(std::uint64_t from, std::uint64_t to) override;

        Result<std::vector<std::uint64_t>> erroredHeights(std::uint64_t from, std::uint64_t to) override;

        Result<std::vector<TaskRecord>> tasks(std::uint64_t from, std::uint64_t to) override;

        Result<std::vector<BreakpointRecord>> breakpoints() override;

        Result<std::vector<TaskRecord>> claimTasks(std::size_t limit, Timestamp at) override;

        Result<void> updateTask(const TaskRecord & task) override;

        Result<std::size_t> requeueDueTasks(Timestamp at) override;

        Result<std::size_t> resetRunningTasks() override;

        Result<std::vector<TaskRecord>> permanentlyFailedTasks(std::size_t limit) override;

        Result<void> notify(const std::string & channel, const std::string & payload) override;

    private:
        struct ResultDeleter
        {
            void operator()(PGresult * result) const { PQclear(result); }
        };

        using PgResult = std::unique_ptr<PGresult, ResultDeleter>;

        explicit PgConnection(PGconn * connection);

        Result<PgResult> exec(const std::string & sql, const std::vector<std::optional<std::string>> & params = {});

        Result<std::vector<std::uint64_t>> heightColumn(const std::string & sql, std::uint64_t from, std::uint64_t to);

        Result<std::vector<TaskRecord>> taskRows(const PgResult & result) const;

        PGconn * _connection;
    };

    /**
     * @brief SQL text of `statement` with `$n` placeholders, one per bound parameter.
     */
    std::string toSql(const InsertStatement & statement);

    /**
     * @brief DDL of the pipeline tables, safe to run repeatedly.
     */
    const std::string & migrationSql();
}
