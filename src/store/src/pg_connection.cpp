#include "pg_connection.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

namespace chainsink::store
{
    namespace
    {
        struct _TextParam
        {
            std::optional<std::string> operator()(std::monostate) const { return std::nullopt; }
            std::optional<std::string> operator()(std::uint64_t value) const { return std::to_string(value); }
            std::optional<std::string> operator()(bool value) const { return value ? "true" : "false"; }
            std::optional<std::string> operator()(const std::string & value) const { return value; }
            std::optional<std::string> operator()(const Bytes & value) const { return "\\x" + utils::toHex(value); }
            std::optional<std::string> operator()(const nlohmann::json & value) const { return value.dump(); }
        };

        std::string _join(const std::vector<std::string> & values, const std::string & separator)
        {
            std::string out;
            for(std::size_t i = 0; i < values.size(); ++i)
            {
                if(i > 0) out += separator;
                out += values[i];
            }
            return out;
        }

        std::optional<std::uint64_t> _readUnsigned(const PGresult * result, int row, int column)
        {
            if(PQgetisnull(result, row, column))
            {
                return std::nullopt;
            }

            const char * text = PQgetvalue(result, row, column);
            const int length = PQgetlength(result, row, column);

            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text, text + length, value);
            if(ec != std::errc{} || ptr != text + length)
            {
                return std::nullopt;
            }
            return value;
        }

        std::optional<std::string> _readText(const PGresult * result, int row, int column)
        {
            if(PQgetisnull(result, row, column))
            {
                return std::nullopt;
            }
            return std::string(PQgetvalue(result, row, column), static_cast<std::size_t>(PQgetlength(result, row, column)));
        }

        std::optional<Bytes> _readBytea(const PGresult * result, int row, int column)
        {
            auto text = _readText(result, row, column);
            if(!text)
            {
                return std::nullopt;
            }

            std::string_view hex = *text;
            if(hex.starts_with("\\x"))
            {
                hex.remove_prefix(2);
            }
            return utils::fromHex(hex);
        }

        std::optional<Timestamp> _readTimestamp(const PGresult * result, int row, int column)
        {
            const auto millis = _readUnsigned(result, row, column);
            if(!millis)
            {
                return std::nullopt;
            }
            return Timestamp{std::chrono::milliseconds{static_cast<std::int64_t>(*millis)}};
        }

        std::optional<std::string> _timestampParam(const std::optional<Timestamp> & value)
        {
            if(!value)
            {
                return std::nullopt;
            }
            return std::to_string(value->time_since_epoch().count());
        }

        StoreError::Kind _errorKind(const PGresult * result, PGconn * connection)
        {
            if(PQstatus(connection) != CONNECTION_OK)
            {
                return StoreError::Kind::CONNECTION;
            }

            // class 23: integrity constraint violation
            const char * state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
            if(state != nullptr && std::string_view(state).starts_with("23"))
            {
                return StoreError::Kind::CONSTRAINT;
            }
            return StoreError::Kind::QUERY;
        }

        std::size_t _affectedRows(const PGresult * result)
        {
            const char * affected = PQcmdTuples(const_cast<PGresult *>(result));
            std::size_t count = 0;
            std::from_chars(affected, affected + std::strlen(affected), count);
            return count;
        }

        constexpr const char * TASK_COLUMNS =
            "id, target_height, status, attempt_count, payload, last_run_at, next_run_at, last_error";
    }

    const std::string & migrationSql()
    {
        static const std::string sql = R"sql(
CREATE TABLE IF NOT EXISTS metadata (
    version BIGINT PRIMARY KEY CHECK (version >= 0),
    first_height BIGINT NOT NULL CHECK (first_height >= 0),
    meta BYTEA NOT NULL
);

CREATE TABLE IF NOT EXISTS blocks (
    hash BYTEA PRIMARY KEY,
    parent_hash BYTEA NOT NULL,
    height BIGINT NOT NULL UNIQUE CHECK (height >= 0),
    state_root BYTEA NOT NULL,
    extrinsics_root BYTEA NOT NULL,
    schema_version BIGINT NOT NULL REFERENCES metadata(version),
    payload BYTEA
);

CREATE TABLE IF NOT EXISTS extrinsics (
    id BIGSERIAL PRIMARY KEY,
    block_hash BYTEA NOT NULL REFERENCES blocks(hash) ON DELETE CASCADE,
    height BIGINT NOT NULL CHECK (height >= 0),
    idx BIGINT NOT NULL CHECK (idx >= 0),
    module TEXT NOT NULL,
    call_name TEXT NOT NULL,
    signature BYTEA,
    args JSONB NOT NULL,
    UNIQUE (block_hash, idx)
);

CREATE TABLE IF NOT EXISTS events (
    id BIGSERIAL PRIMARY KEY,
    block_hash BYTEA NOT NULL REFERENCES blocks(hash) ON DELETE CASCADE,
    height BIGINT NOT NULL CHECK (height >= 0),
    idx BIGINT NOT NULL CHECK (idx >= 0),
    module TEXT NOT NULL,
    event_name TEXT NOT NULL,
    parameters JSONB NOT NULL,
    UNIQUE (block_hash, idx)
);

CREATE TABLE IF NOT EXISTS storage (
    id BIGSERIAL PRIMARY KEY,
    height BIGINT NOT NULL CHECK (height >= 0),
    block_hash BYTEA NOT NULL REFERENCES blocks(hash) ON DELETE CASCADE,
    is_full BOOLEAN NOT NULL,
    key BYTEA NOT NULL,
    value BYTEA
);

CREATE UNIQUE INDEX IF NOT EXISTS storage_block_key_value_idx
    ON storage (block_hash, key, COALESCE(md5(value), 'deleted'));
CREATE INDEX IF NOT EXISTS storage_height_idx ON storage (height);

CREATE TABLE IF NOT EXISTS recovery_tasks (
    id BIGSERIAL PRIMARY KEY,
    target_height BIGINT NOT NULL UNIQUE CHECK (target_height >= 0),
    status TEXT NOT NULL CHECK (status IN ('pending', 'running', 'done', 'failed')),
    attempt_count BIGINT NOT NULL DEFAULT 0 CHECK (attempt_count >= 0),
    payload JSONB NOT NULL,
    last_run_at BIGINT,
    next_run_at BIGINT,
    last_error TEXT
);

CREATE INDEX IF NOT EXISTS recovery_tasks_status_idx ON recovery_tasks (status, next_run_at);

CREATE TABLE IF NOT EXISTS block_errors (
    height BIGINT PRIMARY KEY CHECK (height >= 0),
    kind TEXT NOT NULL,
    message TEXT NOT NULL,
    recorded_at BIGINT NOT NULL
);
)sql";
        return sql;
    }

    std::string toSql(const InsertStatement & statement)
    {
        std::string sql = std::format("INSERT INTO {} ({}) VALUES ", statement.table, _join(statement.columns, ", "));

        std::size_t param = 1;
        for(std::size_t row = 0; row < statement.rows.size(); ++row)
        {
            if(row > 0) sql += ", ";
            sql += "(";
            for(std::size_t column = 0; column < statement.columns.size(); ++column)
            {
                if(column > 0) sql += ", ";
                sql += std::format("${}", param++);
            }
            sql += ")";
        }

        if(statement.update_columns.empty())
        {
            sql += " ON CONFLICT DO NOTHING";
            return sql;
        }

        std::vector<std::string> assignments;
        assignments.reserve(statement.update_columns.size());
        for(const std::string & column : statement.update_columns)
        {
            assignments.push_back(std::format("{0} = EXCLUDED.{0}", column));
        }

        sql += std::format(" ON CONFLICT ({}) DO UPDATE SET {}", _join(statement.conflict_columns, ", "), _join(assignments, ", "));
        return sql;
    }

    Result<std::unique_ptr<IConnection>> PgConnection::connect(const std::string & database_url)
    {
        PGconn * connection = PQconnectdb(database_url.c_str());
        if(connection == nullptr)
        {
            return std::unexpected(StoreError{StoreError::Kind::CONNECTION, "out of memory"});
        }

        if(PQstatus(connection) != CONNECTION_OK)
        {
            StoreError error{StoreError::Kind::CONNECTION, PQerrorMessage(connection)};
            PQfinish(connection);
            return std::unexpected(std::move(error));
        }

        return std::unique_ptr<IConnection>(new PgConnection(connection));
    }

    PgConnection::PgConnection(PGconn * connection)
    : _connection(connection)
    {
    }

    PgConnection::~PgConnection()
    {
        PQfinish(_connection);
    }

    Result<PgConnection::PgResult> PgConnection::exec(const std::string & sql, const std::vector<std::optional<std::string>> & params)
    {
        std::vector<const char *> values;
        values.reserve(params.size());
        for(const auto & param : params)
        {
            values.push_back(param ? param->c_str() : nullptr);
        }

        PgResult result(PQexecParams(
            _connection,
            sql.c_str(),
            static_cast<int>(values.size()),
            nullptr,
            values.empty() ? nullptr : values.data(),
            nullptr,
            nullptr,
            0));

        if(!result)
        {
            return std::unexpected(StoreError{StoreError::Kind::CONNECTION, PQerrorMessage(_connection)});
        }

        const ExecStatusType status = PQresultStatus(result.get());
        if(status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK)
        {
            StoreError error{_errorKind(result.get(), _connection), PQresultErrorMessage(result.get())};
            spdlog::debug("PostgreSQL error: {}", error.message);
            return std::unexpected(std::move(error));
        }

        return result;
    }

    Result<void> PgConnection::migrate()
    {
        // multiple statements are only accepted without parameters
        PgResult result(PQexec(_connection, migrationSql().c_str()));
        if(!result || PQresultStatus(result.get()) != PGRES_COMMAND_OK)
        {
            return std::unexpected(StoreError{StoreError::Kind::QUERY, PQerrorMessage(_connection)});
        }
        spdlog::info("Store schema is up to date");
        return {};
    }

    Result<void> PgConnection::begin()
    {
        const auto res = exec("BEGIN");
        if(!res) return std::unexpected(res.error());
        return {};
    }

    Result<void> PgConnection::commit()
    {
        const auto res = exec("COMMIT");
        if(!res) return std::unexpected(res.error());
        return {};
    }

    Result<void> PgConnection::rollback()
    {
        const auto res = exec("ROLLBACK");
        if(!res) return std::unexpected(res.error());
        return {};
    }

    Result<std::size_t> PgConnection::insert(const InsertStatement & statement)
    {
        if(statement.rows.empty())
        {
            return 0;
        }

        std::vector<std::optional<std::string>> params;
        params.reserve(statement.parameterCount());
        for(const Row & row : statement.rows)
        {
            if(row.size() != statement.columns.size())
            {
                return std::unexpected(StoreError{StoreError::Kind::QUERY,
                    std::format("row has {} values for {} columns of {}", row.size(), statement.columns.size(), statement.table)});
            }

            for(const Value & value : row)
            {
                params.push_back(std::visit(_TextParam{}, value));
            }
        }

        const auto result = exec(toSql(statement), params);
        if(!result)
        {
            return std::unexpected(result.error());
        }

        return _affectedRows(result->get());
    }

    Result<std::vector<std::uint64_t>> PgConnection::heightColumn(const std::string & sql, std::uint64_t from, std::uint64_t to)
    {
        const auto result = exec(sql, {std::to_string(from), std::to_string(to)});
        if(!result)
        {
            return std::unexpected(result.error());
        }

        std::vector<std::uint64_t> heights;
        const int rows = PQntuples(result->get());
        heights.reserve(static_cast<std::size_t>(rows));
        for(int row = 0; row < rows; ++row)
        {
            const auto height = _readUnsigned(result->get(), row, 0);
            if(!height)
            {
                return std::unexpected(StoreError{StoreError::Kind::QUERY, "height column is not an unsigned integer"});
            }
            heights.push_back(*height);
        }
        return heights;
    }

    Result<std::vector<std::uint64_t>> PgConnection::blockHeights(std::uint64_t from, std::uint64_t to)
    {
        return heightColumn("SELECT height FROM blocks WHERE height BETWEEN $1 AND $2 ORDER BY height", from, to);
    }

    Result<std::optional<Bytes>> PgConnection::blockHash(std::uint64_t height)
    {
        const auto result = exec("SELECT hash FROM blocks WHERE height = $1", {std::to_string(height)});
        if(!result)
        {
            return std::unexpected(result.error());
        }

        if(PQntuples(result->get()) == 0)
        {
            return std::optional<Bytes>{};
        }
        return _readBytea(result->get(), 0, 0);
    }

    Result<std::vector<std::uint64_t>> PgConnection::storageHeights(std::uint64_t from, std::uint64_t to)
    {
        return heightColumn("SELECT DISTINCT height FROM storage WHERE height BETWEEN $1 AND $2 ORDER BY height", from, to);
    }

    Result<std::vector<std::uint64_t>> PgConnection::erroredHeights(std::uint64_t from, std::uint64_t to)
    {
        return heightColumn("SELECT height FROM block_errors WHERE height BETWEEN $1 AND $2 ORDER BY height", from, to);
    }

    Result<std::vector<TaskRecord>> PgConnection::taskRows(const PgResult & result) const
    {
        std::vector<TaskRecord> tasks;
        const int rows = PQntuples(result.get());
        tasks.reserve(static_cast<std::size_t>(rows));

        for(int row = 0; row < rows; ++row)
        {
            TaskRecord task;

            const auto id = _readUnsigned(result.get(), row, 0);
            const auto height = _readUnsigned(result.get(), row, 1);
            const auto status = _readText(result.get(), row, 2);
            const auto attempts = _readUnsigned(result.get(), row, 3);
            if(!id || !height || !status || !attempts)
            {
                return std::unexpected(StoreError{StoreError::Kind::QUERY, "malformed recovery task row"});
            }

            const auto parsed_status = taskStatusFromString(*status);
            if(!parsed_status)
            {
                return std::unexpected(StoreError{StoreError::Kind::QUERY, std::format("unknown task status `{}`", *status)});
            }

            task.id = *id;
            task.target_height = *height;
            task.status = *parsed_status;
            task.attempt_count = static_cast<std::uint32_t>(*attempts);
            task.payload = _readText(result.get(), row, 4).value_or("{}");
            task.last_run_at = _readTimestamp(result.get(), row, 5);
            task.next_run_at = _readTimestamp(result.get(), row, 6);
            task.last_error = _readText(result.get(), row, 7);

            tasks.push_back(std::move(task));
        }
        return tasks;
    }

    Result<std::vector<TaskRecord>> PgConnection::tasks(std::uint64_t from, std::uint64_t to)
    {
        const auto result = exec(
            std::format("SELECT {} FROM recovery_tasks WHERE target_height BETWEEN $1 AND $2 ORDER BY target_height", TASK_COLUMNS),
            {std::to_string(from), std::to_string(to)});
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return taskRows(*result);
    }

    Result<std::vector<BreakpointRecord>> PgConnection::breakpoints()
    {
        const auto result = exec("SELECT first_height, version FROM metadata ORDER BY first_height");
        if(!result)
        {
            return std::unexpected(result.error());
        }

        std::vector<BreakpointRecord> breakpoints;
        const int rows = PQntuples(result->get());
        for(int row = 0; row < rows; ++row)
        {
            const auto first_height = _readUnsigned(result->get(), row, 0);
            const auto version = _readUnsigned(result->get(), row, 1);
            if(!first_height || !version)
            {
                return std::unexpected(StoreError{StoreError::Kind::QUERY, "malformed metadata row"});
            }
            breakpoints.push_back(BreakpointRecord{*first_height, static_cast<std::uint32_t>(*version)});
        }
        return breakpoints;
    }

    Result<std::vector<TaskRecord>> PgConnection::claimTasks(std::size_t limit, Timestamp at)
    {
        const auto result = exec(std::format(
            "UPDATE recovery_tasks SET status = 'running', attempt_count = attempt_count + 1, last_run_at = $2 "
            "WHERE id IN (SELECT id FROM recovery_tasks WHERE status = 'pending' "
            "ORDER BY target_height LIMIT $1 FOR UPDATE SKIP LOCKED) "
            "RETURNING {}", TASK_COLUMNS),
            {std::to_string(limit), std::to_string(at.time_since_epoch().count())});
        if(!result)
        {
            return std::unexpected(result.error());
        }

        auto claimed = taskRows(*result);
        if(claimed)
        {
            std::ranges::sort(*claimed, {}, &TaskRecord::target_height);
        }
        return claimed;
    }

    Result<void> PgConnection::updateTask(const TaskRecord & task)
    {
        const auto result = exec(
            "UPDATE recovery_tasks SET status = $2, attempt_count = $3, last_run_at = $4, next_run_at = $5, last_error = $6 "
            "WHERE id = $1",
            {
                std::to_string(task.id),
                std::string(toString(task.status)),
                std::to_string(task.attempt_count),
                _timestampParam(task.last_run_at),
                _timestampParam(task.next_run_at),
                task.last_error
            });
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return {};
    }

    Result<std::size_t> PgConnection::requeueDueTasks(Timestamp at)
    {
        const auto result = exec(
            "UPDATE recovery_tasks SET status = 'pending', next_run_at = NULL "
            "WHERE status = 'failed' AND next_run_at IS NOT NULL AND next_run_at <= $1",
            {std::to_string(at.time_since_epoch().count())});
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return _affectedRows(result->get());
    }

    Result<std::size_t> PgConnection::resetRunningTasks()
    {
        const auto result = exec("UPDATE recovery_tasks SET status = 'pending' WHERE status = 'running'");
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return _affectedRows(result->get());
    }

    Result<std::vector<TaskRecord>> PgConnection::permanentlyFailedTasks(std::size_t limit)
    {
        const auto result = exec(std::format(
            "SELECT {} FROM recovery_tasks WHERE status = 'failed' AND next_run_at IS NULL "
            "ORDER BY target_height LIMIT $1", TASK_COLUMNS),
            {std::to_string(limit)});
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return taskRows(*result);
    }

    Result<void> PgConnection::notify(const std::string & channel, const std::string & payload)
    {
        const auto result = exec("SELECT pg_notify($1, $2)", {channel, payload});
        if(!result)
        {
            return std::unexpected(result.error());
        }
        return {};
    }
}
