#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "schema.hpp"
#include "statement.hpp"
#include "store_error.hpp"
#include "utils.hpp"

namespace chainsink::store
{
    /**
     * @brief One session with the relational store.
     *
     * Implementations are not thread safe; a connection is used by one borrower at a time
     * through the `ConnectionPool`. Height ranges are inclusive.
     */
    class IConnection
    {
    public:
        virtual ~IConnection() = default;

        /**
         * @brief Creates the pipeline tables if they do not exist yet.
         */
        virtual Result<void> migrate() = 0;

        virtual Result<void> begin() = 0;
        virtual Result<void> commit() = 0;
        virtual Result<void> rollback() = 0;

        /**
         * @brief Runs the insert and returns the number of rows actually written.
         * Rows skipped by `ON CONFLICT DO NOTHING` are not counted.
         */
        virtual Result<std::size_t> insert(const InsertStatement & statement) = 0;

        virtual Result<std::vector<std::uint64_t>> blockHeights(std::uint64_t from, std::uint64_t to) = 0;

        virtual Result<std::optional<Bytes>> blockHash(std::uint64_t height) = 0;

        /**
         * @brief Heights in range with at least one storage row.
         */
        virtual Result<std::vector<std::uint64_t>> storageHeights(std::uint64_t from, std::uint64_t to) = 0;

        virtual Result<std::vector<std::uint64_t>> erroredHeights(std::uint64_t from, std::uint64_t to) = 0;

        virtual Result<std::vector<TaskRecord>> tasks(std::uint64_t from, std::uint64_t to) = 0;

        virtual Result<std::vector<BreakpointRecord>> breakpoints() = 0;

        /**
         * @brief Moves up to `limit` pending tasks, lowest height first, to `running`.
         * Increments their attempt count and stamps `last_run_at` with `at`.
         */
        virtual Result<std::vector<TaskRecord>> claimTasks(std::size_t limit, Timestamp at) = 0;

        virtual Result<void> updateTask(const TaskRecord & task) = 0;

        /**
         * @brief Failed tasks whose `next_run_at` is due go back to `pending`.
         */
        virtual Result<std::size_t> requeueDueTasks(Timestamp at) = 0;

        /**
         * @brief Every `running` task becomes `pending`.
         */
        virtual Result<std::size_t> resetRunningTasks() = 0;

        virtual Result<std::vector<TaskRecord>> permanentlyFailedTasks(std::size_t limit) = 0;

        virtual Result<void> notify(const std::string & channel, const std::string & payload) = 0;
    };

    using ConnectionFactory = std::function<Result<std::unique_ptr<IConnection>>()>;
}
