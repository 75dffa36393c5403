#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

#include <asio.hpp>

#include "chain_interface.hpp"
#include "recovery_task.hpp"
#include "write_coordinator.hpp"

namespace chainsink::recovery
{
    struct RecoveryConfig
    {
        // tasks claimed and executed per round
        std::size_t workers = 2;
        std::chrono::milliseconds task_timeout = std::chrono::milliseconds(20000);
        RetryPolicy retry = {};
    };

    struct RoundSummary
    {
        std::size_t requeued = 0;
        std::size_t claimed = 0;
        std::size_t completed = 0;
        std::size_t retrying = 0;
        std::size_t permanently_failed = 0;
    };

    /**
     * @brief Durable queue of storage recovery tasks kept in `recovery_tasks`.
     *
     * A task runs at least once: whatever was `running` when the process stopped is pending
     * again after `recoverInterrupted`, and the idempotent storage insert absorbs repeats.
     */
    class RecoveryQueue
    {
    public:
        using Clock = std::function<store::Timestamp()>;

        RecoveryQueue(chain::IChainClient & chain, write::WriteCoordinator & coordinator, RecoveryConfig cfg, Clock clock = store::now);

        /**
         * @brief Adds pending tasks; heights that already have a task are left alone.
         */
        asio::awaitable<store::Result<write::CommitSummary>> enqueue(std::vector<RecoveryJob> jobs);

        asio::awaitable<store::Result<std::size_t>> recoverInterrupted();

        /**
         * @brief One round: requeue due retries, claim up to `workers` tasks, run them concurrently.
         */
        asio::awaitable<store::Result<RoundSummary>> runOnce();

        asio::awaitable<store::Result<std::vector<store::TaskRecord>>> permanentlyFailed(std::size_t limit);

    private:
        enum class RunResult : std::uint8_t
        {
            COMPLETED = 0,
            RETRYING,
            FAILED
        };

        asio::awaitable<RunResult> runTask(store::TaskRecord task);

        // chain side of a task, the only part bounded by `task_timeout`
        asio::awaitable<std::expected<chain::StorageDelta, TaskOutcome>> recoverDelta(const store::TaskRecord & task);

        asio::awaitable<TaskOutcome> execute(const store::TaskRecord & task);

        chain::IChainClient & _chain;
        write::WriteCoordinator & _coordinator;
        RecoveryConfig _cfg;
        Clock _clock;
    };
}
