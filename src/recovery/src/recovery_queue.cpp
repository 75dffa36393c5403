#include "recovery_queue.hpp"

#include <algorithm>

#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/parallel_group.hpp>

#include <spdlog/spdlog.h>

using namespace asio::experimental::awaitable_operators;

namespace chainsink::recovery
{
    namespace
    {
        bool _retryable(const chain::ChainError & error)
        {
            return error.kind != chain::ChainError::Kind::UNSUPPORTED && error.kind != chain::ChainError::Kind::MALFORMED;
        }
    }

    RecoveryQueue::RecoveryQueue(chain::IChainClient & chain, write::WriteCoordinator & coordinator, RecoveryConfig cfg, Clock clock)
    : _chain(chain), _coordinator(coordinator), _cfg(std::move(cfg)), _clock(std::move(clock))
    {
        _cfg.workers = std::max<std::size_t>(1, _cfg.workers);
    }

    asio::awaitable<store::Result<write::CommitSummary>> RecoveryQueue::enqueue(std::vector<RecoveryJob> jobs)
    {
        std::vector<store::TaskRecord> tasks;
        tasks.reserve(jobs.size());
        for(const RecoveryJob & job : jobs)
        {
            auto task = makeTask(job);
            if(!task)
            {
                spdlog::error("Cannot encode recovery job for height {}: {}", jobHeight(job), task.error().message);
                continue;
            }
            tasks.push_back(std::move(*task));
        }

        const auto summary = co_await _coordinator.enqueueTasks(std::move(tasks));
        if(summary && summary->rows_inserted > 0)
        {
            spdlog::info("Queued {} storage recovery tasks", summary->rows_inserted);
        }
        co_return summary;
    }

    asio::awaitable<store::Result<std::size_t>> RecoveryQueue::recoverInterrupted()
    {
        const auto reset = co_await _coordinator.resetRunningTasks();
        if(reset && *reset > 0)
        {
            spdlog::warn("Returned {} interrupted recovery tasks to pending", *reset);
        }
        co_return reset;
    }

    asio::awaitable<store::Result<std::vector<store::TaskRecord>>> RecoveryQueue::permanentlyFailed(std::size_t limit)
    {
        co_return co_await _coordinator.query<std::vector<store::TaskRecord>>([limit](store::IConnection & connection)
        {
            return connection.permanentlyFailedTasks(limit);
        });
    }

    asio::awaitable<std::expected<chain::StorageDelta, TaskOutcome>> RecoveryQueue::recoverDelta(const store::TaskRecord & task)
    {
        const auto job = parse::parseFromJson<RecoveryJob>(task.payload, parse::use_protobuf);
        if(!job)
        {
            co_return std::unexpected(TaskOutcome{false, std::format("undecodable payload: {}", job.error().message), false});
        }

        std::expected<chain::StorageDelta, chain::ChainError> delta;
        bool is_full = false;
        Bytes block_hash;

        switch(job->job_case())
        {
            case RecoveryJob::kExecuteBlock :
                block_hash.assign(job->execute_block().block_hash().begin(), job->execute_block().block_hash().end());
                delta = co_await _chain.executeBlock(task.target_height);
                break;

            case RecoveryJob::kFullStorage :
                is_full = true;
                delta = co_await _chain.fullStorage(task.target_height);
                break;

            default:
                co_return std::unexpected(TaskOutcome{false, "recovery job has no kind", false});
        }

        if(!delta)
        {
            co_return std::unexpected(TaskOutcome{false, std::format("{}: {}", delta.error().kind, delta.error().message), _retryable(delta.error())});
        }

        delta->height = task.target_height;
        delta->is_full = is_full;
        if(delta->block_hash.empty())
        {
            delta->block_hash = std::move(block_hash);
        }
        co_return std::move(*delta);
    }

    asio::awaitable<TaskOutcome> RecoveryQueue::execute(const store::TaskRecord & task)
    {
        asio::steady_timer deadline(co_await asio::this_coro::executor, _cfg.task_timeout);
        auto raced = co_await (recoverDelta(task) || deadline.async_wait(asio::use_awaitable));

        if(raced.index() == 1)
        {
            co_return TaskOutcome{false, std::format("timed out after {}ms", _cfg.task_timeout.count()), true};
        }

        auto delta = std::move(std::get<0>(raced));
        if(!delta)
        {
            co_return delta.error();
        }

        // once started the commit runs to completion, it marks the task done in the same transaction
        const auto committed = co_await _coordinator.commitStorage(std::move(*delta), task);
        if(!committed)
        {
            co_return TaskOutcome{false, std::format("{}: {}", committed.error().kind, committed.error().message), true};
        }

        co_return TaskOutcome{true};
    }

    asio::awaitable<RecoveryQueue::RunResult> RecoveryQueue::runTask(store::TaskRecord task)
    {
        const TaskOutcome outcome = co_await execute(task);

        if(outcome.success)
        {
            spdlog::debug("Recovered storage at height {}", task.target_height);
            co_return RunResult::COMPLETED;
        }

        const store::TaskRecord next = transition(task, outcome, _clock(), _cfg.retry);

        if(const auto updated = co_await _coordinator.updateTask(next); !updated)
        {
            // the task stays `running` and is picked up again after a restart
            spdlog::error("Cannot record failure of recovery task {}: {}", task.target_height, updated.error().message);
        }

        if(store::isPermanentlyFailed(next))
        {
            spdlog::error("Storage recovery at height {} failed for good after {} attempts: {}",
                task.target_height, next.attempt_count, outcome.error);
            co_return RunResult::FAILED;
        }

        spdlog::warn("Storage recovery at height {} failed (attempt {}/{}), retrying: {}",
            task.target_height, next.attempt_count, _cfg.retry.max_attempts, outcome.error);
        co_return RunResult::RETRYING;
    }

    asio::awaitable<store::Result<RoundSummary>> RecoveryQueue::runOnce()
    {
        RoundSummary summary;

        const auto requeued = co_await _coordinator.requeueDueTasks(_clock());
        if(!requeued)
        {
            co_return std::unexpected(requeued.error());
        }
        summary.requeued = *requeued;

        auto claimed = co_await _coordinator.claimTasks(_cfg.workers, _clock());
        if(!claimed)
        {
            co_return std::unexpected(claimed.error());
        }
        summary.claimed = claimed->size();

        if(claimed->empty())
        {
            co_return summary;
        }

        const auto executor = co_await asio::this_coro::executor;

        using TaskOp = decltype(asio::co_spawn(executor, runTask(store::TaskRecord{}), asio::deferred));
        std::vector<TaskOp> ops;
        ops.reserve(claimed->size());
        for(store::TaskRecord & task : *claimed)
        {
            ops.push_back(asio::co_spawn(executor, runTask(std::move(task)), asio::deferred));
        }

        auto [order, exceptions, results] = co_await asio::experimental::make_parallel_group(std::move(ops)).async_wait(
            asio::experimental::wait_for_all(),
            asio::use_awaitable);

        for(const std::exception_ptr & e : exceptions)
        {
            if(e)
            {
                std::rethrow_exception(e);
            }
        }

        for(const RunResult result : results)
        {
            switch(result)
            {
                case RunResult::COMPLETED : ++summary.completed; break;
                case RunResult::RETRYING : ++summary.retrying; break;
                case RunResult::FAILED : ++summary.permanently_failed; break;
            }
        }

        spdlog::info("Recovery round: {} claimed, {} completed, {} retrying, {} failed",
            summary.claimed, summary.completed, summary.retrying, summary.permanently_failed);
        co_return summary;
    }
}
