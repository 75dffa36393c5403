#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "recovery_job.pb.h"

#include "parser.hpp"
#include "schema.hpp"
#include "utils.hpp"

namespace chainsink::recovery
{
    using ::chainsink::RecoveryJob;

    // bumped whenever RecoveryJob changes incompatibly
    inline constexpr std::uint32_t JOB_ENCODING_VERSION = 1;

    struct RetryPolicy
    {
        std::uint32_t max_attempts = 5;
        std::chrono::milliseconds backoff_base = std::chrono::milliseconds(1000);
        std::chrono::milliseconds backoff_max = std::chrono::milliseconds(300000);
    };

    struct TaskOutcome
    {
        bool success = false;
        std::string error = "";
        // false for failures another attempt cannot fix
        bool retryable = true;
    };

    /**
     * @brief Applies the outcome of one run to a `running` task.
     *
     * Success marks the task done. A retryable failure below `max_attempts` schedules the next run
     * at `now + backoff(attempt_count)`; any other failure leaves the task failed with no retry.
     * Tasks in another state are returned unchanged.
     */
    store::TaskRecord transition(store::TaskRecord task, const TaskOutcome & outcome, store::Timestamp now, const RetryPolicy & policy);

    std::chrono::milliseconds retryDelay(std::uint32_t attempt_count, const RetryPolicy & policy);

    RecoveryJob makeExecuteBlockJob(std::uint64_t height, const Bytes & block_hash = {});

    RecoveryJob makeFullStorageJob(std::uint64_t height);

    std::uint64_t jobHeight(const RecoveryJob & job);

    /**
     * @brief A pending task carrying `job` as its payload.
     */
    parse::Result<store::TaskRecord> makeTask(const RecoveryJob & job);
}

namespace chainsink::parse
{
    template<>
    Result<std::string> parseToJson(RecoveryJob job, use_protobuf_t);

    /**
     * @brief Unknown fields are ignored; a newer `encoding_version` is rejected.
     */
    template<>
    Result<RecoveryJob> parseFromJson(std::string json_str, use_protobuf_t);
}
