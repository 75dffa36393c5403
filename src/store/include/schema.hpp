#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace chainsink::store
{
    // wall clock in milliseconds, stored as BIGINT
    using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

    Timestamp now();

    namespace table
    {
        inline constexpr std::string_view BLOCKS = "blocks";
        inline constexpr std::string_view EXTRINSICS = "extrinsics";
        inline constexpr std::string_view EVENTS = "events";
        inline constexpr std::string_view STORAGE = "storage";
        inline constexpr std::string_view METADATA = "metadata";
        inline constexpr std::string_view RECOVERY_TASKS = "recovery_tasks";
        inline constexpr std::string_view BLOCK_ERRORS = "block_errors";
    }

    enum class TaskStatus : std::uint8_t
    {
        PENDING = 0,
        RUNNING,
        DONE,
        FAILED
    };

    std::string_view toString(TaskStatus status);

    std::optional<TaskStatus> taskStatusFromString(std::string_view value);

    struct TaskRecord
    {
        std::uint64_t id = 0;
        std::uint64_t target_height = 0;
        TaskStatus status = TaskStatus::PENDING;
        std::uint32_t attempt_count = 0;
        // protobuf JSON of the recovery job
        std::string payload;
        std::optional<Timestamp> last_run_at;
        // set while a failed task waits for its retry, absent once it failed for good
        std::optional<Timestamp> next_run_at;
        std::optional<std::string> last_error;
    };

    /**
     * @brief A failed task with no retry scheduled will not run again without an operator.
     */
    inline bool isPermanentlyFailed(const TaskRecord & task)
    {
        return task.status == TaskStatus::FAILED && !task.next_run_at.has_value();
    }

    struct BreakpointRecord
    {
        std::uint64_t first_height = 0;
        std::uint32_t version = 0;
    };

    struct BlockErrorRecord
    {
        std::uint64_t height = 0;
        std::string kind;
        std::string message;
        Timestamp recorded_at{};
    };
}

template <>
struct std::formatter<chainsink::store::TaskStatus> : std::formatter<std::string> {
    auto format(const chainsink::store::TaskStatus & status, format_context& ctx) const {
        return formatter<string>::format(std::string(chainsink::store::toString(status)), ctx);
    }
};
