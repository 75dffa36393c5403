#include "schema.hpp"

namespace chainsink::store
{
    Timestamp now()
    {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    }

    std::string_view toString(TaskStatus status)
    {
        switch(status)
        {
            case TaskStatus::PENDING : return "pending";
            case TaskStatus::RUNNING : return "running";
            case TaskStatus::DONE : return "done";
            case TaskStatus::FAILED : return "failed";
        }
        return "pending";
    }

    std::optional<TaskStatus> taskStatusFromString(std::string_view value)
    {
        if(value == "pending") return TaskStatus::PENDING;
        if(value == "running") return TaskStatus::RUNNING;
        if(value == "done") return TaskStatus::DONE;
        if(value == "failed") return TaskStatus::FAILED;
        return std::nullopt;
    }
}
