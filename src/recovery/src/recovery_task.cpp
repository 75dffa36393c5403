#include "recovery_task.hpp"

namespace chainsink::recovery
{
    std::chrono::milliseconds retryDelay(std::uint32_t attempt_count, const RetryPolicy & policy)
    {
        return utils::exponentialBackoff(attempt_count, policy.backoff_base, policy.backoff_max);
    }

    store::TaskRecord transition(store::TaskRecord task, const TaskOutcome & outcome, store::Timestamp now, const RetryPolicy & policy)
    {
        if(task.status != store::TaskStatus::RUNNING)
        {
            return task;
        }

        if(outcome.success)
        {
            task.status = store::TaskStatus::DONE;
            task.next_run_at.reset();
            task.last_error.reset();
            return task;
        }

        task.status = store::TaskStatus::FAILED;
        task.last_error = outcome.error;

        if(outcome.retryable && task.attempt_count < policy.max_attempts)
        {
            task.next_run_at = now + retryDelay(task.attempt_count, policy);
            return task;
        }

        task.next_run_at.reset();
        return task;
    }

    RecoveryJob makeExecuteBlockJob(std::uint64_t height, const Bytes & block_hash)
    {
        RecoveryJob job;
        job.set_encoding_version(JOB_ENCODING_VERSION);
        job.mutable_execute_block()->set_height(height);
        job.mutable_execute_block()->set_block_hash(std::string(block_hash.begin(), block_hash.end()));
        return job;
    }

    RecoveryJob makeFullStorageJob(std::uint64_t height)
    {
        RecoveryJob job;
        job.set_encoding_version(JOB_ENCODING_VERSION);
        job.mutable_full_storage()->set_height(height);
        return job;
    }

    std::uint64_t jobHeight(const RecoveryJob & job)
    {
        switch(job.job_case())
        {
            case RecoveryJob::kExecuteBlock : return job.execute_block().height();
            case RecoveryJob::kFullStorage : return job.full_storage().height();
            default: return 0;
        }
    }

    parse::Result<store::TaskRecord> makeTask(const RecoveryJob & job)
    {
        if(job.job_case() == RecoveryJob::JOB_NOT_SET)
        {
            return std::unexpected(parse::ParseError{parse::ParseError::Kind::INVALID_VALUE, "recovery job has no kind"});
        }

        auto payload = parse::parseToJson(job, parse::use_protobuf);
        if(!payload)
        {
            return std::unexpected(payload.error());
        }

        store::TaskRecord task;
        task.target_height = jobHeight(job);
        task.status = store::TaskStatus::PENDING;
        task.payload = std::move(*payload);
        return task;
    }
}

namespace chainsink::parse
{
    template<>
    Result<std::string> parseToJson(RecoveryJob job, use_protobuf_t)
    {
        google::protobuf::util::JsonPrintOptions options;
        options.preserve_proto_field_names = true; // Use snake_case from proto

        std::string json_output;

        auto status = google::protobuf::util::MessageToJsonString(job, &json_output, options);

        if(!status.ok()) return std::unexpected(ParseError{ParseError::Kind::INVALID_VALUE, "invalid recovery job"});

        return json_output;
    }

    template<>
    Result<RecoveryJob> parseFromJson(std::string json_str, use_protobuf_t)
    {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;

        RecoveryJob job;

        auto status = google::protobuf::util::JsonStringToMessage(json_str, &job, options);

        if(!status.ok()) return std::unexpected(ParseError{ParseError::Kind::INVALID_VALUE, std::string(status.message())});

        if(job.encoding_version() > recovery::JOB_ENCODING_VERSION)
        {
            return std::unexpected(ParseError{ParseError::Kind::UNSUPPORTED_VERSION,
                std::format("recovery job encoding {} is newer than {}", job.encoding_version(), recovery::JOB_ENCODING_VERSION)});
        }

        return job;
    }
}
