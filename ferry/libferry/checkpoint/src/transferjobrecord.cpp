#include "transferjobrecord.hpp"

namespace ferry::checkpoint
{
const char *to_string(JobStatus status)
{
    switch (status)
    {
        case JobStatus::NOT_STARTED: return "not_started";
        case JobStatus::TRANSFERRING: return "transferring";
        case JobStatus::FINISHED: return "finished";
        case JobStatus::FAILED: return "failed";
        case JobStatus::SKIPPED: return "skipped";
        default: return "INVALID_JOB_STATUS";
    }
}

bool from_string(const std::string &str, JobStatus &status)
{
    for (auto s : {JobStatus::NOT_STARTED, JobStatus::TRANSFERRING, JobStatus::FINISHED,
             JobStatus::FAILED, JobStatus::SKIPPED})
    {
        if (str == to_string(s))
        {
            status = s;
            return true;
        }
    }
    return false;
}

bool is_terminal(JobStatus status)
{
    return status == JobStatus::FINISHED || status == JobStatus::SKIPPED;
}
}  // namespace ferry::checkpoint
