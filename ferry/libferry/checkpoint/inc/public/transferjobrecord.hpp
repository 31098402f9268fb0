#ifndef FERRY_CHECKPOINT_TRANSFERJOBRECORD_HPP_
#define FERRY_CHECKPOINT_TRANSFERJOBRECORD_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ferry::location
{
// Forward declarations
class TransferLocation;
}  // namespace ferry::location

namespace ferry::checkpoint
{
enum class JobStatus
{
    NOT_STARTED,
    TRANSFERRING,
    FINISHED,
    FAILED,
    SKIPPED
};

const char *to_string(JobStatus status);
bool        from_string(const std::string &str, JobStatus &status);

// Nothing is left to copy for jobs in these states
bool is_terminal(JobStatus status);

struct TransferProgress
{
    uint64_t              bytes_transferred {0};
    uint64_t              total_bytes {0};
    std::vector<uint64_t> completed_chunks;  // start offsets of chunks already written

    bool operator==(const TransferProgress &rhs) const
    {
        return bytes_transferred == rhs.bytes_transferred && total_bytes == rhs.total_bytes &&
               completed_chunks == rhs.completed_chunks;
    }
};

struct TransferJobRecord
{
    std::string                                  job_id;
    std::shared_ptr<location::TransferLocation> source;
    std::shared_ptr<location::TransferLocation> destination;
    bool                                         overwrite {false};
    JobStatus                                    status {JobStatus::NOT_STARTED};
    TransferProgress                             progress;
};
}  // namespace ferry::checkpoint

#endif  // FERRY_CHECKPOINT_TRANSFERJOBRECORD_HPP_
