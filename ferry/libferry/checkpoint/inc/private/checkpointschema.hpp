#ifndef FERRY_CHECKPOINT_CHECKPOINTSCHEMA_HPP_
#define FERRY_CHECKPOINT_CHECKPOINTSCHEMA_HPP_

#include <cstdint>

// Field names are part of the persisted format and must never change
namespace ferry::checkpoint::schema
{
constexpr uint64_t current_version = 1;

constexpr char const *version           = "version";
constexpr char const *kind              = "kind";
constexpr char const *resource          = "resource";
constexpr char const *access_condition  = "access_condition";
constexpr char const *condition_type    = "type";
constexpr char const *fingerprint       = "fingerprint";
constexpr char const *condition_checked = "condition_checked";
constexpr char const *request_options   = "request_options";

constexpr char const *server_timeout         = "server_timeout_s";
constexpr char const *maximum_execution_time = "maximum_execution_time_s";
constexpr char const *retry_count            = "retry_count";
constexpr char const *retry_interval         = "retry_interval_ms";

constexpr char const *endpoint       = "endpoint";
constexpr char const *container      = "container";
constexpr char const *blob_name      = "blob_name";
constexpr char const *blob_type      = "blob_type";
constexpr char const *snapshot       = "snapshot";
constexpr char const *prefix         = "prefix";
constexpr char const *share          = "share";
constexpr char const *file_path      = "file_path";
constexpr char const *directory_path = "directory_path";
constexpr char const *path           = "path";
constexpr char const *stream_id      = "stream_id";
constexpr char const *uri            = "uri";

constexpr char const *job_id            = "job_id";
constexpr char const *overwrite         = "overwrite";
constexpr char const *status            = "status";
constexpr char const *progress          = "progress";
constexpr char const *bytes_transferred = "bytes_transferred";
constexpr char const *total_bytes       = "total_bytes";
constexpr char const *completed_chunks  = "completed_chunks";
constexpr char const *source            = "source";
constexpr char const *destination       = "destination";
}  // namespace ferry::checkpoint::schema

#endif  // FERRY_CHECKPOINT_CHECKPOINTSCHEMA_HPP_
