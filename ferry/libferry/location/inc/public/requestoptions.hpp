#ifndef FERRY_LOCATION_REQUESTOPTIONS_HPP_
#define FERRY_LOCATION_REQUESTOPTIONS_HPP_

#include <chrono>
#include <cstdint>

namespace ferry::location
{
// Zero timeouts mean "no limit"
struct RequestOptions
{
    std::chrono::seconds      server_timeout {0};
    std::chrono::seconds      maximum_execution_time {0};
    uint32_t                  retry_count {0};
    std::chrono::milliseconds retry_interval {0};

    bool operator==(const RequestOptions &rhs) const
    {
        return server_timeout == rhs.server_timeout &&
               maximum_execution_time == rhs.maximum_execution_time &&
               retry_count == rhs.retry_count && retry_interval == rhs.retry_interval;
    }

    bool operator!=(const RequestOptions &rhs) const
    {
        return !(*this == rhs);
    }
};
}  // namespace ferry::location

#endif  // FERRY_LOCATION_REQUESTOPTIONS_HPP_
