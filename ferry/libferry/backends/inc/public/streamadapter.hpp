#ifndef FERRY_BACKENDS_STREAMADAPTER_HPP_
#define FERRY_BACKENDS_STREAMADAPTER_HPP_

#include <ios>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "backendadapter.hpp"

namespace ferry::backends
{
/// Streams cannot be reopened from a checkpoint; the embedding application attaches them by id
/// for every run. A stream is reachable while attached and in a good state.
class StreamAdapter : public location::BackendAdapter
{
public:
    bool attach(const std::string &stream_id, std::shared_ptr<std::ios> stream);
    bool detach(const std::string &stream_id);

    [[nodiscard]] std::shared_ptr<std::ios> stream(const std::string &stream_id) const;

    [[nodiscard]] location::ResourceState probe(const location::ResourceRef &resource,
        const location::CredentialHandle &credentials,
        const location::RequestOptions &   options) override;

private:
    std::map<std::string, std::shared_ptr<std::ios>> streams_;
    mutable std::mutex                               mutex_;
};
}  // namespace ferry::backends

#endif  // FERRY_BACKENDS_STREAMADAPTER_HPP_
