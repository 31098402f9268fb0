#include "streamadapter.hpp"

#include <utility>

#include <glog/logging.h>

namespace ferry::backends
{
bool StreamAdapter::attach(const std::string &stream_id, std::shared_ptr<std::ios> stream)
{
    if (stream_id.empty() || !stream)
    {
        LOG(WARNING) << "Refusing to attach a stream without id or object";
        return false;
    }

    std::lock_guard lock {mutex_};
    return streams_.try_emplace(stream_id, std::move(stream)).second;
}

bool StreamAdapter::detach(const std::string &stream_id)
{
    std::lock_guard lock {mutex_};
    return streams_.erase(stream_id) != 0;
}

std::shared_ptr<std::ios> StreamAdapter::stream(const std::string &stream_id) const
{
    std::lock_guard lock {mutex_};

    auto it = streams_.find(stream_id);
    if (it == streams_.end())
    {
        return nullptr;
    }
    return it->second;
}

location::ResourceState StreamAdapter::probe(const location::ResourceRef &resource,
    const location::CredentialHandle & /*credentials*/, const location::RequestOptions & /*options*/)
{
    auto stream_ref = std::get_if<location::StreamRef>(&resource);
    if (!stream_ref)
    {
        LOG(ERROR) << "Stream adapter cannot probe " << location::kind_of(resource)
                   << " resources";
        return {location::ProbeStatus::UNREACHABLE, false, ""};
    }

    auto s = stream(stream_ref->stream_id);
    if (!s || !s->good())
    {
        return {location::ProbeStatus::NOT_FOUND, false, ""};
    }
    return {location::ProbeStatus::OK, true, ""};
}
}  // namespace ferry::backends
