#include "transferlocation.hpp"

#include <utility>

#include <glog/logging.h>

#include "backendadapter.hpp"
#include "backendregistry.hpp"
#include "credentialhandle.hpp"

namespace ferry::location
{
namespace
{
bool is_acceptable_condition(LocationKind kind, const AccessCondition &condition)
{
    return condition.is_valid() && (condition.is_none() || supports_access_condition(kind));
}
}  // namespace

ErrorCode TransferLocation::create(ResourceRef resource,
    std::shared_ptr<const CredentialHandle> credentials, RequestOptions request_options,
    std::shared_ptr<TransferLocation> &location)
{
    if (!is_complete(resource))
    {
        LOG(WARNING) << "Cannot create " << kind_of(resource)
                     << " location: resource reference is incomplete";
        return ErrorCode::INVALID_ARGUMENT;
    }

    if (!credentials || !credentials->is_valid())
    {
        LOG(WARNING) << "Cannot create location " << location::canonical_identifier(resource)
                     << ": missing or invalid credentials";
        return ErrorCode::INVALID_ARGUMENT;
    }

    location = std::make_shared<TransferLocation>(Passkey {}, std::move(resource),
        std::move(credentials), AccessCondition::none(), false, "", request_options);
    return ErrorCode::OK;
}

ErrorCode TransferLocation::restore(Snapshot snapshot, std::shared_ptr<TransferLocation> &location)
{
    if (!is_complete(snapshot.resource))
    {
        LOG(WARNING) << "Persisted " << kind_of(snapshot.resource)
                     << " location has an incomplete resource reference";
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    if (!is_acceptable_condition(kind_of(snapshot.resource), snapshot.access_condition))
    {
        LOG(WARNING) << "Persisted location " << location::canonical_identifier(snapshot.resource)
                     << " has an invalid access condition ("
                     << to_string(snapshot.access_condition.type()) << ")";
        return ErrorCode::CORRUPT_CHECKPOINT;
    }

    location = std::make_shared<TransferLocation>(Passkey {}, std::move(snapshot.resource),
        nullptr, std::move(snapshot.access_condition), snapshot.condition_checked,
        std::move(snapshot.fingerprint), snapshot.request_options);
    return ErrorCode::OK;
}

TransferLocation::TransferLocation(Passkey, ResourceRef resource,
    std::shared_ptr<const CredentialHandle> credentials, AccessCondition access_condition,
    bool condition_checked, std::string fingerprint, RequestOptions request_options)
    : resource_ {std::move(resource)}
    , kind_ {kind_of(resource_)}
    , canonical_identifier_ {location::canonical_identifier(resource_)}
    , phase_ {credentials ? Phase::READY : Phase::AWAITING_CREDENTIALS}
    , credentials_ {std::move(credentials)}
    , access_condition_ {std::move(access_condition)}
    , condition_checked_ {condition_checked}
    , fingerprint_ {std::move(fingerprint)}
    , request_options_ {request_options}
{}

LocationKind TransferLocation::type() const
{
    return kind_;
}

const std::string &TransferLocation::canonical_identifier() const
{
    return canonical_identifier_;
}

const ResourceRef &TransferLocation::resource() const
{
    return resource_;
}

TransferLocation::Phase TransferLocation::phase() const
{
    std::lock_guard lock {mutex_};
    return phase_;
}

TransferLocation::Snapshot TransferLocation::snapshot() const
{
    std::lock_guard lock {mutex_};
    return Snapshot {
        resource_, access_condition_, condition_checked_, fingerprint_, request_options_};
}

AccessCondition TransferLocation::access_condition() const
{
    std::lock_guard lock {mutex_};
    return access_condition_;
}

bool TransferLocation::condition_checked() const
{
    std::lock_guard lock {mutex_};
    return condition_checked_;
}

std::string TransferLocation::fingerprint() const
{
    std::lock_guard lock {mutex_};
    return fingerprint_;
}

RequestOptions TransferLocation::request_options() const
{
    std::lock_guard lock {mutex_};
    return request_options_;
}

ErrorCode TransferLocation::credentials(std::shared_ptr<const CredentialHandle> &out) const
{
    std::lock_guard lock {mutex_};
    if (phase_ != Phase::READY)
    {
        LOG(WARNING) << "Credentials of " << canonical_identifier_ << " requested while "
                     << to_string(phase_);
        return ErrorCode::NOT_READY;
    }
    out = credentials_;
    return ErrorCode::OK;
}

ErrorCode TransferLocation::update_credentials(std::shared_ptr<const CredentialHandle> credentials)
{
    if (!credentials || !credentials->is_valid())
    {
        LOG(WARNING) << "Rejected missing or invalid credentials for " << canonical_identifier_;
        return ErrorCode::INVALID_ARGUMENT;
    }

    auto type = credentials->type();
    {
        std::lock_guard lock {mutex_};
        credentials_ = std::move(credentials);
        phase_       = Phase::READY;
    }

    LOG(INFO) << "Credentials of " << canonical_identifier_ << " updated (" << to_string(type)
              << ")";
    return ErrorCode::OK;
}

ErrorCode TransferLocation::set_access_condition(AccessCondition condition)
{
    if (!is_acceptable_condition(kind_, condition))
    {
        LOG(WARNING) << "Access condition " << to_string(condition.type())
                     << " is not applicable to " << canonical_identifier_;
        return ErrorCode::INVALID_ARGUMENT;
    }

    std::lock_guard lock {mutex_};
    if (condition_checked_)
    {
        LOG(WARNING) << "Access condition of " << canonical_identifier_
                     << " was already enforced and can no longer change";
        return ErrorCode::INVALID_ARGUMENT;
    }
    access_condition_ = std::move(condition);
    return ErrorCode::OK;
}

ErrorCode TransferLocation::record_fingerprint(std::string fingerprint)
{
    if (fingerprint.empty() || !supports_access_condition(kind_))
    {
        LOG(WARNING) << "Cannot record fingerprint \"" << fingerprint << "\" for "
                     << canonical_identifier_;
        return ErrorCode::INVALID_ARGUMENT;
    }

    std::lock_guard lock {mutex_};
    if (phase_ != Phase::READY)
    {
        LOG(WARNING) << "Fingerprint of " << canonical_identifier_ << " recorded while "
                     << to_string(phase_);
        return ErrorCode::NOT_READY;
    }
    if (!condition_checked_)
    {
        LOG(WARNING) << "Fingerprint of " << canonical_identifier_
                     << " recorded before its access condition was enforced";
        return ErrorCode::INVALID_ARGUMENT;
    }
    fingerprint_ = std::move(fingerprint);
    return ErrorCode::OK;
}

ErrorCode TransferLocation::validate(const BackendRegistry &backends, Existence existence) const
{
    std::shared_ptr<const CredentialHandle> credentials;
    RequestOptions                          options;
    std::string                             expected_fingerprint;

    {
        std::lock_guard lock {mutex_};
        if (phase_ != Phase::READY)
        {
            LOG(WARNING) << "Validation of " << canonical_identifier_ << " attempted while "
                         << to_string(phase_);
            return ErrorCode::NOT_READY;
        }
        credentials          = credentials_;
        options              = request_options_;
        expected_fingerprint = fingerprint_;
    }

    ResourceState state;
    if (auto err = probe(backends, *credentials, options, state); err != ErrorCode::OK)
    {
        return err;
    }

    if (!state.exists && existence == Existence::MUST_EXIST)
    {
        LOG(WARNING) << canonical_identifier_ << " does not exist";
        return ErrorCode::UNREACHABLE_OR_CHANGED;
    }

    // Without a captured fingerprint there is nothing to compare against
    if (expected_fingerprint.empty())
    {
        return ErrorCode::OK;
    }

    if (!state.exists)
    {
        LOG(WARNING) << canonical_identifier_ << " no longer exists";
        return ErrorCode::UNREACHABLE_OR_CHANGED;
    }

    if (state.fingerprint != expected_fingerprint)
    {
        LOG(WARNING) << canonical_identifier_ << " changed since the transfer started (expected "
                     << expected_fingerprint << ", found " << state.fingerprint << ")";
        return ErrorCode::UNREACHABLE_OR_CHANGED;
    }

    return ErrorCode::OK;
}

ErrorCode TransferLocation::enforce_access_condition(const BackendRegistry &backends)
{
    std::shared_ptr<const CredentialHandle> credentials;
    RequestOptions                          options;
    AccessCondition                         condition;

    {
        std::lock_guard lock {mutex_};
        if (phase_ != Phase::READY)
        {
            LOG(WARNING) << "Access condition enforcement on " << canonical_identifier_
                         << " attempted while " << to_string(phase_);
            return ErrorCode::NOT_READY;
        }
        if (condition_checked_)
        {
            return ErrorCode::OK;
        }
        credentials = credentials_;
        options     = request_options_;
        condition   = access_condition_;
    }

    ResourceState state;
    if (auto err = probe(backends, *credentials, options, state); err != ErrorCode::OK)
    {
        return err;
    }

    if (!condition.is_satisfied_by(state.exists, state.fingerprint))
    {
        LOG(WARNING) << "Access condition " << to_string(condition.type()) << " not satisfied by "
                     << canonical_identifier_;
        return ErrorCode::PRECONDITION_FAILED;
    }

    std::lock_guard lock {mutex_};
    if (condition_checked_)
    {
        // Another worker finished the check first, its captured state stands
        return ErrorCode::OK;
    }
    fingerprint_       = state.exists ? state.fingerprint : "";
    condition_checked_ = true;

    LOG(INFO) << "Access condition " << to_string(condition.type()) << " of "
              << canonical_identifier_ << " satisfied";
    return ErrorCode::OK;
}

ErrorCode TransferLocation::probe(const BackendRegistry &backends,
    const CredentialHandle &credentials, const RequestOptions &options, ResourceState &state) const
{
    auto adapter = backends.adapter(kind_);
    if (!adapter)
    {
        LOG(ERROR) << "No backend adapter registered for " << kind_;
        return ErrorCode::UNREACHABLE_OR_CHANGED;
    }

    state = adapter->probe(resource_, credentials, options);
    if (state.status != ProbeStatus::OK)
    {
        LOG(ERROR) << "Probing " << canonical_identifier_ << " failed: " << to_string(state.status);
        return ErrorCode::UNREACHABLE_OR_CHANGED;
    }

    return ErrorCode::OK;
}

const char *to_string(TransferLocation::Phase phase)
{
    switch (phase)
    {
        case TransferLocation::Phase::AWAITING_CREDENTIALS: return "AWAITING_CREDENTIALS";
        case TransferLocation::Phase::READY: return "READY";
        default: return "INVALID_PHASE";
    }
}
}  // namespace ferry::location
