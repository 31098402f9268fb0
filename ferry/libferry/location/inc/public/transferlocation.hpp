#ifndef FERRY_LOCATION_TRANSFERLOCATION_HPP_
#define FERRY_LOCATION_TRANSFERLOCATION_HPP_

#include <memory>
#include <mutex>
#include <string>

#include "accesscondition.hpp"
#include "errorcode.hpp"
#include "locationkind.hpp"
#include "requestoptions.hpp"
#include "resourceref.hpp"
#include "resourcestate.hpp"

namespace ferry::location
{
// Forward declarations
class BackendRegistry;
class CredentialHandle;

/// One endpoint (source or destination) of a transfer job.
///
/// A location is shared by all workers copying chunks of the same job. Every mutable field is
/// guarded by a single mutex which is held only to copy or swap state; backend probes always
/// run on a private copy with the lock released.
///
/// Lifecycle: create() yields a READY location. restore() (checkpoint path) yields a location in
/// AWAITING_CREDENTIALS that refuses any authorized operation until update_credentials() is
/// called.
class TransferLocation
{
public:
    enum class Phase
    {
        AWAITING_CREDENTIALS,
        READY
    };

    enum class Existence
    {
        MAY_BE_MISSING,  // destinations may be created by the transfer
        MUST_EXIST
    };

    // Restricts construction to create() and restore()
    class Passkey
    {
        friend class TransferLocation;
        Passkey() {}
    };

    // Everything a checkpoint persists. Credentials are intentionally absent.
    struct Snapshot
    {
        ResourceRef     resource;
        AccessCondition access_condition;
        bool            condition_checked {false};
        std::string     fingerprint;
        RequestOptions  request_options;

        bool operator==(const Snapshot &rhs) const
        {
            return resource == rhs.resource && access_condition == rhs.access_condition &&
                   condition_checked == rhs.condition_checked && fingerprint == rhs.fingerprint &&
                   request_options == rhs.request_options;
        }
    };

    /// INVALID_ARGUMENT when the resource reference is incomplete or the credential handle is
    /// null or invalid.
    [[nodiscard]] static ErrorCode create(ResourceRef resource,
        std::shared_ptr<const CredentialHandle> credentials, RequestOptions request_options,
        std::shared_ptr<TransferLocation> &location);

    /// Never touches the backend. CORRUPT_CHECKPOINT when the persisted state cannot describe a
    /// valid location.
    [[nodiscard]] static ErrorCode restore(
        Snapshot snapshot, std::shared_ptr<TransferLocation> &location);

    TransferLocation(Passkey, ResourceRef resource,
        std::shared_ptr<const CredentialHandle> credentials, AccessCondition access_condition,
        bool condition_checked, std::string fingerprint, RequestOptions request_options);

    TransferLocation(const TransferLocation &) = delete;
    TransferLocation &operator=(const TransferLocation &) = delete;

    [[nodiscard]] LocationKind       type() const;
    [[nodiscard]] const std::string &canonical_identifier() const;
    [[nodiscard]] const ResourceRef &resource() const;
    [[nodiscard]] Phase              phase() const;
    [[nodiscard]] Snapshot           snapshot() const;
    [[nodiscard]] AccessCondition    access_condition() const;
    [[nodiscard]] bool               condition_checked() const;
    [[nodiscard]] std::string        fingerprint() const;
    [[nodiscard]] RequestOptions     request_options() const;

    // Credentials for the next chunk operation; NOT_READY while they are stale
    [[nodiscard]] ErrorCode credentials(std::shared_ptr<const CredentialHandle> &out) const;

    /// Swaps the credentials in place. Subsequent readers see the new handle, in-flight users
    /// keep the one they copied. Never resets condition_checked or fingerprint.
    [[nodiscard]] ErrorCode update_credentials(std::shared_ptr<const CredentialHandle> credentials);

    [[nodiscard]] ErrorCode set_access_condition(AccessCondition condition);

    /// Replaces the captured fingerprint with the version the copy engine itself produced,
    /// after creating the destination or committing a write to it. Rejected until the access
    /// condition has been enforced, since the enforced probe is what captures the first one.
    [[nodiscard]] ErrorCode record_fingerprint(std::string fingerprint);

    /// Confirms the resource is reachable and, if a fingerprint was captured, unchanged. With
    /// Existence::MUST_EXIST a missing resource fails as well. Issues exactly one backend probe.
    [[nodiscard]] ErrorCode validate(
        const BackendRegistry &backends, Existence existence = Existence::MAY_BE_MISSING) const;

    /// Evaluates the access condition against the live resource once per job lifetime. Once
    /// condition_checked is set this returns OK without contacting the backend.
    [[nodiscard]] ErrorCode enforce_access_condition(const BackendRegistry &backends);

private:
    [[nodiscard]] ErrorCode probe(const BackendRegistry &backends,
        const CredentialHandle &credentials, const RequestOptions &options,
        ResourceState &state) const;

    const ResourceRef                       resource_;
    const LocationKind                      kind_;
    const std::string                       canonical_identifier_;
    Phase                                   phase_;
    std::shared_ptr<const CredentialHandle> credentials_;
    AccessCondition                         access_condition_;
    bool                                    condition_checked_;
    std::string                             fingerprint_;
    RequestOptions                          request_options_;
    mutable std::mutex                      mutex_;
};

const char *to_string(TransferLocation::Phase phase);
}  // namespace ferry::location

#endif  // FERRY_LOCATION_TRANSFERLOCATION_HPP_
