#ifndef FERRY_LOCATION_ACCESSCONDITION_HPP_
#define FERRY_LOCATION_ACCESSCONDITION_HPP_

#include <string>

namespace ferry::location
{
/// Optimistic-concurrency precondition evaluated once against the live state of a resource.
/// "*" is accepted as a wildcard fingerprint: IF_MATCH("*") requires the resource to exist and
/// IF_NONE_MATCH("*") requires it not to exist.
class AccessCondition
{
public:
    enum class Type
    {
        NONE,
        IF_MATCH,
        IF_NONE_MATCH,
        IF_NOT_EXISTS,
        IF_EXISTS
    };

    static constexpr char const *any_fingerprint = "*";

    AccessCondition();

    static AccessCondition none();
    static AccessCondition if_match(std::string fingerprint);
    static AccessCondition if_none_match(std::string fingerprint);
    static AccessCondition if_not_exists();
    static AccessCondition if_exists();

    [[nodiscard]] Type               type() const;
    [[nodiscard]] const std::string &fingerprint() const;
    [[nodiscard]] bool               is_none() const;

    // IF_MATCH and IF_NONE_MATCH are meaningless without a fingerprint to compare against
    [[nodiscard]] bool is_valid() const;

    [[nodiscard]] bool is_satisfied_by(bool exists, const std::string &current_fingerprint) const;

    bool operator==(const AccessCondition &rhs) const;
    bool operator!=(const AccessCondition &rhs) const;

private:
    AccessCondition(Type type, std::string fingerprint);

    Type        type_;
    std::string fingerprint_;
};

const char *to_string(AccessCondition::Type type);
bool        from_string(const std::string &str, AccessCondition::Type &type);
bool        requires_fingerprint(AccessCondition::Type type);
}  // namespace ferry::location

#endif  // FERRY_LOCATION_ACCESSCONDITION_HPP_
