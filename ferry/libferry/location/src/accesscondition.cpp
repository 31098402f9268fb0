#include "accesscondition.hpp"

#include <utility>

namespace ferry::location
{
AccessCondition::AccessCondition()
    : type_ {Type::NONE}
{}

AccessCondition::AccessCondition(Type type, std::string fingerprint)
    : type_ {type}
    , fingerprint_ {std::move(fingerprint)}
{}

AccessCondition AccessCondition::none()
{
    return AccessCondition {};
}

AccessCondition AccessCondition::if_match(std::string fingerprint)
{
    return AccessCondition {Type::IF_MATCH, std::move(fingerprint)};
}

AccessCondition AccessCondition::if_none_match(std::string fingerprint)
{
    return AccessCondition {Type::IF_NONE_MATCH, std::move(fingerprint)};
}

AccessCondition AccessCondition::if_not_exists()
{
    return AccessCondition {Type::IF_NOT_EXISTS, ""};
}

AccessCondition AccessCondition::if_exists()
{
    return AccessCondition {Type::IF_EXISTS, ""};
}

AccessCondition::Type AccessCondition::type() const
{
    return type_;
}

const std::string &AccessCondition::fingerprint() const
{
    return fingerprint_;
}

bool AccessCondition::is_none() const
{
    return type_ == Type::NONE;
}

bool AccessCondition::is_valid() const
{
    if (requires_fingerprint(type_))
    {
        return !fingerprint_.empty();
    }
    return fingerprint_.empty();
}

bool AccessCondition::is_satisfied_by(bool exists, const std::string &current_fingerprint) const
{
    switch (type_)
    {
        case Type::NONE: return true;
        case Type::IF_EXISTS: return exists;
        case Type::IF_NOT_EXISTS: return !exists;
        case Type::IF_MATCH:
            if (fingerprint_ == any_fingerprint)
            {
                return exists;
            }
            return exists && current_fingerprint == fingerprint_;
        case Type::IF_NONE_MATCH:
            if (fingerprint_ == any_fingerprint)
            {
                return !exists;
            }
            return !exists || current_fingerprint != fingerprint_;
    }
    return false;
}

bool AccessCondition::operator==(const AccessCondition &rhs) const
{
    return type_ == rhs.type_ && fingerprint_ == rhs.fingerprint_;
}

bool AccessCondition::operator!=(const AccessCondition &rhs) const
{
    return !(*this == rhs);
}

const char *to_string(AccessCondition::Type type)
{
    switch (type)
    {
        case AccessCondition::Type::NONE: return "none";
        case AccessCondition::Type::IF_MATCH: return "if_match";
        case AccessCondition::Type::IF_NONE_MATCH: return "if_none_match";
        case AccessCondition::Type::IF_NOT_EXISTS: return "if_not_exists";
        case AccessCondition::Type::IF_EXISTS: return "if_exists";
        default: return "invalid_condition";
    }
}

bool from_string(const std::string &str, AccessCondition::Type &type)
{
    for (auto t : {AccessCondition::Type::NONE, AccessCondition::Type::IF_MATCH,
             AccessCondition::Type::IF_NONE_MATCH, AccessCondition::Type::IF_NOT_EXISTS,
             AccessCondition::Type::IF_EXISTS})
    {
        if (str == to_string(t))
        {
            type = t;
            return true;
        }
    }
    return false;
}

bool requires_fingerprint(AccessCondition::Type type)
{
    return type == AccessCondition::Type::IF_MATCH || type == AccessCondition::Type::IF_NONE_MATCH;
}
}  // namespace ferry::location
