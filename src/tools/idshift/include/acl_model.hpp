#pragma once

#include "id_remapper.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace idshift::shift
{

enum class AclTag
{
    UserObject,
    GroupObject,
    Other,
    Mask,
    NamedUser,
    NamedGroup
};

enum class AclType
{
    Access,
    Default
};

struct AclPermissions
{
    bool read = false;
    bool write = false;
    bool execute = false;

    bool operator==(const AclPermissions &) const noexcept = default;
};

struct AclEntry
{
    AclTag tag = AclTag::Other;
    std::optional<std::uint32_t> qualifier; // only NamedUser / NamedGroup
    AclPermissions permissions;

    bool operator==(const AclEntry &) const noexcept = default;
};

using Acl = std::vector<AclEntry>;

struct AclChange
{
    AclType type = AclType::Access;
    AclTag tag = AclTag::NamedUser;
    std::uint32_t oldId = 0;
    std::uint32_t newId = 0;
    AclPermissions permissions;

    bool operator==(const AclChange &) const noexcept = default;
};

// Remaps the qualifiers of named user and group entries in place, keeping entry
// order. Returns one change per rewritten entry; empty when the ACL is unaffected.
std::vector<AclChange> rewriteAcl(Acl &acl, AclType type, const IdRemapper &users, const IdRemapper &groups);

const char *aclTypeName(AclType type) noexcept;
std::string permissionString(const AclPermissions &permissions);
std::string formatAclChange(const AclChange &change);

} // namespace idshift::shift
