#include "acl_model.hpp"

namespace idshift::shift
{

std::vector<AclChange> rewriteAcl(Acl &acl, AclType type, const IdRemapper &users, const IdRemapper &groups)
{
    std::vector<AclChange> changes;
    for (auto &entry : acl)
    {
        const IdRemapper *remapper = nullptr;
        if (entry.tag == AclTag::NamedUser)
            remapper = &users;
        else if (entry.tag == AclTag::NamedGroup)
            remapper = &groups;
        if (!remapper || !entry.qualifier)
            continue;

        std::optional<std::uint32_t> newId = remapper->changedId(*entry.qualifier);
        if (!newId)
            continue;

        changes.push_back(AclChange{type, entry.tag, *entry.qualifier, *newId, entry.permissions});
        entry.qualifier = *newId;
    }
    return changes;
}

const char *aclTypeName(AclType type) noexcept
{
    switch (type)
    {
    case AclType::Access:
        return "access";
    case AclType::Default:
        return "default";
    }
    return "unknown";
}

std::string permissionString(const AclPermissions &permissions)
{
    std::string text;
    text.push_back(permissions.read ? 'r' : '-');
    text.push_back(permissions.write ? 'w' : '-');
    text.push_back(permissions.execute ? 'x' : '-');
    return text;
}

std::string formatAclChange(const AclChange &change)
{
    std::string prefix = change.type == AclType::Default ? "d:" : "";
    prefix += change.tag == AclTag::NamedGroup ? "g:" : "u:";
    const std::string perms = permissionString(change.permissions);
    return prefix + std::to_string(change.oldId) + ":" + perms + " -> " + prefix + std::to_string(change.newId) +
           ":" + perms;
}

} // namespace idshift::shift
