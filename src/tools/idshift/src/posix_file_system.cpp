#include "file_system.hpp"

#include <cerrno>
#include <system_error>
#include <sys/acl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <acl/libacl.h>

namespace idshift::shift
{
namespace
{
namespace fs = std::filesystem;

[[noreturn]] void throwErrno(const char *operation)
{
    throw std::system_error(errno, std::generic_category(), operation);
}

class AclHandle
{
public:
    explicit AclHandle(acl_t acl) noexcept
        : handle(acl)
    {
    }
    ~AclHandle()
    {
        if (handle)
            acl_free(handle);
    }
    AclHandle(const AclHandle &) = delete;
    AclHandle &operator=(const AclHandle &) = delete;

    acl_t get() const noexcept { return handle; }
    acl_t *address() noexcept { return &handle; }

private:
    acl_t handle;
};

acl_type_t nativeType(AclType type) noexcept
{
    return type == AclType::Default ? ACL_TYPE_DEFAULT : ACL_TYPE_ACCESS;
}

AclTag tagFromNative(acl_tag_t tag)
{
    switch (tag)
    {
    case ACL_USER_OBJ:
        return AclTag::UserObject;
    case ACL_GROUP_OBJ:
        return AclTag::GroupObject;
    case ACL_OTHER:
        return AclTag::Other;
    case ACL_MASK:
        return AclTag::Mask;
    case ACL_USER:
        return AclTag::NamedUser;
    case ACL_GROUP:
        return AclTag::NamedGroup;
    default:
        throw std::system_error(EINVAL, std::generic_category(), "acl_get_tag_type");
    }
}

acl_tag_t tagToNative(AclTag tag) noexcept
{
    switch (tag)
    {
    case AclTag::UserObject:
        return ACL_USER_OBJ;
    case AclTag::GroupObject:
        return ACL_GROUP_OBJ;
    case AclTag::Other:
        return ACL_OTHER;
    case AclTag::Mask:
        return ACL_MASK;
    case AclTag::NamedUser:
        return ACL_USER;
    case AclTag::NamedGroup:
        return ACL_GROUP;
    }
    return ACL_UNDEFINED_TAG;
}

std::uint32_t readQualifier(acl_entry_t entry, AclTag tag)
{
    void *qualifier = acl_get_qualifier(entry);
    if (!qualifier)
        throwErrno("acl_get_qualifier");
    std::uint32_t id = tag == AclTag::NamedUser ? static_cast<std::uint32_t>(*static_cast<uid_t *>(qualifier))
                                                : static_cast<std::uint32_t>(*static_cast<gid_t *>(qualifier));
    acl_free(qualifier);
    return id;
}

AclPermissions readPermissions(acl_entry_t entry)
{
    acl_permset_t permset;
    if (acl_get_permset(entry, &permset) == -1)
        throwErrno("acl_get_permset");
    AclPermissions permissions;
    permissions.read = acl_get_perm(permset, ACL_READ) == 1;
    permissions.write = acl_get_perm(permset, ACL_WRITE) == 1;
    permissions.execute = acl_get_perm(permset, ACL_EXECUTE) == 1;
    return permissions;
}

void appendEntry(AclHandle &acl, const AclEntry &source)
{
    acl_entry_t entry;
    if (acl_create_entry(acl.address(), &entry) == -1)
        throwErrno("acl_create_entry");
    if (acl_set_tag_type(entry, tagToNative(source.tag)) == -1)
        throwErrno("acl_set_tag_type");

    if (source.tag == AclTag::NamedUser)
    {
        uid_t uid = static_cast<uid_t>(source.qualifier.value_or(0));
        if (acl_set_qualifier(entry, &uid) == -1)
            throwErrno("acl_set_qualifier");
    }
    else if (source.tag == AclTag::NamedGroup)
    {
        gid_t gid = static_cast<gid_t>(source.qualifier.value_or(0));
        if (acl_set_qualifier(entry, &gid) == -1)
            throwErrno("acl_set_qualifier");
    }

    acl_permset_t permset;
    if (acl_get_permset(entry, &permset) == -1)
        throwErrno("acl_get_permset");
    acl_clear_perms(permset);
    if (source.permissions.read)
        acl_add_perm(permset, ACL_READ);
    if (source.permissions.write)
        acl_add_perm(permset, ACL_WRITE);
    if (source.permissions.execute)
        acl_add_perm(permset, ACL_EXECUTE);
    if (acl_set_permset(entry, permset) == -1)
        throwErrno("acl_set_permset");
}

} // namespace

std::vector<DirectoryEntry> PosixFileSystem::listDirectory(const std::filesystem::path &path)
{
    std::vector<DirectoryEntry> entries;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec)
        throw std::system_error(ec, "opendir");

    fs::directory_iterator endIter;
    for (; it != endIter; it.increment(ec))
    {
        if (ec)
            throw std::system_error(ec, "readdir");

        const fs::directory_entry &entry = *it;
        fs::file_status status = entry.symlink_status(ec);
        if (ec)
            throw std::system_error(ec, "lstat");
        entries.push_back(DirectoryEntry{entry.path().filename().string(), fs::is_directory(status)});
    }
    if (ec)
        throw std::system_error(ec, "readdir");

    return entries;
}

EntryStatus PosixFileSystem::status(const std::filesystem::path &path)
{
    struct stat sb{};
    if (lstat(path.c_str(), &sb) != 0)
        throwErrno("lstat");

    EntryStatus result;
    result.uid = static_cast<std::uint32_t>(sb.st_uid);
    result.gid = static_cast<std::uint32_t>(sb.st_gid);
    result.isDirectory = S_ISDIR(sb.st_mode);
    result.isSymlink = S_ISLNK(sb.st_mode);
    result.device = static_cast<std::uint64_t>(sb.st_dev);
    result.inode = static_cast<std::uint64_t>(sb.st_ino);
    result.linkCount = static_cast<std::uint64_t>(sb.st_nlink);
    return result;
}

void PosixFileSystem::changeOwner(const std::filesystem::path &path, std::optional<std::uint32_t> uid,
                                  std::optional<std::uint32_t> gid)
{
    // lchown leaves a side untouched when it is passed as -1.
    const uid_t nativeUid = uid ? static_cast<uid_t>(*uid) : static_cast<uid_t>(-1);
    const gid_t nativeGid = gid ? static_cast<gid_t>(*gid) : static_cast<gid_t>(-1);
    if (lchown(path.c_str(), nativeUid, nativeGid) != 0)
        throwErrno("lchown");
}

Acl PosixFileSystem::readAcl(const std::filesystem::path &path, AclType type)
{
    AclHandle acl(acl_get_file(path.c_str(), nativeType(type)));
    if (!acl.get())
        throwErrno("acl_get_file");

    Acl result;
    acl_entry_t entry;
    int rc = acl_get_entry(acl.get(), ACL_FIRST_ENTRY, &entry);
    while (rc == 1)
    {
        acl_tag_t nativeTag;
        if (acl_get_tag_type(entry, &nativeTag) == -1)
            throwErrno("acl_get_tag_type");

        AclEntry converted;
        converted.tag = tagFromNative(nativeTag);
        if (converted.tag == AclTag::NamedUser || converted.tag == AclTag::NamedGroup)
            converted.qualifier = readQualifier(entry, converted.tag);
        converted.permissions = readPermissions(entry);
        result.push_back(converted);

        rc = acl_get_entry(acl.get(), ACL_NEXT_ENTRY, &entry);
    }
    if (rc == -1)
        throwErrno("acl_get_entry");

    return result;
}

void PosixFileSystem::writeAcl(const std::filesystem::path &path, AclType type, const Acl &acl)
{
    if (type == AclType::Default && acl.empty())
    {
        if (acl_delete_def_file(path.c_str()) == -1)
            throwErrno("acl_delete_def_file");
        return;
    }

    AclHandle native(acl_init(static_cast<int>(acl.size())));
    if (!native.get())
        throwErrno("acl_init");
    for (const auto &entry : acl)
        appendEntry(native, entry);

    if (acl_set_file(path.c_str(), nativeType(type), native.get()) == -1)
        throwErrno("acl_set_file");
}

} // namespace idshift::shift
