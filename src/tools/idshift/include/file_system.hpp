#pragma once

#include "acl_model.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace idshift::shift
{

struct EntryStatus
{
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    bool isDirectory = false;
    bool isSymlink = false;
    std::uint64_t device = 0;
    std::uint64_t inode = 0;
    std::uint64_t linkCount = 1;
};

struct DirectoryEntry
{
    std::string name;
    bool isDirectory = false; // symlinks to directories are not directories
};

// Metadata primitives used by the shifter. None of them follow symlinks.
// Failures are reported as std::system_error.
class FileSystem
{
public:
    virtual ~FileSystem() = default;

    virtual std::vector<DirectoryEntry> listDirectory(const std::filesystem::path &path) = 0;
    virtual EntryStatus status(const std::filesystem::path &path) = 0;
    // An empty side is left untouched.
    virtual void changeOwner(const std::filesystem::path &path, std::optional<std::uint32_t> uid,
                             std::optional<std::uint32_t> gid) = 0;
    virtual Acl readAcl(const std::filesystem::path &path, AclType type) = 0;
    virtual void writeAcl(const std::filesystem::path &path, AclType type, const Acl &acl) = 0;
};

class PosixFileSystem final : public FileSystem
{
public:
    std::vector<DirectoryEntry> listDirectory(const std::filesystem::path &path) override;
    EntryStatus status(const std::filesystem::path &path) override;
    void changeOwner(const std::filesystem::path &path, std::optional<std::uint32_t> uid,
                     std::optional<std::uint32_t> gid) override;
    Acl readAcl(const std::filesystem::path &path, AclType type) override;
    void writeAcl(const std::filesystem::path &path, AclType type, const Acl &acl) override;
};

} // namespace idshift::shift
