#pragma once

#include "acl_model.hpp"
#include "file_system.hpp"
#include "id_remapper.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace idshift::shift
{

enum class EntryDisposition
{
    Excluded,
    Unchanged,
    Shifted
};

struct ShiftOutcome
{
    std::filesystem::path path;
    EntryDisposition disposition = EntryDisposition::Unchanged;
    bool isDirectory = false;
    bool isSymlink = false;
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::optional<std::uint32_t> newUid;
    std::optional<std::uint32_t> newGid;
    std::vector<AclChange> aclChanges;
    std::vector<AclChange> defaultAclChanges;

    bool shifted() const noexcept { return disposition == EntryDisposition::Shifted; }
};

struct ShiftOptions
{
    bool shiftOwner = true;
    bool shiftAcl = true;
    bool dryRun = false;
    bool quiet = false;
    std::function<void(const ShiftOutcome &)> reportCallback;
};

struct ShiftStats
{
    std::size_t shiftedPaths = 0;
    std::size_t shiftedUids = 0;
    std::size_t shiftedGids = 0;
    std::size_t shiftedAcls = 0;
    std::size_t shiftedDefaultAcls = 0;
    std::size_t skipped = 0;
    std::size_t excluded = 0; // subset of skipped matched by an exclusion pattern

    bool operator==(const ShiftStats &) const noexcept = default;
};

bool matchesAnyPattern(const std::string &value, const std::vector<std::string> &patterns);

class Shifter
{
public:
    Shifter(std::int64_t uidOffset, std::int64_t gidOffset, std::vector<IdRange> excludeUidRanges = {},
            std::vector<IdRange> excludeGidRanges = {}, std::vector<std::string> excludePaths = {},
            std::shared_ptr<FileSystem> files = nullptr);

    const IdRemapper &uidRemapper() const noexcept { return users; }
    const IdRemapper &gidRemapper() const noexcept { return groups; }
    const std::vector<std::string> &excludedPaths() const noexcept { return excludePatterns; }

    bool isExcludedPath(const std::filesystem::path &path) const;

    // Shifts a single entry. Throws EntryAccessError or OutOfRangeError; both abort a run.
    ShiftOutcome shift(const std::filesystem::path &path, const ShiftOptions &options, ShiftStats &stats) const;

    // Shifts every descendant of root (not root itself) and returns fresh statistics.
    // An inode reached through several hard links is shifted once.
    ShiftStats run(const std::filesystem::path &root, const ShiftOptions &options = {}) const;

private:
    using InodeSet = std::set<std::pair<std::uint64_t, std::uint64_t>>;

    struct Walk
    {
        const ShiftOptions &options;
        ShiftStats &stats;
        InodeSet linkedInodes;
    };

    ShiftOutcome shiftEntry(const std::filesystem::path &path, bool listedAsDirectory, Walk &walk) const;
    void walkDirectory(const std::filesystem::path &directory, Walk &walk) const;
    void inspectAndCommit(ShiftOutcome &outcome, Walk &walk) const;

    IdRemapper users;
    IdRemapper groups;
    std::vector<std::string> excludePatterns;
    std::shared_ptr<FileSystem> fileSystem;
};

} // namespace idshift::shift
