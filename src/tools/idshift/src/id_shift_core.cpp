#include "id_shift_core.hpp"

#include "shift_errors.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fnmatch.h>

namespace idshift::shift
{
namespace
{
namespace fs = std::filesystem;

bool matchPattern(const std::string &pattern, const std::string &value)
{
    return fnmatch(pattern.c_str(), value.c_str(), 0) == 0;
}

template <typename Operation>
auto accessEntry(const fs::path &path, const char *operation, Operation &&op) -> decltype(op())
{
    try
    {
        return op();
    }
    catch (const std::system_error &error)
    {
        throw EntryAccessError(path, operation, error.code());
    }
}

void report(const ShiftOptions &options, const ShiftOutcome &outcome)
{
    if (options.quiet || !options.reportCallback)
        return;
    options.reportCallback(outcome);
}

} // namespace

bool matchesAnyPattern(const std::string &value, const std::vector<std::string> &patterns)
{
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::string &pattern) { return matchPattern(pattern, value); });
}

Shifter::Shifter(std::int64_t uidOffset, std::int64_t gidOffset, std::vector<IdRange> excludeUidRanges,
                 std::vector<IdRange> excludeGidRanges, std::vector<std::string> excludePaths,
                 std::shared_ptr<FileSystem> files)
    : users(IdKind::User, uidOffset, std::move(excludeUidRanges)),
      groups(IdKind::Group, gidOffset, std::move(excludeGidRanges)),
      excludePatterns(std::move(excludePaths)),
      fileSystem(std::move(files))
{
    for (const auto &pattern : excludePatterns)
    {
        if (pattern.empty())
            throw ConfigurationError("Invalid exclusion path pattern: pattern is empty");
    }
    if (!fileSystem)
        fileSystem = std::make_shared<PosixFileSystem>();
}

bool Shifter::isExcludedPath(const std::filesystem::path &path) const
{
    return matchesAnyPattern(path.string(), excludePatterns);
}

ShiftOutcome Shifter::shift(const std::filesystem::path &path, const ShiftOptions &options, ShiftStats &stats) const
{
    Walk walk{options, stats, {}};
    return shiftEntry(path, false, walk);
}

ShiftOutcome Shifter::shiftEntry(const std::filesystem::path &path, bool listedAsDirectory, Walk &walk) const
{
    ShiftOutcome outcome;
    outcome.path = path;

    if (isExcludedPath(path))
    {
        outcome.disposition = EntryDisposition::Excluded;
        outcome.isDirectory = listedAsDirectory;
        ++walk.stats.skipped;
        ++walk.stats.excluded;
        report(walk.options, outcome);
        return outcome;
    }

    try
    {
        inspectAndCommit(outcome, walk);
    }
    catch (const OutOfRangeError &error)
    {
        if (!error.path().empty())
            throw;
        throw error.withPath(path);
    }
    return outcome;
}

void Shifter::inspectAndCommit(ShiftOutcome &outcome, Walk &walk) const
{
    const fs::path &path = outcome.path;
    const ShiftOptions &options = walk.options;
    ShiftStats &stats = walk.stats;

    EntryStatus status = accessEntry(path, "lstat", [&] { return fileSystem->status(path); });
    outcome.isDirectory = status.isDirectory;
    outcome.isSymlink = status.isSymlink;
    outcome.uid = status.uid;
    outcome.gid = status.gid;

    // Ownership and ACLs belong to the inode; further links to it are already handled.
    if (!status.isDirectory && status.linkCount > 1 &&
        !walk.linkedInodes.insert({status.device, status.inode}).second)
    {
        outcome.disposition = EntryDisposition::Unchanged;
        ++stats.skipped;
        report(options, outcome);
        return;
    }

    if (options.shiftOwner)
    {
        outcome.newUid = users.changedId(status.uid);
        outcome.newGid = groups.changedId(status.gid);
    }

    Acl accessAcl;
    Acl defaultAcl;
    // ACLs never attach to the link itself.
    if (options.shiftAcl && !status.isSymlink)
    {
        accessAcl = accessEntry(path, "acl_get_file", [&] { return fileSystem->readAcl(path, AclType::Access); });
        outcome.aclChanges = rewriteAcl(accessAcl, AclType::Access, users, groups);

        if (status.isDirectory)
        {
            defaultAcl = accessEntry(path, "acl_get_file", [&] { return fileSystem->readAcl(path, AclType::Default); });
            outcome.defaultAclChanges = rewriteAcl(defaultAcl, AclType::Default, users, groups);
        }
    }

    const bool ownerChanged = outcome.newUid.has_value() || outcome.newGid.has_value();
    if (!ownerChanged && outcome.aclChanges.empty() && outcome.defaultAclChanges.empty())
    {
        outcome.disposition = EntryDisposition::Unchanged;
        ++stats.skipped;
        report(options, outcome);
        return;
    }

    outcome.disposition = EntryDisposition::Shifted;
    ++stats.shiftedPaths;
    if (outcome.newUid)
        ++stats.shiftedUids;
    if (outcome.newGid)
        ++stats.shiftedGids;
    stats.shiftedAcls += outcome.aclChanges.size();
    stats.shiftedDefaultAcls += outcome.defaultAclChanges.size();
    report(options, outcome);

    if (options.dryRun)
        return;

    if (ownerChanged)
        accessEntry(path, "lchown", [&] { fileSystem->changeOwner(path, outcome.newUid, outcome.newGid); });
    if (!outcome.aclChanges.empty())
        accessEntry(path, "acl_set_file", [&] { fileSystem->writeAcl(path, AclType::Access, accessAcl); });
    if (status.isDirectory && !outcome.defaultAclChanges.empty())
        accessEntry(path, "acl_set_file", [&] { fileSystem->writeAcl(path, AclType::Default, defaultAcl); });
}

ShiftStats Shifter::run(const std::filesystem::path &root, const ShiftOptions &options) const
{
    ShiftStats stats;
    Walk walk{options, stats, {}};
    walkDirectory(root, walk);
    return stats;
}

void Shifter::walkDirectory(const std::filesystem::path &directory, Walk &walk) const
{
    std::vector<DirectoryEntry> entries =
        accessEntry(directory, "list directory", [&] { return fileSystem->listDirectory(directory); });
    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry &a, const DirectoryEntry &b) { return a.name < b.name; });

    std::vector<fs::path> subdirectories;
    for (const auto &entry : entries)
    {
        if (!entry.isDirectory)
            continue;
        fs::path child = directory / entry.name;
        shiftEntry(child, true, walk);
        subdirectories.push_back(std::move(child));
    }

    for (const auto &entry : entries)
    {
        if (entry.isDirectory)
            continue;
        shiftEntry(directory / entry.name, false, walk);
    }

    for (const auto &subdirectory : subdirectories)
        walkDirectory(subdirectory, walk);
}

} // namespace idshift::shift
