#include <gtest/gtest.h>

#include "file_system.hpp"
#include "id_shift_core.hpp"
#include "shift_errors.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using namespace idshift::shift;

namespace
{
namespace fs = std::filesystem;

class PosixTree : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root = fs::temp_directory_path() /
               fs::path("idshift-posix-test-" +
                        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root / "dir" / "cache");
        std::ofstream(root / "dir" / "file.txt") << "data" << std::endl;
        std::ofstream(root / "dir" / "cache" / "blob") << "blob" << std::endl;
        fs::create_directory_symlink(root / "dir", root / "link");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

bool aclUnsupported(const std::system_error &error)
{
    return error.code().value() == ENOTSUP || error.code().value() == EOPNOTSUPP;
}

} // namespace

TEST_F(PosixTree, ListsEntriesWithoutFollowingSymlinks)
{
    PosixFileSystem files;
    auto entries = files.listDirectory(root);
    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry &a, const DirectoryEntry &b) { return a.name < b.name; });

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "dir");
    EXPECT_TRUE(entries[0].isDirectory);
    EXPECT_EQ(entries[1].name, "link");
    EXPECT_FALSE(entries[1].isDirectory);
}

TEST_F(PosixTree, StatusDoesNotFollowSymlinks)
{
    PosixFileSystem files;
    EntryStatus link = files.status(root / "link");
    EXPECT_TRUE(link.isSymlink);
    EXPECT_FALSE(link.isDirectory);

    EntryStatus dir = files.status(root / "dir");
    EXPECT_TRUE(dir.isDirectory);
    EXPECT_FALSE(dir.isSymlink);

    EXPECT_THROW(files.status(root / "missing"), std::system_error);
}

TEST_F(PosixTree, ChangeOwnerLeavesEmptySidesUntouched)
{
    PosixFileSystem files;
    const fs::path file = root / "dir" / "file.txt";
    EntryStatus before = files.status(file);

    files.changeOwner(file, std::nullopt, std::nullopt);
    files.changeOwner(file, std::nullopt, before.gid);

    EntryStatus after = files.status(file);
    EXPECT_EQ(after.uid, before.uid);
    EXPECT_EQ(after.gid, before.gid);
}

TEST_F(PosixTree, ReadsAndRewritesAccessAcl)
{
    PosixFileSystem files;
    const fs::path file = root / "dir" / "file.txt";
    Acl acl;
    try
    {
        acl = files.readAcl(file, AclType::Access);
    }
    catch (const std::system_error &error)
    {
        if (aclUnsupported(error))
            GTEST_SKIP() << "ACLs are not supported on " << root;
        throw;
    }

    ASSERT_GE(acl.size(), 3u);
    EXPECT_TRUE(std::any_of(acl.begin(), acl.end(), [](const AclEntry &entry) { return entry.tag == AclTag::UserObject; }));
    EXPECT_TRUE(std::any_of(acl.begin(), acl.end(), [](const AclEntry &entry) { return entry.tag == AclTag::Other; }));

    files.writeAcl(file, AclType::Access, acl);
    EXPECT_EQ(files.readAcl(file, AclType::Access), acl);
}

TEST_F(PosixTree, DryRunWalksRealTreeWithExclusions)
{
    Shifter shifter(1, 1, {}, {}, {"*/cache/*"});
    ShiftOptions options;
    options.dryRun = true;
    options.quiet = true;
    options.shiftAcl = false;

    const EntryStatus before = PosixFileSystem().status(root / "dir" / "file.txt");
    ShiftStats stats = shifter.run(root, options);

    // dir, link, dir/cache, dir/file.txt are shifted; dir/cache/blob is excluded.
    EXPECT_EQ(stats.shiftedPaths, 4u);
    EXPECT_EQ(stats.excluded, 1u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_EQ(PosixFileSystem().status(root / "dir" / "file.txt").uid, before.uid);
}

TEST_F(PosixTree, HardLinksShareOneShift)
{
    fs::create_hard_link(root / "dir" / "file.txt", root / "hard");

    PosixFileSystem files;
    EntryStatus original = files.status(root / "dir" / "file.txt");
    EntryStatus linked = files.status(root / "hard");
    EXPECT_EQ(original.inode, linked.inode);
    EXPECT_EQ(original.device, linked.device);
    EXPECT_EQ(linked.linkCount, 2u);

    // Unprivileged, so only a dry-run can observe a non-zero shift.
    Shifter shifter(1, 1);
    ShiftOptions options;
    options.dryRun = true;
    options.shiftAcl = false;
    std::vector<std::string> shifted;
    options.reportCallback = [&](const ShiftOutcome &outcome) {
        if (outcome.shifted())
            shifted.push_back(outcome.path.lexically_relative(root).string());
    };
    ShiftStats stats = shifter.run(root, options);

    EXPECT_EQ(stats.shiftedPaths, 5u);
    EXPECT_EQ(stats.skipped, 1u);
    EXPECT_NE(std::find(shifted.begin(), shifted.end(), "hard"), shifted.end());
    EXPECT_EQ(std::find(shifted.begin(), shifted.end(), "dir/file.txt"), shifted.end());
}

TEST_F(PosixTree, ExcludingEveryIdentifierSkipsEverything)
{
    Shifter shifter(100000, 100000, {{0, kIdSpaceSize}}, {{0, kIdSpaceSize}});
    ShiftOptions options;
    options.quiet = true;
    options.shiftAcl = false;

    ShiftStats stats = shifter.run(root, options);
    EXPECT_EQ(stats.shiftedPaths, 0u);
    EXPECT_EQ(stats.skipped, 5u);
}

TEST_F(PosixTree, FileRootIsAnAccessFailure)
{
    Shifter shifter(1, 1);
    ShiftOptions options;
    options.dryRun = true;
    options.quiet = true;
    EXPECT_THROW(shifter.run(root / "dir" / "file.txt", options), EntryAccessError);
}
