/**
 * @file test_filesafety.cpp
 * @brief Unit tests for the delete guard
 *
 * Covers the checks FileSafety runs before BrowserSession removes an entry:
 * which paths are refused and in which order, how paths are normalized
 * before comparison, how /proc/mounts is read and which mount owns a path.
 * The last tests drive the refusal through BrowserSession::deleteHighlighted.
 *
 * Scratch files live below $HOME/.cache because /tmp is often tmpfs, which
 * the guard refuses outright.
 *
 * @see FileSafety
 */

#include <gtest/gtest.h>
#include "browsersession.hpp"
#include "filesafety.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

using Status = FileSafety::DeletionStatus;

class FileSafetyTest : public ::testing::Test {
protected:
    fs::path scratch;

    void SetUp() override {
        const char* home = std::getenv("HOME");
        ASSERT_NE(home, nullptr);

        scratch = fs::path(home) / ".cache" /
                  ("treeseek_guard_" + std::to_string(::getpid()));
        fs::remove_all(scratch);
        fs::create_directories(scratch);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(scratch, ec);
    }

    /** @brief Number of components of a mount point, "/" counting as one */
    static std::size_t depth(const fs::path &mountpoint) {
        return static_cast<std::size_t>(
            std::distance(mountpoint.begin(), mountpoint.end()));
    }
};

/**
 * @test SystemPathsRefusedInAnySpelling
 * @brief Trailing separators, "." and ".." do not get a system path past
 *        the guard
 */
TEST_F(FileSafetyTest, SystemPathsRefusedInAnySpelling) {
    for (const char* path : {"/", "/etc", "/usr/", "/usr/../etc", "/etc/.", "/var/lib/.."}) {
        EXPECT_TRUE(FileSafety::isSystemPath(path)) << path;
        EXPECT_EQ(FileSafety::checkDeletion(path), Status::BlockedSystemPath) << path;
    }
}

TEST_F(FileSafetyTest, ContentsOfSystemFoldersAreNotSystemPaths) {
    EXPECT_FALSE(FileSafety::isSystemPath("/usr/share"));
    EXPECT_FALSE(FileSafety::isSystemPath("/etc/hostname"));
    EXPECT_FALSE(FileSafety::isSystemPath(scratch));
}

/**
 * @test SystemPathOutranksOtherReasons
 * @brief /proc is a system path, a mount point and a virtual filesystem;
 *        the system path reason is the one reported
 */
TEST_F(FileSafetyTest, SystemPathOutranksOtherReasons) {
    EXPECT_TRUE(FileSafety::isMountPoint("/proc"));
    EXPECT_TRUE(FileSafety::isProtectedFilesystem("/proc"));
    EXPECT_EQ(FileSafety::checkDeletion("/proc"), Status::BlockedSystemPath);
}

TEST_F(FileSafetyTest, HomeRefusedWithOrWithoutSeparator) {
    const std::string home = std::getenv("HOME");

    EXPECT_TRUE(FileSafety::isUserHome(home));
    EXPECT_TRUE(FileSafety::isUserHome(home + "/"));
    EXPECT_FALSE(FileSafety::isUserHome(scratch));
    EXPECT_FALSE(FileSafety::mayDelete(FileSafety::checkDeletion(home + "/")));

    // A home like /root is caught one step earlier
    if (!FileSafety::isSystemPath(home)) {
        EXPECT_EQ(FileSafety::checkDeletion(home), Status::BlockedHome);
    }
}

TEST_F(FileSafetyTest, VirtualFilesystemContentsRefused) {
    EXPECT_EQ(FileSafety::checkDeletion("/proc/self"), Status::BlockedVirtualFS);
    EXPECT_EQ(FileSafety::checkDeletion("/sys/class"), Status::BlockedVirtualFS);

    // /dev/shm is tmpfs on every common Linux setup
    if (fs::exists("/dev/shm")) {
        EXPECT_TRUE(FileSafety::isProtectedFilesystem("/dev/shm"));
    }
}

/**
 * @test ScratchEntriesAllowed
 * @brief Plain files and folders in the user's cache pass every check
 */
TEST_F(FileSafetyTest, ScratchEntriesAllowed) {
    if (FileSafety::isProtectedFilesystem(scratch)) {
        GTEST_SKIP() << scratch << " is on a protected filesystem";
    }

    std::ofstream(scratch / "notes.txt") << "notes";
    fs::create_directories(scratch / "folder" / "inner");

    EXPECT_EQ(FileSafety::checkDeletion(scratch / "notes.txt"), Status::Allowed);
    EXPECT_EQ(FileSafety::checkDeletion(scratch / "folder"), Status::Allowed);
    EXPECT_EQ(FileSafety::checkDeletion(scratch / "folder/inner/../"), Status::Allowed);
    EXPECT_FALSE(FileSafety::isMountPoint(scratch / "folder"));
}

TEST_F(FileSafetyTest, OnlyAllowedAndRemovableMayProceed) {
    EXPECT_TRUE(FileSafety::mayDelete(Status::Allowed));
    EXPECT_TRUE(FileSafety::mayDelete(Status::WarningRemovableMedia));
    for (Status refused : {Status::BlockedSystemPath, Status::BlockedHome,
                           Status::BlockedMountPoint, Status::BlockedVirtualFS}) {
        EXPECT_FALSE(FileSafety::mayDelete(refused));
    }
}

/**
 * @test MessagesNameThePath
 * @brief Every refusal message carries the path the user tried to delete
 */
TEST_F(FileSafetyTest, MessagesNameThePath) {
    const fs::path target = "/media/usb/photos";
    for (Status status : {Status::BlockedSystemPath, Status::BlockedHome,
                          Status::BlockedMountPoint, Status::BlockedVirtualFS,
                          Status::WarningRemovableMedia}) {
        const std::string message = FileSafety::getStatusMessage(status, target);
        EXPECT_NE(message.find(target.string()), std::string::npos) << message;
    }
    EXPECT_NE(FileSafety::getStatusMessage(Status::BlockedSystemPath, "/etc").find("system"),
              std::string::npos);
    EXPECT_NE(FileSafety::getStatusMessage(Status::WarningRemovableMedia, target).find("removable"),
              std::string::npos);
}

/**
 * @test MountTableHasRoot
 * @brief /proc/mounts parses into entries; "/" is there and not removable
 */
TEST_F(FileSafetyTest, MountTableHasRoot) {
    const auto mounts = FileSafety::getMountPoints();
    ASSERT_FALSE(mounts.empty());

    auto root = std::find_if(mounts.begin(), mounts.end(),
                             [](const FileSafety::MountInfo &m) { return m.m_mountpoint == "/"; });
    ASSERT_NE(root, mounts.end());
    EXPECT_FALSE(root->m_isRemovable);
    EXPECT_FALSE(root->m_fstype.empty());
    EXPECT_TRUE(FileSafety::isMountPoint("/"));
}

TEST_F(FileSafetyTest, MountFieldEscapesDecoded) {
    EXPECT_EQ(FileSafety::unescapeMountField("/mnt/my\\040disk"), "/mnt/my disk");
    EXPECT_EQ(FileSafety::unescapeMountField("a\\011b\\012c"), "a\tb\nc");
    EXPECT_EQ(FileSafety::unescapeMountField("back\\134slash"), "back\\slash");
    EXPECT_EQ(FileSafety::unescapeMountField("/plain/path"), "/plain/path");
    // Cut-off escapes are kept as they are
    EXPECT_EQ(FileSafety::unescapeMountField("trailing\\04"), "trailing\\04");
}

/**
 * @test OwningMountIsDeepestContainingMount
 * @brief /proc/self belongs to the /proc mount, not to "/"
 */
TEST_F(FileSafetyTest, OwningMountIsDeepestContainingMount) {
    auto proc = FileSafety::findOwningMount("/proc/self/status");
    ASSERT_TRUE(proc.has_value());
    EXPECT_EQ(proc->m_mountpoint, "/proc");
    EXPECT_EQ(proc->m_fstype, "proc");

    auto root = FileSafety::findOwningMount("/");
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->m_mountpoint, "/");
}

TEST_F(FileSafetyTest, OwningMountOfScratchContainsIt) {
    const fs::path target = fs::canonical(scratch);
    auto owner = FileSafety::findOwningMount(target);
    ASSERT_TRUE(owner.has_value());

    const fs::path relative = target.lexically_relative(owner->m_mountpoint);
    ASSERT_FALSE(relative.empty());
    EXPECT_NE(*relative.begin(), "..");

    // No other containing mount is deeper
    for (const auto &mount : FileSafety::getMountPoints()) {
        const fs::path other = target.lexically_relative(mount.m_mountpoint);
        if (!other.empty() && *other.begin() != "..") {
            EXPECT_LE(depth(mount.m_mountpoint), depth(owner->m_mountpoint))
                << mount.m_mountpoint;
        }
    }
}

/**
 * @test SessionRefusesSystemFolder
 * @brief Highlighting /etc from a session at "/" and deleting leaves it in
 *        place with the guard's message
 */
TEST_F(FileSafetyTest, SessionRefusesSystemFolder) {
    BrowserSession session("/");
    session.updateFilter(std::string());

    const auto rows = session.engine().selected().size();
    for (std::size_t i = 0; i < rows; ++i) {
        const Entry *entry = session.highlightedEntry();
        ASSERT_NE(entry, nullptr);
        if (entry->getName() == "etc") {
            break;
        }
        session.moveDown();
    }
    ASSERT_EQ(session.highlightedEntry()->getName(), "etc");

    DeleteResult result = session.deleteHighlighted();
    EXPECT_FALSE(result.m_deleted);
    EXPECT_EQ(result.m_message,
              FileSafety::getStatusMessage(Status::BlockedSystemPath, "/etc"));
    EXPECT_TRUE(fs::is_directory("/etc"));
}

TEST_F(FileSafetyTest, SessionRefusesVirtualFilesystemEntry) {
    BrowserSession session("/proc/self");
    session.updateFilter(std::string("status"));
    ASSERT_NE(session.highlightedEntry(), nullptr);

    DeleteResult result = session.deleteHighlighted();
    EXPECT_FALSE(result.m_deleted);
    EXPECT_NE(result.m_message.find("virtual"), std::string::npos) << result.m_message;
}
