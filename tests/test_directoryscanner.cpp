/**
 * @file test_directoryscanner.cpp
 * @brief Unit tests for DirectoryScanner
 *
 * Uses the real FilesystemReader on a temporary tree. A counting wrapper
 * records how many directory reads a scan performs.
 *
 * @see DirectoryScanner
 * @see FilesystemReader
 */

#include <gtest/gtest.h>
#include "browsererror.hpp"
#include "directoryscanner.hpp"
#include "countingreader.hpp"
#include "testtree.hpp"

#include <memory>

namespace fs = std::filesystem;

class DirectoryScannerTest : public ::testing::Test {
protected:
    std::unique_ptr<TestTree> tree;
    CountingReader reader;
    std::unique_ptr<DirectoryScanner> scanner;

    void SetUp() override {
        tree = std::make_unique<TestTree>(fs::temp_directory_path());
        scanner = std::make_unique<DirectoryScanner>(reader);
    }

    void TearDown() override { tree.reset(); }

    static std::vector<std::string> names(const DirectorySnapshot &snapshot) {
        std::vector<std::string> result;
        for (const auto &entry : snapshot.entries) {
            result.push_back(entry.getName());
        }
        return result;
    }
};

/**
 * @test SortsByNameWithParentFirst
 * @brief ".." leads, the rest is sorted byte-wise with files and folders mixed
 */
TEST_F(DirectoryScannerTest, SortsByNameWithParentFirst) {
    DirectorySnapshot snapshot = scanner->scanDirectory(tree->root(), true);

    std::vector<std::string> expected = {"..",    ".gitkeep", "README.md",
                                         "empty", "main.rs",  "src"};
    EXPECT_EQ(names(snapshot), expected);
    EXPECT_EQ(reader.calls, 1);

    EXPECT_EQ(snapshot.entries[0].getParent(), tree->root());
    EXPECT_FALSE(snapshot.entries[0].isFile());
}

TEST_F(DirectoryScannerTest, OmitsParentShortcutWhenNotRequested) {
    DirectorySnapshot snapshot = scanner->scanDirectory(tree->path("src"), false);

    std::vector<std::string> expected = {"lib.rs", "module.rs", "nested"};
    EXPECT_EQ(names(snapshot), expected);
}

TEST_F(DirectoryScannerTest, SetsFileFlags) {
    DirectorySnapshot snapshot = scanner->scanDirectory(tree->path("src"), false);

    ASSERT_EQ(snapshot.entries.size(), 3u);
    EXPECT_TRUE(snapshot.entries[0].isFile());
    EXPECT_TRUE(snapshot.entries[1].isFile());
    EXPECT_FALSE(snapshot.entries[2].isFile());
    for (const auto &entry : snapshot.entries) {
        EXPECT_EQ(entry.getParent(), tree->path("src"));
    }
}

TEST_F(DirectoryScannerTest, EmptyDirectoryHasOnlyParentShortcut) {
    DirectorySnapshot snapshot = scanner->scanDirectory(tree->path("empty"), true);
    ASSERT_EQ(snapshot.entries.size(), 1u);
    EXPECT_TRUE(snapshot.entries[0].isParentShortcut());

    EXPECT_TRUE(scanner->scanDirectory(tree->path("empty"), false).entries.empty());
}

TEST_F(DirectoryScannerTest, RootHasNoParentShortcut) {
    DirectorySnapshot snapshot = scanner->scanDirectory("/", true);
    for (const auto &entry : snapshot.entries) {
        EXPECT_FALSE(entry.isParentShortcut());
    }
}

/**
 * @test SkipsBrokenSymlinks
 * @brief An entry whose target is gone does not fail the whole listing
 */
TEST_F(DirectoryScannerTest, SkipsBrokenSymlinks) {
    fs::create_symlink(tree->path("nowhere"), tree->path("dangling"));

    DirectorySnapshot snapshot = scanner->scanDirectory(tree->root(), false);
    for (const auto &entry : snapshot.entries) {
        EXPECT_NE(entry.getName(), "dangling");
    }
    EXPECT_EQ(snapshot.entries.size(), 5u);
}

TEST_F(DirectoryScannerTest, MissingDirectoryIsIoError) {
    try {
        scanner->scanDirectory(tree->path("missing"), true);
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

TEST_F(DirectoryScannerTest, StampsLoadTime) {
    const auto before = std::chrono::system_clock::now();
    DirectorySnapshot snapshot = scanner->scanDirectory(tree->root(), true);
    const auto after = std::chrono::system_clock::now();

    EXPECT_GE(snapshot.loadedAt, before);
    EXPECT_LE(snapshot.loadedAt, after);
}

/**
 * @class ListedReader
 * @brief Returns a fixed listing, whatever directory is asked for
 */
class ListedReader : public IDirectoryReader {
public:
    std::vector<fs::path> listing;

    std::vector<fs::path> listDirectory(const fs::path &) const override {
        return listing;
    }
};

TEST_F(DirectoryScannerTest, SkipsEntriesRemovedWhileListing) {
    ListedReader listed;
    listed.listing = {tree->path("main.rs"), tree->path("removed.txt"),
                      tree->path("README.md")};
    DirectoryScanner fake(listed);

    DirectorySnapshot snapshot = fake.scanDirectory(tree->root(), false);
    std::vector<std::string> expected = {"README.md", "main.rs"};
    EXPECT_EQ(names(snapshot), expected);
}

TEST_F(DirectoryScannerTest, ReaderFailureProducesNoSnapshot) {
    reader.failOn = tree->path("src");

    try {
        scanner->scanDirectory(tree->path("src"), true);
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
    EXPECT_EQ(reader.calls, 1);
}
