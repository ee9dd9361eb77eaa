/**
 * @file test_navigationengine.cpp
 * @brief Unit tests for NavigationEngine
 *
 * This file contains Google Test unit tests for the navigation engine:
 * entering directories, filtering, the LRU directory cache and its history
 * view, multi-level expand/collapse and stale-entry handling.
 *
 * All tests run on a temporary tree (see TestTree) through a reader that
 * counts directory reads, so cache hits can be told apart from disk reads.
 *
 * @see NavigationEngine
 */

#include <gtest/gtest.h>
#include "browsererror.hpp"
#include "countingreader.hpp"
#include "navigationengine.hpp"
#include "testtree.hpp"

#include <memory>

namespace fs = std::filesystem;

/**
 * @class NavigationEngineTest
 * @brief Fixture providing a sample tree, a state and a counting reader
 *
 * The engine is created lazily by start(), so tests can pick a cache
 * capacity or prepare the tree first.
 */
class NavigationEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<TestTree> tree;
    NavigationState state;
    CountingReader reader;
    std::unique_ptr<NavigationEngine> engine;

    void SetUp() override {
        tree = std::make_unique<TestTree>(fs::temp_directory_path());
    }

    void TearDown() override {
        engine.reset();
        tree.reset();
    }

    void start(std::size_t capacity = DirectoryCache::DEFAULT_CAPACITY) {
        engine = std::make_unique<NavigationEngine>(state, reader, tree->root(),
                                                    capacity);
    }

    /** @brief Display texts of the selected rows */
    std::vector<std::string> rows() const {
        std::vector<std::string> result;
        for (const auto &entry : engine->selected()) {
            result.push_back(engine->displayText(entry));
        }
        return result;
    }

    std::size_t indexOf(const std::string &text) const {
        const auto listed = rows();
        for (std::size_t i = 0; i < listed.size(); ++i) {
            if (listed[i] == text) {
                return i;
            }
        }
        ADD_FAILURE() << "row not found: " << text;
        return listed.size();
    }
};

TEST_F(NavigationEngineTest, InitialListing) {
    start();

    std::vector<std::string> expected = {"..",    ".gitkeep", "README.md",
                                         "empty", "main.rs",  "src"};
    EXPECT_EQ(rows(), expected);
    EXPECT_EQ(engine->currentDirectory(), tree->root());
    EXPECT_EQ(engine->expandLevel(), 0u);
    EXPECT_EQ(engine->filter(), "");
    EXPECT_EQ(engine->cache().size(), 1u);
    EXPECT_TRUE(engine->cache().contains(tree->root()));
}

/**
 * @test FilterAndEnter
 * @brief Typing "src" narrows to one row, submitting it enters the folder
 */
TEST_F(NavigationEngineTest, FilterAndEnter) {
    start();

    engine->update(std::string("src"));
    ASSERT_EQ(rows(), std::vector<std::string>{"src"});

    const fs::path target = engine->submit(0);
    EXPECT_EQ(target, tree->path("src"));

    engine->enter(target);
    std::vector<std::string> expected = {"..", "lib.rs", "module.rs", "nested"};
    EXPECT_EQ(rows(), expected);
    EXPECT_EQ(engine->filter(), "");
}

TEST_F(NavigationEngineTest, UpdateIsIdempotent) {
    start();

    engine->update(std::string("m"));
    const auto first = rows();
    engine->update();
    EXPECT_EQ(rows(), first);
    EXPECT_EQ(engine->filter(), "m");

    std::vector<std::string> expected = {"README.md", "empty", "main.rs"};
    EXPECT_EQ(first, expected);
}

TEST_F(NavigationEngineTest, ParentShortcutSubmitsToParent) {
    start();
    engine->enter(tree->path("src"));

    ASSERT_EQ(rows().front(), "..");
    EXPECT_EQ(engine->submit(0), tree->root());
}

/**
 * @test ReturningUsesCachedSnapshot
 * @brief Going back to a visited folder does not read the disk again
 */
TEST_F(NavigationEngineTest, ReturningUsesCachedSnapshot) {
    start();
    const auto loadedAt = engine->currentSnapshot().loadedAt;
    EXPECT_EQ(reader.calls, 1);

    engine->enter(tree->path("src"));
    EXPECT_EQ(reader.calls, 2);

    engine->enter(engine->submit(indexOf("..")));
    EXPECT_EQ(reader.calls, 2);
    EXPECT_EQ(engine->currentDirectory(), tree->root());
    EXPECT_EQ(engine->currentSnapshot().loadedAt, loadedAt);
}

TEST_F(NavigationEngineTest, CachedSnapshotIgnoresDiskChanges) {
    start();
    engine->enter(tree->path("src"));
    tree->createFile("zeta.txt", "z");

    engine->enter(tree->root());
    for (const auto &row : rows()) {
        EXPECT_NE(row, "zeta.txt");
    }
}

TEST_F(NavigationEngineTest, HistoryListsVisitedFoldersMostRecentFirst) {
    start();
    engine->enter(tree->path("src"));
    engine->enter(tree->path("src/nested"));

    state.toHistorySearch();
    engine->update(std::string());

    std::vector<std::string> expected = {tree->path("src/nested").string(),
                                         tree->path("src").string(),
                                         tree->root().string()};
    EXPECT_EQ(rows(), expected);
}

TEST_F(NavigationEngineTest, HistoryFilterMatchesAbsolutePaths) {
    start();
    engine->enter(tree->path("src"));
    engine->enter(tree->path("src/nested"));

    state.toHistorySearch();
    engine->update(std::string("src/n"));

    EXPECT_EQ(rows(), std::vector<std::string>{tree->path("src/nested").string()});
}

/**
 * @test ExpandFlattensOneLevelAtATime
 * @brief Each expand step replaces folder rows by their children
 */
TEST_F(NavigationEngineTest, ExpandFlattensOneLevelAtATime) {
    start();

    engine->expand();
    EXPECT_EQ(engine->expandLevel(), 1u);
    std::vector<std::string> level1 = {"..",      ".gitkeep",   "README.md",
                                       "empty",   "main.rs",    "src/lib.rs",
                                       "src/module.rs", "src/nested"};
    EXPECT_EQ(rows(), level1);

    engine->expand();
    std::vector<std::string> level2 = {"..",      ".gitkeep",   "README.md",
                                       "empty",   "main.rs",    "src/lib.rs",
                                       "src/module.rs", "src/nested/deep"};
    EXPECT_EQ(rows(), level2);

    engine->expand();
    EXPECT_EQ(engine->expandLevel(), 3u);
    EXPECT_EQ(rows().back(), "src/nested/deep/file.txt");

    // Expanding never touches the cache
    EXPECT_EQ(engine->cache().size(), 1u);
}

TEST_F(NavigationEngineTest, CollapseUndoesExpand) {
    start();
    const auto initial = rows();

    engine->expand();
    const auto level1 = rows();
    engine->expand();
    engine->expand();

    engine->collapse();
    engine->collapse();
    EXPECT_EQ(engine->expandLevel(), 1u);
    EXPECT_EQ(rows(), level1);

    engine->collapse();
    EXPECT_EQ(engine->expandLevel(), 0u);
    EXPECT_EQ(rows(), initial);
    EXPECT_EQ(engine->currentChildren(), engine->currentSnapshot().entries);
}

TEST_F(NavigationEngineTest, CollapseAtTopLevelIsNoOp) {
    start();
    const auto initial = rows();

    engine->collapse();
    EXPECT_EQ(engine->expandLevel(), 0u);
    EXPECT_EQ(rows(), initial);
}

TEST_F(NavigationEngineTest, FilterSurvivesExpand) {
    start();

    engine->update(std::string("lib"));
    EXPECT_TRUE(rows().empty());

    engine->expand();
    EXPECT_EQ(rows(), std::vector<std::string>{"src/lib.rs"});
    EXPECT_EQ(engine->filter(), "lib");
}

TEST_F(NavigationEngineTest, ExpandDropsVanishedEntries) {
    start();
    tree->remove("main.rs");

    engine->expand();
    for (const auto &row : rows()) {
        EXPECT_NE(row, "main.rs");
    }
}

TEST_F(NavigationEngineTest, ExpandAndCollapseRejectedInHistory) {
    start();
    state.toHistorySearch();

    try {
        engine->expand();
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::State);
    }
    EXPECT_THROW(engine->collapse(), BrowserError);
    EXPECT_EQ(engine->expandLevel(), 0u);
}

/**
 * @test StaleHistoryEntryIsDropped
 * @brief A deleted folder fails to resolve and is removed from the cache
 */
TEST_F(NavigationEngineTest, StaleHistoryEntryIsDropped) {
    start();
    engine->enter(tree->path("src"));
    engine->enter(tree->path("src/nested"));
    engine->enter(tree->path("src"));
    tree->remove("src/nested");

    state.toHistorySearch();
    engine->update(std::string());

    const std::size_t stale = indexOf(tree->path("src/nested").string());
    try {
        engine->submit(stale);
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Path);
    }

    engine->dropInvalidFolder(stale);

    std::vector<std::string> expected = {tree->path("src").string(),
                                         tree->root().string()};
    EXPECT_EQ(rows(), expected);
    EXPECT_FALSE(engine->cache().contains(tree->path("src/nested")));
    EXPECT_EQ(engine->cache().invalidationCount(), 1u);

    // The cache keys agree with the edited selection
    engine->update();
    EXPECT_EQ(rows(), expected);
}

/**
 * @test DroppingCurrentFolderMovesToAncestor
 * @brief A stale history row for the current folder re-enters its parent
 */
TEST_F(NavigationEngineTest, DroppingCurrentFolderMovesToAncestor) {
    start();
    engine->enter(tree->path("src"));
    engine->expand();
    tree->remove("src");

    state.toHistorySearch();
    engine->update(tree->path("src").string());
    ASSERT_EQ(rows(), std::vector<std::string>{tree->path("src").string()});

    engine->dropInvalidFolder(0);

    EXPECT_EQ(engine->currentDirectory(), tree->root());
    EXPECT_EQ(engine->expandLevel(), 0u);
    EXPECT_FALSE(engine->cache().contains(tree->path("src")));
    EXPECT_TRUE(rows().empty());
    EXPECT_EQ(engine->filter(), tree->path("src").string());

    state.toSearch();
    engine->update(std::string());
    EXPECT_NO_THROW(engine->currentSnapshot());
    EXPECT_EQ(engine->currentSnapshot().entries.size(), rows().size());
}

TEST_F(NavigationEngineTest, DropRequiresHistoryMode) {
    start();

    try {
        engine->dropInvalidFolder(0);
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::State);
    }
}

TEST_F(NavigationEngineTest, EvictsColdFoldersAtCapacity) {
    start(2);
    engine->enter(tree->path("src"));
    engine->enter(tree->path("src/nested"));

    EXPECT_EQ(engine->cache().size(), 2u);
    EXPECT_EQ(engine->cache().evictionCount(), 1u);
    EXPECT_FALSE(engine->cache().contains(tree->root()));

    // The evicted root is read from disk again
    const int before = reader.calls;
    engine->enter(tree->root());
    EXPECT_EQ(reader.calls, before + 1);
}

TEST_F(NavigationEngineTest, RefreshRereadsAndResetsLevel) {
    start();
    engine->update(std::string("z"));
    engine->expand();
    tree->createFile("zeta.txt", "z");

    engine->refresh();

    EXPECT_EQ(engine->expandLevel(), 0u);
    EXPECT_EQ(engine->filter(), "z");
    EXPECT_EQ(rows(), std::vector<std::string>{"zeta.txt"});
    EXPECT_EQ(engine->cache().size(), 1u);
}

TEST_F(NavigationEngineTest, EnterRejectsFilesAndMissingPaths) {
    start();

    try {
        engine->enter(tree->path("README.md"));
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Path);
    }
    EXPECT_THROW(engine->enter(tree->path("missing")), BrowserError);

    // A failed enter leaves the view untouched
    EXPECT_EQ(engine->currentDirectory(), tree->root());
    EXPECT_EQ(rows().size(), 6u);
}

/**
 * @test UnreadableFolderLeavesCacheUntouched
 * @brief A failed read is reported and nothing about the view changes
 */
TEST_F(NavigationEngineTest, UnreadableFolderLeavesCacheUntouched) {
    start();
    reader.failOn = tree->path("src");

    try {
        engine->enter(tree->path("src"));
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
    EXPECT_EQ(engine->cache().size(), 1u);
    EXPECT_FALSE(engine->cache().contains(tree->path("src")));
    EXPECT_EQ(engine->currentDirectory(), tree->root());
    EXPECT_EQ(rows().size(), 6u);
}

TEST_F(NavigationEngineTest, ExpandKeepsUnreadableFolder) {
    start();
    reader.failOn = tree->path("src");

    engine->expand();
    EXPECT_EQ(rows().back(), "src");
    EXPECT_EQ(engine->expandLevel(), 1u);
}

TEST_F(NavigationEngineTest, SubmitOutOfRangeIsParseError) {
    start();

    try {
        engine->submit(6);
        FAIL() << "expected BrowserError";
    } catch (const BrowserError &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Parse);
    }
}

TEST_F(NavigationEngineTest, StartInMissingDirectoryFails) {
    tree->remove("src");
    EXPECT_THROW({ NavigationEngine broken(state, reader, tree->path("src")); },
                 BrowserError);
}
