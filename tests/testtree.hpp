/**
 * @file testtree.hpp
 * @brief Sample directory tree shared by the navigator tests
 *
 * Layout created under the root:
 * @code
 * root/
 * ├── .gitkeep
 * ├── README.md
 * ├── main.rs
 * ├── empty/
 * └── src/
 *     ├── lib.rs
 *     ├── module.rs
 *     └── nested/
 *         └── deep/
 *             └── file.txt
 * @endcode
 *
 * Each test gets its own root (test name plus process id), so tests can
 * run in parallel.
 */

#ifndef TESTTREE_HPP
#define TESTTREE_HPP

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

class TestTree {
private:
  std::filesystem::path m_root;

public:
  /**
   * @brief Creates the tree below @p base
   *
   * @param base Parent directory, e.g. the system temp directory
   * @param nested If false, only the empty root is created
   */
  explicit TestTree(const std::filesystem::path &base, bool nested = true) {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = "treeseek_";
    if (info != nullptr) {
      name += std::string(info->test_suite_name()) + "_" + info->name();
    }
    name += "_" + std::to_string(::getpid());

    const auto location = base / name;
    std::filesystem::remove_all(location);
    std::filesystem::create_directories(location);
    m_root = std::filesystem::canonical(location);

    if (nested) {
      createNestedStructure();
    }
  }

  ~TestTree() {
    std::error_code ec;
    std::filesystem::remove_all(m_root, ec);
  }

  TestTree(const TestTree &) = delete;
  TestTree &operator=(const TestTree &) = delete;

  /** @brief Canonical root of the tree */
  const std::filesystem::path &root() const { return m_root; }

  std::filesystem::path path(const std::string &relative) const {
    return m_root / relative;
  }

  void createFile(const std::string &relative, const std::string &content) {
    std::filesystem::create_directories(path(relative).parent_path());
    std::ofstream file(path(relative), std::ios::binary);
    file << content;
  }

  void createDir(const std::string &relative) {
    std::filesystem::create_directories(path(relative));
  }

  void remove(const std::string &relative) {
    std::filesystem::remove_all(path(relative));
  }

  void createNestedStructure() {
    createFile("README.md", "# Test Project\n");
    createFile("main.rs", "fn main() {\n    println!(\"hello\");\n}\n");
    createFile(".gitkeep", "");
    createFile("src/lib.rs", "pub mod module;\n");
    createFile("src/module.rs", "pub fn f() {}\n");
    createFile("src/nested/deep/file.txt", "deep\n");
    createDir("empty");
  }
};

#endif // TESTTREE_HPP
