/**
 * @file entry.hpp
 * @brief Value types describing filesystem entries and directory snapshots
 *
 * An Entry is one row of a directory listing: the directory it was found in,
 * its name and whether it is a regular file. A DirectorySnapshot is the
 * sorted listing of one directory together with the time it was read.
 *
 * @see DirectoryScanner
 * @see DirectoryCache
 */

#ifndef ENTRY_HPP
#define ENTRY_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @class Entry
 * @brief Immutable description of one filesystem entry
 *
 * The parent directory existed when the entry was built; the name is never
 * empty. The synthetic ".." entry that leads to the parent directory is an
 * Entry whose parent is the listed directory itself.
 */
class Entry {
private:
  std::filesystem::path m_parent;
  std::string m_name;
  bool m_isFile;

public:
  /** @brief Name of the synthetic parent-directory row */
  static constexpr const char *PARENT_SHORTCUT = "..";

  /**
   * @brief Builds an entry from its parts
   *
   * @throws BrowserError (Path) if @p name is empty
   */
  Entry(const std::filesystem::path &parent, const std::string &name,
        bool isFile);

  /**
   * @brief Builds an entry from an existing path
   *
   * Splits the path into parent and name and stats it (following symlinks)
   * to find out whether it is a regular file.
   *
   * @param path Path of the entry, usually absolute
   * @return Entry describing the path
   *
   * @throws BrowserError (Path) if the path has no file name or no parent
   *         (e.g. the filesystem root), or if its target does not exist
   *         (e.g. a broken symlink)
   */
  static Entry fromPath(const std::filesystem::path &path);

  /**
   * @brief Builds the entry representing a cached directory in history view
   *
   * Does not touch the disk, so stale directories can still be listed. The
   * filesystem root has no name of its own and is represented as "." inside
   * itself.
   */
  static Entry forDirectoryKey(const std::filesystem::path &directory);

  /** @brief Builds the ".." row of @p directory */
  static Entry parentShortcut(const std::filesystem::path &directory);

  const std::filesystem::path &getParent() const { return m_parent; }
  const std::string &getName() const { return m_name; }
  bool isFile() const { return m_isFile; }
  bool isParentShortcut() const { return m_name == PARENT_SHORTCUT; }

  /** @brief parent/name, without resolving anything */
  std::filesystem::path fullPath() const { return m_parent / m_name; }

  /**
   * @brief Resolves symlinks and "..", returning the absolute path
   *
   * @throws BrowserError (Path) if the target no longer exists
   */
  std::filesystem::path canonicalPath() const;

  /**
   * @brief Renders the entry relative to an ancestor directory
   *
   * Returns the bare name when the entry lives directly in @p reference and
   * a "nested/deep/file.txt" style path for deeper entries.
   *
   * @throws BrowserError (Path) if @p reference is not a prefix of the
   *         entry's parent
   */
  std::string relativeTo(const std::filesystem::path &reference) const;

  bool operator==(const Entry &other) const {
    return m_isFile == other.m_isFile && m_name == other.m_name &&
           m_parent == other.m_parent;
  }
  bool operator!=(const Entry &other) const { return !(*this == other); }
};

/**
 * @struct DirectorySnapshot
 * @brief Listing of one directory at a point in time
 *
 * Entries are sorted by name; the ".." row, when present, comes first.
 */
struct DirectorySnapshot {
  std::vector<Entry> entries;
  std::chrono::system_clock::time_point loadedAt;
};

#endif // ENTRY_HPP
