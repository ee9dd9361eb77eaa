/**
 * @file navigationengine.hpp
 * @brief Directory cache and navigation engine
 *
 * This header defines the NavigationEngine class, which owns the directory
 * cache and answers "what is visible right now": the current directory's
 * (possibly flattened) children in browse mode, or every cached directory in
 * history mode, narrowed by a fuzzy filter.
 *
 * @see NavigationState
 * @see DirectoryCache
 * @see fuzzyMatch()
 */

#ifndef NAVIGATIONENGINE_HPP
#define NAVIGATIONENGINE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "directorycache.hpp"
#include "directoryscanner.hpp"
#include "entry.hpp"
#include "idirectoryreader.hpp"
#include "navigationstate.hpp"

/**
 * @class NavigationEngine
 * @brief Owns the LRU directory cache, the current view and the selection
 *
 * State:
 * - cache: canonical directory path -> DirectorySnapshot, LRU-bounded
 * - current directory (canonical) and its children, possibly flattened by
 *   expand() into a multi-level view
 * - expand level: number of expand() steps applied since the last directory
 *   change or refresh
 * - filter and selected: selected is always the filter applied to either the
 *   current children (browse mode) or the cache keys (history mode); it is
 *   recomputed by update() and never edited independently, except when a
 *   stale history row is dropped
 *
 * The engine reads the navigation state to choose the data source but never
 * changes it; transitions are the caller's business.
 *
 * Invariant: the snapshot of the current directory is in the cache after
 * every successful enter() or refresh().
 *
 * @note Single-threaded: every operation runs inline and may block on disk
 */
class NavigationEngine {
private:
  /** @brief Mode predicates (history vs. browse) */
  const NavigationState &m_state;

  /** @brief Lists directories for the cache and for expand() */
  DirectoryScanner m_scanner;

  DirectoryCache m_cache;

  std::filesystem::path m_currentDirectory;

  /** @brief Rows of the current view, ".." first when present */
  std::vector<Entry> m_currentChildren;

  unsigned int m_expandLevel = 0;

  std::string m_filter;

  /** @brief Rows passing the filter, in display order */
  std::vector<Entry> m_selected;

  void requireBrowseMode(const char *operation) const;
  void requireSelectedIndex(std::size_t index) const;
  void enterNearestAncestor(const std::filesystem::path &directory);

public:
  /**
   * @brief Creates the engine and enters @p startDirectory
   *
   * @param state Navigation state consulted for the history/browse choice;
   *              must outlive the engine
   * @param reader Directory-read primitive; must outlive the engine
   * @param startDirectory First directory to enter
   * @param cacheCapacity Maximum number of cached directories
   *
   * @throws BrowserError if the start directory cannot be resolved or read
   */
  NavigationEngine(const NavigationState &state,
                   const IDirectoryReader &reader,
                   const std::filesystem::path &startDirectory,
                   std::size_t cacheCapacity = DirectoryCache::DEFAULT_CAPACITY);

  NavigationEngine(const NavigationEngine &) = delete;
  NavigationEngine &operator=(const NavigationEngine &) = delete;

  /**
   * @brief Returns the cached snapshot of a directory, reading it if absent
   *
   * A cached snapshot is marked most-recently-used and returned as is, even
   * if the directory changed on disk since. A missing one is read and
   * inserted, possibly evicting the least-recently-used directory.
   *
   * @param directory Canonical directory path (the cache key)
   * @param addParentShortcut Prefix a ".." row when reading
   *
   * @return Reference valid until the next cache mutation
   *
   * @throws BrowserError (Io) if the directory cannot be read; the cache is
   *         left untouched
   */
  const DirectorySnapshot &loadOrGet(const std::filesystem::path &directory,
                                     bool addParentShortcut);

  /**
   * @brief Makes @p path the current directory
   *
   * Resolves the path, loads or reuses its snapshot, clears the filter,
   * resets the expand level and recomputes the selection. Nothing changes
   * if it fails.
   *
   * @throws BrowserError (Path) if the path does not resolve to a directory
   * @throws BrowserError (Io) if the directory cannot be read
   */
  void enter(const std::filesystem::path &path);

  /**
   * @brief Recomputes the selection, optionally with a new filter
   *
   * Idempotent: calling it twice with no new filter yields the same list.
   */
  void update(const std::optional<std::string> &filter = std::nullopt);

  /**
   * @brief Flattens one more directory level into the current view
   *
   * Every directory row (except the leading "..") is replaced in place by
   * its own children, read without touching the cache. Files stay as they
   * are. Empty or unreadable directories stay as their own row; rows whose
   * target vanished are dropped.
   *
   * @throws BrowserError (State) in history mode
   */
  void expand();

  /**
   * @brief Folds the view back by one level
   *
   * Rows deeper than the new level are replaced by their ancestor directory
   * at that level, one row per ancestor. No-op at level 0.
   *
   * @throws BrowserError (State) in history mode
   * @throws BrowserError (Path) if a row does not live under the current
   *         directory
   */
  void collapse();

  /**
   * @brief Resolves the selected row at @p index to its canonical path
   *
   * @throws BrowserError (Parse) if the index is out of range
   * @throws BrowserError (Path) if the row's target no longer exists
   */
  std::filesystem::path submit(std::size_t index) const;

  /**
   * @brief Re-reads the current directory from disk
   *
   * Replaces its cache entry, rebuilds the unflattened view (expand level
   * back to 0) and re-applies the current filter.
   *
   * @throws BrowserError (Io) if the directory cannot be read
   */
  void refresh();

  /**
   * @brief Removes a stale history row and its cache entry
   *
   * When the row is the current directory, the nearest existing ancestor
   * is entered instead and the history rows are rebuilt with the current
   * filter, so the current directory always stays cached.
   *
   * @throws BrowserError (State) outside history mode
   * @throws BrowserError (Cache) if the row's directory is not cached
   */
  void dropInvalidFolder(std::size_t index);

  /**
   * @brief Text shown (and filtered on) for a row
   *
   * Absolute path in history mode, path relative to the current directory
   * otherwise.
   */
  std::string displayText(const Entry &entry) const;

  /**
   * @brief Snapshot of the current directory, without promoting it
   * @throws BrowserError (Cache) if it is missing from the cache
   */
  const DirectorySnapshot &currentSnapshot() const;

  const std::vector<Entry> &selected() const { return m_selected; }
  const std::vector<Entry> &currentChildren() const {
    return m_currentChildren;
  }
  const std::filesystem::path &currentDirectory() const {
    return m_currentDirectory;
  }
  const std::string &filter() const { return m_filter; }
  unsigned int expandLevel() const { return m_expandLevel; }
  const DirectoryCache &cache() const { return m_cache; }
};

#endif // NAVIGATIONENGINE_HPP
