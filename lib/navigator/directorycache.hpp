/**
 * @file directorycache.hpp
 * @brief Bounded least-recently-used cache of directory snapshots
 */

#ifndef DIRECTORYCACHE_HPP
#define DIRECTORYCACHE_HPP

#include <cstddef>
#include <filesystem>
#include <list>
#include <string>
#include <unordered_map>
#include <vector>

#include "entry.hpp"

/**
 * @class DirectoryCache
 * @brief Maps canonical directory paths to their snapshots, LRU-bounded
 *
 * Two removal paths feed the same map and are counted and logged apart:
 * - eviction: the least-recently-used entry is dropped because the cache is
 *   over capacity ("cold")
 * - invalidation: a caller found the directory gone from disk ("stale")
 *
 * Keys are expected to be canonical; the cache does not resolve them.
 */
class DirectoryCache {
public:
  static constexpr std::size_t DEFAULT_CAPACITY = 100;

  /**
   * @throws BrowserError (Cache) if @p capacity is 0
   */
  explicit DirectoryCache(std::size_t capacity = DEFAULT_CAPACITY);

  /**
   * @brief Looks up a snapshot and marks it most-recently-used
   * @return Pointer to the snapshot, or nullptr if absent. Valid until the
   *         next put() or invalidate().
   */
  const DirectorySnapshot *get(const std::filesystem::path &key);

  /** @brief Looks up a snapshot without changing the recency order */
  const DirectorySnapshot *peek(const std::filesystem::path &key) const;

  /**
   * @brief Inserts or replaces a snapshot and marks it most-recently-used
   *
   * Evicts the least-recently-used entry when the capacity is exceeded.
   */
  void put(const std::filesystem::path &key, DirectorySnapshot snapshot);

  /**
   * @brief Removes a key known to be stale
   * @return true if the key was present
   */
  bool invalidate(const std::filesystem::path &key);

  bool contains(const std::filesystem::path &key) const;

  /** @brief All keys, most-recently-used first */
  std::vector<std::filesystem::path> keys() const;

  std::size_t size() const { return m_lru.size(); }
  std::size_t capacity() const { return m_capacity; }
  std::size_t evictionCount() const { return m_evictions; }
  std::size_t invalidationCount() const { return m_invalidations; }

private:
  struct Node {
    std::filesystem::path key;
    DirectorySnapshot snapshot;
  };

  using NodeList = std::list<Node>;

  void evictOverflow();

  std::size_t m_capacity;
  NodeList m_lru; // front = most recently used
  std::unordered_map<std::string, NodeList::iterator> m_index;
  std::size_t m_evictions = 0;
  std::size_t m_invalidations = 0;
};

#endif // DIRECTORYCACHE_HPP
