/**
 * @file directorycache.cpp
 * @brief Implementation of DirectoryCache
 */

#include "directorycache.hpp"
#include "browsererror.hpp"

#include <spdlog/spdlog.h>

DirectoryCache::DirectoryCache(std::size_t capacity) : m_capacity(capacity) {
  if (m_capacity == 0) {
    throw BrowserError(ErrorKind::Cache, "cache capacity must be non-zero");
  }
}

const DirectorySnapshot *
DirectoryCache::get(const std::filesystem::path &key) {
  auto found = m_index.find(key.string());
  if (found == m_index.end()) {
    return nullptr;
  }

  if (found->second != m_lru.begin()) {
    m_lru.splice(m_lru.begin(), m_lru, found->second);
  }
  return &found->second->snapshot;
}

const DirectorySnapshot *
DirectoryCache::peek(const std::filesystem::path &key) const {
  auto found = m_index.find(key.string());
  if (found == m_index.end()) {
    return nullptr;
  }
  return &found->second->snapshot;
}

void DirectoryCache::put(const std::filesystem::path &key,
                         DirectorySnapshot snapshot) {
  auto found = m_index.find(key.string());
  if (found != m_index.end()) {
    found->second->snapshot = std::move(snapshot);
    m_lru.splice(m_lru.begin(), m_lru, found->second);
    return;
  }

  m_lru.push_front(Node{key, std::move(snapshot)});
  m_index.emplace(key.string(), m_lru.begin());
  evictOverflow();
}

bool DirectoryCache::invalidate(const std::filesystem::path &key) {
  auto found = m_index.find(key.string());
  if (found == m_index.end()) {
    return false;
  }

  m_lru.erase(found->second);
  m_index.erase(found);
  ++m_invalidations;
  spdlog::info("Cache: invalidated stale folder {}", key.string());
  return true;
}

bool DirectoryCache::contains(const std::filesystem::path &key) const {
  return m_index.count(key.string()) > 0;
}

std::vector<std::filesystem::path> DirectoryCache::keys() const {
  std::vector<std::filesystem::path> result;
  result.reserve(m_lru.size());
  for (const auto &node : m_lru) {
    result.push_back(node.key);
  }
  return result;
}

void DirectoryCache::evictOverflow() {
  while (m_lru.size() > m_capacity) {
    const Node &coldest = m_lru.back();
    spdlog::debug("Cache: evicted cold folder {}", coldest.key.string());
    m_index.erase(coldest.key.string());
    m_lru.pop_back();
    ++m_evictions;
  }
}
