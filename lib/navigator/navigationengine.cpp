/**
 * @file navigationengine.cpp
 * @brief Implementation of NavigationEngine
 */

#include "navigationengine.hpp"
#include "browsererror.hpp"
#include "selection.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <system_error>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

NavigationEngine::NavigationEngine(const NavigationState &state,
                                   const IDirectoryReader &reader,
                                   const fs::path &startDirectory,
                                   std::size_t cacheCapacity)
    : m_state(state), m_scanner(reader), m_cache(cacheCapacity) {
  enter(startDirectory);
}

void NavigationEngine::requireBrowseMode(const char *operation) const {
  if (m_state.isHistorySearch()) {
    throw BrowserError(ErrorKind::State,
                       std::string(operation) +
                           " is not available in history view");
  }
}

void NavigationEngine::requireSelectedIndex(std::size_t index) const {
  if (index >= m_selected.size()) {
    throw BrowserError(ErrorKind::Parse,
                       "highlight index " + std::to_string(index) +
                           " is out of range for " +
                           std::to_string(m_selected.size()) + " rows");
  }
}

const DirectorySnapshot &NavigationEngine::loadOrGet(const fs::path &directory,
                                                     bool addParentShortcut) {
  if (const DirectorySnapshot *cached = m_cache.get(directory)) {
    spdlog::debug("Cache hit for {}", directory.string());
    return *cached;
  }

  // Scan before touching the cache so a failed read leaves it unchanged
  DirectorySnapshot snapshot =
      m_scanner.scanDirectory(directory, addParentShortcut);
  m_cache.put(directory, std::move(snapshot));

  const DirectorySnapshot *inserted = m_cache.peek(directory);
  if (inserted == nullptr) {
    throw BrowserError(ErrorKind::Cache,
                       "folder vanished from cache right after insertion: " +
                           directory.string());
  }
  return *inserted;
}

void NavigationEngine::enter(const fs::path &path) {
  std::error_code ec;
  fs::path canonical = fs::canonical(path, ec);
  if (ec) {
    throw BrowserError(ErrorKind::Path, "unable to resolve " + path.string() +
                                            ": " + ec.message());
  }
  if (!fs::is_directory(canonical, ec)) {
    throw BrowserError(ErrorKind::Path,
                       canonical.string() + " is not a directory");
  }

  std::vector<Entry> children = loadOrGet(canonical, true).entries;

  m_currentDirectory = std::move(canonical);
  m_currentChildren = std::move(children);
  m_expandLevel = 0;
  update(std::string());

  spdlog::info("Entered {}", m_currentDirectory.string());
}

void NavigationEngine::update(const std::optional<std::string> &filter) {
  std::string pattern = filter ? *filter : m_filter;
  std::vector<Entry> selected;

  if (m_state.isHistorySearch()) {
    for (const auto &key : m_cache.keys()) {
      Entry entry = Entry::forDirectoryKey(key);
      if (fuzzyMatch(displayText(entry), pattern)) {
        selected.push_back(std::move(entry));
      }
    }
  } else {
    for (const auto &entry : m_currentChildren) {
      if (fuzzyMatch(entry.relativeTo(m_currentDirectory), pattern)) {
        selected.push_back(entry);
      }
    }
  }

  m_filter = std::move(pattern);
  m_selected = std::move(selected);
}

void NavigationEngine::expand() {
  requireBrowseMode("expand");

  std::vector<Entry> expanded;
  expanded.reserve(m_currentChildren.size());

  auto it = m_currentChildren.begin();
  if (it != m_currentChildren.end() && it->isParentShortcut()) {
    expanded.push_back(*it);
    ++it;
  }

  for (; it != m_currentChildren.end(); ++it) {
    const fs::path path = it->fullPath();

    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
      spdlog::debug("Dropping vanished entry {}", path.string());
      continue;
    }

    if (it->isFile() || !fs::is_directory(status)) {
      expanded.push_back(*it);
      continue;
    }

    try {
      DirectorySnapshot nested = m_scanner.scanDirectory(path, false);
      if (nested.entries.empty()) {
        expanded.push_back(*it);
      } else {
        std::move(nested.entries.begin(), nested.entries.end(),
                  std::back_inserter(expanded));
      }
    } catch (const BrowserError &e) {
      spdlog::warn("Keeping unreadable folder {} unexpanded: {}",
                   path.string(), e.what());
      expanded.push_back(*it);
    }
  }

  m_currentChildren = std::move(expanded);
  ++m_expandLevel;
  update();
}

void NavigationEngine::collapse() {
  requireBrowseMode("collapse");

  if (m_expandLevel == 0) {
    return;
  }

  const unsigned int level = m_expandLevel - 1;
  std::vector<Entry> folded;
  std::unordered_set<std::string> seen;

  auto it = m_currentChildren.begin();
  if (it != m_currentChildren.end() && it->isParentShortcut()) {
    folded.push_back(*it);
    ++it;
  }

  for (; it != m_currentChildren.end(); ++it) {
    const std::string relative = it->relativeTo(m_currentDirectory);
    const auto depth =
        static_cast<unsigned int>(std::count(relative.begin(), relative.end(), '/'));

    if (depth <= level) {
      if (seen.insert(it->fullPath().string()).second) {
        folded.push_back(*it);
      }
      continue;
    }

    // Keep the first level + 1 components below the current directory
    fs::path ancestor = m_currentDirectory;
    unsigned int taken = 0;
    for (const auto &part : fs::path(relative)) {
      if (taken++ > level) {
        break;
      }
      ancestor /= part;
    }

    if (seen.insert(ancestor.string()).second) {
      folded.emplace_back(ancestor.parent_path(), ancestor.filename().string(),
                          false);
    }
  }

  m_currentChildren = std::move(folded);
  m_expandLevel = level;
  update();
}

fs::path NavigationEngine::submit(std::size_t index) const {
  requireSelectedIndex(index);
  return m_selected[index].canonicalPath();
}

void NavigationEngine::refresh() {
  DirectorySnapshot snapshot = m_scanner.scanDirectory(m_currentDirectory, true);
  std::vector<Entry> children = snapshot.entries;
  m_cache.put(m_currentDirectory, std::move(snapshot));

  m_currentChildren = std::move(children);
  m_expandLevel = 0;
  update();

  spdlog::info("Refreshed {}", m_currentDirectory.string());
}

void NavigationEngine::dropInvalidFolder(std::size_t index) {
  if (!m_state.isHistorySearch()) {
    throw BrowserError(ErrorKind::State,
                       "stale folders can only be dropped from history view");
  }
  requireSelectedIndex(index);

  const fs::path key = m_selected[index].fullPath().lexically_normal();
  if (!m_cache.invalidate(key)) {
    throw BrowserError(ErrorKind::Cache,
                       "history row is not backed by a cached folder: " +
                           key.string());
  }

  if (key == m_currentDirectory) {
    const std::string filter = m_filter;
    enterNearestAncestor(key);
    update(filter);
    return;
  }
  m_selected.erase(m_selected.begin() + static_cast<std::ptrdiff_t>(index));
}

void NavigationEngine::enterNearestAncestor(const fs::path &directory) {
  fs::path ancestor = directory.parent_path();
  std::error_code ec;
  while (!fs::is_directory(ancestor, ec) && ancestor != ancestor.root_path()) {
    ancestor = ancestor.parent_path();
  }

  spdlog::warn("Current folder {} is gone, moving to {}", directory.string(),
               ancestor.string());
  enter(ancestor);
}

std::string NavigationEngine::displayText(const Entry &entry) const {
  if (m_state.isHistorySearch()) {
    return entry.fullPath().lexically_normal().string();
  }
  return entry.relativeTo(m_currentDirectory);
}

const DirectorySnapshot &NavigationEngine::currentSnapshot() const {
  const DirectorySnapshot *snapshot = m_cache.peek(m_currentDirectory);
  if (snapshot == nullptr) {
    throw BrowserError(ErrorKind::Cache, "current folder is not cached: " +
                                             m_currentDirectory.string());
  }
  return *snapshot;
}
