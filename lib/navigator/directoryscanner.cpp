/**
 * @file directoryscanner.cpp
 * @brief Implementation of DirectoryScanner
 */

#include "directoryscanner.hpp"
#include "browsererror.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

/**
 * @brief Reads one directory level into a snapshot
 *
 * The reader is queried first; only when the whole listing succeeded are
 * entries built. An entry that fails to build is logged and skipped, it
 * does not fail the listing.
 *
 * Result order:
 * 1. ".." if requested and the directory has a parent
 * 2. All other entries, by name (byte-wise), files and folders mixed
 */
DirectorySnapshot
DirectoryScanner::scanDirectory(const std::filesystem::path &directory,
                                bool addParentShortcut) const {
  std::vector<std::filesystem::path> children =
      m_reader.listDirectory(directory);

  DirectorySnapshot snapshot;
  snapshot.entries.reserve(children.size() + 1);

  if (addParentShortcut && directory != directory.root_path()) {
    snapshot.entries.push_back(Entry::parentShortcut(directory));
  }

  for (const auto &child : children) {
    try {
      snapshot.entries.push_back(Entry::fromPath(child));
    } catch (const BrowserError &e) {
      spdlog::debug("Skipping {}: {}", child.string(), e.what());
    }
  }

  sortEntries(snapshot.entries);
  snapshot.loadedAt = std::chrono::system_clock::now();

  spdlog::debug("Loaded {} ({} entries)", directory.string(),
                snapshot.entries.size());
  return snapshot;
}

void DirectoryScanner::sortEntries(std::vector<Entry> &entries) {
  auto first = entries.begin();
  if (first != entries.end() && first->isParentShortcut()) {
    ++first;
  }

  std::sort(first, entries.end(), [](const Entry &a, const Entry &b) {
    return a.getName() < b.getName();
  });
}
