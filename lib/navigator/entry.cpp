/**
 * @file entry.cpp
 * @brief Construction and path helpers of Entry
 */

#include "entry.hpp"
#include "browsererror.hpp"

#include <system_error>

namespace fs = std::filesystem;

Entry::Entry(const fs::path &parent, const std::string &name, bool isFile)
    : m_parent(parent), m_name(name), m_isFile(isFile) {
  if (m_name.empty()) {
    throw BrowserError(ErrorKind::Path,
                       "empty entry name in " + parent.string());
  }
}

Entry Entry::fromPath(const fs::path &path) {
  fs::path normalized = path.lexically_normal();

  // "/a/b/" has an empty file name, "/a/b" does not
  if (!normalized.has_filename()) {
    normalized = normalized.parent_path();
  }

  if (!normalized.has_filename()) {
    throw BrowserError(ErrorKind::Path,
                       "unable to get file name for " + path.string());
  }
  if (!normalized.has_parent_path()) {
    throw BrowserError(ErrorKind::Path,
                       "unable to get parent folder for " + path.string());
  }

  std::error_code ec;
  fs::file_status status = fs::status(normalized, ec);
  if (ec || !fs::exists(status)) {
    throw BrowserError(ErrorKind::Path,
                       "unable to resolve " + normalized.string());
  }

  return Entry(normalized.parent_path(), normalized.filename().string(),
               fs::is_regular_file(status));
}

Entry Entry::forDirectoryKey(const fs::path &directory) {
  if (directory.has_filename()) {
    return Entry(directory.parent_path(), directory.filename().string(),
                 false);
  }
  return Entry(directory, ".", false);
}

Entry Entry::parentShortcut(const fs::path &directory) {
  return Entry(directory, PARENT_SHORTCUT, false);
}

fs::path Entry::canonicalPath() const {
  std::error_code ec;
  fs::path resolved = fs::canonical(fullPath(), ec);
  if (ec) {
    throw BrowserError(ErrorKind::Path, "unable to resolve " +
                                            fullPath().string() + ": " +
                                            ec.message());
  }
  return resolved;
}

std::string Entry::relativeTo(const fs::path &reference) const {
  fs::path relative = m_parent.lexically_relative(reference);

  if (relative.empty() || *relative.begin() == "..") {
    throw BrowserError(ErrorKind::Path, "can not get path prefix from " +
                                            m_parent.string() + " for " +
                                            reference.string());
  }

  if (relative == ".") {
    return m_name;
  }
  return (relative / m_name).generic_string();
}
