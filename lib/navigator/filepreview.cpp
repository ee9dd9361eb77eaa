/**
 * @file filepreview.cpp
 * @brief Implementation of FilePreview
 */

#include "filepreview.hpp"
#include "browsererror.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace fs = std::filesystem;

FilePreview FilePreview::load(const fs::path &path, std::uintmax_t maxBytes) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw BrowserError(ErrorKind::Path,
                       path.string() + " is not a regular file");
  }

  const std::uintmax_t size = fs::file_size(path, ec);
  if (ec) {
    throw BrowserError(ErrorKind::Io, "unable to stat " + path.string() +
                                          ": " + ec.message());
  }
  if (size > maxBytes) {
    throw BrowserError(ErrorKind::Path,
                       path.string() + " is too large to preview (" +
                           formatBytes(static_cast<long long>(size)) +
                           ", limit " +
                           formatBytes(static_cast<long long>(maxBytes)) + ")");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw BrowserError(ErrorKind::Io, "unable to open " + path.string());
  }

  FilePreview preview;
  preview.m_path = path;
  preview.m_fileSize = size;

  // Zero bytes in the head mark the file as binary
  char probe[BINARY_PROBE_BYTES];
  file.read(probe, sizeof(probe));
  const auto probed = static_cast<std::size_t>(file.gcount());
  if (std::find(probe, probe + probed, '\0') != probe + probed) {
    preview.m_binary = true;
    preview.m_lines.push_back("<binary file, " +
                              formatBytes(static_cast<long long>(size)) +
                              ", not shown>");
    preview.m_maxLineWidth = preview.m_lines.front().size();
    spdlog::debug("Preview of binary file {}", path.string());
    return preview;
  }

  file.clear();
  file.seekg(0);

  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    preview.m_maxLineWidth = std::max(preview.m_maxLineWidth, line.size());
    preview.m_lines.push_back(std::move(line));
  }

  if (file.bad()) {
    throw BrowserError(ErrorKind::Io, "failed while reading " + path.string());
  }

  spdlog::debug("Preview of {}: {} rows", path.string(), preview.rowCount());
  return preview;
}
