/**
 * @file filepreview.hpp
 * @brief Read-only text view of a file opened from the listing
 */

#ifndef FILEPREVIEW_HPP
#define FILEPREVIEW_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @class FilePreview
 * @brief Lines of a file plus the extents the file view scrolls over
 *
 * Binary files (a NUL byte within the first BINARY_PROBE_BYTES) are not
 * split into lines; the preview holds a single line saying so.
 */
class FilePreview {
private:
  std::filesystem::path m_path;
  std::vector<std::string> m_lines;
  std::uintmax_t m_fileSize = 0;
  std::size_t m_maxLineWidth = 0;
  bool m_binary = false;

  FilePreview() = default;

public:
  /** @brief Default size limit for previews (10 MiB) */
  static constexpr std::uintmax_t DEFAULT_MAX_BYTES = 10ull * 1024 * 1024;

  /** @brief Number of leading bytes inspected for NUL bytes */
  static constexpr std::size_t BINARY_PROBE_BYTES = 8192;

  /**
   * @brief Loads a file for viewing
   *
   * @param path File to open
   * @param maxBytes Files larger than this are refused without being read
   *
   * @return FilePreview holding the file's lines
   *
   * @throws BrowserError (Path) if @p path is not a regular file or is larger
   *         than @p maxBytes
   * @throws BrowserError (Io) if the file cannot be opened or read
   */
  static FilePreview load(const std::filesystem::path &path,
                          std::uintmax_t maxBytes = DEFAULT_MAX_BYTES);

  const std::filesystem::path &path() const { return m_path; }
  const std::vector<std::string> &lines() const { return m_lines; }

  /** @brief Number of rows, a trailing newline does not add one */
  std::size_t rowCount() const { return m_lines.size(); }

  /** @brief Longest line in bytes, trailing '\r' excluded */
  std::size_t maxLineWidth() const { return m_maxLineWidth; }

  std::uintmax_t fileSize() const { return m_fileSize; }
  bool isBinary() const { return m_binary; }
};

#endif // FILEPREVIEW_HPP
