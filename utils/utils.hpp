/**
 * @file utils.hpp
 * @brief Utility functions shared by the navigator library and its frontends
 *
 * Key utilities:
 * - safeAt: Bounds-checked vector element access
 * - formatBytes: Human-readable file size formatting
 * - formatTimestamp: Local wall-clock time of a directory load
 *
 * @see safeAt()
 * @see formatBytes()
 * @see formatTimestamp()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <cstddef> // size_t
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * Returns nullptr if the index is out of bounds, which is the common case in
 * UI code where the highlight index may be absent (empty listing).
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access, or std::nullopt
 *
 * @return const T* Pointer to the element, or nullptr
 *
 * Example usage:
 * @code
 * const Entry *entry = safeAt(engine.selected(), session.highlightIndex());
 * if (entry) {
 *     status = entry->fullPath().string();
 * }
 * @endcode
 */
template <typename T>
const T *safeAt(const std::vector<T> &vec, std::optional<std::size_t> index) {
  if (!index || *index >= vec.size())
    return nullptr;
  return &vec[*index];
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Binary units (1024 bytes = 1 KB), one decimal place, up to TB.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(10485760) → "10.0 MB"
 */
inline std::string formatBytes(long long bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Formats a point in time as local "YYYY-MM-DD HH:MM:SS"
 *
 * Used for the "loaded at" part of the directory title.
 */
inline std::string formatTimestamp(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&seconds, &local);

  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local) == 0)
    return "?";
  return std::string(buf);
}

#endif // UTILS_HPP
