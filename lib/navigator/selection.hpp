/**
 * @file selection.hpp
 * @brief Pure helpers deciding which rows are visible and which is highlighted
 *
 * - fuzzyMatch: subsequence filter shared by browse and history views
 * - wrapIndex: maps an unbounded highlight cursor onto a list
 *
 * Neither function touches the filesystem or any cache state.
 */

#ifndef SELECTION_HPP
#define SELECTION_HPP

#include <cctype>
#include <climits>
#include <cstddef>
#include <string>

#include "browsererror.hpp"

/**
 * @brief Case-insensitive subsequence match
 *
 * Walks @p name and advances a cursor into @p filter each time the current
 * filter character equals the current name character (ASCII case folded).
 * The name matches when the cursor reaches the end of the filter, so the
 * filter characters must appear in order but not necessarily contiguously.
 *
 * @param name Text of the row (bare name or relative/absolute path)
 * @param filter User-typed filter; empty matches everything
 *
 * @return true if every filter character was consumed
 *
 * Examples:
 * - fuzzyMatch("abc", "c")    → true
 * - fuzzyMatch("abc", "")     → true
 * - fuzzyMatch("abc", "d")    → false
 * - fuzzyMatch("abc", "abcd") → false
 * - fuzzyMatch("ABC", "bc")   → true
 */
inline bool fuzzyMatch(const std::string &name, const std::string &filter) {
  std::size_t cursor = 0;

  for (char c : name) {
    if (cursor == filter.size()) {
      break;
    }
    if (std::tolower(static_cast<unsigned char>(c)) ==
        std::tolower(static_cast<unsigned char>(filter[cursor]))) {
      ++cursor;
    }
  }

  return cursor == filter.size();
}

/**
 * @brief Euclidean modulo of a highlight cursor by the list length
 *
 * Moving up from 0 (raw -1) lands on the last row, moving past the last row
 * lands on 0.
 *
 * @param rawIndex Unbounded cursor, may be negative
 * @param length Number of rows; callers check for an empty list first
 *
 * @return Index in [0, length)
 *
 * @throws BrowserError (Parse) if @p length is 0 or does not fit an int
 */
inline std::size_t wrapIndex(int rawIndex, std::size_t length) {
  if (length == 0 || length > static_cast<std::size_t>(INT_MAX)) {
    throw BrowserError(ErrorKind::Parse,
                       "cannot wrap highlight index over " +
                           std::to_string(length) + " rows");
  }

  const int divisor = static_cast<int>(length);
  int remainder = rawIndex % divisor;
  if (remainder < 0) {
    remainder += divisor;
  }
  return static_cast<std::size_t>(remainder);
}

#endif // SELECTION_HPP
