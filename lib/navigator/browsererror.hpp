/**
 * @file browsererror.hpp
 * @brief Error type shared by the navigation library
 *
 * Every failure inside the library is reported as a BrowserError. The
 * ErrorKind tells the caller which recovery policy applies:
 * - Io: filesystem read/metadata failure
 * - Path: missing name/parent, failed canonicalization, stale entry,
 *   bad relative-path prefix, file too large
 * - Parse: highlight index conversion, unreadable file content
 * - Cache: an expected cache key is missing (broken invariant)
 * - State: operation invoked in an incompatible navigation state
 */

#ifndef BROWSERERROR_HPP
#define BROWSERERROR_HPP

#include <stdexcept>
#include <string>

enum class ErrorKind { Io, Path, Parse, Cache, State };

/**
 * @brief Returns the printable name of an error kind (e.g. "Path")
 */
inline const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "IO";
  case ErrorKind::Path:
    return "Path";
  case ErrorKind::Parse:
    return "Parse";
  case ErrorKind::Cache:
    return "Cache";
  case ErrorKind::State:
    return "State";
  }
  return "Unknown";
}

/**
 * @class BrowserError
 * @brief Exception carrying an ErrorKind
 *
 * what() is prefixed with the kind, so frontends can show it in the status
 * line as is: "Path error: unable to resolve /tmp/x".
 */
class BrowserError : public std::runtime_error {
private:
  ErrorKind m_kind;

public:
  BrowserError(ErrorKind kind, const std::string &message)
      : std::runtime_error(std::string(errorKindName(kind)) + " error: " +
                           message),
        m_kind(kind) {}

  ErrorKind kind() const { return m_kind; }
};

#endif // BROWSERERROR_HPP
