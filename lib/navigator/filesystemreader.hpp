#ifndef FILESYSTEMREADER_HPP
#define FILESYSTEMREADER_HPP

#include "browsererror.hpp"
#include "idirectoryreader.hpp"

#include <system_error>

/**
 * @brief IDirectoryReader backed by std::filesystem::directory_iterator
 *
 * Opening the directory is all-or-nothing: a failure to open or to advance
 * the iterator is reported as a single IO error and no partial listing is
 * returned.
 *
 * @note Inherits from IDirectoryReader interface
 */
class FilesystemReader : public IDirectoryReader {
public:
  std::vector<std::filesystem::path>
  listDirectory(const std::filesystem::path &directory) const override {
    std::vector<std::filesystem::path> children;
    std::error_code ec;

    std::filesystem::directory_iterator it(directory, ec);
    const std::filesystem::directory_iterator end;

    while (!ec && it != end) {
      children.push_back(it->path());
      it.increment(ec);
    }

    if (ec) {
      throw BrowserError(ErrorKind::Io, "unable to read directory " +
                                            directory.string() + ": " +
                                            ec.message());
    }

    return children;
  }
};

#endif // FILESYSTEMREADER_HPP
