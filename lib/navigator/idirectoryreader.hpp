#ifndef IDIRECTORYREADER_HPP
#define IDIRECTORYREADER_HPP

#include <filesystem>
#include <vector>

/**
 * @brief Directory-read primitive used by DirectoryScanner
 *
 * Returns the paths of the direct children of a directory, in any order.
 * Implementations throw BrowserError when the directory as a whole cannot be
 * read (permission denied, not found).
 */
class IDirectoryReader {
public:
    virtual std::vector<std::filesystem::path>
    listDirectory(const std::filesystem::path &directory) const = 0;
    virtual ~IDirectoryReader() = default;
};

#endif // IDIRECTORYREADER_HPP
