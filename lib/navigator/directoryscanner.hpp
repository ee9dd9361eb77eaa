/**
 * @file directoryscanner.hpp
 * @brief Builds sorted directory snapshots from a directory reader
 *
 * This header defines the DirectoryScanner class which turns the raw listing
 * of an IDirectoryReader into a DirectorySnapshot of Entry values.
 */

#ifndef DIRECTORYSCANNER_HPP
#define DIRECTORYSCANNER_HPP

#include <filesystem>

#include "entry.hpp"
#include "idirectoryreader.hpp"

/**
 * @class DirectoryScanner
 * @brief Lists one directory level into a DirectorySnapshot
 *
 * DirectoryScanner asks the injected IDirectoryReader for the children of a
 * directory and builds an Entry for each of them. Key features:
 * - Entries that cannot be built (broken symlinks, entries removed while
 *   listing) are skipped, so a listing yields as many rows as possible
 * - Sorted output by name, with the ".." shortcut first when requested
 * - Snapshots are stamped with the time they were read
 *
 * @see IDirectoryReader
 * @see DirectorySnapshot
 */
class DirectoryScanner {
private:
  /** @brief Reader used for the actual directory access */
  const IDirectoryReader &m_reader;

public:
  /**
   * @brief Constructs a DirectoryScanner on top of a directory reader
   *
   * @param reader Reference to the reader implementation (e.g.
   *               FilesystemReader)
   *
   * @note The reader reference must remain valid for the lifetime of the
   *       DirectoryScanner object
   */
  explicit DirectoryScanner(const IDirectoryReader &reader)
      : m_reader(reader) {}

  /**
   * @brief Reads one directory level
   *
   * @param directory The directory to list
   * @param addParentShortcut If true and @p directory is not the filesystem
   *                          root, prefix the listing with a ".." row that
   *                          leads to the parent directory
   *
   * @return DirectorySnapshot Sorted entries plus load time
   *
   * @throws BrowserError if the directory as a whole cannot be read; nothing
   *         is returned in that case
   */
  DirectorySnapshot scanDirectory(const std::filesystem::path &directory,
                                  bool addParentShortcut) const;

private:
  /**
   * @brief Sorts entries by name, keeping a leading ".." in place
   */
  static void sortEntries(std::vector<Entry> &entries);
};

#endif // DIRECTORYSCANNER_HPP
