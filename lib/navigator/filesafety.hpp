#ifndef FILESAFETY_HPP
#define FILESAFETY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Guards the delete action against removing things that hold the
 *        system (or the user's whole home) together
 */
class FileSafety {
public:
  enum class DeletionStatus {
    Allowed,
    BlockedSystemPath,
    BlockedHome,
    BlockedMountPoint,
    BlockedVirtualFS,
    WarningRemovableMedia
  };

  struct MountInfo {
    std::string m_device;
    std::filesystem::path m_mountpoint;
    std::string m_fstype;
    bool m_isRemovable;
  };

  /**
   * @brief Check if deletion is allowed for a path
   * @param path Path of the entry about to be deleted
   * @return DeletionStatus indicating if/why deletion is blocked
   */
  static DeletionStatus checkDeletion(const std::filesystem::path &path);

  /**
   * @brief True for Allowed and WarningRemovableMedia
   */
  static bool mayDelete(DeletionStatus status);

  /**
   * @brief Get human-readable message for deletion status
   */
  static std::string getStatusMessage(DeletionStatus status,
                                      const std::filesystem::path &path);

  static bool isSystemPath(const std::filesystem::path &path);

  static bool isUserHome(const std::filesystem::path &path);

  static bool isMountPoint(const std::filesystem::path &path);

  /**
   * @brief Check if path is on a virtual/protected filesystem
   */
  static bool isProtectedFilesystem(const std::filesystem::path &path);

  /**
   * @brief Check if path is on removable media (USB, etc.)
   */
  static bool isRemovableMedia(const std::filesystem::path &path);

  /**
   * @brief Get all mount points from /proc/mounts
   */
  static std::vector<MountInfo> getMountPoints();

  /**
   * @brief Decodes the octal escapes (\040 for space, ...) of /proc/mounts
   */
  static std::string unescapeMountField(const std::string &field);

  /**
   * @brief Mount holding @p path, the one with the longest mount point
   *        that contains it
   */
  static std::optional<MountInfo>
  findOwningMount(const std::filesystem::path &path);

private:
  static const std::unordered_set<std::string> CRITICAL_PATHS;

  /** @brief Absolute, symlink-resolved form used by every check */
  static std::filesystem::path normalize(const std::filesystem::path &path);
};

#endif // FILESAFETY_HPP
