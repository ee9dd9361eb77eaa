/**
 * @file filesafety.cpp
 * @brief Safety checks run before the browser deletes a file or folder
 *
 * Deleting from the browser is recursive for folders, so a single keystroke
 * in the wrong place could wipe a system directory, the user's home or a
 * whole mounted volume. These checks veto such targets.
 */

#include "filesafety.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>
#include <sys/vfs.h>

namespace fs = std::filesystem;

/**
 * @brief Top-level system directories that are never deleted
 */
const std::unordered_set<std::string> FileSafety::CRITICAL_PATHS = {
    "/",     "/boot", "/dev", "/etc", "/lib", "/lib64", "/proc", "/root", "/run",
    "/sys",  "/usr",  "/var", "/bin", "/sbin", "/opt",  "/srv",  "/tmp", "/home"};

/**
 * @brief Resolves symlinks and "..", tolerating missing trailing parts
 *
 * A trailing separator is dropped so "/usr/" and "/usr" compare equal.
 */
fs::path FileSafety::normalize(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(fs::absolute(path, ec), ec);
  if (ec) {
    resolved = path.lexically_normal();
  }
  if (!resolved.has_filename() && resolved.has_relative_path()) {
    resolved = resolved.parent_path();
  }
  return resolved;
}

/**
 * @brief Checks whether a path is safe to delete
 *
 * Checks run in order of severity:
 * 1. System paths (blocked)
 * 2. User home directory (blocked)
 * 3. Virtual filesystems like /proc, /sys, tmpfs (blocked)
 * 4. Mount points (blocked)
 * 5. Removable media (warning only)
 *
 * @param path The entry to check
 *
 * @return DeletionStatus indicating whether deletion is allowed, blocked,
 *         or requires a warning
 */
FileSafety::DeletionStatus FileSafety::checkDeletion(const fs::path &path) {
  const fs::path target = normalize(path);

  if (isSystemPath(target)) {
    return DeletionStatus::BlockedSystemPath;
  }
  if (isUserHome(target)) {
    return DeletionStatus::BlockedHome;
  }
  if (isProtectedFilesystem(target)) {
    return DeletionStatus::BlockedVirtualFS;
  }
  if (isMountPoint(target)) {
    return DeletionStatus::BlockedMountPoint;
  }
  if (isRemovableMedia(target)) {
    return DeletionStatus::WarningRemovableMedia;
  }
  return DeletionStatus::Allowed;
}

bool FileSafety::mayDelete(DeletionStatus status) {
  return status == DeletionStatus::Allowed ||
         status == DeletionStatus::WarningRemovableMedia;
}

std::string FileSafety::getStatusMessage(DeletionStatus status,
                                         const fs::path &path) {
  switch (status) {
  case DeletionStatus::Allowed:
    return "Deletion allowed";
  case DeletionStatus::BlockedSystemPath:
    return "Cannot delete system directory: " + path.string();
  case DeletionStatus::BlockedHome:
    return "Cannot delete your home directory: " + path.string();
  case DeletionStatus::BlockedMountPoint:
    return "Cannot delete mount point: " + path.string();
  case DeletionStatus::BlockedVirtualFS:
    return "Cannot delete from virtual/system filesystem: " + path.string();
  case DeletionStatus::WarningRemovableMedia:
    return "This is on removable media: " + path.string();
  }
  return "Unknown status";
}

bool FileSafety::isSystemPath(const fs::path &path) {
  return CRITICAL_PATHS.count(normalize(path).string()) > 0;
}

/**
 * @note Returns false if the HOME environment variable is not set
 */
bool FileSafety::isUserHome(const fs::path &path) {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return false;
  }
  return normalize(path) == normalize(home);
}

bool FileSafety::isMountPoint(const fs::path &path) {
  const fs::path target = normalize(path);
  for (const auto &mount : getMountPoints()) {
    if (mount.m_mountpoint == target) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Checks if a path resides on a protected or virtual filesystem
 *
 * Uses statfs() on the path (or its parent when the path itself is gone)
 * and compares the filesystem magic against procfs, sysfs, tmpfs, ramfs,
 * devpts, securityfs and both cgroup versions.
 *
 * @note Returns true when statfs() fails
 * @note Magic numbers from /usr/include/linux/magic.h
 */
bool FileSafety::isProtectedFilesystem(const fs::path &path) {
  const fs::path target = normalize(path);
  struct statfs fsInfo;

  if (statfs(target.c_str(), &fsInfo) != 0 &&
      statfs(target.parent_path().c_str(), &fsInfo) != 0) {
    return true;
  }

  const long PROTECTED_FS[] = {
      0x9fa0,     // PROC_SUPER_MAGIC
      0x62656572, // SYSFS_MAGIC
      0x01021994, // TMPFS_MAGIC
      0x858458f6, // RAMFS_MAGIC
      0x1cd1,     // DEVPTS_SUPER_MAGIC
      0x73636673, // SECURITYFS_MAGIC
      0x27e0eb,   // CGROUP_SUPER_MAGIC
      0x63677270, // CGROUP2_SUPER_MAGIC
  };

  for (auto magic : PROTECTED_FS) {
    if (static_cast<long>(fsInfo.f_type) == magic) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Checks if a path is on removable media
 *
 * Looks up the mount that holds the path. It is removable if it is mounted
 * under /media, /mnt or /run/media, or if its /dev/sdX device reports
 * removable=1 in sysfs.
 */
bool FileSafety::isRemovableMedia(const fs::path &path) {
  auto mount = findOwningMount(normalize(path));
  if (!mount) {
    return false;
  }
  if (mount->m_isRemovable) {
    return true;
  }

  if (mount->m_device.rfind("/dev/sd", 0) == 0 && mount->m_device.size() >= 8) {
    // e.g. /dev/sda1 -> /sys/block/sda/removable
    const std::string deviceName = mount->m_device.substr(5, 3);
    std::ifstream removableFile("/sys/block/" + deviceName + "/removable");
    int removable = 0;
    if (removableFile >> removable) {
      return removable == 1;
    }
  }
  return false;
}

std::optional<FileSafety::MountInfo>
FileSafety::findOwningMount(const fs::path &path) {
  std::optional<MountInfo> best;
  std::size_t bestDepth = 0;

  for (auto &mount : getMountPoints()) {
    const fs::path relative = path.lexically_relative(mount.m_mountpoint);
    if (relative.empty() || *relative.begin() == "..") {
      continue;
    }

    const auto depth = static_cast<std::size_t>(
        std::distance(mount.m_mountpoint.begin(), mount.m_mountpoint.end()));
    if (!best || depth >= bestDepth) {
      bestDepth = depth;
      best = std::move(mount);
    }
  }
  return best;
}

std::string FileSafety::unescapeMountField(const std::string &field) {
  static const std::pair<const char *, char> ESCAPES[] = {
      {"\\040", ' '}, {"\\011", '\t'}, {"\\012", '\n'}, {"\\134", '\\'}};

  std::string decoded;
  decoded.reserve(field.size());

  std::size_t i = 0;
  while (i < field.size()) {
    bool replaced = false;
    for (const auto &[escape, character] : ESCAPES) {
      if (field.compare(i, 4, escape) == 0) {
        decoded.push_back(character);
        i += 4;
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      decoded.push_back(field[i++]);
    }
  }
  return decoded;
}

/**
 * @brief Parses /proc/mounts
 *
 * @return One MountInfo per line; empty if /proc/mounts cannot be read
 *
 * @note Mount points under /media, /mnt or /run/media are flagged as
 *       removable
 */
std::vector<FileSafety::MountInfo> FileSafety::getMountPoints() {
  std::vector<MountInfo> mounts;
  std::ifstream mountsFile("/proc/mounts");

  if (!mountsFile.is_open()) {
    spdlog::warn("Unable to read /proc/mounts, mount checks are disabled");
    return mounts;
  }

  std::string line;
  while (std::getline(mountsFile, line)) {
    std::istringstream iss(line);
    std::string device, mountpoint, fstype;

    if (!(iss >> device >> mountpoint >> fstype)) {
      continue;
    }

    MountInfo info;
    info.m_device = unescapeMountField(device);
    info.m_mountpoint = unescapeMountField(mountpoint);
    info.m_fstype = fstype;

    const std::string &mp = info.m_mountpoint.native();
    info.m_isRemovable = mp.rfind("/media", 0) == 0 ||
                         mp.rfind("/mnt", 0) == 0 ||
                         mp.rfind("/run/media", 0) == 0;

    mounts.push_back(std::move(info));
  }

  return mounts;
}
