#include "Platform.hpp"

#ifdef __linux__
#include <mntent.h>
#endif

namespace burrow {
namespace {
const set<string> PSEUDO_FILESYSTEMS = {
    "autofs",     "binfmt_misc", "bpf",        "cgroup",   "cgroup2",
    "configfs",   "debugfs",     "devpts",     "devtmpfs", "efivarfs",
    "fusectl",    "hugetlbfs",   "mqueue",     "nsfs",     "proc",
    "pstore",     "ramfs",       "rpc_pipefs", "securityfs", "selinuxfs",
    "squashfs",   "sysfs",       "tmpfs",      "tracefs",
};

const set<string> NETWORK_FILESYSTEMS = {
    "nfs", "nfs4", "cifs", "smbfs", "smb3", "afs", "9p", "fuse.sshfs",
};

bool isRemovableDevice(const string& device) {
  if (device.rfind("/dev/", 0) != 0) {
    return false;
  }
  std::error_code ec;
  fs::path blockDir = fs::path("/sys/class/block") / fs::path(device).filename();
  fs::path flag = blockDir / "removable";
  if (!fs::exists(flag, ec)) {
    // Partitions keep the flag on their parent disk
    fs::path resolved = fs::canonical(blockDir, ec);
    if (ec) {
      return false;
    }
    flag = resolved.parent_path() / "removable";
  }
  ifstream in(flag);
  int removable = 0;
  if (in >> removable) {
    return removable == 1;
  }
  return false;
}
}  // namespace

string PosixPlatform::defaultShell() {
  if (!shellOverride.empty()) {
    return shellOverride;
  }
  const char* shellEnv = ::getenv("SHELL");
  if (shellEnv != NULL && shellEnv[0] != '\0') {
    return string(shellEnv);
  }
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_shell != NULL && pwd->pw_shell[0] != '\0') {
    return string(pwd->pw_shell);
  }
  return "/bin/sh";
}

vector<VolumeInfo> PosixPlatform::listVolumes() {
  vector<VolumeInfo> volumes;
#ifdef __linux__
  FILE* mounts = setmntent(mountTable.c_str(), "r");
  if (mounts == NULL) {
    LOG(WARNING) << "Cannot open mount table " << mountTable << ": "
                 << strerror(GetErrno());
    return volumes;
  }
  mntent entry;
  char buf[4096];
  set<string> seen;
  while (getmntent_r(mounts, &entry, buf, sizeof(buf)) != NULL) {
    string fileSystem(entry.mnt_type);
    string mountPoint(entry.mnt_dir);
    if (PSEUDO_FILESYSTEMS.count(fileSystem) || seen.count(mountPoint)) {
      continue;
    }
    struct statvfs stats;
    if (::statvfs(entry.mnt_dir, &stats) != 0) {
      VLOG(1) << "Skipping unreadable mount " << mountPoint;
      continue;
    }
    if (stats.f_blocks == 0) {
      continue;
    }
    seen.insert(mountPoint);

    VolumeInfo volume;
    string device(entry.mnt_fsname);
    volume.set_name(device);
    volume.set_path(mountPoint);
    volume.set_file_system(fileSystem);
    volume.set_total_space(uint64_t(stats.f_blocks) * stats.f_frsize);
    volume.set_available_space(uint64_t(stats.f_bavail) * stats.f_frsize);
    bool removable = isRemovableDevice(device);
    volume.set_is_removable(removable);
    if (removable) {
      volume.set_drive_type(DRIVE_REMOVABLE);
    } else if (NETWORK_FILESYSTEMS.count(fileSystem)) {
      volume.set_drive_type(DRIVE_NETWORK);
    } else if (fileSystem == "iso9660" || fileSystem == "udf") {
      volume.set_drive_type(DRIVE_CDROM);
    } else if (device.rfind("/dev/", 0) == 0) {
      volume.set_drive_type(DRIVE_FIXED);
    } else {
      volume.set_drive_type(DRIVE_UNKNOWN);
    }
    volumes.push_back(volume);
  }
  endmntent(mounts);
#else
  LOG(INFO) << "Volume listing is not supported on this platform";
#endif
  return volumes;
}
}  // namespace burrow
