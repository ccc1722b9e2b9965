#ifndef __BURROW_PLATFORM__
#define __BURROW_PLATFORM__

#include "Headers.hpp"

namespace burrow {
/**
 * @brief Per-OS capabilities, chosen once at startup.
 */
class Platform {
 public:
  virtual ~Platform() {}

  /** @brief Absolute path (or name) of the shell new sessions run. */
  virtual string defaultShell() = 0;

  /** @brief Mounted volumes the explorer can offer as roots. */
  virtual vector<VolumeInfo> listVolumes() = 0;
};

/**
 * @brief Linux/BSD/macOS implementation.
 *
 * The shell comes from the configured override, then $SHELL, then the
 * password database, then /bin/sh.
 */
class PosixPlatform : public Platform {
 public:
  explicit PosixPlatform(const string& _shellOverride = "")
      : shellOverride(_shellOverride) {}
  virtual ~PosixPlatform() {}

  virtual string defaultShell();
  virtual vector<VolumeInfo> listVolumes();

  /** @brief Mount table consulted by listVolumes(). */
  void setMountTable(const string& path) { mountTable = path; }

 protected:
  string shellOverride;
  string mountTable = "/proc/self/mounts";
};
}  // namespace burrow

#endif  // __BURROW_PLATFORM__
