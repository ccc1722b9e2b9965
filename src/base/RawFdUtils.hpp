#ifndef __BURROW_RAW_FD_UTILS__
#define __BURROW_RAW_FD_UTILS__

#include "Headers.hpp"

namespace burrow {
/**
 * @brief Blocking helpers around POSIX read/write on pty and pipe fds.
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the descriptor, retrying on
   * EAGAIN/EINTR.  Throws `IoError` on any other failure.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for the descriptor to become readable.
   * @return true if data (or EOF) is ready.
   */
  static bool waitOnData(int fd, int timeoutMs);

  /** @brief Sets FD_CLOEXEC so the descriptor does not leak into children. */
  static void setCloseOnExec(int fd);
};
}  // namespace burrow
#endif  // __BURROW_RAW_FD_UTILS__
