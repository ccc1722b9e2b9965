#include "RawFdUtils.hpp"

#include "Errors.hpp"

namespace burrow {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw IoError("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The other side is slow, back off and retry
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw IoError(string("Cannot write: ") + strerror(localErrno));
    }
    if (rc == 0) {
      throw IoError("Cannot write: descriptor closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

bool RawFdUtils::waitOnData(int fd, int timeoutMs) {
  fd_set rfd;
  timeval tv;

  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw IoError(string("select failed: ") + strerror(GetErrno()));
  }
  return FD_ISSET(fd, &rfd);
}

void RawFdUtils::setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}
}  // namespace burrow
