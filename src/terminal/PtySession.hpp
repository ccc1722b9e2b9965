#ifndef __BURROW_PTY_SESSION__
#define __BURROW_PTY_SESSION__

#include "Headers.hpp"

namespace burrow {
/**
 * @brief A shell running on a pseudo-terminal, plus the master fd we use to
 * talk to it.
 *
 * The master fd is used from two threads: the output pump reads it, the
 * registry writes and resizes it.  Those are independent directions, so no
 * lock is needed here; the registry serializes its own callers.
 */
class PtySession {
 public:
  /**
   * @brief Forks `shell` as a login shell on a new pty of the given size,
   * running in `cwd` (the home directory when empty).
   *
   * Throws `SpawnFailureError` if the pty cannot be opened, the directory
   * cannot be entered, or the shell cannot be executed.
   */
  static shared_ptr<PtySession> spawn(const string& id, const string& shell,
                                      const string& cwd, int rows, int cols);

  ~PtySession();

  /** @brief Writes raw bytes to the shell's input.  Throws `IoError`. */
  void write(const string& data);

  /** @brief Applies a new window size (TIOCSWINSZ).  Throws `IoError`. */
  void resize(int rows, int cols);

  /**
   * @brief Waits up to `timeoutMs` and reads whatever output is available.
   * @return bytes read, 0 when nothing arrived in time, -1 on EOF.
   * Throws `IoError` on any other read failure.
   */
  ssize_t read(char* buf, size_t count, int timeoutMs);

  /**
   * @brief Gives the child `graceMs` to exit on its own, then terminates it.
   */
  void waitForExit(int graceMs);

  /** @brief Hangs up the child (SIGHUP, then SIGKILL) and reaps it. */
  void terminate();

  /** @brief Exit code of the reaped child, -1 while unknown. */
  int getExitCode();

  const string& getId() const { return id; }
  pid_t getPid() const { return childPid; }
  int getRows() const { return rows; }
  int getCols() const { return cols; }

 protected:
  PtySession(const string& _id, int _masterFd, pid_t _childPid, int _rows,
             int _cols);

  /** @brief Non-blocking waitpid, returns true once the child is reaped. */
  bool tryReap();
  void recordStatus(int status);

  string id;
  int masterFd;
  pid_t childPid;
  std::atomic<int> rows;
  std::atomic<int> cols;

  std::mutex childMutex;
  bool reaped;
  int exitCode;
};
}  // namespace burrow

#endif  // __BURROW_PTY_SESSION__
