#include "PtySession.hpp"

#include "Errors.hpp"
#include "RawFdUtils.hpp"

extern char** environ;

namespace burrow {
namespace {
// How long a hung-up shell gets before SIGKILL
const int HANGUP_GRACE_MS = 500;
const int REAP_POLL_MS = 10;

// Called in the forked child, so only async-signal-safe calls
void reportChildFailure(int statusFd, int err) {
  ssize_t rc = ::write(statusFd, &err, sizeof(err));
  (void)rc;
  _exit(127);
}

/** Copies the daemon's environment with the session variables set. */
vector<string> buildShellEnvironment(const string& id) {
  map<string, string> overrides = {
      {"TERM", "xterm-256color"},
      {"BURROW_SESSION_ID", id},
      {"BURROW_VERSION", BURROW_VERSION},
  };
  vector<string> retval;
  for (char** entry = environ; entry != NULL && *entry != NULL; entry++) {
    string variable(*entry);
    string name = variable.substr(0, variable.find('='));
    if (overrides.find(name) == overrides.end()) {
      retval.push_back(variable);
    }
  }
  for (const auto& it : overrides) {
    retval.push_back(it.first + "=" + it.second);
  }
  return retval;
}
}  // namespace

PtySession::PtySession(const string& _id, int _masterFd, pid_t _childPid,
                       int _rows, int _cols)
    : id(_id),
      masterFd(_masterFd),
      childPid(_childPid),
      rows(_rows),
      cols(_cols),
      reaped(false),
      exitCode(-1) {}

PtySession::~PtySession() {
  terminate();
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

shared_ptr<PtySession> PtySession::spawn(const string& id, const string& shell,
                                         const string& cwd, int rows,
                                         int cols) {
  // The child reports chdir/exec failures through this pipe.  A successful
  // exec closes the write end (O_CLOEXEC) and the parent reads EOF.
  int statusPipe[2];
  if (::pipe(statusPipe) == -1) {
    throw SpawnFailureError(string("Cannot create status pipe: ") +
                            strerror(GetErrno()));
  }
  RawFdUtils::setCloseOnExec(statusPipe[0]);
  RawFdUtils::setCloseOnExec(statusPipe[1]);

  string loginName = "-" + fs::path(shell).filename().string();
  string homeDir;
  if (cwd.empty()) {
    passwd* pwd = getpwuid(getuid());
    homeDir = (pwd != NULL && pwd->pw_dir != NULL) ? pwd->pw_dir : "/";
  }
  const string& workingDir = cwd.empty() ? homeDir : cwd;

  // The child may not allocate, so its environment is built here
  vector<string> shellEnvironment = buildShellEnvironment(id);
  vector<char*> envp;
  for (auto& variable : shellEnvironment) {
    envp.push_back(&variable[0]);
  }
  envp.push_back(NULL);

  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &tmpwin);
  switch (pid) {
    case -1: {
      int err = GetErrno();
      ::close(statusPipe[0]);
      ::close(statusPipe[1]);
      throw SpawnFailureError(string("Cannot open pty: ") + strerror(err));
    }
    case 0: {
      ::close(statusPipe[0]);
      if (::chdir(workingDir.c_str()) == -1) {
        reportChildFailure(statusPipe[1], errno);
      }
      // burrowd ignores SIGPIPE and ignored dispositions survive exec
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      execle(shell.c_str(), loginName.c_str(), (char*)NULL, envp.data());
      reportChildFailure(statusPipe[1], errno);
      break;
    }
    default:
      break;
  }

  // parent
  ::close(statusPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(statusPipe[0]);

  if (rc > 0) {
    int status;
    waitpid(pid, &status, 0);
    ::close(masterFd);
    throw SpawnFailureError("Cannot start " + shell + " in " + workingDir +
                            ": " + strerror(childErrno));
  }

  RawFdUtils::setCloseOnExec(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for session " << id << " pid "
          << pid;
  return shared_ptr<PtySession>(
      new PtySession(id, masterFd, pid, rows, cols));
}

void PtySession::write(const string& data) {
  RawFdUtils::writeAll(masterFd, data.data(), data.length());
}

void PtySession::resize(int newRows, int newCols) {
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_row = newRows;
  tmpwin.ws_col = newCols;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw IoError(string("Cannot resize pty: ") + strerror(GetErrno()));
  }
  rows = newRows;
  cols = newCols;
}

ssize_t PtySession::read(char* buf, size_t count, int timeoutMs) {
  if (!RawFdUtils::waitOnData(masterFd, timeoutMs)) {
    return 0;
  }
  ssize_t rc = ::read(masterFd, buf, count);
  if (rc > 0) {
    return rc;
  }
  if (rc == 0) {
    return -1;
  }
  int localErrno = GetErrno();
  if (localErrno == EINTR || localErrno == EAGAIN) {
    return 0;
  }
  if (localErrno == EIO) {
    // Linux reports EIO on the master once every slave fd is closed
    return -1;
  }
  throw IoError(string("Cannot read from pty: ") + strerror(localErrno));
}

void PtySession::waitForExit(int graceMs) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(graceMs);
  while (!tryReap()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      terminate();
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(REAP_POLL_MS));
  }
}

void PtySession::terminate() {
  if (tryReap()) {
    return;
  }
  VLOG(1) << "Hanging up session " << id << " pid " << childPid;
  ::kill(childPid, SIGHUP);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(HANGUP_GRACE_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    if (tryReap()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(REAP_POLL_MS));
  }

  LOG(INFO) << "Session " << id << " ignored SIGHUP, killing " << childPid;
  ::kill(childPid, SIGKILL);
  lock_guard<std::mutex> guard(childMutex);
  if (reaped) {
    return;
  }
  int status;
  pid_t rc;
  do {
    rc = waitpid(childPid, &status, 0);
  } while (rc == -1 && GetErrno() == EINTR);
  if (rc == childPid) {
    recordStatus(status);
  }
  reaped = true;
}

int PtySession::getExitCode() {
  lock_guard<std::mutex> guard(childMutex);
  return exitCode;
}

bool PtySession::tryReap() {
  lock_guard<std::mutex> guard(childMutex);
  if (reaped) {
    return true;
  }
  int status;
  pid_t rc = waitpid(childPid, &status, WNOHANG);
  if (rc == childPid) {
    recordStatus(status);
    reaped = true;
  } else if (rc == -1 && GetErrno() == ECHILD) {
    // Somebody else collected it
    reaped = true;
  }
  return reaped;
}

void PtySession::recordStatus(int status) {
  if (WIFEXITED(status)) {
    exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exitCode = 128 + WTERMSIG(status);
  }
  VLOG(1) << "Session " << id << " exited with " << exitCode;
}
}  // namespace burrow
