#ifndef __BURROW_SESSION_REGISTRY__
#define __BURROW_SESSION_REGISTRY__

#include "Errors.hpp"
#include "EventSink.hpp"
#include "OutputPump.hpp"
#include "Platform.hpp"
#include "PtySession.hpp"

namespace burrow {
/** @brief Snapshot of one live session, for listSessions. */
struct SessionInfo {
  string id;
  int rows;
  int cols;
  pid_t pid;
  OutputPump::State state;
};

/**
 * @brief Owns every live pty session, keyed by an opaque id.
 *
 * All operations take the same lock for their whole duration; they only do
 * a map lookup plus one syscall, so holds are short.  Each session gets its
 * own `OutputPump` that streams output to the sink.
 */
class SessionRegistry {
 public:
  SessionRegistry(shared_ptr<Platform> _platform, shared_ptr<EventSink> _sink,
                  int _readBufferSize = DEFAULT_PTY_READ_BUFFER_SIZE);
  ~SessionRegistry();

  /**
   * @brief Spawns the default shell in `cwd` with the given size and starts
   * relaying its output.
   * @return the new session id.  Throws `SpawnFailureError`.
   */
  string create(const string& cwd, int rows, int cols);

  /** @brief Sends raw input.  Throws `SessionNotFoundError` or `IoError`. */
  void write(const string& id, const string& data);

  /** @brief Resizes the pty.  Throws `SessionNotFoundError` or `IoError`. */
  void resize(const string& id, int rows, int cols);

  /**
   * @brief Forgets the session and stops its pump, which hangs up the shell
   * and reports an exit.  Unknown ids are ignored.
   */
  void destroy(const string& id);

  vector<SessionInfo> listSessions();

  bool contains(const string& id);

  inline int numSessions() {
    lock_guard<std::mutex> guard(registryMutex);
    return int(sessions.size());
  }

  /** @brief Destroys every session and waits for all pumps to finish. */
  void shutdown();

 protected:
  struct Entry {
    shared_ptr<PtySession> session;
    shared_ptr<OutputPump> pump;
  };

  /** @brief Looks up a live session.  Caller holds registryMutex. */
  inline shared_ptr<Entry> getEntry(const string& id) {
    auto it = sessions.find(id);
    if (it == sessions.end()) {
      throw SessionNotFoundError(id);
    }
    return it->second;
  }

  /** @brief Drops retired pumps that are done.  Caller holds registryMutex. */
  void collectRetiredPumps();

  shared_ptr<Platform> platform;
  shared_ptr<EventSink> sink;
  int readBufferSize;

  std::mutex registryMutex;
  map<string, shared_ptr<Entry>> sessions;
  /** @brief Pumps of destroyed sessions that may still be winding down. */
  vector<shared_ptr<OutputPump>> retiredPumps;
};
}  // namespace burrow

#endif  // __BURROW_SESSION_REGISTRY__
