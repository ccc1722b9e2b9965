#ifndef __BURROW_OUTPUT_PUMP__
#define __BURROW_OUTPUT_PUMP__

#include "EventSink.hpp"
#include "PtySession.hpp"

namespace burrow {
/**
 * @brief Background reader that relays a session's pty output as events.
 *
 * Sends `PtyOutput` for every chunk read, in read order, and exactly one
 * `PtyExit` when the pty reaches EOF, fails, or the pump is cancelled.  The
 * pump is the only reader of the master fd.
 */
class OutputPump {
 public:
  enum State {
    /** Started, nothing read yet */
    CREATED = 0,
    /** Relaying bytes */
    RUNNING = 1,
    /** Terminal: the exit event has been sent */
    EXITED = 2,
  };

  OutputPump(shared_ptr<PtySession> _session, shared_ptr<EventSink> _sink,
             int _readBufferSize = DEFAULT_PTY_READ_BUFFER_SIZE);
  /** @brief Cancels and joins the reader thread. */
  ~OutputPump();

  /** @brief Starts the reader thread.  Called once. */
  void start();

  /**
   * @brief Asks the reader to stop.  The shell is hung up and the pump
   * reports `EXIT_DESTROYED`, unless it already exited on its own.
   */
  void cancel();

  /** @brief Blocks until the reader thread has finished. */
  void join();

  State getState() const { return state; }
  bool isFinished() const { return state == EXITED; }

 protected:
  void run();
  void sendOutput(const string& text);
  void sendExit(PtyExitReason reason, int exitCode);

  shared_ptr<PtySession> session;
  shared_ptr<EventSink> sink;
  int readBufferSize;
  shared_ptr<CancellationToken> token;
  std::atomic<State> state;
  std::unique_ptr<std::thread> pumpThread;
};
}  // namespace burrow

#endif  // __BURROW_OUTPUT_PUMP__
