#include "OutputPump.hpp"

#include "Errors.hpp"
#include "TextDecoder.hpp"

namespace burrow {
namespace {
// Upper bound on how long a cancel can go unnoticed
const int POLL_INTERVAL_MS = 50;
// A shell whose pty hit EOF gets this long to be reaped before we kill it
const int EXIT_GRACE_MS = 1000;
}  // namespace

OutputPump::OutputPump(shared_ptr<PtySession> _session,
                       shared_ptr<EventSink> _sink, int _readBufferSize)
    : session(_session),
      sink(_sink),
      readBufferSize(_readBufferSize),
      token(new CancellationToken()),
      state(CREATED) {}

OutputPump::~OutputPump() {
  cancel();
  join();
}

void OutputPump::start() {
  if (pumpThread) {
    STFATAL << "Output pump for " << session->getId() << " started twice";
  }
  pumpThread.reset(new std::thread(&OutputPump::run, this));
}

void OutputPump::cancel() { token->cancel(); }

void OutputPump::join() {
  if (pumpThread && pumpThread->joinable()) {
    pumpThread->join();
  }
}

void OutputPump::run() {
  el::Helpers::setThreadName("pty-pump");
  vector<char> buf(readBufferSize);
  TextDecoder decoder;
  PtyExitReason reason = EXIT_EOF;

  try {
    while (true) {
      if (token->isCancelled()) {
        reason = EXIT_DESTROYED;
        break;
      }
      ssize_t rc = session->read(&buf[0], buf.size(), POLL_INTERVAL_MS);
      if (rc < 0) {
        LOG(INFO) << "Terminal session " << session->getId() << " ended";
        break;
      }
      if (rc == 0) {
        continue;
      }
      if (state == CREATED) {
        state = RUNNING;
      }
      string text = decoder.decode(string(&buf[0], rc));
      if (!text.empty()) {
        sendOutput(text);
      }
    }
  } catch (const IoError& ioe) {
    LOG(INFO) << "Terminal session " << session->getId()
              << " failed: " << ioe.what();
    reason = EXIT_ERROR;
  }

  string tail = decoder.flush();
  if (!tail.empty()) {
    sendOutput(tail);
  }

  if (reason == EXIT_EOF) {
    session->waitForExit(EXIT_GRACE_MS);
  } else {
    session->terminate();
  }
  state = EXITED;
  sendExit(reason, session->getExitCode());
}

void OutputPump::sendOutput(const string& text) {
  Event event;
  PtyOutput* output = event.mutable_pty_output();
  output->set_session_id(session->getId());
  output->set_data(text);
  if (!sink->send(event)) {
    VLOG(1) << "Dropped output for session " << session->getId();
  }
}

void OutputPump::sendExit(PtyExitReason reason, int exitCode) {
  Event event;
  PtyExit* ptyExit = event.mutable_pty_exit();
  ptyExit->set_session_id(session->getId());
  ptyExit->set_reason(reason);
  ptyExit->set_exit_code(exitCode);
  if (!sink->send(event)) {
    VLOG(1) << "Dropped exit for session " << session->getId();
  }
}
}  // namespace burrow
