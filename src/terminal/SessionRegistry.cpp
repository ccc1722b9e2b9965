#include "SessionRegistry.hpp"

namespace burrow {
SessionRegistry::SessionRegistry(shared_ptr<Platform> _platform,
                                 shared_ptr<EventSink> _sink,
                                 int _readBufferSize)
    : platform(_platform), sink(_sink), readBufferSize(_readBufferSize) {}

SessionRegistry::~SessionRegistry() { shutdown(); }

string SessionRegistry::create(const string& cwd, int rows, int cols) {
  lock_guard<std::mutex> guard(registryMutex);
  collectRetiredPumps();

  // Unique among live sessions; v4 ids are 122 random bits
  string id;
  do {
    id = sole::uuid4().str();
  } while (sessions.find(id) != sessions.end());

  string shell = platform->defaultShell();
  LOG(INFO) << "Creating session " << id << " running " << shell << " in "
            << (cwd.empty() ? string("<home>") : cwd) << " (" << rows << "x"
            << cols << ")";
  auto entry = shared_ptr<Entry>(new Entry());
  entry->session = PtySession::spawn(id, shell, cwd, rows, cols);
  entry->pump = shared_ptr<OutputPump>(
      new OutputPump(entry->session, sink, readBufferSize));
  sessions.insert(make_pair(id, entry));
  entry->pump->start();
  return id;
}

void SessionRegistry::write(const string& id, const string& data) {
  lock_guard<std::mutex> guard(registryMutex);
  VLOG(2) << "Writing " << data.length() << " bytes to " << id;
  getEntry(id)->session->write(data);
}

void SessionRegistry::resize(const string& id, int rows, int cols) {
  lock_guard<std::mutex> guard(registryMutex);
  VLOG(1) << "Resizing " << id << " to " << rows << "x" << cols;
  getEntry(id)->session->resize(rows, cols);
}

void SessionRegistry::destroy(const string& id) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    VLOG(1) << "Ignoring destroy of unknown session " << id;
    return;
  }
  LOG(INFO) << "Destroying session " << id;
  auto pump = it->second->pump;
  sessions.erase(it);
  pump->cancel();
  retiredPumps.push_back(pump);
  collectRetiredPumps();
}

vector<SessionInfo> SessionRegistry::listSessions() {
  lock_guard<std::mutex> guard(registryMutex);
  vector<SessionInfo> retval;
  for (auto& it : sessions) {
    SessionInfo info;
    info.id = it.first;
    info.rows = it.second->session->getRows();
    info.cols = it.second->session->getCols();
    info.pid = it.second->session->getPid();
    info.state = it.second->pump->getState();
    retval.push_back(info);
  }
  return retval;
}

bool SessionRegistry::contains(const string& id) {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.find(id) != sessions.end();
}

void SessionRegistry::shutdown() {
  vector<shared_ptr<OutputPump>> pumps;
  {
    lock_guard<std::mutex> guard(registryMutex);
    for (auto& it : sessions) {
      pumps.push_back(it.second->pump);
    }
    sessions.clear();
    pumps.insert(pumps.end(), retiredPumps.begin(), retiredPumps.end());
    retiredPumps.clear();
  }
  if (!pumps.empty()) {
    LOG(INFO) << "Stopping " << pumps.size() << " output pumps";
  }
  for (auto& pump : pumps) {
    pump->cancel();
  }
  // Joining outside the lock: a pump may take a hangup grace period to stop
  for (auto& pump : pumps) {
    pump->join();
  }
}

void SessionRegistry::collectRetiredPumps() {
  auto it = retiredPumps.begin();
  while (it != retiredPumps.end()) {
    if ((*it)->isFinished()) {
      (*it)->join();
      it = retiredPumps.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace burrow
