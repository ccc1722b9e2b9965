#include "SearchManager.hpp"

namespace burrow {
SearchManager::SearchManager(const SearchOptions& options,
                             shared_ptr<EventSink> _sink, int numThreads)
    : engine(options),
      sink(_sink),
      accepting(true),
      pool(new ThreadPool(numThreads)) {}

SearchManager::~SearchManager() { shutdown(); }

void SearchManager::start(const SearchRequest& request) {
  shared_ptr<CancellationToken> token(new CancellationToken());
  {
    lock_guard<std::mutex> guard(searchMutex);
    if (!accepting) {
      throw CommandError("Search manager is shutting down");
    }
    if (running.find(request.searchId) != running.end()) {
      throw DuplicateSearchError(request.searchId);
    }
    running.insert(make_pair(request.searchId, token));
    pool->enqueue([this, request, token]() { runSearch(request, token); });
  }
  VLOG(1) << "Queued search " << request.searchId;
}

void SearchManager::cancel(uint32_t searchId) {
  lock_guard<std::mutex> guard(searchMutex);
  auto it = running.find(searchId);
  if (it == running.end()) {
    VLOG(1) << "Ignoring cancel of unknown search " << searchId;
    return;
  }
  it->second->cancel();
}

bool SearchManager::isRunning(uint32_t searchId) {
  lock_guard<std::mutex> guard(searchMutex);
  return running.find(searchId) != running.end();
}

int SearchManager::numRunning() {
  lock_guard<std::mutex> guard(searchMutex);
  return int(running.size());
}

void SearchManager::waitForIdle() {
  unique_lock<std::mutex> lock(searchMutex);
  idleCondition.wait(lock, [this] { return running.empty(); });
}

void SearchManager::shutdown() {
  {
    lock_guard<std::mutex> guard(searchMutex);
    if (!accepting) {
      return;
    }
    accepting = false;
    for (auto& it : running) {
      it.second->cancel();
    }
  }
  // The pool destructor drains the queue and joins its workers
  pool.reset();
}

void SearchManager::runSearch(const SearchRequest& request,
                              shared_ptr<CancellationToken> token) {
  el::Helpers::setThreadName("search-worker");
  try {
    engine.run(request, sink, token);
  } catch (const std::exception& ex) {
    // Bad entries are skipped inside the traversal, so this is a bug
    STERROR << "Search " << request.searchId << " failed: " << ex.what();
  }
  {
    lock_guard<std::mutex> guard(searchMutex);
    running.erase(request.searchId);
  }
  idleCondition.notify_all();
}
}  // namespace burrow
