#ifndef __BURROW_SEARCH_MANAGER__
#define __BURROW_SEARCH_MANAGER__

#include "Errors.hpp"
#include "SearchEngine.hpp"

namespace burrow {
/**
 * @brief Runs searches on a worker pool, one cancellation token per search.
 *
 * Search ids come from the caller.  An id may not be reused while the search
 * that owns it is still queued or running.
 */
class SearchManager {
 public:
  SearchManager(const SearchOptions& options, shared_ptr<EventSink> _sink,
                int numThreads);
  ~SearchManager();

  /**
   * @brief Queues a search and returns immediately.
   * Throws `DuplicateSearchError` if the id is in use.
   */
  void start(const SearchRequest& request);

  /** @brief Cancels a queued or running search.  Unknown ids are ignored. */
  void cancel(uint32_t searchId);

  bool isRunning(uint32_t searchId);

  int numRunning();

  /** @brief Blocks until no search is queued or running. */
  void waitForIdle();

  /** @brief Cancels everything and joins the workers. */
  void shutdown();

 protected:
  void runSearch(const SearchRequest& request,
                 shared_ptr<CancellationToken> token);

  SearchEngine engine;
  shared_ptr<EventSink> sink;

  std::mutex searchMutex;
  std::condition_variable idleCondition;
  map<uint32_t, shared_ptr<CancellationToken>> running;
  bool accepting;
  std::unique_ptr<ThreadPool> pool;
};
}  // namespace burrow

#endif  // __BURROW_SEARCH_MANAGER__
