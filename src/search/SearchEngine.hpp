#ifndef __BURROW_SEARCH_ENGINE__
#define __BURROW_SEARCH_ENGINE__

#include "EventSink.hpp"

namespace burrow {
struct SearchOptions {
  /** @brief Matches buffered before a batch is sent. */
  int maxResultsPerBatch = DEFAULT_MAX_RESULTS_PER_BATCH;
  /** @brief Results sent per search; matches past this are only counted. */
  int maxTotalResults = DEFAULT_MAX_TOTAL_RESULTS;
  /** @brief Scan the root's direct children before recursing. */
  bool shallowFirst = true;
  bool followSymlinks = true;
};

struct SearchRequest {
  uint32_t searchId = 0;
  string rootPath;
  string query;
};

struct SearchSummary {
  uint64_t totalMatches = 0;
  uint64_t resultsSent = 0;
  bool hasMore = false;
  bool cancelled = false;
};

/**
 * @brief Case-insensitive file name search over a directory tree.
 *
 * One call to `run` produces `SearchStarted`, then up to `maxTotalResults`
 * `SearchResult`s in traversal order, then exactly one `SearchFinished`.
 * Entries that cannot be read are skipped without failing the search.
 */
class SearchEngine {
 public:
  explicit SearchEngine(const SearchOptions& _options = SearchOptions())
      : options(_options) {}

  /**
   * @brief Runs one search to completion on the calling thread.
   * @param token Checked between entries; may be null.
   */
  SearchSummary run(const SearchRequest& request, shared_ptr<EventSink> sink,
                    shared_ptr<CancellationToken> token);

  const SearchOptions& getOptions() const { return options; }

 protected:
  class Traversal;

  SearchOptions options;
};
}  // namespace burrow

#endif  // __BURROW_SEARCH_ENGINE__
