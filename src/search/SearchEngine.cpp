#include "SearchEngine.hpp"

#include "PathUtils.hpp"
#include "TextDecoder.hpp"

namespace burrow {
/**
 * @brief State of a single search: counters, the pending batch, and the set
 * of directories already entered.
 */
class SearchEngine::Traversal {
 public:
  Traversal(const SearchOptions& _options, const SearchRequest& _request,
            shared_ptr<EventSink> _sink, shared_ptr<CancellationToken> _token)
      : options(_options),
        request(_request),
        lowerQuery(toLowerUtf8(_request.query)),
        sink(_sink),
        token(_token) {}

  SearchSummary run() {
    sendStarted();

    fs::path root(request.rootPath);
    if (!root.has_filename() && root.has_relative_path()) {
      // "/a/b/" -> "/a/b"
      root = root.parent_path();
    }

    struct stat rootStat;
    if (::stat(root.c_str(), &rootStat) == 0) {
      visited.insert(make_pair(rootStat.st_dev, rootStat.st_ino));
      consider(root, rootStat);
      if (S_ISDIR(rootStat.st_mode)) {
        if (options.shallowFirst) {
          walk(root, true);
        }
        walk(root, false);
      }
    } else {
      LOG(INFO) << "Search " << request.searchId << ": cannot read root "
                << request.rootPath << ": " << strerror(GetErrno());
    }

    flushBatch();
    summary.hasMore = summary.totalMatches > summary.resultsSent;
    sendFinished();
    return summary;
  }

 protected:
  struct Frame {
    fs::directory_iterator it;
    int depth;
  };

  bool isCancelled() {
    if (!summary.cancelled && token && token->isCancelled()) {
      LOG(INFO) << "Search " << request.searchId << " cancelled";
      summary.cancelled = true;
    }
    return summary.cancelled;
  }

  /**
   * Pre-order depth first walk below `root`.  With `shallowOnly` only the
   * direct children are examined; otherwise direct children are skipped when
   * the shallow pass already reported them.
   */
  void walk(const fs::path& root, bool shallowOnly) {
    vector<Frame> stack;
    pushDirectory(root, 1, &stack);
    while (!stack.empty()) {
      if (isCancelled()) {
        return;
      }
      Frame& top = stack.back();
      if (top.it == fs::directory_iterator()) {
        stack.pop_back();
        continue;
      }
      fs::path path = top.it->path();
      int depth = top.depth;
      std::error_code ec;
      top.it.increment(ec);
      if (ec) {
        VLOG(2) << "Stopped reading " << path.parent_path() << ": "
                << ec.message();
        top.it = fs::directory_iterator();
      }

      struct stat entryStat;
      if (!statEntry(path, &entryStat)) {
        continue;
      }
      bool alreadyReported = !shallowOnly && options.shallowFirst && depth == 1;
      if (shallowOnly || !alreadyReported) {
        consider(path, entryStat);
      }
      if (shallowOnly || !S_ISDIR(entryStat.st_mode)) {
        continue;
      }
      if (!visited.insert(make_pair(entryStat.st_dev, entryStat.st_ino))
               .second) {
        VLOG(2) << "Not re-entering " << path;
        continue;
      }
      pushDirectory(path, depth + 1, &stack);
    }
  }

  void pushDirectory(const fs::path& dir, int depth, vector<Frame>* stack) {
    std::error_code ec;
    fs::directory_iterator it(
        dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      VLOG(2) << "Skipping " << dir << ": " << ec.message();
      return;
    }
    Frame frame;
    frame.it = std::move(it);
    frame.depth = depth;
    stack->push_back(std::move(frame));
  }

  /** Stats the entry, following the link unless symlinks are not followed. */
  bool statEntry(const fs::path& path, struct stat* entryStat) {
    int rc = options.followSymlinks ? ::stat(path.c_str(), entryStat)
                                    : ::lstat(path.c_str(), entryStat);
    if (rc != 0) {
      VLOG(2) << "Skipping " << path << ": " << strerror(GetErrno());
      return false;
    }
    return true;
  }

  void consider(const fs::path& path, const struct stat& entryStat) {
    string name = path.filename().string();
    if (toLowerUtf8(name).find(lowerQuery) == string::npos) {
      return;
    }
    summary.totalMatches++;
    if (summary.resultsSent + batch.size() >= uint64_t(options.maxTotalResults)) {
      return;
    }

    Event event;
    SearchResult* result = event.mutable_search_result();
    result->set_search_id(request.searchId);
    result->set_path(displayPath(path));
    result->set_name(toValidUtf8(name));
    result->set_is_file(S_ISREG(entryStat.st_mode));
    result->set_size(uint64_t(entryStat.st_size));
    result->set_modified(entryStat.st_mtime > 0 ? uint64_t(entryStat.st_mtime)
                                                : 0);
    batch.push_back(event);
    if (int(batch.size()) >= options.maxResultsPerBatch) {
      flushBatch();
    }
  }

  void flushBatch() {
    for (auto& event : batch) {
      if (summary.resultsSent >= uint64_t(options.maxTotalResults)) {
        break;
      }
      send(event);
      summary.resultsSent++;
    }
    batch.clear();
  }

  void sendStarted() {
    Event event;
    SearchStarted* started = event.mutable_search_started();
    started->set_query(request.query);
    started->set_search_id(request.searchId);
    send(event);
  }

  void sendFinished() {
    Event event;
    SearchFinished* finished = event.mutable_search_finished();
    finished->set_search_id(request.searchId);
    finished->set_total_matches(summary.totalMatches);
    finished->set_has_more(summary.hasMore);
    finished->set_cancelled(summary.cancelled);
    send(event);
  }

  void send(const Event& event) {
    if (!sink->send(event)) {
      VLOG(1) << "Search " << request.searchId << ": event dropped";
    }
  }

  const SearchOptions& options;
  const SearchRequest& request;
  string lowerQuery;
  shared_ptr<EventSink> sink;
  shared_ptr<CancellationToken> token;

  SearchSummary summary;
  vector<Event> batch;
  set<pair<dev_t, ino_t>> visited;
};

SearchSummary SearchEngine::run(const SearchRequest& request,
                                shared_ptr<EventSink> sink,
                                shared_ptr<CancellationToken> token) {
  LOG(INFO) << "Search " << request.searchId << " for \"" << request.query
            << "\" under " << request.rootPath;
  Traversal traversal(options, request, sink, token);
  SearchSummary summary = traversal.run();
  LOG(INFO) << "Search " << request.searchId << " done: "
            << summary.totalMatches << " matches, " << summary.resultsSent
            << " sent" << (summary.cancelled ? " (cancelled)" : "");
  return summary;
}
}  // namespace burrow
