#include "SearchManager.hpp"

#include "FakeEventSink.hpp"
#include "TestHeaders.hpp"

using namespace burrow;

namespace {
/** Holds the first search result until the test opens the gate. */
class GatedEventSink : public FakeEventSink {
 public:
  GatedEventSink() : open(false), blocked(false) {}

  virtual bool send(const Event& event) {
    if (event.has_search_result()) {
      unique_lock<std::mutex> lock(gateMutex);
      blocked = true;
      gateCondition.notify_all();
      gateCondition.wait(lock, [this] { return open; });
    }
    return FakeEventSink::send(event);
  }

  void waitUntilBlocked() {
    unique_lock<std::mutex> lock(gateMutex);
    gateCondition.wait(lock, [this] { return blocked; });
  }

  void openGate() {
    lock_guard<std::mutex> guard(gateMutex);
    open = true;
    gateCondition.notify_all();
  }

 protected:
  std::mutex gateMutex;
  std::condition_variable gateCondition;
  bool open;
  bool blocked;
};

SearchRequest makeRequest(uint32_t searchId, const fs::path& root,
                          const string& query) {
  SearchRequest request;
  request.searchId = searchId;
  request.rootPath = root.string();
  request.query = query;
  return request;
}

const SearchFinished* findFinished(const vector<Event>& events,
                                   uint32_t searchId) {
  for (const auto& event : events) {
    if (event.has_search_finished() &&
        event.search_finished().search_id() == searchId) {
      return &event.search_finished();
    }
  }
  return NULL;
}
}  // namespace

TEST_CASE("Concurrent searches keep their results apart", "[SearchManager]") {
  string directory = makeTempDirectory("burrow_manager");
  fs::path root = fs::canonical(directory) / "tree";
  for (int a = 0; a < 30; a++) {
    writeFile(root / ("alpha_" + std::to_string(a) + ".txt"));
  }
  for (int a = 0; a < 12; a++) {
    writeFile(root / "nested" / ("beta_" + std::to_string(a) + ".txt"));
  }

  auto sink = shared_ptr<FakeEventSink>(new FakeEventSink());
  SearchManager manager(SearchOptions(), sink, 4);
  manager.start(makeRequest(1, root, "alpha"));
  manager.start(makeRequest(2, root, "beta"));
  manager.waitForIdle();
  REQUIRE(manager.numRunning() == 0);

  auto events = sink->getEvents();
  map<uint32_t, int> resultCounts;
  for (const auto& event : events) {
    if (event.has_search_result()) {
      const auto& result = event.search_result();
      if (result.search_id() == 1) {
        REQUIRE(result.name().find("alpha") == 0);
      } else {
        REQUIRE(result.search_id() == 2);
        REQUIRE(result.name().find("beta") == 0);
      }
      resultCounts[result.search_id()]++;
    }
  }
  REQUIRE(resultCounts[1] == 30);
  REQUIRE(resultCounts[2] == 12);

  REQUIRE(findFinished(events, 1) != NULL);
  REQUIRE(findFinished(events, 1)->total_matches() == 30);
  REQUIRE(findFinished(events, 2) != NULL);
  REQUIRE(findFinished(events, 2)->total_matches() == 12);

  manager.shutdown();
  fs::remove_all(directory);
}

TEST_CASE("Search ids are unique while running", "[SearchManager]") {
  string directory = makeTempDirectory("burrow_manager");
  fs::path root = fs::canonical(directory) / "tree";
  for (int a = 0; a < 50; a++) {
    writeFile(root / ("gamma_" + std::to_string(a)));
  }

  auto sink = shared_ptr<GatedEventSink>(new GatedEventSink());
  SearchManager manager(SearchOptions(), sink, 2);
  manager.start(makeRequest(5, root, "gamma"));
  sink->waitUntilBlocked();
  REQUIRE(manager.isRunning(5));

  REQUIRE_THROWS_AS(manager.start(makeRequest(5, root, "gamma")),
                    DuplicateSearchError);

  SECTION("Cancel stops the search") {
    manager.cancel(5);
    sink->openGate();
    manager.waitForIdle();

    auto events = sink->getEvents();
    const SearchFinished* finished = findFinished(events, 5);
    REQUIRE(finished != NULL);
    REQUIRE(finished->cancelled());
    REQUIRE(finished->total_matches() < 50);
    REQUIRE(events.back().has_search_finished());
  }

  SECTION("Finished ids can be reused") {
    sink->openGate();
    manager.waitForIdle();
    REQUIRE_FALSE(manager.isRunning(5));
    REQUIRE(findFinished(sink->getEvents(), 5)->total_matches() == 50);

    manager.start(makeRequest(5, root, "gamma_1"));
    manager.waitForIdle();
    int finishedCount = 0;
    for (const auto& event : sink->getEvents()) {
      if (event.has_search_finished()) {
        finishedCount++;
      }
    }
    REQUIRE(finishedCount == 2);
  }

  manager.shutdown();
  fs::remove_all(directory);
}

TEST_CASE("Cancelling an unknown search is ignored", "[SearchManager]") {
  auto sink = shared_ptr<FakeEventSink>(new FakeEventSink());
  SearchManager manager(SearchOptions(), sink, 1);
  manager.cancel(42);
  REQUIRE(manager.numRunning() == 0);
  REQUIRE(sink->getEvents().empty());
}

TEST_CASE("Searches are refused after shutdown", "[SearchManager]") {
  auto sink = shared_ptr<FakeEventSink>(new FakeEventSink());
  SearchManager manager(SearchOptions(), sink, 1);
  manager.shutdown();
  REQUIRE_THROWS_AS(manager.start(makeRequest(1, "/", "x")), CommandError);
  // Shutting down twice is fine
  manager.shutdown();
}
