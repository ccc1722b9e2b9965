#include "CommandDispatcher.hpp"

#include "FakeEventSink.hpp"
#include "TestHeaders.hpp"

using namespace burrow;

namespace {
struct DispatcherFixture {
  DispatcherFixture() {
    sink.reset(new FakeEventSink());
    platform.reset(new PosixPlatform("/bin/sh"));
    registry.reset(new SessionRegistry(platform, sink));
    searches.reset(new SearchManager(SearchOptions(), sink, 2));
    dispatcher.reset(new CommandDispatcher(registry, searches, platform));
  }

  ~DispatcherFixture() {
    registry->shutdown();
    searches->shutdown();
  }

  json call(const string& command, const json& args = json::object(),
            int id = 1) {
    json request;
    request["id"] = id;
    request["command"] = command;
    request["args"] = args;
    json response = dispatcher->handle(request);
    REQUIRE(response["type"] == "response");
    REQUIRE(response["id"] == id);
    return response;
  }

  static string errorKind(const json& response) {
    REQUIRE(response["ok"] == false);
    return response["error"]["kind"].get<string>();
  }

  shared_ptr<FakeEventSink> sink;
  shared_ptr<Platform> platform;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<SearchManager> searches;
  std::unique_ptr<CommandDispatcher> dispatcher;
};
}  // namespace

TEST_CASE("Malformed requests are rejected", "[CommandDispatcher]") {
  DispatcherFixture fixture;

  SECTION("Not JSON") {
    json response = fixture.dispatcher->handleLine("{not json");
    REQUIRE(response["ok"] == false);
    REQUIRE(response["id"].is_null());
    REQUIRE(response["error"]["kind"] == "BadCommand");
  }

  SECTION("Not an object") {
    json response = fixture.dispatcher->handleLine("[1,2,3]");
    REQUIRE(response["error"]["kind"] == "BadCommand");
  }

  SECTION("Missing command") {
    json response = fixture.dispatcher->handleLine("{\"id\":9}");
    REQUIRE(response["id"] == 9);
    REQUIRE(response["error"]["kind"] == "BadCommand");
  }

  SECTION("Unknown command") {
    REQUIRE(DispatcherFixture::errorKind(fixture.call("formatDisk")) ==
            "BadCommand");
  }

  SECTION("Missing arguments") {
    REQUIRE(DispatcherFixture::errorKind(fixture.call("writeSession")) ==
            "BadCommand");
    REQUIRE(DispatcherFixture::errorKind(
                fixture.call("searchFiles", {{"path", "/"}})) ==
            "BadCommand");
  }

  SECTION("Bad dimensions") {
    REQUIRE(DispatcherFixture::errorKind(fixture.call(
                "createSession", {{"rows", 0}, {"cols", 80}})) ==
            "BadCommand");
    REQUIRE(DispatcherFixture::errorKind(fixture.call(
                "createSession", {{"rows", 24}, {"cols", 70000}})) ==
            "BadCommand");
    REQUIRE(DispatcherFixture::errorKind(fixture.call(
                "createSession", {{"rows", "24"}, {"cols", 80}})) ==
            "BadCommand");
    REQUIRE(fixture.registry->numSessions() == 0);
  }

  SECTION("Search id out of range") {
    REQUIRE(DispatcherFixture::errorKind(fixture.call(
                "cancelSearch", {{"searchId", -1}})) == "BadCommand");
  }
}

TEST_CASE("Unknown sessions", "[CommandDispatcher]") {
  DispatcherFixture fixture;
  REQUIRE(DispatcherFixture::errorKind(fixture.call(
              "writeSession", {{"sessionId", "nope"}, {"data", "ls\n"}})) ==
          "SessionNotFound");
  REQUIRE(DispatcherFixture::errorKind(fixture.call(
              "resizeSession",
              {{"sessionId", "nope"}, {"rows", 24}, {"cols", 80}})) ==
          "SessionNotFound");

  json response = fixture.call("destroySession", {{"sessionId", "nope"}});
  REQUIRE(response["ok"] == true);
  REQUIRE(fixture.sink->getEvents().empty());
}

TEST_CASE("Session lifecycle through commands", "[CommandDispatcher]") {
  DispatcherFixture fixture;
  json created =
      fixture.call("createSession", {{"cwd", "/"}, {"rows", 24}, {"cols", 80}});
  REQUIRE(created["ok"] == true);
  string sessionId = created["result"]["sessionId"].get<string>();
  REQUIRE_FALSE(sessionId.empty());

  json listed = fixture.call("listSessions");
  REQUIRE(listed["result"].size() == 1);
  REQUIRE(listed["result"][0]["sessionId"] == sessionId);
  REQUIRE(listed["result"][0]["rows"] == 24);
  REQUIRE(listed["result"][0]["cols"] == 80);

  REQUIRE(fixture.call("resizeSession", {{"sessionId", sessionId},
                                         {"rows", 40},
                                         {"cols", 120}})["ok"] == true);
  REQUIRE(fixture.call("listSessions")["result"][0]["rows"] == 40);

  REQUIRE(fixture.call("writeSession", {{"sessionId", sessionId},
                                        {"data", "echo dispatch-$((6*7))\n"}})
              ["ok"] == true);
  REQUIRE(fixture.sink->waitForOutput(sessionId, "dispatch-42"));

  REQUIRE(fixture.call("destroySession", {{"sessionId", sessionId}})["ok"] ==
          true);
  REQUIRE(fixture.sink->waitForExit(sessionId));
  REQUIRE(fixture.call("listSessions")["result"].empty());
  REQUIRE(DispatcherFixture::errorKind(fixture.call(
              "writeSession", {{"sessionId", sessionId}, {"data", "x"}})) ==
          "SessionNotFound");
}

TEST_CASE("Bad working directory fails the spawn", "[CommandDispatcher]") {
  DispatcherFixture fixture;
  REQUIRE(DispatcherFixture::errorKind(fixture.call(
              "createSession", {{"cwd", "/nonexistent/burrow/dir"},
                                {"rows", 24},
                                {"cols", 80}})) == "SpawnFailure");
  REQUIRE(fixture.registry->numSessions() == 0);
}

TEST_CASE("Search commands", "[CommandDispatcher]") {
  DispatcherFixture fixture;
  string directory = makeTempDirectory("burrow_dispatch");
  fs::path root = fs::canonical(directory) / "tree";
  writeFile(root / "findme.txt");

  json response = fixture.call(
      "searchFiles",
      {{"path", root.string()}, {"query", "FINDME"}, {"searchId", 11}});
  REQUIRE(response["ok"] == true);
  fixture.searches->waitForIdle();

  bool sawResult = false;
  for (const auto& event : fixture.sink->getEvents()) {
    if (event.has_search_result()) {
      REQUIRE(event.search_result().name() == "findme.txt");
      sawResult = true;
    }
  }
  REQUIRE(sawResult);

  REQUIRE(fixture.call("cancelSearch", {{"searchId", 11}})["ok"] == true);
  fs::remove_all(directory);
}

TEST_CASE("Drives and shutdown", "[CommandDispatcher]") {
  DispatcherFixture fixture;
  json drives = fixture.call("listDrives");
  REQUIRE(drives["ok"] == true);
  REQUIRE(drives["result"].is_array());

  REQUIRE_FALSE(fixture.dispatcher->isShutdownRequested());
  REQUIRE(fixture.call("shutdown")["ok"] == true);
  REQUIRE(fixture.dispatcher->isShutdownRequested());
}
