#include "EventJson.hpp"

#include "TestHeaders.hpp"

using namespace burrow;

TEST_CASE("Search events use camelCase fields", "[EventJson]") {
  Event started;
  started.mutable_search_started()->set_query("read");
  started.mutable_search_started()->set_search_id(4);
  json j = eventToJson(started);
  REQUIRE(j["type"] == "event");
  REQUIRE(j["event"] == "Started");
  REQUIRE(j["data"]["query"] == "read");
  REQUIRE(j["data"]["searchId"] == 4);

  Event result;
  SearchResult* r = result.mutable_search_result();
  r->set_search_id(4);
  r->set_path("/home/user/readme.txt");
  r->set_name("readme.txt");
  r->set_is_file(true);
  r->set_size(1234);
  r->set_modified(1700000000);
  j = eventToJson(result);
  REQUIRE(j["event"] == "Result");
  REQUIRE(j["data"]["path"] == "/home/user/readme.txt");
  REQUIRE(j["data"]["name"] == "readme.txt");
  REQUIRE(j["data"]["isFile"] == true);
  REQUIRE(j["data"]["size"] == 1234);
  REQUIRE(j["data"]["modified"] == 1700000000);

  Event finished;
  SearchFinished* f = finished.mutable_search_finished();
  f->set_search_id(4);
  f->set_total_matches(150);
  f->set_has_more(true);
  j = eventToJson(finished);
  REQUIRE(j["event"] == "Finished");
  REQUIRE(j["data"]["totalMatches"] == 150);
  REQUIRE(j["data"]["hasMore"] == true);
  REQUIRE(j["data"]["cancelled"] == false);
}

TEST_CASE("Session events", "[EventJson]") {
  Event output;
  output.mutable_pty_output()->set_session_id("abc");
  output.mutable_pty_output()->set_data("hi\r\n");
  json j = eventToJson(output);
  REQUIRE(j["event"] == "Output");
  REQUIRE(j["data"]["sessionId"] == "abc");
  REQUIRE(j["data"]["data"] == "hi\r\n");

  Event exitEvent;
  exitEvent.mutable_pty_exit()->set_session_id("abc");
  exitEvent.mutable_pty_exit()->set_reason(EXIT_DESTROYED);
  j = eventToJson(exitEvent);
  REQUIRE(j["event"] == "Exit");
  REQUIRE(j["data"]["reason"] == "destroyed");
  REQUIRE(j["data"]["exitCode"] == -1);

  REQUIRE(exitReasonName(EXIT_EOF) == "eof");
  REQUIRE(exitReasonName(EXIT_ERROR) == "error");
}

TEST_CASE("Volumes", "[EventJson]") {
  VolumeInfo volume;
  volume.set_name("/dev/sda1");
  volume.set_path("/");
  volume.set_drive_type(DRIVE_FIXED);
  volume.set_total_space(1000);
  volume.set_available_space(250);
  volume.set_file_system("ext4");
  json j = volumeToJson(volume);
  REQUIRE(j["name"] == "/dev/sda1");
  REQUIRE(j["path"] == "/");
  REQUIRE(j["driveType"] == "Fixed");
  REQUIRE(j["totalSpace"] == 1000);
  REQUIRE(j["availableSpace"] == 250);
  REQUIRE(j["isRemovable"] == false);
  REQUIRE(j["fileSystem"] == "ext4");

  REQUIRE(driveTypeName(DRIVE_REMOVABLE) == "Removable");
  REQUIRE(driveTypeName(DRIVE_NETWORK) == "Network");
  REQUIRE(driveTypeName(DRIVE_CDROM) == "CdRom");
  REQUIRE(driveTypeName(DRIVE_UNKNOWN) == "Unknown");
}
