#include "EventChannel.hpp"

#include "TestHeaders.hpp"

using namespace burrow;

namespace {
Event makeOutput(const string& sessionId, const string& data) {
  Event event;
  event.mutable_pty_output()->set_session_id(sessionId);
  event.mutable_pty_output()->set_data(data);
  return event;
}
}  // namespace

TEST_CASE("EventChannel delivers in send order", "[EventChannel]") {
  std::mutex deliveredMutex;
  vector<string> delivered;
  EventChannel channel([&](const Event& event) {
    lock_guard<std::mutex> guard(deliveredMutex);
    delivered.push_back(event.pty_output().data());
    return true;
  });

  for (int a = 0; a < 1000; a++) {
    REQUIRE(channel.send(makeOutput("s", std::to_string(a))));
  }
  channel.shutdown();

  REQUIRE(delivered.size() == 1000);
  for (int a = 0; a < 1000; a++) {
    REQUIRE(delivered[a] == std::to_string(a));
  }
  REQUIRE(channel.pending() == 0);
}

TEST_CASE("EventChannel keeps per-producer order across threads",
          "[EventChannel]") {
  std::mutex deliveredMutex;
  map<string, vector<int>> delivered;
  EventChannel channel([&](const Event& event) {
    lock_guard<std::mutex> guard(deliveredMutex);
    delivered[event.pty_output().session_id()].push_back(
        std::stoi(event.pty_output().data()));
    return true;
  });

  vector<std::thread> producers;
  for (int p = 0; p < 4; p++) {
    producers.emplace_back([&channel, p]() {
      for (int a = 0; a < 500; a++) {
        channel.send(makeOutput("producer" + std::to_string(p),
                                std::to_string(a)));
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  channel.shutdown();

  REQUIRE(delivered.size() == 4);
  for (auto& it : delivered) {
    REQUIRE(it.second.size() == 500);
    for (int a = 0; a < 500; a++) {
      REQUIRE(it.second[a] == a);
    }
  }
}

TEST_CASE("EventChannel rejects events after shutdown", "[EventChannel]") {
  int deliveredCount = 0;
  EventChannel channel([&](const Event& event) {
    deliveredCount++;
    return true;
  });
  REQUIRE(channel.send(makeOutput("s", "before")));
  channel.shutdown();
  REQUIRE(deliveredCount == 1);

  REQUIRE_FALSE(channel.send(makeOutput("s", "after")));
  // Shutting down twice is fine
  channel.shutdown();
  REQUIRE(deliveredCount == 1);
}

TEST_CASE("EventChannel survives a failing consumer", "[EventChannel]") {
  int attempts = 0;
  EventChannel channel([&](const Event& event) -> bool {
    attempts++;
    if (event.pty_output().data() == "throw") {
      throw std::runtime_error("transport closed");
    }
    return event.pty_output().data() != "reject";
  });
  channel.send(makeOutput("s", "ok"));
  channel.send(makeOutput("s", "reject"));
  channel.send(makeOutput("s", "throw"));
  channel.send(makeOutput("s", "ok again"));
  channel.shutdown();

  REQUIRE(attempts == 4);
  REQUIRE(channel.getDroppedCount() == 2);
}
