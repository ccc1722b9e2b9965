#include "EventChannel.hpp"

namespace burrow {
EventChannel::EventChannel(DeliveryFunction _deliver)
    : deliver(_deliver), running(true), droppedCount(0) {
  dispatchThread.reset(new std::thread(&EventChannel::dispatchLoop, this));
}

EventChannel::~EventChannel() { shutdown(); }

bool EventChannel::send(const Event& event) {
  {
    lock_guard<std::mutex> guard(queueMutex);
    if (!running) {
      VLOG(2) << "Dropping event, channel is shut down";
      return false;
    }
    queue.push_back(event);
  }
  queueCondition.notify_one();
  return true;
}

void EventChannel::shutdown() {
  {
    lock_guard<std::mutex> guard(queueMutex);
    running = false;
  }
  queueCondition.notify_all();
  if (dispatchThread) {
    dispatchThread->join();
    dispatchThread.reset();
  }
}

size_t EventChannel::pending() {
  lock_guard<std::mutex> guard(queueMutex);
  return queue.size();
}

void EventChannel::dispatchLoop() {
  el::Helpers::setThreadName("event-dispatch");
  while (true) {
    Event event;
    {
      unique_lock<std::mutex> lock(queueMutex);
      queueCondition.wait(lock, [this] { return !running || !queue.empty(); });
      if (queue.empty()) {
        // Not running and fully drained
        break;
      }
      event = std::move(queue.front());
      queue.pop_front();
    }

    try {
      if (!deliver(event)) {
        droppedCount++;
        VLOG(1) << "Consumer rejected event " << event.payload_case();
      }
    } catch (const std::runtime_error& re) {
      droppedCount++;
      LOG(ERROR) << "Error delivering event: " << re.what();
    }
  }
  VLOG(1) << "Event dispatcher exiting";
}
}  // namespace burrow
