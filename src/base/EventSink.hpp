#ifndef __BURROW_EVENT_SINK__
#define __BURROW_EVENT_SINK__

#include "Headers.hpp"

namespace burrow {
/**
 * @brief One-way channel from the core to whoever consumes events.
 *
 * Events from one producer are delivered in the order they were sent.  A
 * failed send is not an error for the producer: the consumer may simply have
 * gone away.
 */
class EventSink {
 public:
  virtual ~EventSink() {}

  /**
   * @brief Hands an event to the consumer.
   * @return false if the event was dropped.
   */
  virtual bool send(const Event& event) = 0;
};

/** @brief Shared flag used to stop a pump or a traversal early. */
class CancellationToken {
 public:
  CancellationToken() : cancelled(false) {}

  void cancel() { cancelled = true; }
  bool isCancelled() const { return cancelled; }

 protected:
  std::atomic<bool> cancelled;
};
}  // namespace burrow

#endif  // __BURROW_EVENT_SINK__
