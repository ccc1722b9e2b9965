#ifndef __BURROW_EVENT_CHANNEL__
#define __BURROW_EVENT_CHANNEL__

#include "EventSink.hpp"

namespace burrow {
/**
 * @brief Queue between I/O threads and the transport.
 *
 * Pumps and searches push events from their own threads; a single dispatcher
 * thread pops them in FIFO order and hands them to `deliver`.  Producers never
 * touch the transport, and never block on it.
 */
class EventChannel : public EventSink {
 public:
  typedef std::function<bool(const Event&)> DeliveryFunction;

  explicit EventChannel(DeliveryFunction _deliver);
  virtual ~EventChannel();

  /** @brief Enqueues an event, returns false once the channel is shut down. */
  virtual bool send(const Event& event);

  /**
   * @brief Stops accepting events, delivers everything already queued and
   * joins the dispatcher.  Safe to call more than once.
   */
  void shutdown();

  /** @brief Number of events waiting for the dispatcher. */
  size_t pending();

  /** @brief Events the delivery function rejected or threw on. */
  int64_t getDroppedCount() const { return droppedCount; }

 protected:
  void dispatchLoop();

  DeliveryFunction deliver;
  std::mutex queueMutex;
  std::condition_variable queueCondition;
  deque<Event> queue;
  bool running;
  std::atomic<int64_t> droppedCount;
  std::unique_ptr<std::thread> dispatchThread;
};
}  // namespace burrow

#endif  // __BURROW_EVENT_CHANNEL__
