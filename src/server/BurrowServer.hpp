#ifndef __BURROW_SERVER__
#define __BURROW_SERVER__

#include "BurrowConfig.hpp"
#include "CommandDispatcher.hpp"
#include "EventChannel.hpp"
#include "JsonLineWriter.hpp"

namespace burrow {
/**
 * @brief Wires the registry, the search manager and the event channel
 * together and serves the line protocol on a pair of streams.
 */
class BurrowServer {
 public:
  BurrowServer(const BurrowConfig& config, shared_ptr<Platform> _platform,
               std::ostream& out);
  ~BurrowServer();

  /**
   * @brief Handles requests from `in` until EOF or a shutdown command, then
   * shuts everything down.
   */
  void run(std::istream& in);

  /** @brief Stops sessions and searches, then drains pending events. */
  void shutdown();

  shared_ptr<SessionRegistry> getRegistry() { return registry; }
  shared_ptr<SearchManager> getSearches() { return searches; }

 protected:
  shared_ptr<JsonLineWriter> writer;
  shared_ptr<EventChannel> channel;
  shared_ptr<Platform> platform;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<SearchManager> searches;
  std::unique_ptr<CommandDispatcher> dispatcher;
  bool stopped;
};
}  // namespace burrow

#endif  // __BURROW_SERVER__
