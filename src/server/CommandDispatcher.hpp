#ifndef __BURROW_COMMAND_DISPATCHER__
#define __BURROW_COMMAND_DISPATCHER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Platform.hpp"
#include "SearchManager.hpp"
#include "SessionRegistry.hpp"

namespace burrow {
/**
 * @brief Maps protocol requests onto the session registry and the search
 * manager.
 *
 * A request is `{"id":..., "command":..., "args":{...}}`.  Every request gets
 * exactly one response; command failures become `ok:false` responses with an
 * error kind, they are never fatal.
 */
class CommandDispatcher {
 public:
  CommandDispatcher(shared_ptr<SessionRegistry> _registry,
                    shared_ptr<SearchManager> _searches,
                    shared_ptr<Platform> _platform);

  /** @brief Parses and executes one protocol line. */
  json handleLine(const string& line);

  /** @brief Executes an already parsed request. */
  json handle(const json& request);

  /** @brief True once a `shutdown` command was handled. */
  bool isShutdownRequested() const { return shutdownRequested; }

 protected:
  json dispatch(const string& command, const json& args);

  json createSession(const json& args);
  json writeSession(const json& args);
  json resizeSession(const json& args);
  json destroySession(const json& args);
  json searchFiles(const json& args);
  json cancelSearch(const json& args);
  json listSessions();
  json listDrives();

  static json okResponse(const json& id, const json& result);
  static json errorResponse(const json& id, const string& kind,
                            const string& message);

  shared_ptr<SessionRegistry> registry;
  shared_ptr<SearchManager> searches;
  shared_ptr<Platform> platform;
  std::atomic<bool> shutdownRequested;
};
}  // namespace burrow

#endif  // __BURROW_COMMAND_DISPATCHER__
