#include "CommandDispatcher.hpp"

#include "EventJson.hpp"

namespace burrow {
namespace {
string requireString(const json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_string()) {
    throw CommandError(string("Missing string argument: ") + key);
  }
  return it->get<string>();
}

/** Rows/cols travel as uint16 on the wire. */
int requireDimension(const json& args, const char* key) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_number_integer()) {
    throw CommandError(string("Missing integer argument: ") + key);
  }
  int64_t value = it->get<int64_t>();
  if (value < 1 || value > 65535) {
    throw CommandError(string("Out of range: ") + key + "=" +
                       std::to_string(value));
  }
  return int(value);
}

uint32_t requireSearchId(const json& args) {
  auto it = args.find("searchId");
  if (it == args.end() || !it->is_number_integer()) {
    throw CommandError("Missing integer argument: searchId");
  }
  int64_t value = it->get<int64_t>();
  if (value < 0 || value > int64_t(UINT32_MAX)) {
    throw CommandError("searchId must fit in 32 bits");
  }
  return uint32_t(value);
}
}  // namespace

CommandDispatcher::CommandDispatcher(shared_ptr<SessionRegistry> _registry,
                                     shared_ptr<SearchManager> _searches,
                                     shared_ptr<Platform> _platform)
    : registry(_registry),
      searches(_searches),
      platform(_platform),
      shutdownRequested(false) {}

json CommandDispatcher::handleLine(const string& line) {
  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error& pe) {
    LOG(WARNING) << "Unparseable request: " << pe.what();
    return errorResponse(json(), "BadCommand", pe.what());
  }
  return handle(request);
}

json CommandDispatcher::handle(const json& request) {
  if (!request.is_object()) {
    return errorResponse(json(), "BadCommand", "Request must be an object");
  }
  json id = request.contains("id") ? request["id"] : json();
  auto commandIt = request.find("command");
  if (commandIt == request.end() || !commandIt->is_string()) {
    return errorResponse(id, "BadCommand", "Missing command");
  }
  string command = commandIt->get<string>();
  json args = request.contains("args") ? request["args"] : json::object();
  if (!args.is_object()) {
    return errorResponse(id, "BadCommand", "args must be an object");
  }

  VLOG(1) << "Handling " << command;
  try {
    return okResponse(id, dispatch(command, args));
  } catch (const CommandError& ce) {
    LOG(INFO) << command << " failed: " << ce.kind() << ": " << ce.what();
    return errorResponse(id, ce.kind(), ce.what());
  } catch (const json::exception& je) {
    LOG(INFO) << command << " has malformed arguments: " << je.what();
    return errorResponse(id, "BadCommand", je.what());
  }
}

json CommandDispatcher::dispatch(const string& command, const json& args) {
  if (command == "createSession") {
    return createSession(args);
  } else if (command == "writeSession") {
    return writeSession(args);
  } else if (command == "resizeSession") {
    return resizeSession(args);
  } else if (command == "destroySession") {
    return destroySession(args);
  } else if (command == "searchFiles") {
    return searchFiles(args);
  } else if (command == "cancelSearch") {
    return cancelSearch(args);
  } else if (command == "listSessions") {
    return listSessions();
  } else if (command == "listDrives") {
    return listDrives();
  } else if (command == "shutdown") {
    shutdownRequested = true;
    return json();
  }
  throw CommandError("Unknown command: " + command);
}

json CommandDispatcher::createSession(const json& args) {
  string cwd = args.contains("cwd") ? requireString(args, "cwd") : string();
  int rows = requireDimension(args, "rows");
  int cols = requireDimension(args, "cols");
  json result;
  result["sessionId"] = registry->create(cwd, rows, cols);
  return result;
}

json CommandDispatcher::writeSession(const json& args) {
  registry->write(requireString(args, "sessionId"),
                  requireString(args, "data"));
  return json();
}

json CommandDispatcher::resizeSession(const json& args) {
  string sessionId = requireString(args, "sessionId");
  registry->resize(sessionId, requireDimension(args, "rows"),
                   requireDimension(args, "cols"));
  return json();
}

json CommandDispatcher::destroySession(const json& args) {
  registry->destroy(requireString(args, "sessionId"));
  return json();
}

json CommandDispatcher::searchFiles(const json& args) {
  SearchRequest request;
  request.rootPath = requireString(args, "path");
  request.query = requireString(args, "query");
  request.searchId = requireSearchId(args);
  searches->start(request);
  return json();
}

json CommandDispatcher::cancelSearch(const json& args) {
  searches->cancel(requireSearchId(args));
  return json();
}

json CommandDispatcher::listSessions() {
  json result = json::array();
  for (const auto& info : registry->listSessions()) {
    json session;
    session["sessionId"] = info.id;
    session["rows"] = info.rows;
    session["cols"] = info.cols;
    session["pid"] = int64_t(info.pid);
    switch (info.state) {
      case OutputPump::CREATED:
        session["state"] = "created";
        break;
      case OutputPump::RUNNING:
        session["state"] = "running";
        break;
      case OutputPump::EXITED:
        session["state"] = "exited";
        break;
    }
    result.push_back(session);
  }
  return result;
}

json CommandDispatcher::listDrives() {
  json result = json::array();
  for (const auto& volume : platform->listVolumes()) {
    result.push_back(volumeToJson(volume));
  }
  return result;
}

json CommandDispatcher::okResponse(const json& id, const json& result) {
  json response;
  response["type"] = "response";
  response["id"] = id;
  response["ok"] = true;
  response["result"] = result;
  return response;
}

json CommandDispatcher::errorResponse(const json& id, const string& kind,
                                      const string& message) {
  json response;
  response["type"] = "response";
  response["id"] = id;
  response["ok"] = false;
  response["error"]["kind"] = kind;
  response["error"]["message"] = message;
  return response;
}
}  // namespace burrow
