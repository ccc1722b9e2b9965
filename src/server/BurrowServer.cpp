#include "BurrowServer.hpp"

#include "EventJson.hpp"

namespace burrow {
BurrowServer::BurrowServer(const BurrowConfig& config,
                           shared_ptr<Platform> _platform, std::ostream& out)
    : writer(new JsonLineWriter(out)), platform(_platform), stopped(false) {
  shared_ptr<JsonLineWriter> eventWriter = writer;
  channel.reset(new EventChannel([eventWriter](const Event& event) {
    return eventWriter->writeLine(eventToJson(event));
  }));

  registry.reset(new SessionRegistry(platform, channel, config.readBufferSize));

  SearchOptions searchOptions;
  searchOptions.maxResultsPerBatch = config.maxResultsPerBatch;
  searchOptions.maxTotalResults = config.maxTotalResults;
  searchOptions.shallowFirst = config.shallowFirst;
  searchOptions.followSymlinks = config.followSymlinks;
  searches.reset(
      new SearchManager(searchOptions, channel, config.searchThreads));

  dispatcher.reset(new CommandDispatcher(registry, searches, platform));
}

BurrowServer::~BurrowServer() { shutdown(); }

void BurrowServer::run(std::istream& in) {
  string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (!writer->writeLine(dispatcher->handleLine(line))) {
      LOG(INFO) << "Output closed, exiting";
      break;
    }
    if (dispatcher->isShutdownRequested()) {
      LOG(INFO) << "Shutdown requested";
      break;
    }
  }
  shutdown();
}

void BurrowServer::shutdown() {
  if (stopped) {
    return;
  }
  stopped = true;
  // Pumps and searches still emit their final events into the channel, so it
  // goes last.
  registry->shutdown();
  searches->shutdown();
  channel->shutdown();
}
}  // namespace burrow
