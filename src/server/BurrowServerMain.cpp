#include <cxxopts.hpp>

#include "BurrowServer.hpp"
#include "LogHandler.hpp"

using namespace burrow;

int main(int argc, char **argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  burrow::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, burrow::InterruptSignalHandler);
  // A frontend that went away must not kill us mid-write
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("burrowd",
                           "Terminal sessions and file search for the "
                           "burrow file explorer, over json lines on stdio");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(defaultConfigPath()))  //
        ("logtostdout", "log to stdout (breaks the protocol, debug only)")  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(GetTempDirectory()))  //
        ("shell", "Shell for new sessions, overrides $SHELL",
         cxxopts::value<std::string>())  //
        ("search-threads", "Number of concurrent searches",
         cxxopts::value<int>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "burrowd version " << BURROW_VERSION << endl;
      exit(0);
    }

    BurrowConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (fs::exists(cfgfilename)) {
      if (!loadConfigFile(cfgfilename, &config)) {
        CLOG(ERROR, "stdout") << "Invalid config file: " << cfgfilename << endl;
        exit(1);
      }
    } else if (result.count("cfgfile")) {
      CLOG(ERROR, "stdout") << "Config file not found: " << cfgfilename
                            << endl;
      exit(1);
    }

    // command line wins over the config file
    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }
    if (result.count("search-threads")) {
      config.searchThreads = std::max(1, result["search-threads"].as<int>());
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }

    LogHandler::setupLogFiles(&defaultConf, config,
                              result["logdir"].as<string>(),
                              result.count("logtostdout") > 0, true);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("burrowd-main");

    shared_ptr<Platform> platform(new PosixPlatform(config.shell));
    LOG(INFO) << "burrowd " << BURROW_VERSION << " starting, shell "
              << platform->defaultShell();

    BurrowServer server(config, platform, std::cout);
    server.run(std::cin);
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  LOG(INFO) << "burrowd is shutting down";
  google::protobuf::ShutdownProtobufLibrary();
  return 0;
}
