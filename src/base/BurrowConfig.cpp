#include "BurrowConfig.hpp"

#include "SimpleIni.h"

namespace burrow {
namespace {
int readPositiveInt(const CSimpleIniA& ini, const char* section,
                    const char* key, int current) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return current;
  }
  int parsed = atoi(value);
  if (parsed <= 0) {
    LOG(WARNING) << "Ignoring invalid " << section << "." << key << ": "
                 << value;
    return current;
  }
  return parsed;
}
}  // namespace

string defaultConfigPath() {
  return sago::getConfigHome() + "/burrow/burrowd.ini";
}

bool loadConfigFile(const string& path, BurrowConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << path << " (" << rc << ")";
    return false;
  }

  const char* shell = ini.GetValue("Terminal", "shell", NULL);
  if (shell != NULL) {
    config->shell = string(shell);
  }
  config->readBufferSize = readPositiveInt(ini, "Terminal", "read_buffer_size",
                                           config->readBufferSize);

  config->maxResultsPerBatch = readPositiveInt(
      ini, "Search", "max_results_per_batch", config->maxResultsPerBatch);
  config->maxTotalResults = readPositiveInt(ini, "Search", "max_total_results",
                                            config->maxTotalResults);
  config->shallowFirst =
      ini.GetBoolValue("Search", "shallow_first", config->shallowFirst);
  config->followSymlinks =
      ini.GetBoolValue("Search", "follow_symlinks", config->followSymlinks);
  config->searchThreads =
      readPositiveInt(ini, "Search", "threads", config->searchThreads);

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = atoi(vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent && atoi(silent) != 0) {
    config->silent = true;
  }
  // make sure maxLogSize is a string of int value
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->maxLogSize = string(logsize);
  }
  return true;
}
}  // namespace burrow
