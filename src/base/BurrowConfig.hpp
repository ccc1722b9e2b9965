#ifndef __BURROW_CONFIG__
#define __BURROW_CONFIG__

#include "Headers.hpp"

namespace burrow {
/** @brief Runtime settings for burrowd, filled from the ini file and argv. */
struct BurrowConfig {
  /** @brief Shell override; empty means $SHELL / passwd / /bin/sh. */
  string shell;
  int readBufferSize = DEFAULT_PTY_READ_BUFFER_SIZE;

  int maxResultsPerBatch = DEFAULT_MAX_RESULTS_PER_BATCH;
  int maxTotalResults = DEFAULT_MAX_TOTAL_RESULTS;
  bool shallowFirst = true;
  bool followSymlinks = true;
  int searchThreads = 4;

  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";
};

/** @brief Default config file location under the user's config home. */
string defaultConfigPath();

/**
 * @brief Overlays the values found in an ini file onto `config`.
 * @return false if the file could not be loaded.  Missing keys keep their
 * current value.
 */
bool loadConfigFile(const string& path, BurrowConfig* config);
}  // namespace burrow

#endif  // __BURROW_CONFIG__
