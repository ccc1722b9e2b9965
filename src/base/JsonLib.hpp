#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Short alias for `nlohmann::json`, used by the line protocol.
 */
using json = nlohmann::json;
