#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Hook payloads, decision responses and tool arguments are all
 * `nlohmann::json` values; objects keep their keys sorted, which is what makes
 * `dump()` usable as a canonical form.
 */
using json = nlohmann::json;
