#ifndef __OT_JSON_LIB__
#define __OT_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Exposes `nlohmann::json` as `json` for the health reports.
 */
using json = nlohmann::json;

#endif  // __OT_JSON_LIB__
