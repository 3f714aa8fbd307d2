#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace wt {
/**
 * @brief Serializes a message for the wire.
 *
 * Terminal output is forwarded as-is, so any byte that is not valid UTF-8 is
 * replaced instead of throwing inside a socket callback.
 */
inline std::string dumpJson(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace wt
