#pragma once

#include "Headers.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace pt {
/**
 * @brief Serializes a document for the wire, replacing invalid UTF-8 (raw
 * terminal bytes) with U+FFFD instead of throwing.
 */
inline string dumpJson(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace pt
