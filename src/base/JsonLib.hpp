#pragma once

#include <string>

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace wt {
/**
 * @brief Returns `j[key]` as a string, or `fallback` when absent or not a
 * string.
 */
inline std::string jsonString(const json& j, const char* key,
                              const std::string& fallback = "") {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return it->get<std::string>();
}

/**
 * @brief Returns `j[key]` as an integer, or `fallback` when absent, null or
 * not numeric.
 */
inline int64_t jsonInt64(const json& j, const char* key, int64_t fallback = 0) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<int64_t>();
}
}  // namespace wt
