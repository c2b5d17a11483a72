// endpoint.hpp

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>


namespace restcov {
/**\brief opaque token returned by route registration, identifies endpoint in
 * the registry
 */
using endpoint_id = std::size_t;

struct endpoint {
  std::string method;
  std::string path;
  int64_t     hits = 0;
};

inline bool operator==(const endpoint &lhs, const endpoint &rhs) {
  return std::tie(lhs.method, lhs.path, lhs.hits) ==
         std::tie(rhs.method, rhs.path, rhs.hits);
}

inline bool operator!=(const endpoint &lhs, const endpoint &rhs) {
  return !(lhs == rhs);
}

inline bool operator<(const endpoint &lhs, const endpoint &rhs) {
  return std::tie(lhs.path, lhs.method, lhs.hits) <
         std::tie(rhs.path, rhs.method, rhs.hits);
}


/**\brief serialize endpoints as json array of objects with Method, Path and
 * Hits keys. Output is indented by two spaces, and every line after the first
 * one has additional two spaces prefix
 * \throw nlohmann::json::exception if some value can not be serialized, for
 * example a path that isn't valid utf-8
 */
std::string endpoints_to_json(const std::vector<endpoint> &endpoints);
} // namespace restcov
