// endpoint.cpp

#include "restcov/endpoint.hpp"
#include <nlohmann/json.hpp>


#define JSON_INDENT 2
#define JSON_PREFIX "  "


namespace restcov {
std::string endpoints_to_json(const std::vector<endpoint> &endpoints) {
  // ordered_json keeps keys in order of insertion
  nlohmann::ordered_json list = nlohmann::ordered_json::array();
  for (const endpoint &item : endpoints) {
    nlohmann::ordered_json object;
    object["Method"] = item.method;
    object["Path"]   = item.path;
    object["Hits"]   = item.hits;

    list.push_back(std::move(object));
  }

  std::string dumped = list.dump(JSON_INDENT);

  std::string retval;
  retval.reserve(dumped.size() * 2);
  for (char c : dumped) {
    retval.push_back(c);
    if (c == '\n') {
      retval.append(JSON_PREFIX);
    }
  }

  return retval;
}
} // namespace restcov
