// verb.hpp

#pragma once

#include <boost/beast/http/verb.hpp>
#include <restcov/misc.hpp>


namespace restcov::http {
using verb = boost::beast::http::verb;

inline verb string_to_verb(std::string_view method) {
  return boost::beast::http::string_to_verb(
      boost::string_view{method.data(), method.size()});
}

inline std::string_view to_string(verb method) {
  return misc::string_view_cast(boost::beast::http::to_string(method));
}


namespace literals {
inline verb operator""_verb(const char *str, size_t len) {
  return string_to_verb(std::string_view{str, len});
}
} // namespace literals
} // namespace restcov::http
