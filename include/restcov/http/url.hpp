// url.hpp

#pragma once

#include <map>
#include <restcov/misc.hpp>
#include <stdexcept>
#include <string>
#include <vector>


namespace restcov::http {
class url {
public:
  class query;

  class args : public std::multimap<std::string, std::string> {
  public:
    args::mapped_type &operator[](const args::key_type &key) {
      if (auto found = this->find(key); found != this->end()) {
        return found->second;
      }

      const auto &out = this->emplace(key, args::mapped_type{});
      return out->second;
    }

    const args::mapped_type &at(const args::key_type &key) const {
      if (auto found = this->find(key); found != this->end()) {
        return found->second;
      }

      throw std::out_of_range{"args::at"};
    }

    args::mapped_type &at(const args::key_type &key) {
      if (auto found = this->find(key); found != this->end()) {
        return found->second;
      }

      throw std::out_of_range{"args::at"};
    }
  };


  static std::string_view get_path(std::string_view url) noexcept;
  static std::string_view get_query(std::string_view url) noexcept;

  /**\brief split path on segments by slash. The leading slash is skipped,
   * every other slash separates two segments, so empty segments are kept:
   * "/" gives one empty segment and "/a/" gives "a" and empty segment
   * \note returned values point to the input
   */
  static std::vector<std::string_view> segments(std::string_view path);

  /**\brief canonical form of the path: starts with single slash, without
   * repeated slashes, "." and ".." elements. The trailing slash is kept
   * \note ".." never goes above the root
   */
  static std::string clean_path(std::string_view path);

  /**\brief replace percent-encoded octets, like `%20`, by their values.
   * Invalid sequences are kept as is, `+` is not a space in the path
   * \note decoded `%2F` is a segment separator for routing
   */
  static std::string decode_path(std::string_view path);


  class query {
  public:
    using args = url::args;
    static args split(std::string_view query) noexcept;
  };
};


namespace literals {
inline url::query::args operator""_query(const char *str, size_t len) {
  return url::query::split(std::string_view{str, len});
}
} // namespace literals
} // namespace restcov::http
