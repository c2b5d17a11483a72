// route_tree.hpp

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <restcov/endpoint.hpp>
#include <restcov/http/request.hpp>
#include <restcov/http/response.hpp>
#include <restcov/http/url.hpp>
#include <restcov/misc.hpp>
#include <stdexcept>
#include <string>
#include <vector>


namespace restcov {
/**\brief thrown if new route is ambiguous with already registered one
 */
class route_conflict : public std::logic_error {
public:
  using std::logic_error::logic_error;
};


struct route {
  using handler = std::function<void(http::request &,
                                     OUTPUT http::response &,
                                     const http::url::args &)>;

  handler handle;

  /**\brief empty for routes that are not counted
   */
  std::optional<endpoint_id> id;
};


/**\brief prefix tree of routes, one tree per method. Every tree level is one
 * path segment.
 *
 * Pattern segments:
 * - static, like `users`, matches only the same segment
 * - parameter, like `:id`, matches any non empty segment
 * - catch-all, like `*filepath`, matches rest of the path, must be the last
 *
 * Static children are checked first, then parameter, then catch-all. If some
 * branch doesn't match the rest of the path, then the next one is checked.
 *
 * \warning the tree is not synchronized. All insertions must be done before
 * resolving starts
 */
class route_tree {
public:
  enum class outcome {
    found,
    method_not_allowed,
    not_found,
  };

  struct result {
    outcome         status = outcome::not_found;
    const route *   matched = nullptr;
    http::url::args params;

    /**\brief sorted methods that match the path, filled only for
     * method_not_allowed
     */
    std::vector<std::string> allowed;
  };

  route_tree();
  ~route_tree();

  route_tree(const route_tree &) = delete;
  route_tree &operator=(const route_tree &) = delete;

  /**\throw std::invalid_argument if the pattern is malformed
   * \throw route_conflict if the pattern is ambiguous with already inserted
   * one, or the same pattern is already inserted for the method
   * \note if exception was thrown, then the tree stays unchanged
   * \return inserted route
   */
  route &insert(std::string_view method, std::string_view pattern, route value);

  result resolve(std::string_view method, std::string_view path) const;

  /**\return route that match the path for the method, or nullptr
   */
  const route *match(std::string_view           method,
                     std::string_view           path,
                     OUTPUT http::url::args &params) const;

  /**\return sorted methods, except the given one, which trees match the path
   */
  std::vector<std::string> allowed(std::string_view path,
                                   std::string_view except) const;

  /**\return true if the path doesn't match, but the path with added or removed
   * trailing slash match
   */
  bool recommend_trailing_slash(std::string_view method,
                                std::string_view path) const;

private:
  class node;
  using node_ptr = std::unique_ptr<node>;

  std::map<std::string, node_ptr, std::less<>> trees_;
};
} // namespace restcov
