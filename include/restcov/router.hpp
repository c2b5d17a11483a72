// router.hpp

#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <restcov/endpoint.hpp>
#include <restcov/endpoint_registry.hpp>
#include <restcov/file_system.hpp>
#include <restcov/http/verb.hpp>
#include <restcov/route_tree.hpp>
#include <restcov/service.hpp>


namespace restcov {
class router_builder;

/**\brief service that dispatches requests to handlers by method and path, and
 * counts calls of every registered handler.
 *
 * Visit `GET /endpoints` for all endpoints with their hits, and
 * `GET /endpoints/unhit` for endpoints that were never called.
 *
 * \warning all routes must be added before the router starts handling
 * requests. Counting locks one mutex for every request, so don't use it under
 * high load
 */
class router final : public service {
  friend router_builder;

public:
  using handler  = route::handler;
  using fallback = std::function<void(http::request &, OUTPUT http::response &)>;
  using panic_handler = std::function<void(http::request &,
                                           OUTPUT http::response &,
                                           std::exception_ptr)>;

  static constexpr std::string_view endpoints_path       = "/endpoints";
  static constexpr std::string_view endpoints_unhit_path = "/endpoints/unhit";


  /**\throw std::invalid_argument if path is malformed
   * \throw route_conflict if the route is ambiguous with already added one
   * \return token of the endpoint for the route
   */
  endpoint_id add_route(std::string_view method, std::string_view path, handler h);
  endpoint_id add_route(http::verb method, std::string_view path, handler h);

  endpoint_id get(std::string_view path, handler h);
  endpoint_id head(std::string_view path, handler h);
  endpoint_id options(std::string_view path, handler h);
  endpoint_id post(std::string_view path, handler h);
  endpoint_id put(std::string_view path, handler h);
  endpoint_id patch(std::string_view path, handler h);
  endpoint_id del(std::string_view path, handler h);

  /**\brief serve files from the file system by GET requests. The route is not
   * counted and not listed in endpoints
   * \param path pattern which last segment is `*filepath`
   * \throw std::invalid_argument if the last segment of path isn't `*filepath`
   */
  void serve_files(std::string_view path, file_system_ptr root);


  void handle(http::request &req, OUTPUT http::response &res) override;


  /**\return copy of registered endpoints, except the introspection ones
   */
  std::vector<endpoint> endpoints(bool unhit_only = false) const;

  /**\return the endpoint for the token, including the introspection ones
   */
  std::optional<endpoint> endpoint_info(endpoint_id id) const;

  const route_tree &routes() const noexcept;

private:
  router();

  endpoint_id register_route(std::string_view method,
                             std::string_view path,
                             handler          h,
                             bool             hidden);

  void dispatch(const route &            matched,
                const http::url::args &params,
                http::request &          req,
                OUTPUT http::response &res);

  void redirect(const http::request &req,
                OUTPUT http::response &res,
                std::string_view       location) const;

  void write_endpoints(OUTPUT http::response &res,
                       const std::vector<endpoint> &endpoints) const;

private:
  route_tree        tree_;
  endpoint_registry registry_;

  fallback      not_found_;
  fallback      method_not_allowed_;
  panic_handler panic_handler_;

  bool redirect_trailing_slash_;
  bool redirect_fixed_path_;
  bool handle_method_not_allowed_;
  bool handle_options_;
};

using router_ptr = std::shared_ptr<router>;


class router_builder {
public:
  router_builder();

  /**\brief set handler for requests without matched route. By default
   * responds 404
   */
  router_builder &set_not_found(router::fallback handler);

  /**\brief set handler for requests which path matches other methods. The
   * Allow header is already set when it is called. By default responds 405
   */
  router_builder &set_method_not_allowed(router::fallback handler);

  /**\brief set handler for exceptions thrown by route handlers. If it is not
   * set, exceptions go to the host server
   */
  router_builder &set_panic_handler(router::panic_handler handler);


  /**\brief redirect to the path with added or removed trailing slash if only
   * that one has a route. Enabled by default
   */
  router_builder &set_redirect_trailing_slash(bool enable);

  /**\brief redirect to the cleaned path, see url::clean_path, if only that one
   * has a route. Enabled by default
   */
  router_builder &set_redirect_fixed_path(bool enable);

  /**\brief if disabled, then requests for other methods are handled as not
   * found. Enabled by default
   */
  router_builder &set_handle_method_not_allowed(bool enable);

  /**\brief respond OPTIONS requests automatically, if there is no OPTIONS
   * route for the path. Enabled by default
   */
  router_builder &set_handle_options(bool enable);


  /**\return router with registered introspection routes
   */
  router_ptr build() const;

private:
  router::fallback      not_found_;
  router::fallback      method_not_allowed_;
  router::panic_handler panic_handler_;

  bool redirect_trailing_slash_;
  bool redirect_fixed_path_;
  bool handle_method_not_allowed_;
  bool handle_options_;
};
} // namespace restcov
