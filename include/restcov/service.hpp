// service.hpp

#pragma once

#include <exception>
#include <memory>
#include <restcov/http/request.hpp>
#include <restcov/http/response.hpp>
#include <restcov/http/status.hpp>
#include <restcov/misc.hpp>


namespace restcov {
/**\brief service handles requests given by the host server
 * \note handle can be called from several threads at the same time
 */
class service {
public:
  virtual ~service() = default;

  virtual void handle(http::request &req, OUTPUT http::response &res) = 0;


  /**\brief host calls it if it catch exception from service::handle. By
   * default just send internal_server_error code to client
   */
  virtual void exception(const http::request &req,
                         OUTPUT http::response &          res,
                         [[maybe_unused]] std::exception &e) noexcept {
    // reinitialize the response, because there can be invalid values
    // after exception
    res = http::response{};
    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.result(http::status::internal_server_error);
  }
};

using service_ptr = std::shared_ptr<service>;
} // namespace restcov
