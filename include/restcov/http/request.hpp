// request.hpp

#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <restcov/http/url.hpp>
#include <restcov/misc.hpp>


namespace restcov::http {
/**\brief request as it comes from the host server. The router reads only the
 * method and the target, the body is left to handlers
 */
class request
    : public boost::beast::http::request<boost::beast::http::string_body> {
  using message = boost::beast::http::request<boost::beast::http::string_body>;

public:
  request() = default;

  request(const message &rhs)
      : message{rhs} {
  }

  request(message &&rhs)
      : message{std::move(rhs)} {
  }

  request &operator=(const message &rhs) {
    message::operator=(rhs);
    return *this;
  }

  request &operator=(message &&rhs) {
    message::operator=(std::move(rhs));
    return *this;
  }

  std::string_view target() const noexcept {
    return misc::string_view_cast(message::target());
  }

  std::string_view method_name() const noexcept {
    return misc::string_view_cast(message::method_string());
  }

  /**\return path part of the target, without query
   */
  std::string_view path() const noexcept {
    return url::get_path(this->target());
  }

  url::args query() const {
    return url::query::split(url::get_query(this->target()));
  }

protected:
  using message::target;
};
} // namespace restcov::http
