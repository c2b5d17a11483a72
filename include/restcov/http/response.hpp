// response.hpp

#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <functional>


namespace restcov::http {
/**\note by default the host writes the response after handling. If the host
 * installs a writer, handlers can flush the response earlier by write. Then
 * written returns true and the host must not write the response again
 */
class response
    : public boost::beast::http::response<boost::beast::http::string_body> {
public:
  using writer = std::function<void(response &)>;

  void set_writer(writer callback) {
    writer_ = std::move(callback);
  }

  /**\brief write complete response to client through the host writer. Does
   * nothing if the host didn't install a writer or the response is already
   * written. Call prepare_payload before it
   * \throw anything that the writer throws
   */
  void write() {
    if (writer_ && written_ == false) {
      writer_(*this);
      written_ = true;
    }
  }

  bool written() const noexcept {
    return written_;
  }

private:
  writer writer_;
  bool   written_ = false;
};
} // namespace restcov::http
