// file_system.hpp

#pragma once

#include <filesystem>
#include <memory>
#include <restcov/http/request.hpp>
#include <restcov/http/response.hpp>
#include <restcov/misc.hpp>


namespace restcov {
/**\brief source of static files for router::serve_files
 */
class file_system {
public:
  virtual ~file_system() = default;

  /**\brief fill the response by the file
   * \param file_path path of the file relative to the root of the file system,
   * without leading slash
   */
  virtual void serve(std::string_view file_path,
                     const http::request &req,
                     OUTPUT http::response &res) = 0;
};

using file_system_ptr = std::shared_ptr<file_system>;


/**\brief serves files from a local directory. Paths are cleaned before
 * reading, so a request can not leave the directory. For a directory serves
 * index.html from it
 */
class directory final : public file_system {
public:
  explicit directory(std::filesystem::path root);

  void serve(std::string_view file_path,
             const http::request &req,
             OUTPUT http::response &res) override;

private:
  std::filesystem::path root_;
};
} // namespace restcov
