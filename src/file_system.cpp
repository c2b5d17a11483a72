// file_system.cpp

#include "restcov/file_system.hpp"
#include "restcov/http/status.hpp"
#include "restcov/http/url.hpp"
#include <fstream>
#include <simple_logs/logs.hpp>
#include <sstream>
#include <unordered_map>


#define INDEX_FILE           "index.html"
#define DEFAULT_CONTENT_TYPE "application/octet-stream"


namespace restcov {
namespace {
std::string_view content_type(const std::filesystem::path &file) {
  static const std::unordered_map<std::string, std::string_view> types{
      {".html", "text/html; charset=utf-8"},
      {".htm", "text/html; charset=utf-8"},
      {".css", "text/css; charset=utf-8"},
      {".js", "text/javascript; charset=utf-8"},
      {".json", "application/json"},
      {".txt", "text/plain; charset=utf-8"},
      {".xml", "text/xml; charset=utf-8"},
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".gif", "image/gif"},
      {".svg", "image/svg+xml"},
      {".ico", "image/x-icon"},
  };

  if (auto found = types.find(file.extension().string());
      found != types.end()) {
    return found->second;
  }

  return DEFAULT_CONTENT_TYPE;
}
} // namespace


directory::directory(std::filesystem::path root)
    : root_{std::move(root)} {
}

void directory::serve(std::string_view                      file_path,
                      [[maybe_unused]] const http::request &req,
                      OUTPUT http::response &res) {
  // clean_path never goes above the root, so the file always is inside
  std::string relative =
      http::url::clean_path("/" + std::string{file_path}).substr(1);

  std::filesystem::path file = root_ / relative;

  std::error_code err;
  if (std::filesystem::is_directory(file, err)) {
    file /= INDEX_FILE;
  }

  std::ifstream input{file, std::ios::binary};
  if (input.is_open() == false) {
    LOG_DEBUG("file not found: %1%", file.string());

    res.result(http::status::not_found);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = "404 page not found";
    return;
  }

  std::stringstream content;
  content << input.rdbuf();

  std::string_view type = content_type(file);

  res.result(http::status::ok);
  res.set(http::field::content_type,
          boost::beast::string_view{type.data(), type.size()});
  res.body() = content.str();
}
} // namespace restcov
