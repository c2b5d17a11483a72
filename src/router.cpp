// router.cpp

#include "restcov/router.hpp"
#include "restcov/http/status.hpp"
#include "restcov/http/url.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <simple_logs/logs.hpp>


#define FILEPATH_PARAM  "filepath"
#define FILEPATH_SUFFIX "/*" FILEPATH_PARAM

#define TEXT_CONTENT_TYPE "text/plain; charset=utf-8"
#define JSON_CONTENT_TYPE "application/json"


namespace restcov {
namespace {
void set_text(OUTPUT http::response &res,
              http::status            code,
              std::string_view        body) {
  res.result(code);
  res.set(http::field::content_type, TEXT_CONTENT_TYPE);
  res.body() = body;
}
} // namespace


router::router()
    : redirect_trailing_slash_{true}
    , redirect_fixed_path_{true}
    , handle_method_not_allowed_{true}
    , handle_options_{true} {
  // router can't be moved, so capturing this is safe
  this->register_route(
      http::to_string(http::verb::get),
      endpoints_path,
      [this](http::request &, http::response &res, const http::url::args &) {
        this->write_endpoints(res, registry_.list(false));
      },
      true);

  this->register_route(
      http::to_string(http::verb::get),
      endpoints_unhit_path,
      [this](http::request &, http::response &res, const http::url::args &) {
        this->write_endpoints(res, registry_.list(true));
      },
      true);
}

endpoint_id
router::add_route(std::string_view method, std::string_view path, handler h) {
  return this->register_route(method, path, std::move(h), false);
}

endpoint_id
router::add_route(http::verb method, std::string_view path, handler h) {
  return this->add_route(http::to_string(method), path, std::move(h));
}

endpoint_id router::get(std::string_view path, handler h) {
  return this->add_route(http::verb::get, path, std::move(h));
}

endpoint_id router::head(std::string_view path, handler h) {
  return this->add_route(http::verb::head, path, std::move(h));
}

endpoint_id router::options(std::string_view path, handler h) {
  return this->add_route(http::verb::options, path, std::move(h));
}

endpoint_id router::post(std::string_view path, handler h) {
  return this->add_route(http::verb::post, path, std::move(h));
}

endpoint_id router::put(std::string_view path, handler h) {
  return this->add_route(http::verb::put, path, std::move(h));
}

endpoint_id router::patch(std::string_view path, handler h) {
  return this->add_route(http::verb::patch, path, std::move(h));
}

endpoint_id router::del(std::string_view path, handler h) {
  return this->add_route(http::verb::delete_, path, std::move(h));
}

endpoint_id router::register_route(std::string_view method,
                                   std::string_view path,
                                   handler          h,
                                   bool             hidden) {
  if (h == nullptr) {
    throw std::invalid_argument{"empty handler for path: " +
                                std::string{path}};
  }

  route &inserted = tree_.insert(method, path, route{std::move(h), {}});

  endpoint_id id = registry_.record(method, path, hidden);
  inserted.id    = id;

  LOG_DEBUG("register route %1% %2%", method, path);

  return id;
}

void router::serve_files(std::string_view path, file_system_ptr root) {
  constexpr std::string_view suffix = FILEPATH_SUFFIX;
  if (path.size() < suffix.size() ||
      path.substr(path.size() - suffix.size()) != suffix) {
    throw std::invalid_argument{"path must end with " FILEPATH_SUFFIX
                                " in path: " +
                                std::string{path}};
  }

  if (root == nullptr) {
    throw std::invalid_argument{"file system for serving is not set"};
  }

  // files are not counted, so the route has no endpoint
  tree_.insert(http::to_string(http::verb::get),
               path,
               route{[root](http::request &          req,
                            http::response &         res,
                            const http::url::args &params) {
                       root->serve(params.at(FILEPATH_PARAM), req, res);
                     },
                     {}});

  LOG_DEBUG("serve files at %1%", path);
}


void router::handle(http::request &req, OUTPUT http::response &res) {
  std::string_view method = req.method_name();

  // routes and parameters are matched on the decoded path
  std::string      decoded = http::url::decode_path(req.path());
  std::string_view path    = decoded;
  if (path.empty()) {
    path = "/";
  }

  route_tree::result found = tree_.resolve(method, path);
  if (found.status == route_tree::outcome::found) {
    this->dispatch(*found.matched, found.params, req, res);
    return;
  }


  if (method != http::to_string(http::verb::connect) && path != "/") {
    if (redirect_trailing_slash_ &&
        tree_.recommend_trailing_slash(method, path)) {
      std::string location{path};
      if (location.back() == '/') {
        location.pop_back();
      } else {
        location.push_back('/');
      }

      this->redirect(req, res, location);
      return;
    }

    if (redirect_fixed_path_) {
      std::string     clean = http::url::clean_path(path);
      http::url::args params;
      if (clean != path && tree_.match(method, clean, params) != nullptr) {
        this->redirect(req, res, clean);
        return;
      }
    }
  }


  std::vector<std::string> allowed = found.allowed;
  if (handle_options_ && allowed.empty() == false) {
    allowed.emplace_back(http::to_string(http::verb::options));
    std::sort(allowed.begin(), allowed.end());
    allowed.erase(std::unique(allowed.begin(), allowed.end()), allowed.end());
  }

  std::string allow_header;
  for (const std::string &item : allowed) {
    if (allow_header.empty() == false) {
      allow_header += ", ";
    }
    allow_header += item;
  }


  if (method == http::to_string(http::verb::options) && handle_options_) {
    if (found.allowed.empty() == false) {
      res.result(http::status::ok);
      res.set(http::field::allow, allow_header);
      return;
    }
  } else if (found.status == route_tree::outcome::method_not_allowed &&
             handle_method_not_allowed_) {
    LOG_DEBUG("method %1% not allowed for %2%", method, path);

    res.set(http::field::allow, allow_header);
    if (method_not_allowed_) {
      method_not_allowed_(req, res);
    } else {
      set_text(res, http::status::method_not_allowed, "Method Not Allowed");
    }
    return;
  }


  LOG_DEBUG("route for %1% %2% not found", method, path);

  if (not_found_) {
    not_found_(req, res);
  } else {
    set_text(res, http::status::not_found, "404 page not found");
  }
}

void router::dispatch(const route &            matched,
                      const http::url::args &params,
                      http::request &          req,
                      OUTPUT http::response &res) {
  try {
    // the hit is counted at any exit from the handler
    hit_guard guard{registry_, matched.id};

    matched.handle(req, res, params);
  } catch (...) {
    if (panic_handler_ == nullptr) {
      throw;
    }

    LOG_ERROR("handler for %1% failed, call panic handler", req.target());

    panic_handler_(req, res, std::current_exception());
  }
}

void router::redirect(const http::request &req,
                      OUTPUT http::response &res,
                      std::string_view       location) const {
  std::string target{location};
  if (std::string_view query = http::url::get_query(req.target());
      query.empty() == false) {
    target.push_back('?');
    target.append(query);
  }

  LOG_DEBUG("redirect %1% to %2%", req.target(), target);

  // GET can be redirected with 301, other methods must keep the method
  res.result(req.method() == http::verb::get
                 ? http::status::moved_permanently
                 : http::status::permanent_redirect);
  res.set(http::field::location, target);
}

void router::write_endpoints(OUTPUT http::response &res,
                             const std::vector<endpoint> &endpoints) const {
  std::string body;
  try {
    body = endpoints_to_json(endpoints);
  } catch (nlohmann::json::exception &e) {
    LOG_ERROR("can not serialize endpoints: %1%", e.what());

    set_text(res, http::status::internal_server_error, e.what());
    return;
  }

  res.result(http::status::ok);
  res.set(http::field::content_type, JSON_CONTENT_TYPE);
  res.body() = std::move(body);
  res.prepare_payload();

  // the response is already complete, so only log write errors
  try {
    res.write();
  } catch (std::exception &e) {
    LOG_ERROR("can not write endpoints: %1%", e.what());
  }
}


std::vector<endpoint> router::endpoints(bool unhit_only) const {
  return registry_.list(unhit_only);
}

std::optional<endpoint> router::endpoint_info(endpoint_id id) const {
  return registry_.get(id);
}

const route_tree &router::routes() const noexcept {
  return tree_;
}


router_builder::router_builder()
    : redirect_trailing_slash_{true}
    , redirect_fixed_path_{true}
    , handle_method_not_allowed_{true}
    , handle_options_{true} {
}

router_builder &router_builder::set_not_found(router::fallback handler) {
  not_found_ = std::move(handler);
  return *this;
}

router_builder &
router_builder::set_method_not_allowed(router::fallback handler) {
  method_not_allowed_ = std::move(handler);
  return *this;
}

router_builder &
router_builder::set_panic_handler(router::panic_handler handler) {
  panic_handler_ = std::move(handler);
  return *this;
}

router_builder &router_builder::set_redirect_trailing_slash(bool enable) {
  redirect_trailing_slash_ = enable;
  return *this;
}

router_builder &router_builder::set_redirect_fixed_path(bool enable) {
  redirect_fixed_path_ = enable;
  return *this;
}

router_builder &router_builder::set_handle_method_not_allowed(bool enable) {
  handle_method_not_allowed_ = enable;
  return *this;
}

router_builder &router_builder::set_handle_options(bool enable) {
  handle_options_ = enable;
  return *this;
}


router_ptr router_builder::build() const {
  // constructor of router is private, so make_shared can't be used
  router_ptr retval{new router{}};

  retval->not_found_          = not_found_;
  retval->method_not_allowed_ = method_not_allowed_;
  retval->panic_handler_      = panic_handler_;

  retval->redirect_trailing_slash_   = redirect_trailing_slash_;
  retval->redirect_fixed_path_       = redirect_fixed_path_;
  retval->handle_method_not_allowed_ = handle_method_not_allowed_;
  retval->handle_options_            = handle_options_;

  return retval;
}
} // namespace restcov
