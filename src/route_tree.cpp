// route_tree.cpp

#include "restcov/route_tree.hpp"
#include <simple_logs/logs.hpp>


namespace restcov {
namespace {
[[noreturn]] void throw_conflict(std::string_view method,
                                 std::string_view pattern,
                                 const std::string &reason) {
  LOG_ERROR("can not register %1% %2%: %3%", method, pattern, reason);

  throw route_conflict{std::string{method} + " " + std::string{pattern} +
                       ": " + reason};
}
} // namespace


class route_tree::node {
public:
  enum class kind {
    literal,
    parameter,
    catch_all,
  };

  struct segment {
    kind             type;
    std::string_view str;
  };

  using segment_list = std::vector<segment>;
  using path_tokens  = std::vector<std::string_view>;


  static segment_list parse(std::string_view pattern) {
    path_tokens tokens = http::url::segments(pattern);

    segment_list retval;
    retval.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
      std::string_view token = tokens[i];
      if (token.empty() == false && token.front() == ':') {
        if (token.size() == 1) {
          throw std::invalid_argument{"empty parameter name in pattern: " +
                                      std::string{pattern}};
        }

        retval.push_back(segment{kind::parameter, token.substr(1)});
      } else if (token.empty() == false && token.front() == '*') {
        if (token.size() == 1) {
          throw std::invalid_argument{"empty catch-all name in pattern: " +
                                      std::string{pattern}};
        }
        if (i + 1 != tokens.size()) {
          throw std::invalid_argument{
              "catch-all must be the last segment in pattern: " +
              std::string{pattern}};
        }

        retval.push_back(segment{kind::catch_all, token.substr(1)});
      } else {
        retval.push_back(segment{kind::literal, token});
      }
    }

    return retval;
  }


  void check(const segment_list &segments,
             size_t              index,
             std::string_view    method,
             std::string_view    pattern) const {
    if (index == segments.size()) {
      if (value_.has_value()) {
        throw_conflict(method, pattern, "route already registered");
      }
      return;
    }

    const segment &current = segments[index];
    const node *   next    = nullptr;
    switch (current.type) {
    case kind::literal:
      if (catch_all_) {
        throw_conflict(method,
                       pattern,
                       "segment '" + std::string{current.str} +
                           "' conflicts with catch-all '*" + catch_all_name_ +
                           "'");
      }

      if (auto found = literals_.find(current.str); found != literals_.end()) {
        next = found->second.get();
      }
      break;
    case kind::parameter:
      if (catch_all_) {
        throw_conflict(method,
                       pattern,
                       "parameter ':" + std::string{current.str} +
                           "' conflicts with catch-all '*" + catch_all_name_ +
                           "'");
      }

      if (parameter_) {
        if (parameter_name_ != current.str) {
          throw_conflict(method,
                         pattern,
                         "parameter ':" + std::string{current.str} +
                             "' conflicts with parameter ':" +
                             parameter_name_ + "'");
        }
        next = parameter_.get();
      }
      break;
    case kind::catch_all:
      if (parameter_ || literals_.empty() == false) {
        throw_conflict(method,
                       pattern,
                       "catch-all '*" + std::string{current.str} +
                           "' conflicts with existing segments");
      }

      if (catch_all_) {
        if (catch_all_name_ != current.str) {
          throw_conflict(method,
                         pattern,
                         "catch-all '*" + std::string{current.str} +
                             "' conflicts with catch-all '*" +
                             catch_all_name_ + "'");
        }
        next = catch_all_.get();
      }
      break;
    }

    if (next != nullptr) {
      next->check(segments, index + 1, method, pattern);
    }
  }

  /**\note must be called only after check
   */
  route &insert(const segment_list &segments, size_t index, route value) {
    if (index == segments.size()) {
      value_ = std::move(value);
      return value_.value();
    }

    const segment &current = segments[index];
    node_ptr *     next    = nullptr;
    switch (current.type) {
    case kind::literal:
      next = &literals_[std::string{current.str}];
      break;
    case kind::parameter:
      if (parameter_ == nullptr) {
        parameter_name_ = current.str;
      }
      next = &parameter_;
      break;
    case kind::catch_all:
      if (catch_all_ == nullptr) {
        catch_all_name_ = current.str;
      }
      next = &catch_all_;
      break;
    }

    if (*next == nullptr) {
      *next = std::make_unique<node>();
    }

    return (*next)->insert(segments, index + 1, std::move(value));
  }

  /**\param path the path from which tokens were taken, used for catch-all
   */
  const route *match(const path_tokens &tokens,
                     size_t             index,
                     std::string_view   path,
                     OUTPUT http::url::args &params) const {
    if (index == tokens.size()) {
      return value_.has_value() ? &value_.value() : nullptr;
    }

    std::string_view token = tokens[index];

    if (auto found = literals_.find(token); found != literals_.end()) {
      if (const route *retval =
              found->second->match(tokens, index + 1, path, params)) {
        return retval;
      }
    }

    if (parameter_ && token.empty() == false) {
      auto arg = params.emplace(parameter_name_, std::string{token});
      if (const route *retval =
              parameter_->match(tokens, index + 1, path, params)) {
        return retval;
      }

      // this branch doesn't match, so forget its argument
      params.erase(arg);
    }

    if (catch_all_ && catch_all_->value_.has_value()) {
      size_t offset = token.data() - path.data();
      params.emplace(catch_all_name_, std::string{path.substr(offset)});
      return &catch_all_->value_.value();
    }

    return nullptr;
  }

private:
  std::map<std::string, node_ptr, std::less<>> literals_;

  node_ptr    parameter_;
  std::string parameter_name_;

  node_ptr    catch_all_;
  std::string catch_all_name_;

  std::optional<route> value_;
};


route_tree::route_tree() = default;

route_tree::~route_tree() = default;

route &route_tree::insert(std::string_view method,
                          std::string_view pattern,
                          route            value) {
  if (method.empty()) {
    throw std::invalid_argument{"empty method for pattern: " +
                                std::string{pattern}};
  }

  node::segment_list segments = node::parse(pattern);

  auto found = trees_.find(method);
  if (found != trees_.end()) {
    found->second->check(segments, 0, method, pattern);
  } else {
    found =
        trees_.emplace(std::string{method}, std::make_unique<node>()).first;
  }

  return found->second->insert(segments, 0, std::move(value));
}

route_tree::result route_tree::resolve(std::string_view method,
                                       std::string_view path) const {
  result retval;
  if (const route *matched = this->match(method, path, retval.params)) {
    retval.status  = outcome::found;
    retval.matched = matched;
    return retval;
  }

  retval.params.clear();
  retval.allowed = this->allowed(path, method);
  retval.status  = retval.allowed.empty() ? outcome::not_found
                                          : outcome::method_not_allowed;
  return retval;
}

const route *route_tree::match(std::string_view method,
                               std::string_view path,
                               OUTPUT http::url::args &params) const {
  if (path.empty() || path.front() != '/') {
    return nullptr;
  }

  auto found = trees_.find(method);
  if (found == trees_.end()) {
    return nullptr;
  }

  node::path_tokens tokens = http::url::segments(path);
  return found->second->match(tokens, 0, path, params);
}

std::vector<std::string> route_tree::allowed(std::string_view path,
                                             std::string_view except) const {
  std::vector<std::string> retval;
  for (const auto &[method, tree] : trees_) {
    if (method == except) {
      continue;
    }

    http::url::args params;
    if (this->match(method, path, params) != nullptr) {
      retval.emplace_back(method);
    }
  }

  return retval;
}

bool route_tree::recommend_trailing_slash(std::string_view method,
                                          std::string_view path) const {
  if (path.empty()) {
    return false;
  }

  std::string toggled{path};
  if (toggled.back() == '/') {
    toggled.pop_back();
  } else {
    toggled.push_back('/');
  }

  http::url::args params;
  return this->match(method, toggled, params) != nullptr;
}
} // namespace restcov
