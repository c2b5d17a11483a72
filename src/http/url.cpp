// url.cpp

#include "restcov/http/url.hpp"
#include <algorithm>
#include <list>
#include <regex>


const std::regex split_query_reg{R"(&)"};

const std::regex path_from_url{R"(\/[^?]*)"};
const std::regex query_from_url{R"(\?(.+))"};


namespace restcov::http {
std::string_view url::get_path(std::string_view target) noexcept {
  std::cmatch match;
  if (std::regex_search(target.begin(), target.end(), match, path_from_url)) {
    return std::string_view(match[0].first,
                            std::distance(match[0].first, match[0].second));
  }

  return {};
}

std::string_view url::get_query(std::string_view target) noexcept {
  std::cmatch match;
  if (std::regex_search(target.begin(), target.end(), match, query_from_url) &&
      match.size() >= 2) {
    return std::string_view(match[1].first,
                            std::distance(match[1].first, match[1].second));
  }

  return {};
}



std::vector<std::string_view> url::segments(std::string_view path) {
  if (path.empty() || path.front() != '/') {
    throw std::invalid_argument{"invalid path: path must starts with /"};
  }

  std::vector<std::string_view> retval;
  size_t                        cursor = 1; // skip first slash
  for (;;) {
    size_t slash = path.find('/', cursor);
    if (slash == std::string_view::npos) {
      retval.emplace_back(path.substr(cursor));
      break;
    }

    retval.emplace_back(path.substr(cursor, slash - cursor));
    cursor = slash + 1;
  }

  return retval;
}

std::string url::clean_path(std::string_view path) {
  if (path.empty()) {
    return "/";
  }

  std::vector<std::string_view> elements;
  bool                          trailing = false;

  size_t cursor = 0;
  while (cursor <= path.size()) {
    size_t slash = std::min(path.find('/', cursor), path.size());

    std::string_view element = path.substr(cursor, slash - cursor);
    bool             is_last = slash == path.size();
    if (element.empty() || element == ".") {
      trailing = is_last;
    } else if (element == "..") {
      if (elements.empty() == false) {
        elements.pop_back();
      }
      trailing = is_last;
    } else {
      elements.emplace_back(element);
      trailing = false;
    }

    cursor = slash + 1;
  }

  std::string retval = "/";
  for (const std::string_view &element : elements) {
    retval.append(element);
    retval.push_back('/');
  }

  if (elements.empty() == false && trailing == false) {
    retval.pop_back();
  }

  return retval;
}

std::string url::decode_path(std::string_view path) {
  auto hex_value = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  };

  std::string retval;
  retval.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size()) {
      int high = hex_value(path[i + 1]);
      int low  = hex_value(path[i + 2]);
      if (high >= 0 && low >= 0) {
        retval.push_back(static_cast<char>(high * 16 + low));
        i += 2;
        continue;
      }
    }

    retval.push_back(path[i]);
  }

  return retval;
}


url::query::args url::query::split(std::string_view query) noexcept {
  std::list<std::string> tokens;
  std::copy(std::cregex_token_iterator{query.begin(),
                                       query.end(),
                                       split_query_reg,
                                       -1},
            std::cregex_token_iterator{},
            std::back_inserter(tokens));

  args retval;
  for (const std::string &token : tokens) {
    if (auto found = std::find(token.begin(), token.end(), '=');
        found != token.end()) {
      retval.emplace(std::string{token.begin(), found},
                     std::string{std::next(found), token.end()});
    } else { // token contains only key
      retval.emplace(token, "");
    }
  }

  return retval;
}
} // namespace restcov::http
