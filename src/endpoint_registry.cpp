// endpoint_registry.cpp

#include "restcov/endpoint_registry.hpp"
#include <cassert>
#include <simple_logs/logs.hpp>


namespace restcov {
endpoint_id endpoint_registry::record(std::string_view method,
                                      std::string_view path,
                                      bool             hidden) {
  std::lock_guard<std::mutex> lock{mutex_};

  endpoint_id id = next_id_++;
  endpoints_.emplace(
      id,
      entry{endpoint{std::string{method}, std::string{path}, 0}, hidden});

  return id;
}

void endpoint_registry::hit(endpoint_id id) {
  std::lock_guard<std::mutex> lock{mutex_};

  auto found = endpoints_.find(id);
  if (found == endpoints_.end()) {
    LOG_ERROR("hit for unregistered endpoint: %1%", id);
    assert(false && "hit for unregistered endpoint");
    return;
  }

  ++found->second.value.hits;
}

std::vector<endpoint> endpoint_registry::list(bool unhit_only) const {
  std::lock_guard<std::mutex> lock{mutex_};

  std::vector<endpoint> retval;
  retval.reserve(endpoints_.size());
  for (const auto &[id, item] : endpoints_) {
    if (item.hidden) {
      continue;
    }

    if (unhit_only && item.value.hits > 0) {
      continue;
    }

    retval.emplace_back(item.value);
  }

  return retval;
}

std::optional<endpoint> endpoint_registry::get(endpoint_id id) const {
  std::lock_guard<std::mutex> lock{mutex_};

  if (auto found = endpoints_.find(id); found != endpoints_.end()) {
    return found->second.value;
  }

  return std::nullopt;
}
} // namespace restcov
