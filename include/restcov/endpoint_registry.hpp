// endpoint_registry.hpp

#pragma once

#include <mutex>
#include <optional>
#include <restcov/endpoint.hpp>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace restcov {
/**\brief keeps registered endpoints and count of their calls
 * \note all methods are thread-safe. Every call locks one mutex, so the
 * registry serializes all requests that hit it. Not for high load
 */
class endpoint_registry {
public:
  /**\brief add new endpoint with zero hits
   * \param hidden hidden endpoints are counted, but never listed
   * \return token for hit and get
   */
  endpoint_id record(std::string_view method,
                     std::string_view path,
                     bool             hidden = false);

  /**\brief increment hit counter of the endpoint
   * \note unknown id is an invariant violation. It is logged and asserted,
   * in release build it is ignored
   */
  void hit(endpoint_id id);

  /**\return copy of all not hidden endpoints in unspecified order
   * \param unhit_only if true, then return only endpoints without hits
   */
  std::vector<endpoint> list(bool unhit_only = false) const;

  std::optional<endpoint> get(endpoint_id id) const;

private:
  struct entry {
    endpoint value;
    bool     hidden;
  };

  mutable std::mutex                      mutex_;
  std::unordered_map<endpoint_id, entry> endpoints_;
  endpoint_id                             next_id_ = 0;
};


/**\brief records hit for the endpoint at destruction, so the hit is counted
 * even if the handler throws
 */
class hit_guard {
public:
  hit_guard(endpoint_registry &registry, std::optional<endpoint_id> id) noexcept
      : registry_{registry}
      , id_{id} {
  }

  ~hit_guard() {
    if (id_.has_value()) {
      registry_.hit(id_.value());
    }
  }

  hit_guard(const hit_guard &) = delete;
  hit_guard &operator=(const hit_guard &) = delete;

private:
  endpoint_registry &        registry_;
  std::optional<endpoint_id> id_;
};
} // namespace restcov
