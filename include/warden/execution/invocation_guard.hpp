#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>

#include <set>

namespace warden::execution {

/// Fixed whitelist of components an operation may invoke.
class invocation_guard final {
 public:
  invocation_guard() = default;
  explicit invocation_guard(std::set<schema::component_id_t> whitelist);

  /// `unauthorized_invocation_target` unless `target` is whitelisted.
  schema::status_t authorize(const schema::component_id_t& target) const;

  const std::set<schema::component_id_t>& whitelist() const;

 private:
  std::set<schema::component_id_t> whitelist_;
};

}  // namespace warden::execution
