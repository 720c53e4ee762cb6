#include <spdlog/spdlog.h>
#include <warden/execution/invocation_guard.hpp>

#include <utility>

namespace warden::execution {

invocation_guard::invocation_guard(std::set<schema::component_id_t> whitelist)
    : whitelist_{std::move(whitelist)} {}

schema::status_t invocation_guard::authorize(
    const schema::component_id_t& target) const {
  if (whitelist_.contains(target)) {
    return std::nullopt;
  }
  spdlog::warn("Blocked invocation of non-whitelisted component {}",
               schema::to_hex(target));
  return schema::make_error(schema::error_kind::unauthorized_invocation_target,
                            "component " + schema::to_hex(target) +
                                " is not an allowed invocation target");
}

const std::set<schema::component_id_t>& invocation_guard::whitelist() const {
  return whitelist_;
}

}  // namespace warden::execution
