#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/operation_request.hpp>
#include <warden/schema/operation_result.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <vector>

namespace warden::execution {

class engine;
class state_overlay;

/// Handed to a component for the duration of one invocation.
///
/// Reads see everything the calling operation has committed, limited to the
/// addresses the overlay is scoped to. A nested request runs through the full
/// constraint battery under the caller's locks and inherits the caller's
/// verified endorsements; its effects are appended to the caller's.
class invocation_context final {
 public:
  invocation_context(const engine& engine,
                     state_overlay& overlay,
                     const schema::component_id_t& caller,
                     const std::set<schema::identity_t>& inherited,
                     std::vector<schema::effect_t>& effects,
                     std::size_t depth);

  std::optional<schema::resource_record_t> load(
      const schema::address_t& address) const;

  schema::operation_result_t reenter(
      const schema::operation_request_t& request);

  const schema::component_id_t& caller() const { return caller_; }
  std::size_t depth() const { return depth_; }

 private:
  const engine& engine_;
  state_overlay& overlay_;
  const schema::component_id_t& caller_;
  const std::set<schema::identity_t>& inherited_;
  std::vector<schema::effect_t>& effects_;
  std::size_t depth_{};
};

/// An invocable unit of business logic outside the calling operation.
class component {
 public:
  virtual ~component() = default;

  virtual schema::status_t invoke(invocation_context& context,
                                  const schema::bytes_t& payload) = 0;
};

}  // namespace warden::execution
