#pragma once
#include <warden/execution/authorization_checker.hpp>
#include <warden/execution/constraint.hpp>
#include <warden/execution/type_tag_registry.hpp>
#include <warden/schema/error.hpp>
#include <warden/schema/operation_request.hpp>
#include <warden/schema/resource_record.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace warden::execution {

enum class evaluation_state : uint8_t { pending, evaluating, accepted, rejected };

using record_lookup_t = std::function<std::optional<schema::resource_record_t>(
    const schema::address_t&)>;

/// What the battery established about one slot.
struct evaluated_slot_t final {
  /// Record as loaded, or the staged record for a slot being created.
  std::optional<schema::resource_record_t> record{std::nullopt};
  bool created{false};
  std::optional<uint8_t> derived_nonce{std::nullopt};
  std::optional<std::size_t> close_beneficiary{std::nullopt};
};

/// Runs the constraint battery of one operation against a snapshot.
///
/// Slots are evaluated left to right and, within a slot, constraint kinds in
/// `kConstraintKindOrder`. The first failure rejects the evaluation and
/// nothing after it runs. An evaluator is single-use.
class constraint_evaluator final {
 public:
  constraint_evaluator(const type_tag_registry& types,
                       const std::vector<slot_spec_t>& slots,
                       const schema::operation_request_t& request,
                       const authorization_context& authorization,
                       const schema::component_id_t& component);

  schema::status_t run(const record_lookup_t& lookup);

  evaluation_state state() const;
  /// Kind being evaluated, or the kind that failed once rejected.
  std::optional<constraint_kind> current_kind() const;
  const schema::status_t& rejection() const;
  const std::vector<evaluated_slot_t>& slots() const;

 private:
  schema::status_t evaluate_slot(std::size_t index,
                                 const record_lookup_t& lookup);
  schema::status_t evaluate(std::size_t index, const constraint_t& constraint);

  schema::status_t check(std::size_t index, const require_create_t& params);
  schema::status_t check(std::size_t index, const require_mutable_t& params);
  schema::status_t check(std::size_t index,
                         const require_endorsement_t& params);
  schema::status_t check(std::size_t index,
                         const require_derived_address_t& params);
  schema::status_t check(std::size_t index,
                         const require_relationship_t& params);
  schema::status_t check(std::size_t index, const require_controller_t& params);
  schema::status_t check(std::size_t index,
                         const require_fixed_address_t& params);
  schema::status_t check(std::size_t index,
                         const require_custom_predicate_t& params);
  schema::status_t check(std::size_t index, const require_close_t& params);

  schema::result_t<schema::bytes_view_t> read_field(std::size_t index,
                                                    const std::string& field,
                                                    std::size_t width) const;

  const type_tag_registry& types_;
  const std::vector<slot_spec_t>& specs_;
  const schema::operation_request_t& request_;
  const authorization_context& authorization_;
  const schema::component_id_t& component_;

  evaluation_state state_{evaluation_state::pending};
  std::optional<constraint_kind> current_kind_{std::nullopt};
  schema::status_t rejection_{std::nullopt};
  std::vector<evaluated_slot_t> slots_;
};

/// Authoring checks on an operation signature, run once at engine start.
/// Fails with `invalid_specification`.
schema::status_t validate_operation_spec(const std::vector<slot_spec_t>& slots,
                                         const type_tag_registry& types);

}  // namespace warden::execution
