#pragma once

#include <warden/execution/authorization_checker.hpp>
#include <warden/execution/component.hpp>
#include <warden/execution/constraint.hpp>
#include <warden/execution/constraint_evaluator.hpp>
#include <warden/execution/invocation_guard.hpp>
#include <warden/execution/mutation_sequencer.hpp>
#include <warden/execution/signature_verifier.hpp>
#include <warden/execution/state_overlay.hpp>
#include <warden/execution/type_tag_registry.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/error.hpp>
#include <warden/schema/operation_request.hpp>
#include <warden/schema/operation_result.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/record_type.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace warden::execution {

struct engine_options final {
  /// Components an operation may invoke. Fixed for the engine's lifetime.
  std::set<schema::component_id_t> invocation_whitelist;
  /// When false, endorsement signatures are not checked. Test setups only.
  bool require_strict_crypto{true};
  std::size_t max_invocation_depth{4};
};

class operation_context;

using handler_t = std::function<schema::status_t(operation_context&)>;

/// Static signature of one operation type.
struct operation_spec_t final {
  std::string name;
  /// Component that owns the operation; created records are controlled by it
  /// and derived addresses are derived under it.
  schema::component_id_t component{};
  std::vector<slot_spec_t> slots;
  handler_t handler;
};

struct engine_config final {
  engine_options options;
  std::vector<schema::record_type_t> record_types;
  std::vector<operation_spec_t> operations;
  std::map<schema::component_id_t, std::shared_ptr<component>> components;
};

/// Bytes every endorsement signs: the SCALE encoding of the request version,
/// operation id, operation type, slot references and payload.
schema::bytes_t make_signing_message(const schema::operation_request_t& request);

/// View of an admitted operation given to its handler.
///
/// Record writes are staged and reach the overlay only on `commit()`;
/// `invoke()` is refused until then. Slots closed by the operation are closed
/// as part of that commit. The first failed invocation fails the operation
/// whatever the handler returns.
class operation_context final {
 public:
  operation_context(const schema::operation_request_t& request,
                    const operation_spec_t& operation,
                    const authorization_context& authorization,
                    std::vector<evaluated_slot_t> slots,
                    const mutation_sequencer& sequencer);

  const schema::operation_request_t& request() const { return request_; }
  const schema::component_id_t& component() const {
    return operation_.component;
  }
  const authorization_context& authorization() const {
    return authorization_;
  }
  std::size_t slot_count() const { return slots_.size(); }
  const schema::address_t& address(std::size_t slot) const;
  bool created(std::size_t slot) const;
  std::optional<uint8_t> derived_nonce(std::size_t slot) const;

  /// Staged version of the record if there is one, otherwise the record the
  /// constraint battery saw.
  std::optional<schema::resource_record_t> record(std::size_t slot) const;

  /// Request payload decoded as `T`; `invalid_payload` when malformed.
  template <typename T>
  schema::result_t<T> payload() const;

  /// Record payload of a slot decoded as `T`.
  template <typename T>
  schema::result_t<T> read(std::size_t slot) const;

  /// Encode `value` as the new payload of a slot's record and stage it.
  template <typename T>
  schema::status_t write(std::size_t slot, const T& value);

  /// Only writable slots of records controlled by this operation's component
  /// can be staged.
  schema::status_t stage(schema::resource_record_t record);
  schema::status_t commit();
  schema::status_t invoke(const schema::component_id_t& target,
                          const schema::bytes_t& payload);

  const mutation_handle& handle() const { return handle_; }
  const schema::status_t& invocation_failure() const {
    return invocation_failure_;
  }

 private:
  schema::result_t<std::size_t> writable_slot(
      const schema::address_t& address) const;

  const schema::operation_request_t& request_;
  const operation_spec_t& operation_;
  const authorization_context& authorization_;
  std::vector<evaluated_slot_t> slots_;
  const mutation_sequencer& sequencer_;
  mutation_handle handle_;
  schema::status_t invocation_failure_;
};

/// Gatekeeper for state-changing operations.
///
/// Every request is matched to its operation specification, its endorsements
/// are verified, the constraint battery runs against a snapshot and only then
/// does the handler execute. Any failure leaves the overlay as it was.
class engine final {
 public:
  /// Registers record types and validates every operation specification.
  /// An invalid configuration is fatal.
  explicit engine(engine_config config);

  /// Run a request to completion against `overlay`.
  schema::operation_result_t process(const schema::operation_request_t& request,
                                     state_overlay& overlay) const;

  /// Admission only: resolve, authorize and evaluate constraints without
  /// running the handler.
  schema::operation_result_t check(const schema::operation_request_t& request,
                                   const state_overlay& overlay) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const type_tag_registry& types() const { return types_; }
  const engine_options& options() const { return options_; }

  /// Nested request issued from `invocation_context::reenter`.
  schema::operation_result_t process_nested(
      const schema::operation_request_t& request,
      state_overlay& overlay,
      const std::set<schema::identity_t>& inherited,
      std::size_t depth) const;

 private:
  struct admission_t final {
    const operation_spec_t* operation{nullptr};
    authorization_context authorization;
    std::vector<evaluated_slot_t> slots;
  };

  schema::result_t<admission_t> admit(
      const schema::operation_request_t& request,
      const state_overlay& overlay,
      const std::set<schema::identity_t>& inherited) const;

  schema::result_t<authorization_context> authorize(
      const schema::operation_request_t& request,
      const std::set<schema::identity_t>& inherited) const;

  schema::operation_result_t execute(const schema::operation_request_t& request,
                                     state_overlay& overlay,
                                     const std::set<schema::identity_t>& inherited,
                                     std::size_t depth) const;

  schema::status_t dispatch(const schema::component_id_t& target,
                            const schema::bytes_t& payload,
                            state_overlay& overlay,
                            const admission_t& admission,
                            std::size_t depth,
                            std::vector<schema::effect_t>& effects) const;

  const operation_spec_t* find_operation(std::string_view name) const;

  engine_options options_;
  type_tag_registry types_;
  std::map<std::string, operation_spec_t, std::less<>> operations_;
  std::map<schema::component_id_t, std::shared_ptr<component>> components_;
  invocation_guard guard_;
  signature_verifier_t signature_verifier_;
};

template <typename T>
schema::result_t<T> operation_context::payload() const {
  auto encoder = schema::encoding::scale_encoder_t{};
  auto decoded = encoder.try_decode<T>(request_.payload);
  if (!decoded.has_value()) {
    return schema::make_error(schema::error_kind::invalid_payload,
                              "malformed " + request_.operation_type +
                                  " payload");
  }
  return std::move(decoded).value();
}

template <typename T>
schema::result_t<T> operation_context::read(const std::size_t slot) const {
  auto current = record(slot);
  if (!current.has_value()) {
    return schema::make_slot_error(schema::error_kind::record_missing, slot,
                                   "slot has no record");
  }
  auto encoder = schema::encoding::scale_encoder_t{};
  auto decoded = encoder.try_decode<T>(current->payload);
  if (!decoded.has_value()) {
    return schema::make_slot_error(schema::error_kind::invalid_payload, slot,
                                   "record payload does not decode");
  }
  return std::move(decoded).value();
}

template <typename T>
schema::status_t operation_context::write(const std::size_t slot,
                                          const T& value) {
  auto current = record(slot);
  if (!current.has_value()) {
    return schema::make_slot_error(schema::error_kind::record_missing, slot,
                                   "slot has no record");
  }
  auto encoder = schema::encoding::scale_encoder_t{};
  current->payload = encoder.encode(value);
  return stage(std::move(*current));
}

}  // namespace warden::execution
