#pragma once
#include <warden/schema/error_kind.hpp>
#include <warden/schema/operation_request.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace warden::execution {

class authorization_context;

struct require_create_t final {
  /// Zero-filled payload size of the new record.
  std::size_t space{};
};

struct require_mutable_t final {};

/// The slot's own address must have endorsed the request.
struct endorsed_by_slot_t final {};
/// A 32-byte identity stored in a field of the slot's record.
struct endorsed_by_field_t final {
  std::string field;
};
using endorsement_source_t =
    std::variant<endorsed_by_slot_t, schema::identity_t, endorsed_by_field_t>;

struct require_endorsement_t final {
  endorsement_source_t source{endorsed_by_slot_t{}};
};

/// Address of another slot used as derivation seed.
struct seed_slot_address_t final {
  std::size_t slot{};
};
using seed_t = std::variant<schema::bytes_t, seed_slot_address_t>;

struct require_derived_address_t final {
  std::vector<seed_t> seeds;
  /// One-byte field holding the stored nonce; canonical search when absent.
  std::optional<std::string> nonce_field{std::nullopt};
};

struct require_relationship_t final {
  std::size_t other_slot{};
  std::string field;
};

struct require_controller_t final {
  /// Defaults to the component that owns the operation.
  std::optional<schema::component_id_t> component{std::nullopt};
};

struct require_fixed_address_t final {
  schema::address_t address{};
};

/// Everything a custom predicate may look at. The record has already passed
/// type, endorsement, derivation, relationship, controller and fixed-address
/// checks declared on the slot.
struct predicate_input_t final {
  std::size_t slot_index{};
  const schema::resource_record_t* record{nullptr};
  const schema::operation_request_t& request;
  const authorization_context& authorization;
};

/// Returns the failure code, or `std::nullopt` when the predicate holds.
using predicate_t =
    std::function<std::optional<uint32_t>(const predicate_input_t&)>;

struct require_custom_predicate_t final {
  std::string name;
  predicate_t predicate;
};

struct require_close_t final {
  std::size_t beneficiary_slot{};
};

/// Alternative order is the evaluation order.
using constraint_parameters_t = std::variant<require_create_t,
                                             require_mutable_t,
                                             require_endorsement_t,
                                             require_derived_address_t,
                                             require_relationship_t,
                                             require_controller_t,
                                             require_fixed_address_t,
                                             require_custom_predicate_t,
                                             require_close_t>;

enum class constraint_kind : uint8_t {
  create = 0,
  mutable_ = 1,
  endorsement = 2,
  derived_address = 3,
  relationship = 4,
  controller = 5,
  fixed_address = 6,
  custom_predicate = 7,
  close = 8,
};

inline constexpr auto kConstraintKindCount =
    std::variant_size_v<constraint_parameters_t>;

inline constexpr auto kConstraintKindOrder =
    std::array{constraint_kind::create,        constraint_kind::mutable_,
               constraint_kind::endorsement,   constraint_kind::derived_address,
               constraint_kind::relationship,  constraint_kind::controller,
               constraint_kind::fixed_address, constraint_kind::custom_predicate,
               constraint_kind::close};

static_assert(kConstraintKindOrder.size() == kConstraintKindCount);

std::string_view to_string(constraint_kind kind);

/// Error reported when a constraint of this kind fails and declares no
/// override.
schema::error_kind default_error(constraint_kind kind);

struct constraint_t final {
  constraint_parameters_t parameters;
  std::optional<schema::error_kind> error{std::nullopt};

  constraint_kind kind() const {
    return static_cast<constraint_kind>(parameters.index());
  }
};

/// A resource-reference slot in an operation signature. Typed slots are
/// verified against the type tag registry before any payload field is read.
struct slot_spec_t final {
  std::string name;
  std::optional<std::string> type{std::nullopt};
  std::vector<constraint_t> constraints;
};

/// Convenience builders used when authoring operation specifications.
namespace constraints {

constraint_t create(std::size_t space);
constraint_t writable();
constraint_t endorsed_by_self();
constraint_t endorsed_by(const schema::identity_t& identity);
constraint_t endorsed_by_field(std::string field);
constraint_t derived_address(std::vector<seed_t> seeds,
                             std::optional<std::string> nonce_field = {});
constraint_t has_one(std::size_t other_slot, std::string field);
constraint_t controlled_by(
    std::optional<schema::component_id_t> component = {});
constraint_t fixed_address(const schema::address_t& address);
constraint_t predicate(std::string name, predicate_t predicate);
constraint_t close_to(std::size_t beneficiary_slot);

/// Replace the default error of a constraint.
constraint_t with_error(constraint_t constraint, schema::error_kind error);

}  // namespace constraints

}  // namespace warden::execution
