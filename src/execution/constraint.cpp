#include <warden/execution/constraint.hpp>

#include <type_traits>
#include <utility>

namespace warden::execution {

namespace {

template <constraint_kind Kind, typename T>
inline constexpr auto kind_matches_v = std::is_same_v<
    std::variant_alternative_t<static_cast<std::size_t>(Kind),
                               constraint_parameters_t>,
    T>;

static_assert(kind_matches_v<constraint_kind::create, require_create_t>);
static_assert(kind_matches_v<constraint_kind::mutable_, require_mutable_t>);
static_assert(
    kind_matches_v<constraint_kind::endorsement, require_endorsement_t>);
static_assert(kind_matches_v<constraint_kind::derived_address,
                             require_derived_address_t>);
static_assert(
    kind_matches_v<constraint_kind::relationship, require_relationship_t>);
static_assert(
    kind_matches_v<constraint_kind::controller, require_controller_t>);
static_assert(
    kind_matches_v<constraint_kind::fixed_address, require_fixed_address_t>);
static_assert(kind_matches_v<constraint_kind::custom_predicate,
                             require_custom_predicate_t>);
static_assert(kind_matches_v<constraint_kind::close, require_close_t>);

}  // namespace

std::string_view to_string(const constraint_kind kind) {
  switch (kind) {
    case constraint_kind::create:
      return "create";
    case constraint_kind::mutable_:
      return "mutable";
    case constraint_kind::endorsement:
      return "endorsement";
    case constraint_kind::derived_address:
      return "derived_address";
    case constraint_kind::relationship:
      return "relationship";
    case constraint_kind::controller:
      return "controller";
    case constraint_kind::fixed_address:
      return "fixed_address";
    case constraint_kind::custom_predicate:
      return "custom_predicate";
    case constraint_kind::close:
      return "close";
  }
  return "unknown";
}

schema::error_kind default_error(const constraint_kind kind) {
  switch (kind) {
    case constraint_kind::create:
      return schema::error_kind::record_exists;
    case constraint_kind::mutable_:
      return schema::error_kind::record_not_mutable;
    case constraint_kind::endorsement:
      return schema::error_kind::missing_endorsement;
    case constraint_kind::derived_address:
      return schema::error_kind::invalid_derived_address;
    case constraint_kind::relationship:
      return schema::error_kind::relationship_mismatch;
    case constraint_kind::controller:
      return schema::error_kind::invalid_controller;
    case constraint_kind::fixed_address:
      return schema::error_kind::fixed_address_mismatch;
    case constraint_kind::custom_predicate:
      return schema::error_kind::custom_constraint_failed;
    case constraint_kind::close:
      return schema::error_kind::invalid_close_target;
  }
  return schema::error_kind::invalid_specification;
}

namespace constraints {

constraint_t create(const std::size_t space) {
  return constraint_t{.parameters = require_create_t{.space = space}};
}

constraint_t writable() {
  return constraint_t{.parameters = require_mutable_t{}};
}

constraint_t endorsed_by_self() {
  return constraint_t{.parameters = require_endorsement_t{}};
}

constraint_t endorsed_by(const schema::identity_t& identity) {
  return constraint_t{.parameters =
                          require_endorsement_t{.source = identity}};
}

constraint_t endorsed_by_field(std::string field) {
  return constraint_t{
      .parameters = require_endorsement_t{
          .source = endorsed_by_field_t{.field = std::move(field)}}};
}

constraint_t derived_address(std::vector<seed_t> seeds,
                             std::optional<std::string> nonce_field) {
  return constraint_t{.parameters = require_derived_address_t{
                          .seeds = std::move(seeds),
                          .nonce_field = std::move(nonce_field)}};
}

constraint_t has_one(const std::size_t other_slot, std::string field) {
  return constraint_t{.parameters = require_relationship_t{
                          .other_slot = other_slot, .field = std::move(field)}};
}

constraint_t controlled_by(std::optional<schema::component_id_t> component) {
  return constraint_t{
      .parameters = require_controller_t{.component = std::move(component)}};
}

constraint_t fixed_address(const schema::address_t& address) {
  return constraint_t{.parameters =
                          require_fixed_address_t{.address = address}};
}

constraint_t predicate(std::string name, predicate_t predicate) {
  return constraint_t{.parameters = require_custom_predicate_t{
                          .name = std::move(name),
                          .predicate = std::move(predicate)}};
}

constraint_t close_to(const std::size_t beneficiary_slot) {
  return constraint_t{.parameters = require_close_t{
                          .beneficiary_slot = beneficiary_slot}};
}

constraint_t with_error(constraint_t constraint,
                        const schema::error_kind error) {
  constraint.error = error;
  return constraint;
}

}  // namespace constraints

}  // namespace warden::execution
