#include <spdlog/spdlog.h>
#include <warden/execution/address_derivation.hpp>
#include <warden/execution/constraint_evaluator.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace warden::execution {

namespace {

std::string describe(const std::size_t index, const slot_spec_t& spec) {
  return "slot " + std::to_string(index) + " (" + spec.name + ")";
}

schema::error_t invalid_spec(const std::size_t index,
                             const slot_spec_t& spec,
                             const std::string& reason) {
  return schema::make_slot_error(schema::error_kind::invalid_specification,
                                 index, describe(index, spec) + ": " + reason);
}

bool creates(const slot_spec_t& spec) {
  return std::any_of(std::begin(spec.constraints), std::end(spec.constraints),
                     [](const constraint_t& constraint) {
                       return constraint.kind() == constraint_kind::create;
                     });
}

}  // namespace

constraint_evaluator::constraint_evaluator(
    const type_tag_registry& types,
    const std::vector<slot_spec_t>& slots,
    const schema::operation_request_t& request,
    const authorization_context& authorization,
    const schema::component_id_t& component)
    : types_{types},
      specs_{slots},
      request_{request},
      authorization_{authorization},
      component_{component} {}

schema::status_t constraint_evaluator::run(const record_lookup_t& lookup) {
  if (state_ != evaluation_state::pending) {
    return rejection_;
  }
  state_ = evaluation_state::evaluating;

  if (request_.slots.size() != specs_.size()) {
    state_ = evaluation_state::rejected;
    rejection_ = schema::make_error(
        schema::error_kind::slot_count_mismatch,
        "expected " + std::to_string(specs_.size()) + " slot(s), got " +
            std::to_string(request_.slots.size()));
    return rejection_;
  }

  slots_.assign(specs_.size(), evaluated_slot_t{});
  for (std::size_t index = 0; index < specs_.size(); ++index) {
    if (auto failed = evaluate_slot(index, lookup)) {
      state_ = evaluation_state::rejected;
      rejection_ = std::move(failed);
      spdlog::debug("Constraint battery rejected {} at {}: {}",
                    request_.operation_type, describe(index, specs_[index]),
                    schema::to_string(rejection_->kind));
      return rejection_;
    }
  }
  current_kind_.reset();
  state_ = evaluation_state::accepted;
  return std::nullopt;
}

evaluation_state constraint_evaluator::state() const {
  return state_;
}

std::optional<constraint_kind> constraint_evaluator::current_kind() const {
  return current_kind_;
}

const schema::status_t& constraint_evaluator::rejection() const {
  return rejection_;
}

const std::vector<evaluated_slot_t>& constraint_evaluator::slots() const {
  return slots_;
}

schema::status_t constraint_evaluator::evaluate_slot(
    const std::size_t index,
    const record_lookup_t& lookup) {
  const auto& spec = specs_[index];
  auto& slot = slots_[index];
  slot.record = lookup(request_.slots[index].address);

  // Typed payloads are never interpreted before the tag is confirmed.
  if (spec.type.has_value() && !creates(spec)) {
    if (!slot.record.has_value()) {
      return schema::make_slot_error(schema::error_kind::record_missing, index,
                                     describe(index, spec) + " has no record");
    }
    if (auto mismatch = types_.verify(*slot.record, *spec.type)) {
      mismatch->slot_index = index;
      return mismatch;
    }
  }

  for (const auto kind : kConstraintKindOrder) {
    current_kind_ = kind;
    for (const auto& constraint : spec.constraints) {
      if (constraint.kind() != kind) {
        continue;
      }
      if (auto failed = evaluate(index, constraint)) {
        return failed;
      }
    }
  }
  return std::nullopt;
}

schema::status_t constraint_evaluator::evaluate(
    const std::size_t index,
    const constraint_t& constraint) {
  auto failed = std::visit(
      [&](const auto& params) { return check(index, params); },
      constraint.parameters);
  if (!failed.has_value()) {
    return std::nullopt;
  }
  failed->slot_index = index;
  if (constraint.error.has_value() &&
      failed->kind == default_error(constraint.kind())) {
    failed->kind = *constraint.error;
  }
  return failed;
}

schema::status_t constraint_evaluator::check(const std::size_t index,
                                             const require_create_t& params) {
  auto& slot = slots_[index];
  const auto& spec = specs_[index];
  if (slot.record.has_value() && !schema::is_closed(*slot.record)) {
    return schema::make_error(schema::error_kind::record_exists,
                              describe(index, spec) + " already holds a record");
  }
  if (!request_.slots[index].writable) {
    return schema::make_error(schema::error_kind::record_not_mutable,
                              describe(index, spec) +
                                  " must be writable to be created");
  }
  slot.record = schema::resource_record_t{
      .address = request_.slots[index].address,
      .controller = component_,
      .type_tag = spec.type.has_value() ? types_.tag_for(*spec.type)
                                        : schema::type_tag_t{},
      .payload = schema::bytes_t(params.space, 0),
      .is_mutable = true};
  slot.created = true;
  return std::nullopt;
}

schema::status_t constraint_evaluator::check(const std::size_t index,
                                             const require_mutable_t&) {
  const auto& slot = slots_[index];
  const auto& spec = specs_[index];
  if (!request_.slots[index].writable) {
    return schema::make_error(schema::error_kind::record_not_mutable,
                              describe(index, spec) + " is not writable");
  }
  if (!slot.record.has_value()) {
    return schema::make_error(schema::error_kind::record_missing,
                              describe(index, spec) + " has no record");
  }
  if (!slot.record->is_mutable) {
    return schema::make_error(schema::error_kind::record_not_mutable,
                              describe(index, spec) + " record is immutable");
  }
  return std::nullopt;
}

schema::status_t constraint_evaluator::check(
    const std::size_t index,
    const require_endorsement_t& params) {
  auto identity = schema::identity_t{};
  if (std::holds_alternative<endorsed_by_slot_t>(params.source)) {
    identity = request_.slots[index].address;
  } else if (const auto* fixed =
                 std::get_if<schema::identity_t>(&params.source)) {
    identity = *fixed;
  } else {
    const auto& source = std::get<endorsed_by_field_t>(params.source);
    auto field = read_field(index, source.field, identity.size());
    if (!schema::succeeded(field)) {
      return schema::error_of(field);
    }
    identity = schema::make_hash32(schema::value_of(field));
  }
  return require_endorsement(authorization_, identity);
}

schema::status_t constraint_evaluator::check(
    const std::size_t index,
    const require_derived_address_t& params) {
  auto seeds = std::vector<schema::bytes_t>{};
  seeds.reserve(params.seeds.size());
  for (const auto& seed : params.seeds) {
    if (const auto* literal = std::get_if<schema::bytes_t>(&seed)) {
      seeds.push_back(*literal);
      continue;
    }
    const auto other = std::get<seed_slot_address_t>(seed).slot;
    if (other >= request_.slots.size()) {
      return invalid_spec(index, specs_[index], "seed slot out of range");
    }
    const auto& address = request_.slots[other].address;
    seeds.emplace_back(std::begin(address), std::end(address));
  }

  auto& slot = slots_[index];
  const auto& address = request_.slots[index].address;
  if (!params.nonce_field.has_value() || slot.created) {
    auto derived = derive(seeds, component_);
    if (!schema::succeeded(derived)) {
      return schema::error_of(derived);
    }
    const auto& canonical = schema::value_of(derived);
    if (canonical.address != address) {
      return schema::make_error(
          schema::error_kind::invalid_derived_address,
          describe(index, specs_[index]) +
              " is not the canonical derived address");
    }
    slot.derived_nonce = canonical.nonce;
    if (params.nonce_field.has_value() && slot.created) {
      auto layout = types_.field(*specs_[index].type, *params.nonce_field);
      if (layout.has_value() && layout->offset < slot.record->payload.size()) {
        slot.record->payload[layout->offset] = canonical.nonce;
      }
    }
    return std::nullopt;
  }

  auto stored = read_field(index, *params.nonce_field, 1);
  if (!schema::succeeded(stored)) {
    return schema::error_of(stored);
  }
  const auto nonce = schema::value_of(stored)[0];
  if (auto invalid = validate_seeds(seeds)) {
    return invalid;
  }
  if (!verify(address, seeds, nonce, component_)) {
    return schema::make_error(schema::error_kind::invalid_derived_address,
                              describe(index, specs_[index]) +
                                  " does not match its stored nonce " +
                                  std::to_string(nonce));
  }
  slot.derived_nonce = nonce;
  return std::nullopt;
}

schema::status_t constraint_evaluator::check(
    const std::size_t index,
    const require_relationship_t& params) {
  if (params.other_slot >= request_.slots.size()) {
    return invalid_spec(index, specs_[index], "related slot out of range");
  }
  auto field = read_field(index, params.field, sizeof(schema::address_t));
  if (!schema::succeeded(field)) {
    return schema::error_of(field);
  }
  const auto& stored = schema::value_of(field);
  const auto& expected = request_.slots[params.other_slot].address;
  if (!std::equal(std::begin(stored), std::end(stored), std::begin(expected),
                  std::end(expected))) {
    return schema::make_error(
        schema::error_kind::relationship_mismatch,
        describe(index, specs_[index]) + " field '" + params.field +
            "' does not reference slot " + std::to_string(params.other_slot));
  }
  return std::nullopt;
}

schema::status_t constraint_evaluator::check(
    const std::size_t index,
    const require_controller_t& params) {
  const auto& slot = slots_[index];
  if (!slot.record.has_value()) {
    return schema::make_error(schema::error_kind::record_missing,
                              describe(index, specs_[index]) +
                                  " has no record");
  }
  return require_controller(*slot.record, params.component.value_or(component_));
}

schema::status_t constraint_evaluator::check(
    const std::size_t index,
    const require_fixed_address_t& params) {
  if (request_.slots[index].address == params.address) {
    return std::nullopt;
  }
  return schema::make_error(schema::error_kind::fixed_address_mismatch,
                            describe(index, specs_[index]) + " must be " +
                                schema::to_hex(params.address));
}

schema::status_t constraint_evaluator::check(
    const std::size_t index,
    const require_custom_predicate_t& params) {
  if (!params.predicate) {
    return invalid_spec(index, specs_[index],
                        "predicate '" + params.name + "' is empty");
  }
  const auto& slot = slots_[index];
  auto code = params.predicate(predicate_input_t{
      .slot_index = index,
      .record = slot.record.has_value() ? &*slot.record : nullptr,
      .request = request_,
      .authorization = authorization_});
  if (!code.has_value()) {
    return std::nullopt;
  }
  auto failure = schema::make_error(
      schema::error_kind::custom_constraint_failed,
      describe(index, specs_[index]) + " failed predicate '" + params.name +
          "'");
  failure.custom_code = *code;
  return failure;
}

schema::status_t constraint_evaluator::check(const std::size_t index,
                                             const require_close_t& params) {
  const auto beneficiary = params.beneficiary_slot;
  const auto& spec = specs_[index];
  if (beneficiary == index || beneficiary >= request_.slots.size()) {
    return schema::make_error(schema::error_kind::invalid_close_target,
                              describe(index, spec) +
                                  " has no valid beneficiary slot");
  }
  if (!request_.slots[index].writable ||
      !request_.slots[beneficiary].writable) {
    return schema::make_error(schema::error_kind::invalid_close_target,
                              describe(index, spec) +
                                  " and its beneficiary must be writable");
  }
  if (request_.slots[beneficiary].address == request_.slots[index].address) {
    return schema::make_error(schema::error_kind::invalid_close_target,
                              describe(index, spec) +
                                  " cannot be its own beneficiary");
  }
  if (!slots_[index].record.has_value()) {
    return schema::make_error(schema::error_kind::record_missing,
                              describe(index, spec) + " has no record");
  }
  slots_[index].close_beneficiary = beneficiary;
  return std::nullopt;
}

schema::result_t<schema::bytes_view_t> constraint_evaluator::read_field(
    const std::size_t index,
    const std::string& field,
    const std::size_t width) const {
  const auto& spec = specs_[index];
  const auto& slot = slots_[index];
  if (!slot.record.has_value()) {
    return schema::make_error(schema::error_kind::record_missing,
                              describe(index, spec) + " has no record");
  }
  if (!spec.type.has_value()) {
    return invalid_spec(index, spec, "raw slot has no field '" + field + "'");
  }
  auto layout = types_.field(*spec.type, field);
  if (!layout.has_value() || layout->size != width) {
    return invalid_spec(index, spec,
                        "field '" + field + "' is not " +
                            std::to_string(width) + " bytes wide");
  }
  auto bytes = type_tag_registry::read_field(*slot.record, *layout);
  if (!bytes.has_value()) {
    return schema::make_error(schema::error_kind::invalid_payload,
                              describe(index, spec) +
                                  " payload is too short for '" + field + "'");
  }
  return *bytes;
}

schema::status_t validate_operation_spec(const std::vector<slot_spec_t>& slots,
                                         const type_tag_registry& types) {
  for (std::size_t index = 0; index < slots.size(); ++index) {
    const auto& spec = slots[index];
    if (spec.type.has_value() && !types.contains(*spec.type)) {
      return invalid_spec(index, spec, "unknown type '" + *spec.type + "'");
    }

    auto field_error =
        [&](const std::string& name,
            const std::size_t width) -> std::optional<std::string> {
      if (!spec.type.has_value()) {
        return "field '" + name + "' used on a raw slot";
      }
      auto layout = types.field(*spec.type, name);
      if (!layout.has_value()) {
        return "unknown field '" + name + "'";
      }
      if (layout->size != width) {
        return "field '" + name + "' must be " + std::to_string(width) +
               " bytes wide";
      }
      return std::nullopt;
    };

    auto create_space = std::optional<std::size_t>{};
    for (const auto& constraint : spec.constraints) {
      if (const auto* create =
              std::get_if<require_create_t>(&constraint.parameters)) {
        if (!spec.type.has_value()) {
          return invalid_spec(index, spec, "cannot create a raw slot");
        }
        if (create_space.has_value()) {
          return invalid_spec(index, spec, "more than one create constraint");
        }
        create_space = create->space;
      }
    }

    for (const auto& constraint : spec.constraints) {
      auto problem = std::visit(
          overloaded{
              [&](const require_endorsement_t& params)
                  -> std::optional<std::string> {
                if (const auto* source =
                        std::get_if<endorsed_by_field_t>(&params.source)) {
                  return field_error(source->field,
                                     sizeof(schema::identity_t));
                }
                return std::nullopt;
              },
              [&](const require_derived_address_t& params)
                  -> std::optional<std::string> {
                if (params.seeds.size() > kMaxSeeds) {
                  return "too many derivation seeds";
                }
                for (const auto& seed : params.seeds) {
                  if (const auto* literal = std::get_if<schema::bytes_t>(&seed);
                      literal != nullptr && literal->size() > kMaxSeedLength) {
                    return "derivation seed longer than " +
                           std::to_string(kMaxSeedLength) + " bytes";
                  }
                  if (const auto* other = std::get_if<seed_slot_address_t>(&seed);
                      other != nullptr && other->slot >= slots.size()) {
                    return "seed slot out of range";
                  }
                }
                if (!params.nonce_field.has_value()) {
                  return std::nullopt;
                }
                if (auto unusable = field_error(*params.nonce_field, 1)) {
                  return unusable;
                }
                auto layout = types.field(*spec.type, *params.nonce_field);
                if (create_space.has_value() &&
                    layout->offset + layout->size > *create_space) {
                  return "nonce field lies outside the created payload";
                }
                return std::nullopt;
              },
              [&](const require_relationship_t& params)
                  -> std::optional<std::string> {
                if (params.other_slot >= slots.size()) {
                  return "related slot out of range";
                }
                return field_error(params.field, sizeof(schema::address_t));
              },
              [&](const require_custom_predicate_t& params)
                  -> std::optional<std::string> {
                if (!params.predicate) {
                  return "predicate '" + params.name + "' is empty";
                }
                return std::nullopt;
              },
              [&](const require_close_t& params) -> std::optional<std::string> {
                if (params.beneficiary_slot >= slots.size() ||
                    params.beneficiary_slot == index) {
                  return "invalid close beneficiary slot";
                }
                return std::nullopt;
              },
              [](const auto&) -> std::optional<std::string> {
                return std::nullopt;
              }},
          constraint.parameters);
      if (problem.has_value()) {
        return invalid_spec(index, spec, *problem);
      }
    }
  }
  return std::nullopt;
}

}  // namespace warden::execution
