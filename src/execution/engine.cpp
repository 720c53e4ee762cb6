#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/execution/engine.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <tuple>
#include <utility>
#include <variant>

namespace warden::execution {

namespace {

using slot_encoding_t = std::tuple<schema::address_t, bool>;

schema::operation_result_t reject(const schema::operation_request_t& request,
                                  const schema::error_t& error) {
  spdlog::warn("Rejected '{}' operation {}: {}{}{}", request.operation_type,
               schema::to_hex(request.operation_id),
               schema::to_string(error.kind),
               error.slot_index.has_value()
                   ? " at slot " + std::to_string(*error.slot_index)
                   : std::string{},
               error.message.empty() ? std::string{} : " (" + error.message + ")");
  return schema::make_rejected(error);
}

std::map<std::size_t, uint8_t> collect_nonces(
    const std::vector<evaluated_slot_t>& slots) {
  auto nonces = std::map<std::size_t, uint8_t>{};
  for (std::size_t index = 0; index < slots.size(); ++index) {
    if (slots[index].derived_nonce.has_value()) {
      nonces.emplace(index, *slots[index].derived_nonce);
    }
  }
  return nonces;
}

}  // namespace

schema::bytes_t make_signing_message(
    const schema::operation_request_t& request) {
  auto slots = std::vector<slot_encoding_t>{};
  slots.reserve(request.slots.size());
  for (const auto& slot : request.slots) {
    slots.emplace_back(slot.address, slot.writable);
  }
  auto encoder = schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{
      request.version, request.operation_id,
      schema::make_bytes(std::string_view{request.operation_type}), slots,
      request.payload});
}

invocation_context::invocation_context(
    const engine& engine,
    state_overlay& overlay,
    const schema::component_id_t& caller,
    const std::set<schema::identity_t>& inherited,
    std::vector<schema::effect_t>& effects,
    const std::size_t depth)
    : engine_{engine},
      overlay_{overlay},
      caller_{caller},
      inherited_{inherited},
      effects_{effects},
      depth_{depth} {}

std::optional<schema::resource_record_t> invocation_context::load(
    const schema::address_t& address) const {
  if (!overlay_.in_scope(address)) {
    spdlog::warn("Component read of {} outside the locked addresses",
                 schema::to_hex(address));
    return std::nullopt;
  }
  return overlay_.load(address);
}

schema::operation_result_t invocation_context::reenter(
    const schema::operation_request_t& request) {
  auto result = engine_.process_nested(request, overlay_, inherited_, depth_);
  if (auto* accepted = std::get_if<schema::accepted_t>(&result)) {
    effects_.insert(std::end(effects_), std::begin(accepted->effects),
                    std::end(accepted->effects));
  }
  return result;
}

operation_context::operation_context(
    const schema::operation_request_t& request,
    const operation_spec_t& operation,
    const authorization_context& authorization,
    std::vector<evaluated_slot_t> slots,
    const mutation_sequencer& sequencer)
    : request_{request},
      operation_{operation},
      authorization_{authorization},
      slots_{std::move(slots)},
      sequencer_{sequencer},
      handle_{sequencer.begin_mutation()} {}

const schema::address_t& operation_context::address(
    const std::size_t slot) const {
  return request_.slots.at(slot).address;
}

bool operation_context::created(const std::size_t slot) const {
  return slots_.at(slot).created;
}

std::optional<uint8_t> operation_context::derived_nonce(
    const std::size_t slot) const {
  return slots_.at(slot).derived_nonce;
}

std::optional<schema::resource_record_t> operation_context::record(
    const std::size_t slot) const {
  const auto& target = address(slot);
  const auto& staged = handle_.staged();
  auto found = std::find_if(std::begin(staged), std::end(staged),
                            [&](const schema::resource_record_t& record) {
                              return record.address == target;
                            });
  if (found != std::end(staged)) {
    return *found;
  }
  return slots_.at(slot).record;
}

schema::result_t<std::size_t> operation_context::writable_slot(
    const schema::address_t& address) const {
  for (std::size_t index = 0; index < request_.slots.size(); ++index) {
    if (request_.slots[index].address == address &&
        request_.slots[index].writable) {
      return index;
    }
  }
  return schema::make_error(schema::error_kind::record_not_mutable,
                            "record " + schema::to_hex(address) +
                                " is not referenced by a writable slot");
}

schema::status_t operation_context::stage(schema::resource_record_t record) {
  auto slot = writable_slot(record.address);
  if (!schema::succeeded(slot)) {
    return schema::error_of(slot);
  }
  const auto index = schema::value_of(slot);
  const auto& evaluated = slots_[index];
  if (!evaluated.created) {
    if (!evaluated.record.has_value()) {
      return schema::make_slot_error(schema::error_kind::record_missing, index,
                                     "slot has no record");
    }
    if (!evaluated.record->is_mutable) {
      return schema::make_slot_error(schema::error_kind::record_not_mutable,
                                     index, "record is immutable");
    }
    if (evaluated.record->controller != operation_.component) {
      return schema::make_slot_error(
          schema::error_kind::invalid_controller, index,
          "record is controlled by " +
              schema::to_hex(evaluated.record->controller));
    }
  }
  return sequencer_.stage(handle_, std::move(record));
}

schema::status_t operation_context::commit() {
  for (std::size_t index = 0;
       !handle_.committed() && index < slots_.size(); ++index) {
    if (!slots_[index].close_beneficiary.has_value()) {
      continue;
    }
    auto closing = record(index);
    if (!closing.has_value()) {
      return schema::make_slot_error(schema::error_kind::record_missing, index,
                                     "closed record vanished");
    }
    schema::close_record(*closing);
    if (auto failed = sequencer_.stage(handle_, std::move(*closing))) {
      return failed;
    }
  }
  return sequencer_.commit(handle_);
}

schema::status_t operation_context::invoke(const schema::component_id_t& target,
                                           const schema::bytes_t& payload) {
  auto failed = sequencer_.invoke_external(handle_, target, payload);
  if (failed.has_value() && !invocation_failure_.has_value()) {
    invocation_failure_ = failed;
  }
  return failed;
}

engine::engine(engine_config config)
    : options_{std::move(config.options)},
      components_{std::move(config.components)},
      guard_{options_.invocation_whitelist} {
  spdlog::info("Initializing warden engine with {} record type(s) and {} "
               "operation(s)",
               config.record_types.size(), config.operations.size());

  for (auto& type : config.record_types) {
    if (auto failed = types_.register_type(std::move(type))) {
      warden::common::critical("Invalid record type: {}", failed->message);
    }
  }

  for (auto& operation : config.operations) {
    if (auto invalid = validate_operation_spec(operation.slots, types_)) {
      warden::common::critical("Invalid specification for '{}': {}",
                               operation.name, invalid->message);
    }
    if (operations_.contains(operation.name)) {
      warden::common::critical("Duplicate operation '{}'", operation.name);
    }
    auto name = operation.name;
    operations_.emplace(std::move(name), std::move(operation));
  }

  if (!options_.require_strict_crypto) {
    spdlog::warn("Strict crypto disabled; endorsement signatures are not "
                 "verified");
  } else if (!warden::crypto::available()) {
    warden::common::critical("OpenSSL does not provide ed25519");
  }
  for (const auto& target : options_.invocation_whitelist) {
    if (!components_.contains(target)) {
      spdlog::warn("Whitelisted component {} has no implementation",
                   schema::to_hex(target));
    }
  }
  spdlog::info("Warden engine ready; {} invocation target(s) whitelisted",
               options_.invocation_whitelist.size());
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  signature_verifier_ = std::move(verifier);
}

schema::operation_result_t engine::process(
    const schema::operation_request_t& request,
    state_overlay& overlay) const {
  return execute(request, overlay, {}, 0);
}

schema::operation_result_t engine::process_nested(
    const schema::operation_request_t& request,
    state_overlay& overlay,
    const std::set<schema::identity_t>& inherited,
    const std::size_t depth) const {
  return execute(request, overlay, inherited, depth);
}

schema::operation_result_t engine::check(
    const schema::operation_request_t& request,
    const state_overlay& overlay) const {
  auto admitted = admit(request, overlay, {});
  if (!schema::succeeded(admitted)) {
    return reject(request, schema::error_of(admitted));
  }
  return schema::accepted_t{
      .derived_nonces = collect_nonces(schema::value_of(admitted).slots)};
}

const operation_spec_t* engine::find_operation(
    const std::string_view name) const {
  auto found = operations_.find(name);
  return found == std::end(operations_) ? nullptr : &found->second;
}

schema::result_t<authorization_context> engine::authorize(
    const schema::operation_request_t& request,
    const std::set<schema::identity_t>& inherited) const {
  auto identities = inherited;
  if (request.endorsements.empty()) {
    return authorization_context{std::move(identities)};
  }

  const auto message = make_signing_message(request);
  for (const auto& endorsement : request.endorsements) {
    if (options_.require_strict_crypto) {
      const auto valid =
          signature_verifier_
              ? signature_verifier_(message, endorsement.identity,
                                    endorsement.signature)
              : warden::crypto::verify_signature(
                    message, endorsement.identity, endorsement.signature);
      if (!valid) {
        return schema::make_error(schema::error_kind::invalid_endorsement,
                                  "bad signature from " +
                                      schema::to_hex(endorsement.identity));
      }
    }
    identities.insert(endorsement.identity);
  }
  return authorization_context{std::move(identities)};
}

schema::result_t<engine::admission_t> engine::admit(
    const schema::operation_request_t& request,
    const state_overlay& overlay,
    const std::set<schema::identity_t>& inherited) const {
  const auto* operation = find_operation(request.operation_type);
  if (operation == nullptr) {
    return schema::make_error(schema::error_kind::unknown_operation,
                              "unknown operation '" + request.operation_type +
                                  "'");
  }
  if (request.version != 1) {
    return schema::make_error(schema::error_kind::invalid_payload,
                              "unsupported request version " +
                                  std::to_string(request.version));
  }
  if (request.slots.size() != operation->slots.size()) {
    return schema::make_error(
        schema::error_kind::slot_count_mismatch,
        "expected " + std::to_string(operation->slots.size()) +
            " slot(s), got " + std::to_string(request.slots.size()));
  }
  for (std::size_t index = 0; index < request.slots.size(); ++index) {
    const auto& slot = request.slots[index];
    if (!overlay.in_scope(slot.address)) {
      return schema::make_slot_error(schema::error_kind::address_out_of_scope,
                                     index,
                                     "address " + schema::to_hex(slot.address) +
                                         " is not locked by this operation");
    }
    for (std::size_t other = index + 1; other < request.slots.size(); ++other) {
      const auto& duplicate = request.slots[other];
      if (duplicate.address == slot.address &&
          (duplicate.writable || slot.writable)) {
        return schema::make_slot_error(
            schema::error_kind::duplicate_mutable_slot, other,
            "slot aliases writable slot " + std::to_string(index));
      }
    }
  }

  auto authorization = authorize(request, inherited);
  if (!schema::succeeded(authorization)) {
    return schema::error_of(authorization);
  }

  auto evaluator = constraint_evaluator{types_, operation->slots, request,
                                        schema::value_of(authorization),
                                        operation->component};
  if (auto rejected = evaluator.run([&](const schema::address_t& address) {
        return overlay.load(address);
      })) {
    return *rejected;
  }
  return admission_t{
      .operation = operation,
      .authorization = std::get<authorization_context>(std::move(authorization)),
      .slots = evaluator.slots()};
}

schema::operation_result_t engine::execute(
    const schema::operation_request_t& request,
    state_overlay& overlay,
    const std::set<schema::identity_t>& inherited,
    const std::size_t depth) const {
  auto admitted = admit(request, overlay, inherited);
  if (!schema::succeeded(admitted)) {
    return reject(request, schema::error_of(admitted));
  }
  const auto& admission = schema::value_of(admitted);
  const auto& operation = *admission.operation;

  auto closes = std::map<schema::address_t, schema::address_t>{};
  for (std::size_t index = 0; index < admission.slots.size(); ++index) {
    if (const auto& beneficiary = admission.slots[index].close_beneficiary) {
      closes.emplace(request.slots[index].address,
                     request.slots[*beneficiary].address);
    }
  }

  auto savepoint = overlay.savepoint();
  auto effects = std::vector<schema::effect_t>{};
  auto sequencer = mutation_sequencer{
      guard_,
      [&](const std::vector<schema::resource_record_t>& staged) {
        for (const auto& record : staged) {
          overlay.write(record);
          if (auto closed = closes.find(record.address);
              closed != std::end(closes)) {
            effects.push_back(schema::record_closed_t{
                .address = record.address, .beneficiary = closed->second});
          } else {
            effects.push_back(schema::record_written_t{.record = record});
          }
        }
      },
      [&](const schema::component_id_t& target,
          const schema::bytes_t& payload) {
        return dispatch(target, payload, overlay, admission, depth, effects);
      }};
  auto context = operation_context{request, operation, admission.authorization,
                                   admission.slots, sequencer};

  auto failure = schema::status_t{};
  for (const auto& slot : admission.slots) {
    if (slot.created && !failure.has_value()) {
      failure = context.stage(*slot.record);
    }
  }
  if (!failure.has_value() && operation.handler) {
    failure = operation.handler(context);
  }
  if (context.invocation_failure().has_value()) {
    failure = context.invocation_failure();
  }
  if (!failure.has_value() && !context.handle().committed()) {
    failure = context.commit();
  }

  if (failure.has_value()) {
    overlay.restore(std::move(savepoint));
    return reject(request, *failure);
  }

  spdlog::debug("Accepted '{}' operation {} with {} effect(s)",
                request.operation_type, schema::to_hex(request.operation_id),
                effects.size());
  return schema::accepted_t{.effects = std::move(effects),
                            .derived_nonces = collect_nonces(admission.slots)};
}

schema::status_t engine::dispatch(const schema::component_id_t& target,
                                  const schema::bytes_t& payload,
                                  state_overlay& overlay,
                                  const admission_t& admission,
                                  const std::size_t depth,
                                  std::vector<schema::effect_t>& effects) const {
  if (depth + 1 > options_.max_invocation_depth) {
    return schema::make_error(schema::error_kind::invocation_depth_exceeded,
                              "invocation depth limit " +
                                  std::to_string(options_.max_invocation_depth) +
                                  " reached");
  }
  auto found = components_.find(target);
  if (found == std::end(components_) || !found->second) {
    return schema::make_error(schema::error_kind::unknown_component,
                              "no component registered as " +
                                  schema::to_hex(target));
  }
  const auto mark = effects.size();
  effects.push_back(
      schema::invocation_issued_t{.target = target, .payload = payload});
  auto savepoint = overlay.savepoint();
  auto context = invocation_context{*this,
                                    overlay,
                                    admission.operation->component,
                                    admission.authorization.identities(),
                                    effects,
                                    depth + 1};
  if (auto failed = found->second->invoke(context, payload)) {
    overlay.restore(std::move(savepoint));
    effects.erase(
        std::next(std::begin(effects), static_cast<std::ptrdiff_t>(mark)),
        std::end(effects));
    return failed;
  }
  return std::nullopt;
}

}  // namespace warden::execution
