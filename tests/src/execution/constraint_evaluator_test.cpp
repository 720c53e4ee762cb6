#include <gtest/gtest.h>
#include <warden/execution/address_derivation.hpp>
#include <warden/execution/constraint_evaluator.hpp>
#include <warden/testing/common.hpp>

#include <algorithm>
#include <set>
#include <string_view>
#include <vector>

namespace {

namespace constraints = warden::execution::constraints;
using warden::execution::slot_spec_t;
using warden::schema::error_kind;

const auto kProgram = warden::testing::make_hash(0xA0);

struct outcome_t final {
  warden::schema::status_t rejection;
  warden::execution::evaluation_state state{};
  std::optional<warden::execution::constraint_kind> kind;
  std::vector<warden::execution::evaluated_slot_t> slots;
};

struct fixture_t final {
  warden::execution::type_tag_registry types;
  warden::testing::record_map_t records;

  fixture_t() {
    for (const auto* name : {"vault", "account"}) {
      auto failed = types.register_type(warden::schema::record_type_t{
          .name = name,
          .fields = {{.name = "authority", .offset = 0, .size = 32},
                     {.name = "balance", .offset = 32, .size = 8},
                     {.name = "bump", .offset = 40, .size = 1}}});
      EXPECT_FALSE(failed.has_value());
    }
  }

  void put(const warden::schema::address_t& address,
           const std::string_view type,
           const warden::schema::identity_t& authority,
           const uint8_t bump = 0,
           const warden::schema::component_id_t& controller = kProgram) {
    auto payload = warden::schema::bytes_t(41, 0);
    std::copy(std::begin(authority), std::end(authority), std::begin(payload));
    payload[40] = bump;
    records[address] = warden::schema::resource_record_t{
        .address = address,
        .controller = controller,
        .type_tag = types.tag_for(type),
        .payload = std::move(payload)};
  }

  outcome_t evaluate(const std::vector<slot_spec_t>& specs,
                     const warden::schema::operation_request_t& request,
                     std::set<warden::schema::identity_t> identities = {}) {
    auto authorization =
        warden::execution::authorization_context{std::move(identities)};
    auto evaluator = warden::execution::constraint_evaluator{
        types, specs, request, authorization, kProgram};
    auto rejection = evaluator.run(warden::testing::make_loader(records));
    return outcome_t{.rejection = rejection,
                     .state = evaluator.state(),
                     .kind = evaluator.current_kind(),
                     .slots = evaluator.slots()};
  }
};

warden::schema::operation_request_t make_request(
    std::vector<warden::schema::slot_ref_t> slots) {
  auto request = warden::schema::operation_request_t{};
  request.operation_type = "test";
  request.slots = std::move(slots);
  return request;
}

warden::schema::slot_ref_t writable(const warden::schema::address_t& address) {
  return {.address = address, .writable = true};
}

warden::schema::slot_ref_t readonly(const warden::schema::address_t& address) {
  return {.address = address, .writable = false};
}

std::vector<warden::execution::seed_t> vault_seeds() {
  return {warden::schema::make_bytes(std::string_view{"vault"}),
          warden::execution::seed_slot_address_t{.slot = 1}};
}

warden::execution::derived_address_t canonical_vault(
    const warden::schema::address_t& owner) {
  auto seeds = std::vector<warden::schema::bytes_t>{
      warden::schema::make_bytes(std::string_view{"vault"}),
      warden::schema::bytes_t{std::begin(owner), std::end(owner)}};
  auto derived = warden::execution::derive(seeds, kProgram);
  EXPECT_TRUE(warden::schema::succeeded(derived));
  return warden::schema::value_of(derived);
}

}  // namespace

TEST(constraint_evaluator, kinds_run_in_fixed_order_regardless_of_declaration) {
  auto fixture = fixture_t{};
  const auto vault = warden::testing::make_hash(1);
  fixture.put(vault, "vault", warden::testing::make_hash(9));

  auto predicate_calls = 0;
  auto specs = std::vector<slot_spec_t>{slot_spec_t{
      .name = "vault",
      .type = "vault",
      .constraints = {constraints::predicate(
                          "never",
                          [&](const warden::execution::predicate_input_t&)
                              -> std::optional<uint32_t> {
                            ++predicate_calls;
                            return 1;
                          }),
                      constraints::controlled_by(),
                      constraints::endorsed_by_field("authority")}}};

  auto outcome = fixture.evaluate(specs, make_request({writable(vault)}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::missing_endorsement);
  EXPECT_EQ(outcome.rejection->slot_index, 0u);
  EXPECT_EQ(outcome.kind, warden::execution::constraint_kind::endorsement);
  EXPECT_EQ(outcome.state, warden::execution::evaluation_state::rejected);
  EXPECT_EQ(predicate_calls, 0);

  outcome = fixture.evaluate(specs, make_request({writable(vault)}),
                             {warden::testing::make_hash(9)});
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::custom_constraint_failed);
  EXPECT_EQ(outcome.rejection->custom_code, 1u);
  EXPECT_EQ(predicate_calls, 1);
}

TEST(constraint_evaluator, slots_are_evaluated_left_to_right) {
  auto fixture = fixture_t{};
  auto specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "first",
                  .constraints = {constraints::endorsed_by_self()}},
      slot_spec_t{.name = "second",
                  .constraints = {constraints::endorsed_by_self()}}};
  auto outcome = fixture.evaluate(
      specs, make_request({readonly(warden::testing::make_hash(1)),
                           readonly(warden::testing::make_hash(2))}),
      {warden::testing::make_hash(1)});
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->slot_index, 1u);

  outcome = fixture.evaluate(
      specs, make_request({readonly(warden::testing::make_hash(1)),
                           readonly(warden::testing::make_hash(2))}),
      {warden::testing::make_hash(1), warden::testing::make_hash(2)});
  EXPECT_FALSE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.state, warden::execution::evaluation_state::accepted);
  EXPECT_FALSE(outcome.kind.has_value());
}

TEST(constraint_evaluator, error_override_replaces_only_the_default_failure) {
  auto fixture = fixture_t{};
  const auto address = warden::testing::make_hash(1);

  auto endorsement = std::vector<slot_spec_t>{slot_spec_t{
      .name = "signer",
      .constraints = {constraints::with_error(constraints::endorsed_by_self(),
                                              error_kind::invalid_controller)}}};
  auto outcome = fixture.evaluate(endorsement, make_request({readonly(address)}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::invalid_controller);

  // A missing record is not the writable constraint's default failure.
  auto writable_spec = std::vector<slot_spec_t>{slot_spec_t{
      .name = "target",
      .constraints = {constraints::with_error(
          constraints::writable(), error_kind::insufficient_funds)}}};
  outcome = fixture.evaluate(writable_spec, make_request({writable(address)}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::record_missing);

  outcome = fixture.evaluate(writable_spec, make_request({readonly(address)}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::insufficient_funds);
}

TEST(constraint_evaluator, type_is_verified_before_fields_are_read) {
  auto fixture = fixture_t{};
  const auto account = warden::testing::make_hash(1);
  const auto attacker = warden::testing::make_hash(2);
  fixture.put(account, "account", attacker);

  auto specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "vault",
                  .type = "vault",
                  .constraints = {constraints::endorsed_by_field("authority"),
                                  constraints::controlled_by()}}};
  auto outcome =
      fixture.evaluate(specs, make_request({writable(account)}), {attacker});
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::type_tag_mismatch);
  EXPECT_EQ(outcome.rejection->slot_index, 0u);

  auto missing = fixture.evaluate(
      specs, make_request({writable(warden::testing::make_hash(3))}));
  ASSERT_TRUE(missing.rejection.has_value());
  EXPECT_EQ(missing.rejection->kind, error_kind::record_missing);
}

TEST(constraint_evaluator, create_stages_zeroed_record_for_component) {
  auto fixture = fixture_t{};
  const auto address = warden::testing::make_hash(1);
  auto specs = std::vector<slot_spec_t>{slot_spec_t{
      .name = "vault", .type = "vault", .constraints = {constraints::create(41)}}};

  auto outcome = fixture.evaluate(specs, make_request({writable(address)}));
  ASSERT_FALSE(outcome.rejection.has_value());
  const auto& slot = outcome.slots.at(0);
  EXPECT_TRUE(slot.created);
  ASSERT_TRUE(slot.record.has_value());
  EXPECT_EQ(slot.record->controller, kProgram);
  EXPECT_EQ(slot.record->type_tag, fixture.types.tag_for("vault"));
  EXPECT_EQ(slot.record->payload, warden::schema::bytes_t(41, 0));

  auto readonly_outcome =
      fixture.evaluate(specs, make_request({readonly(address)}));
  ASSERT_TRUE(readonly_outcome.rejection.has_value());
  EXPECT_EQ(readonly_outcome.rejection->kind, error_kind::record_not_mutable);
}

TEST(constraint_evaluator, create_refuses_live_records_but_accepts_closed_ones) {
  auto fixture = fixture_t{};
  const auto address = warden::testing::make_hash(1);
  fixture.put(address, "vault", warden::testing::make_hash(9));
  auto specs = std::vector<slot_spec_t>{slot_spec_t{
      .name = "vault", .type = "vault", .constraints = {constraints::create(41)}}};

  auto outcome = fixture.evaluate(specs, make_request({writable(address)}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::record_exists);

  warden::schema::close_record(fixture.records[address]);
  outcome = fixture.evaluate(specs, make_request({writable(address)}));
  EXPECT_FALSE(outcome.rejection.has_value());
}

TEST(constraint_evaluator, derived_address_canonical_and_stored_nonce_paths) {
  auto fixture = fixture_t{};
  const auto owner = warden::testing::make_hash(0x30);
  const auto canonical = canonical_vault(owner);

  auto create_specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "vault",
                  .type = "vault",
                  .constraints = {constraints::create(41),
                                  constraints::derived_address(vault_seeds(),
                                                               "bump")}},
      slot_spec_t{.name = "owner"}};
  auto created = fixture.evaluate(
      create_specs, make_request({writable(canonical.address), readonly(owner)}));
  ASSERT_FALSE(created.rejection.has_value());
  EXPECT_EQ(created.slots.at(0).derived_nonce, canonical.nonce);
  EXPECT_EQ(created.slots.at(0).record->payload[40], canonical.nonce);

  auto wrong = fixture.evaluate(
      create_specs,
      make_request({writable(warden::testing::make_hash(5)), readonly(owner)}));
  ASSERT_TRUE(wrong.rejection.has_value());
  EXPECT_EQ(wrong.rejection->kind, error_kind::invalid_derived_address);

  auto stored_specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "vault",
                  .type = "vault",
                  .constraints = {constraints::derived_address(vault_seeds(),
                                                               "bump")}},
      slot_spec_t{.name = "owner"}};
  fixture.put(canonical.address, "vault", owner, canonical.nonce);
  auto stored = fixture.evaluate(
      stored_specs, make_request({readonly(canonical.address), readonly(owner)}));
  ASSERT_FALSE(stored.rejection.has_value());
  EXPECT_EQ(stored.slots.at(0).derived_nonce, canonical.nonce);

  fixture.put(canonical.address, "vault", owner,
              static_cast<uint8_t>(canonical.nonce + 1));
  auto tampered = fixture.evaluate(
      stored_specs, make_request({readonly(canonical.address), readonly(owner)}));
  ASSERT_TRUE(tampered.rejection.has_value());
  EXPECT_EQ(tampered.rejection->kind, error_kind::invalid_derived_address);
}

TEST(constraint_evaluator, relationship_compares_field_with_other_slot) {
  auto fixture = fixture_t{};
  const auto vault = warden::testing::make_hash(1);
  const auto owner = warden::testing::make_hash(2);
  fixture.put(vault, "vault", owner);
  auto specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "vault",
                  .type = "vault",
                  .constraints = {constraints::has_one(1, "authority")}},
      slot_spec_t{.name = "owner"}};

  EXPECT_FALSE(
      fixture.evaluate(specs, make_request({readonly(vault), readonly(owner)}))
          .rejection.has_value());
  auto mismatch = fixture.evaluate(
      specs,
      make_request({readonly(vault), readonly(warden::testing::make_hash(3))}));
  ASSERT_TRUE(mismatch.rejection.has_value());
  EXPECT_EQ(mismatch.rejection->kind, error_kind::relationship_mismatch);
}

TEST(constraint_evaluator, controller_and_fixed_address_checks) {
  auto fixture = fixture_t{};
  const auto vault = warden::testing::make_hash(1);
  fixture.put(vault, "vault", warden::testing::make_hash(2), 0,
              warden::testing::make_hash(0xEE));

  auto controlled = std::vector<slot_spec_t>{slot_spec_t{
      .name = "vault", .type = "vault", .constraints = {constraints::controlled_by()}}};
  auto outcome = fixture.evaluate(controlled, make_request({readonly(vault)}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::invalid_controller);

  auto explicit_controller = std::vector<slot_spec_t>{slot_spec_t{
      .name = "vault",
      .type = "vault",
      .constraints = {constraints::controlled_by(
          warden::testing::make_hash(0xEE))}}};
  EXPECT_FALSE(fixture.evaluate(explicit_controller, make_request({readonly(vault)}))
                   .rejection.has_value());

  auto pinned = std::vector<slot_spec_t>{slot_spec_t{
      .name = "config",
      .constraints = {constraints::fixed_address(warden::testing::make_hash(7))}}};
  EXPECT_FALSE(
      fixture.evaluate(pinned, make_request({readonly(warden::testing::make_hash(7))}))
          .rejection.has_value());
  auto moved = fixture.evaluate(
      pinned, make_request({readonly(warden::testing::make_hash(8))}));
  ASSERT_TRUE(moved.rejection.has_value());
  EXPECT_EQ(moved.rejection->kind, error_kind::fixed_address_mismatch);
}

TEST(constraint_evaluator, predicate_sees_verified_record) {
  auto fixture = fixture_t{};
  const auto vault = warden::testing::make_hash(1);
  fixture.put(vault, "vault", warden::testing::make_hash(2));

  auto seen = static_cast<const warden::schema::resource_record_t*>(nullptr);
  auto specs = std::vector<slot_spec_t>{slot_spec_t{
      .name = "vault",
      .type = "vault",
      .constraints = {constraints::predicate(
          "inspect",
          [&](const warden::execution::predicate_input_t& input)
              -> std::optional<uint32_t> {
            seen = input.record;
            EXPECT_EQ(input.slot_index, 0u);
            return std::nullopt;
          })}}};
  auto outcome = fixture.evaluate(specs, make_request({readonly(vault)}));
  EXPECT_FALSE(outcome.rejection.has_value());
  EXPECT_NE(seen, nullptr);
}

TEST(constraint_evaluator, close_requires_distinct_writable_beneficiary) {
  auto fixture = fixture_t{};
  const auto vault = warden::testing::make_hash(1);
  const auto beneficiary = warden::testing::make_hash(2);
  fixture.put(vault, "vault", beneficiary);
  auto specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "vault",
                  .type = "vault",
                  .constraints = {constraints::close_to(1)}},
      slot_spec_t{.name = "beneficiary"}};

  auto accepted = fixture.evaluate(
      specs, make_request({writable(vault), writable(beneficiary)}));
  ASSERT_FALSE(accepted.rejection.has_value());
  EXPECT_EQ(accepted.slots.at(0).close_beneficiary, 1u);

  auto readonly_target = fixture.evaluate(
      specs, make_request({writable(vault), readonly(beneficiary)}));
  ASSERT_TRUE(readonly_target.rejection.has_value());
  EXPECT_EQ(readonly_target.rejection->kind, error_kind::invalid_close_target);

  auto self = fixture.evaluate(specs,
                               make_request({writable(vault), writable(vault)}));
  ASSERT_TRUE(self.rejection.has_value());
  EXPECT_EQ(self.rejection->kind, error_kind::invalid_close_target);
}

TEST(constraint_evaluator, evaluator_is_single_use) {
  auto fixture = fixture_t{};
  auto specs = std::vector<slot_spec_t>{slot_spec_t{
      .name = "signer", .constraints = {constraints::endorsed_by_self()}}};
  auto request = make_request({readonly(warden::testing::make_hash(1))});
  auto authorization = warden::execution::authorization_context{};
  auto evaluator = warden::execution::constraint_evaluator{
      fixture.types, specs, request, authorization, kProgram};
  EXPECT_EQ(evaluator.state(), warden::execution::evaluation_state::pending);

  auto first = evaluator.run(warden::testing::make_loader(fixture.records));
  ASSERT_TRUE(first.has_value());
  auto second = evaluator.run(warden::testing::make_loader(fixture.records));
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->kind, first->kind);
  EXPECT_EQ(evaluator.rejection()->kind, error_kind::missing_endorsement);
}

TEST(constraint_evaluator, slot_count_mismatch_is_reported) {
  auto fixture = fixture_t{};
  auto specs = std::vector<slot_spec_t>{slot_spec_t{.name = "only"}};
  auto outcome = fixture.evaluate(specs, make_request({}));
  ASSERT_TRUE(outcome.rejection.has_value());
  EXPECT_EQ(outcome.rejection->kind, error_kind::slot_count_mismatch);
}

TEST(operation_spec_validation, accepts_well_formed_signatures) {
  auto fixture = fixture_t{};
  auto specs = std::vector<slot_spec_t>{
      slot_spec_t{.name = "vault",
                  .type = "vault",
                  .constraints = {constraints::create(41),
                                  constraints::derived_address(vault_seeds(),
                                                               "bump"),
                                  constraints::has_one(1, "authority")}},
      slot_spec_t{.name = "owner",
                  .constraints = {constraints::endorsed_by_self()}}};
  EXPECT_FALSE(
      warden::execution::validate_operation_spec(specs, fixture.types)
          .has_value());
}

TEST(operation_spec_validation, rejects_authoring_mistakes) {
  auto fixture = fixture_t{};
  auto invalid = [&](std::vector<slot_spec_t> specs) {
    auto failed =
        warden::execution::validate_operation_spec(specs, fixture.types);
    return failed.has_value() &&
           failed->kind == error_kind::invalid_specification;
  };

  EXPECT_TRUE(invalid({slot_spec_t{.name = "a", .type = "unknown"}}));
  EXPECT_TRUE(invalid(
      {slot_spec_t{.name = "a", .constraints = {constraints::create(8)}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::create(41), constraints::create(41)}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .constraints = {constraints::endorsed_by_field("authority")}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
                           .name = "a",
                           .type = "vault",
                           .constraints = {constraints::has_one(1, "balance")}},
                       slot_spec_t{.name = "b"}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::has_one(3, "authority")}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::derived_address(
          std::vector<warden::execution::seed_t>(
              warden::execution::kMaxSeeds + 1,
              warden::schema::bytes_t{1}))}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::derived_address(
          {warden::schema::bytes_t(warden::execution::kMaxSeedLength + 1, 1)})}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::derived_address(
          {warden::execution::seed_slot_address_t{.slot = 4}})}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::create(40),
                      constraints::derived_address({}, "bump")}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a",
      .type = "vault",
      .constraints = {constraints::derived_address({}, "balance")}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a", .constraints = {constraints::predicate("empty", {})}}}));
  EXPECT_TRUE(invalid({slot_spec_t{
      .name = "a", .type = "vault", .constraints = {constraints::close_to(0)}}}));
}
