#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error kind.
// Stable rejection taxonomy; callers branch on these values, so existing
// numbers never change.
namespace warden::schema {

enum class error_kind : uint16_t {
  missing_endorsement = 1,
  invalid_controller = 2,
  invalid_derived_address = 3,
  relationship_mismatch = 4,
  type_tag_mismatch = 5,
  arithmetic_overflow = 6,
  arithmetic_underflow = 7,
  division_by_zero = 8,
  unauthorized_invocation_target = 9,
  sequencing_violation = 10,
  derivation_exhausted = 11,
  custom_constraint_failed = 12,
  record_exists = 20,
  record_missing = 21,
  record_not_mutable = 22,
  fixed_address_mismatch = 23,
  invalid_close_target = 24,
  invalid_seeds = 25,
  type_tag_collision = 26,
  unknown_operation = 27,
  slot_count_mismatch = 28,
  duplicate_mutable_slot = 29,
  invalid_endorsement = 30,
  unknown_component = 31,
  invocation_depth_exceeded = 32,
  address_out_of_scope = 33,
  insufficient_funds = 34,
  invalid_payload = 35,
  invalid_specification = 36,
};

inline constexpr auto kErrorKindMappings = std::array{
    enum_mapping_t<error_kind>{"missing_endorsement",
                               error_kind::missing_endorsement},
    enum_mapping_t<error_kind>{"invalid_controller",
                               error_kind::invalid_controller},
    enum_mapping_t<error_kind>{"invalid_derived_address",
                               error_kind::invalid_derived_address},
    enum_mapping_t<error_kind>{"relationship_mismatch",
                               error_kind::relationship_mismatch},
    enum_mapping_t<error_kind>{"type_tag_mismatch",
                               error_kind::type_tag_mismatch},
    enum_mapping_t<error_kind>{"arithmetic_overflow",
                               error_kind::arithmetic_overflow},
    enum_mapping_t<error_kind>{"arithmetic_underflow",
                               error_kind::arithmetic_underflow},
    enum_mapping_t<error_kind>{"division_by_zero",
                               error_kind::division_by_zero},
    enum_mapping_t<error_kind>{"unauthorized_invocation_target",
                               error_kind::unauthorized_invocation_target},
    enum_mapping_t<error_kind>{"sequencing_violation",
                               error_kind::sequencing_violation},
    enum_mapping_t<error_kind>{"derivation_exhausted",
                               error_kind::derivation_exhausted},
    enum_mapping_t<error_kind>{"custom_constraint_failed",
                               error_kind::custom_constraint_failed},
    enum_mapping_t<error_kind>{"record_exists", error_kind::record_exists},
    enum_mapping_t<error_kind>{"record_missing", error_kind::record_missing},
    enum_mapping_t<error_kind>{"record_not_mutable",
                               error_kind::record_not_mutable},
    enum_mapping_t<error_kind>{"fixed_address_mismatch",
                               error_kind::fixed_address_mismatch},
    enum_mapping_t<error_kind>{"invalid_close_target",
                               error_kind::invalid_close_target},
    enum_mapping_t<error_kind>{"invalid_seeds", error_kind::invalid_seeds},
    enum_mapping_t<error_kind>{"type_tag_collision",
                               error_kind::type_tag_collision},
    enum_mapping_t<error_kind>{"unknown_operation",
                               error_kind::unknown_operation},
    enum_mapping_t<error_kind>{"slot_count_mismatch",
                               error_kind::slot_count_mismatch},
    enum_mapping_t<error_kind>{"duplicate_mutable_slot",
                               error_kind::duplicate_mutable_slot},
    enum_mapping_t<error_kind>{"invalid_endorsement",
                               error_kind::invalid_endorsement},
    enum_mapping_t<error_kind>{"unknown_component",
                               error_kind::unknown_component},
    enum_mapping_t<error_kind>{"invocation_depth_exceeded",
                               error_kind::invocation_depth_exceeded},
    enum_mapping_t<error_kind>{"address_out_of_scope",
                               error_kind::address_out_of_scope},
    enum_mapping_t<error_kind>{"insufficient_funds",
                               error_kind::insufficient_funds},
    enum_mapping_t<error_kind>{"invalid_payload", error_kind::invalid_payload},
    enum_mapping_t<error_kind>{"invalid_specification",
                               error_kind::invalid_specification},
};

template <>
inline std::optional<error_kind> try_from_string<error_kind>(
    const std::string_view value) {
  return from_string(value, kErrorKindMappings);
}

inline constexpr std::string_view to_string(const error_kind value) {
  return to_string(value, kErrorKindMappings).value_or("unknown");
}

/// Failures that point at a caller or specification bug; resubmitting with
/// different data cannot succeed.
inline constexpr bool is_retryable(const error_kind value) {
  return value != error_kind::derivation_exhausted &&
         value != error_kind::sequencing_violation &&
         value != error_kind::invalid_specification &&
         value != error_kind::type_tag_collision;
}

}  // namespace warden::schema
