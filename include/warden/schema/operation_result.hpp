#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::schema {

/// Final state of a record the operation created or modified.
struct record_written_t final {
  resource_record_t record;
};

struct record_closed_t final {
  address_t address{};
  address_t beneficiary{};
};

struct invocation_issued_t final {
  component_id_t target{};
  bytes_t payload;
};

using effect_t =
    std::variant<record_written_t, record_closed_t, invocation_issued_t>;

struct accepted_t final {
  std::vector<effect_t> effects;
  /// Nonce found or verified for every slot carrying a derived address.
  std::map<std::size_t, uint8_t> derived_nonces;
};

struct rejected_t final {
  error_kind kind{};
  uint32_t custom_code{};
  std::optional<std::size_t> slot_index{std::nullopt};
  std::string message;
};

using operation_result_t = std::variant<accepted_t, rejected_t>;

inline rejected_t make_rejected(const error_t& error) {
  return rejected_t{.kind = error.kind,
                    .custom_code = error.custom_code,
                    .slot_index = error.slot_index,
                    .message = error.message};
}

inline bool is_accepted(const operation_result_t& result) {
  return std::holds_alternative<accepted_t>(result);
}

}  // namespace warden::schema
