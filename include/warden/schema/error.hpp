#pragma once

#include <warden/schema/error_kind.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace warden::schema {

struct error_t final {
  error_kind kind{};
  /// Only meaningful for `custom_constraint_failed`.
  uint32_t custom_code{};
  std::optional<std::size_t> slot_index{std::nullopt};
  std::string message;
};

/// `std::nullopt` means the check passed.
using status_t = std::optional<error_t>;

template <typename T>
using result_t = std::variant<T, error_t>;

inline error_t make_error(const error_kind kind, std::string message = {}) {
  return error_t{.kind = kind, .message = std::move(message)};
}

inline error_t make_slot_error(const error_kind kind,
                               const std::size_t slot_index,
                               std::string message = {}) {
  return error_t{
      .kind = kind, .slot_index = slot_index, .message = std::move(message)};
}

template <typename T>
bool succeeded(const result_t<T>& result) {
  return std::holds_alternative<T>(result);
}

template <typename T>
const T& value_of(const result_t<T>& result) {
  return std::get<T>(result);
}

template <typename T>
const error_t& error_of(const result_t<T>& result) {
  return std::get<error_t>(result);
}

}  // namespace warden::schema
