#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace warden::schema::key {

/// Byte-string assembler for storage keys and hash preimages.
struct builder final {
  warden::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Append the BLAKE3 digest of the input instead of the input itself.
  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace warden::schema::key
