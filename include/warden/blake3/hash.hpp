#pragma once
#include <warden/schema/primitives.hpp>

#include <blake3.h>

#include <cstdint>
#include <span>
#include <string_view>

namespace warden::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);
  hasher& update(uint8_t byte);

  warden::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace warden::blake3
