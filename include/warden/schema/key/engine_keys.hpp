#pragma once

#include <warden/schema/key/builder.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <optional>
#include <string_view>

// Canonical key prefixes for ledger state held in the storage backend.
namespace warden::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kRecordKeyPrefix{"SYS|STATE|RECORD|"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};

inline warden::schema::bytes_t make_record_key(
    const warden::schema::address_t& address) {
  return builder{}.write(kRecordKeyPrefix).write(address).data;
}

/// Address embedded in a record key, or nothing for foreign keys.
inline std::optional<warden::schema::address_t> parse_record_key(
    const warden::schema::bytes_view_t& key) {
  const auto prefix = make_bytes_view(kRecordKeyPrefix);
  if (key.size() != prefix.size() + 32 ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return make_hash32(key.subspan(prefix.size()));
}

}  // namespace warden::schema::key
