#pragma once
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <cstdint>

namespace warden::schema {

template <uint16_t Version>
struct resource_record;

template <>
struct resource_record<1> final {
  uint16_t version{1};
  address_t address{};
  component_id_t controller{};
  type_tag_t type_tag{};
  bytes_t payload;
  bool is_mutable{true};
};

using resource_record_t = resource_record<1>;

/// Controller of records nobody owns; closed records are handed back to it.
inline constexpr component_id_t kNeutralController{};

inline bool is_closed(const resource_record_t& record) {
  return record.controller == kNeutralController &&
         record.type_tag == type_tag_t{} &&
         std::all_of(std::begin(record.payload), std::end(record.payload),
                     [](const uint8_t byte) { return byte == 0; });
}

/// Zero the payload and tag, then reassign the address to the neutral
/// controller.
inline void close_record(resource_record_t& record) {
  std::fill(std::begin(record.payload), std::end(record.payload), uint8_t{0});
  record.type_tag = type_tag_t{};
  record.controller = kNeutralController;
}

}  // namespace warden::schema
