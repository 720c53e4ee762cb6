#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace warden::schema {

/// Fixed-width region of a record payload. Offsets follow the SCALE layout of
/// the record struct, where fixed-size members are stored back to back.
struct field_layout_t final {
  std::string name;
  std::size_t offset{};
  std::size_t size{};
};

struct record_type_t final {
  std::string name;
  std::vector<field_layout_t> fields;
};

}  // namespace warden::schema
