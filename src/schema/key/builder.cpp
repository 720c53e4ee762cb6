#include <warden/blake3/hash.hpp>
#include <warden/schema/key/builder.hpp>

#include <algorithm>
#include <iterator>

namespace warden::schema::key {

builder& builder::write(const std::string_view& str) {
  std::ranges::copy(str, std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  return write(warden::blake3::hash(str));
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  return write(warden::blake3::hash(bytes));
}

}  // namespace warden::schema::key
