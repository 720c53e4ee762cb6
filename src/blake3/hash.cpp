#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<warden::schema::hash32_t>);

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const uint8_t byte) {
  blake3_hasher_update(&state_, &byte, 1);
  return *this;
}

warden::schema::hash32_t hasher::finalize() const {
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

warden::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace warden::blake3
