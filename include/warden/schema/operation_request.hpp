#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace warden::schema {

/// One resource reference in a request, with the role the caller declares
/// for it.
struct slot_ref_t final {
  address_t address{};
  bool writable{false};
};

/// Proof that `identity` authorized this request.
struct endorsement_t final {
  identity_t identity{};
  ed25519_signature_t signature{};
};

template <uint16_t Version>
struct operation_request;

template <>
struct operation_request<1> final {
  uint16_t version{1};
  hash32_t operation_id{};
  std::string operation_type;
  std::vector<slot_ref_t> slots;
  std::vector<endorsement_t> endorsements;
  bytes_t payload;
};

using operation_request_t = operation_request<1>;

}  // namespace warden::schema
