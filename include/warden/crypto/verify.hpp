#pragma once

#include <warden/schema/primitives.hpp>

namespace warden::crypto {

/// True when the linked OpenSSL exposes ed25519.
bool available();

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::identity_t& signer,
                      const warden::schema::ed25519_signature_t& signature);

}  // namespace warden::crypto
