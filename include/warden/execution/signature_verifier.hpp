#pragma once

#include <warden/schema/primitives.hpp>
#include <functional>

namespace warden::execution {

using signature_verifier_t =
    std::function<bool(const warden::schema::bytes_view_t& message,
                       const warden::schema::identity_t& signer,
                       const warden::schema::ed25519_signature_t& signature)>;

}  // namespace warden::execution
