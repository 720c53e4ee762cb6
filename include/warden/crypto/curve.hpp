#pragma once

#include <warden/schema/primitives.hpp>

namespace warden::crypto {

/// True when `point` decodes to a point of the ed25519 curve, i.e. when it
/// could be the public key of some signing identity.
///
/// Uses the RFC 8032 compressed encoding: little-endian y with the sign of x
/// in the top bit. Non-canonical y (y >= p) is treated as off the curve.
bool is_on_ed25519_curve(const warden::schema::hash32_t& point);

}  // namespace warden::crypto
