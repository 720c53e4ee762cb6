#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

// Deterministic, off-curve addresses for records owned by a component rather
// than by a key holder.
namespace warden::execution {

inline constexpr std::size_t kMaxSeeds = 16;
inline constexpr std::size_t kMaxSeedLength = 32;
inline constexpr std::string_view kDerivedAddressMarker{
    "warden-derived-address"};

using seeds_view_t = std::span<const schema::bytes_t>;

/// Returns true when a candidate hash is a usable public key.
using curve_check_t = std::function<bool(const schema::hash32_t&)>;

struct derived_address_t final {
  schema::address_t address{};
  uint8_t nonce{};
};

schema::status_t validate_seeds(const seeds_view_t& seeds);

/// Address for one specific nonce, or nothing when the seeds are invalid or
/// the hash lands on the curve.
std::optional<schema::address_t> create_address(
    const seeds_view_t& seeds,
    uint8_t nonce,
    const schema::component_id_t& component);

std::optional<schema::address_t> create_address(
    const seeds_view_t& seeds,
    uint8_t nonce,
    const schema::component_id_t& component,
    const curve_check_t& on_curve);

/// Canonical derivation: the first nonce, counting down from 255, whose
/// address is off the ed25519 curve.
///
/// Fails with `invalid_seeds` or `derivation_exhausted`. An exhausted search
/// is final for these seeds.
schema::result_t<derived_address_t> derive(
    const seeds_view_t& seeds,
    const schema::component_id_t& component);

schema::result_t<derived_address_t> derive(
    const seeds_view_t& seeds,
    const schema::component_id_t& component,
    const curve_check_t& on_curve);

bool verify(const schema::address_t& address,
            const seeds_view_t& seeds,
            uint8_t nonce,
            const schema::component_id_t& component);

}  // namespace warden::execution
