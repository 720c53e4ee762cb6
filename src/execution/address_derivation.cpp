#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/crypto/curve.hpp>
#include <warden/execution/address_derivation.hpp>

#include <string>

namespace warden::execution {

namespace {

schema::hash32_t hash_candidate(const seeds_view_t& seeds,
                                const uint8_t nonce,
                                const schema::component_id_t& component) {
  auto hasher = warden::blake3::hasher{};
  for (const auto& seed : seeds) {
    hasher.update(schema::bytes_view_t{seed});
  }
  return hasher.update(nonce)
      .update(schema::bytes_view_t{component})
      .update(kDerivedAddressMarker)
      .finalize();
}

}  // namespace

schema::status_t validate_seeds(const seeds_view_t& seeds) {
  if (seeds.size() > kMaxSeeds) {
    return schema::make_error(
        schema::error_kind::invalid_seeds,
        "too many seeds: " + std::to_string(seeds.size()));
  }
  for (std::size_t i = 0; i < seeds.size(); ++i) {
    if (seeds[i].size() > kMaxSeedLength) {
      return schema::make_error(schema::error_kind::invalid_seeds,
                                "seed " + std::to_string(i) + " is " +
                                    std::to_string(seeds[i].size()) +
                                    " bytes");
    }
  }
  return std::nullopt;
}

std::optional<schema::address_t> create_address(
    const seeds_view_t& seeds,
    const uint8_t nonce,
    const schema::component_id_t& component) {
  return create_address(seeds, nonce, component,
                        warden::crypto::is_on_ed25519_curve);
}

std::optional<schema::address_t> create_address(
    const seeds_view_t& seeds,
    const uint8_t nonce,
    const schema::component_id_t& component,
    const curve_check_t& on_curve) {
  if (validate_seeds(seeds).has_value()) {
    return std::nullopt;
  }
  auto candidate = hash_candidate(seeds, nonce, component);
  if (on_curve(candidate)) {
    return std::nullopt;
  }
  return candidate;
}

schema::result_t<derived_address_t> derive(
    const seeds_view_t& seeds,
    const schema::component_id_t& component) {
  return derive(seeds, component, warden::crypto::is_on_ed25519_curve);
}

schema::result_t<derived_address_t> derive(
    const seeds_view_t& seeds,
    const schema::component_id_t& component,
    const curve_check_t& on_curve) {
  if (auto invalid = validate_seeds(seeds)) {
    return *invalid;
  }
  for (auto nonce = 255; nonce >= 0; --nonce) {
    auto candidate =
        hash_candidate(seeds, static_cast<uint8_t>(nonce), component);
    if (!on_curve(candidate)) {
      return derived_address_t{.address = candidate,
                               .nonce = static_cast<uint8_t>(nonce)};
    }
  }
  spdlog::error("Address derivation exhausted all nonces for component {}",
                schema::to_hex(component));
  return schema::make_error(schema::error_kind::derivation_exhausted,
                            "no off-curve address for these seeds");
}

bool verify(const schema::address_t& address,
            const seeds_view_t& seeds,
            const uint8_t nonce,
            const schema::component_id_t& component) {
  auto expected = create_address(seeds, nonce, component);
  return expected.has_value() && *expected == address;
}

}  // namespace warden::execution
