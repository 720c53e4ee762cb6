#pragma once

#include <openssl/evp.h>
#include <warden/execution/engine.hpp>
#include <warden/schema/operation_request.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/resource_record.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

inline warden::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = warden::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// In-memory record source for overlays in engine-level tests.
using record_map_t =
    std::map<warden::schema::address_t, warden::schema::resource_record_t>;

inline warden::execution::record_loader_t make_loader(
    const record_map_t& records) {
  return [&records](const warden::schema::address_t& address)
             -> std::optional<warden::schema::resource_record_t> {
    auto found = records.find(address);
    if (found == std::end(records)) {
      return std::nullopt;
    }
    return found->second;
  };
}

/// Freshly generated ed25519 key pair backed by OpenSSL.
class keypair final {
 public:
  keypair() : key_{nullptr, EVP_PKEY_free} {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto* generated = static_cast<EVP_PKEY*>(nullptr);
    if (ctx && EVP_PKEY_keygen_init(ctx.get()) == 1 &&
        EVP_PKEY_keygen(ctx.get(), &generated) == 1) {
      key_.reset(generated);
      auto size = public_key_.size();
      EVP_PKEY_get_raw_public_key(key_.get(), public_key_.data(), &size);
    }
  }

  bool valid() const { return static_cast<bool>(key_); }

  const warden::schema::identity_t& identity() const { return public_key_; }

  warden::schema::ed25519_signature_t sign(
      const warden::schema::bytes_view_t& message) const {
    auto signature = warden::schema::ed25519_signature_t{};
    auto size = signature.size();
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (ctx &&
        EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) ==
            1) {
      EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                     message.size());
    }
    return signature;
  }

  /// Append a signature over the request's signing message.
  void endorse(warden::schema::operation_request_t& request) const {
    auto message = warden::execution::make_signing_message(request);
    request.endorsements.push_back(warden::schema::endorsement_t{
        .identity = identity(),
        .signature = sign(warden::schema::make_bytes_view(message))});
  }

 private:
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key_;
  warden::schema::identity_t public_key_{};
};

/// Endorsement with an empty signature, for engines running without strict
/// crypto.
inline warden::schema::endorsement_t unsigned_endorsement(
    const warden::schema::identity_t& identity) {
  return warden::schema::endorsement_t{.identity = identity};
}

}  // namespace warden::testing
