#include <gtest/gtest.h>
#include <warden/crypto/curve.hpp>
#include <warden/testing/common.hpp>

namespace {

warden::schema::hash32_t encode_y(const uint8_t low_byte) {
  auto point = warden::schema::hash32_t{};
  point[0] = low_byte;
  return point;
}

}  // namespace

TEST(crypto_curve, identity_point_is_on_curve) {
  // y = 1, x = 0.
  EXPECT_TRUE(warden::crypto::is_on_ed25519_curve(encode_y(1)));
}

TEST(crypto_curve, zero_x_with_sign_bit_is_rejected) {
  auto point = encode_y(1);
  point[31] |= 0x80u;
  EXPECT_FALSE(warden::crypto::is_on_ed25519_curve(point));
}

TEST(crypto_curve, base_point_is_on_curve) {
  // RFC 8032 base point: y = 4/5.
  auto base = warden::schema::make_hash32(std::string_view{
      "5866666666666666666666666666666666666666666666666666666666666666"});
  EXPECT_TRUE(warden::crypto::is_on_ed25519_curve(base));
}

TEST(crypto_curve, y_of_two_is_off_curve) {
  // (y^2 - 1) / (d y^2 + 1) is a non-residue for y = 2.
  EXPECT_FALSE(warden::crypto::is_on_ed25519_curve(encode_y(2)));
}

TEST(crypto_curve, non_canonical_y_is_off_curve) {
  auto point = warden::schema::hash32_t{};
  point.fill(0xFF);
  point[31] = 0x7F;
  EXPECT_FALSE(warden::crypto::is_on_ed25519_curve(point));
}

TEST(crypto_curve, generated_public_keys_are_on_curve) {
  for (auto i = 0; i < 4; ++i) {
    auto key = warden::testing::keypair{};
    ASSERT_TRUE(key.valid());
    EXPECT_TRUE(warden::crypto::is_on_ed25519_curve(key.identity()));
  }
}
