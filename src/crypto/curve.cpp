#include <warden/crypto/curve.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/multiprecision/integer.hpp>

namespace warden::crypto {

namespace {

using boost::multiprecision::cpp_int;

const cpp_int& field_prime() {
  static const auto p = (cpp_int{1} << 255) - 19;
  return p;
}

// d = -121665 / 121666 mod p
const cpp_int& edwards_d() {
  static const auto d = cpp_int{
      "3709570593466943934313808350875456518954211387984321901638878553308594"
      "0283555"};
  return d;
}

cpp_int mod(const cpp_int& value) {
  auto reduced = cpp_int{value % field_prime()};
  if (reduced < 0) {
    reduced += field_prime();
  }
  return reduced;
}

}  // namespace

bool is_on_ed25519_curve(const warden::schema::hash32_t& point) {
  auto encoded = point;
  const auto x_sign = (encoded[31] & 0x80u) != 0;
  encoded[31] &= 0x7Fu;

  auto y = cpp_int{};
  boost::multiprecision::import_bits(y, std::begin(encoded), std::end(encoded),
                                     8, false);
  const auto& p = field_prime();
  if (y >= p) {
    return false;
  }

  // x^2 = (y^2 - 1) / (d y^2 + 1). The denominator never vanishes because
  // -1/d is not a square mod p.
  const auto y2 = mod(y * y);
  const auto u = mod(y2 - 1);
  const auto v = mod(edwards_d() * y2 + 1);
  const cpp_int v_inverse = boost::multiprecision::powm(v, p - 2, p);
  const auto x2 = mod(u * v_inverse);

  if (x2 == 0) {
    return !x_sign;
  }
  // Euler's criterion.
  const cpp_int legendre = boost::multiprecision::powm(x2, (p - 1) / 2, p);
  return legendre == 1;
}

}  // namespace warden::crypto
