#pragma once
#include <warden/schema/error.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <limits>
#include <type_traits>

// Checked integer arithmetic for balances and counters. Nothing here wraps or
// saturates: out-of-range results are reported as errors.
namespace warden::execution {

template <typename T>
concept checked_integer = std::numeric_limits<T>::is_specialized &&
                          std::numeric_limits<T>::is_integer &&
                          std::numeric_limits<T>::is_bounded;

namespace detail {

inline schema::error_t overflow() {
  return schema::make_error(schema::error_kind::arithmetic_overflow,
                            "arithmetic overflow");
}

inline schema::error_t underflow() {
  return schema::make_error(schema::error_kind::arithmetic_underflow,
                            "arithmetic underflow");
}

}  // namespace detail

template <checked_integer T>
schema::result_t<T> checked_add(const T& a, const T& b) {
  using limits = std::numeric_limits<T>;
  if constexpr (limits::is_signed) {
    if (b > 0 && a > limits::max() - b) {
      return detail::overflow();
    }
    if (b < 0 && a < limits::min() - b) {
      return detail::underflow();
    }
  } else {
    if (a > limits::max() - b) {
      return detail::overflow();
    }
  }
  return static_cast<T>(a + b);
}

template <checked_integer T>
schema::result_t<T> checked_sub(const T& a, const T& b) {
  using limits = std::numeric_limits<T>;
  if constexpr (limits::is_signed) {
    if (b < 0 && a > limits::max() + b) {
      return detail::overflow();
    }
    if (b > 0 && a < limits::min() + b) {
      return detail::underflow();
    }
  } else {
    if (a < b) {
      return detail::underflow();
    }
  }
  return static_cast<T>(a - b);
}

template <checked_integer T>
schema::result_t<T> checked_mul(const T& a, const T& b) {
  using limits = std::numeric_limits<T>;
  if (a == 0 || b == 0) {
    return T{0};
  }
  if constexpr (limits::is_signed) {
    if (a > 0) {
      if (b > 0 && a > limits::max() / b) {
        return detail::overflow();
      }
      if (b < 0 && b < limits::min() / a) {
        return detail::underflow();
      }
    } else {
      if (b > 0 && a < limits::min() / b) {
        return detail::underflow();
      }
      if (b < 0 && a < limits::max() / b) {
        return detail::overflow();
      }
    }
  } else {
    if (a > limits::max() / b) {
      return detail::overflow();
    }
  }
  return static_cast<T>(a * b);
}

template <checked_integer T>
schema::result_t<T> checked_div(const T& a, const T& b) {
  if (b == 0) {
    return schema::make_error(schema::error_kind::division_by_zero,
                              "division by zero");
  }
  if constexpr (std::numeric_limits<T>::is_signed) {
    if (a == std::numeric_limits<T>::min() && b == -1) {
      return detail::overflow();
    }
  }
  return static_cast<T>(a / b);
}

/// `principal` grown by `numerator / denominator` per period, each period's
/// interest rounded down. Fails with `invalid_payload` for zero periods.
template <checked_integer T>
schema::result_t<T> checked_compound(const T& principal,
                                     const T& numerator,
                                     const T& denominator,
                                     const uint64_t periods) {
  if (denominator == 0) {
    return schema::make_error(schema::error_kind::division_by_zero,
                              "compound rate denominator is zero");
  }
  if (periods == 0) {
    return schema::make_error(schema::error_kind::invalid_payload,
                              "compound periods must be positive");
  }
  auto amount = principal;
  for (uint64_t period = 0; period < periods; ++period) {
    auto scaled = checked_mul(amount, numerator);
    if (!schema::succeeded(scaled)) {
      return schema::error_of(scaled);
    }
    auto interest = checked_div(schema::value_of(scaled), denominator);
    if (!schema::succeeded(interest)) {
      return schema::error_of(interest);
    }
    if (schema::value_of(interest) == 0) {
      break;
    }
    auto grown = checked_add(amount, schema::value_of(interest));
    if (!schema::succeeded(grown)) {
      return schema::error_of(grown);
    }
    amount = schema::value_of(grown);
  }
  return amount;
}

}  // namespace warden::execution
