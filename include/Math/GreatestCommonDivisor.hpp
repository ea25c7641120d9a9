#pragma once
#include <array>
#include <bit>
#include <cstdint>
#include <utility>

namespace buckingham::math {

/// |x| as an unsigned value; exact for `INT64_MIN` too.
constexpr inline auto magnitude(int64_t x) noexcept -> uint64_t {
  return x < 0 ? uint64_t(0) - uint64_t(x) : uint64_t(x);
}

/// Stein's binary gcd on the magnitudes. The result is non-negative, and
/// `gcd(0, 0) == 0`. Undefined when the gcd is `2^63`.
constexpr auto gcd(int64_t x, int64_t y) noexcept -> int64_t {
  uint64_t a = magnitude(x), b = magnitude(y);
  if (a == 0) return int64_t(b);
  if (b == 0) return int64_t(a);
  int shift = std::countr_zero(a | b);
  a >>= std::countr_zero(a);
  do {
    b >>= std::countr_zero(b);
    if (a > b) std::swap(a, b);
    b -= a;
  } while (b);
  return int64_t(a << shift);
}

/// divgcd(x, y) = (x / gcd(x, y), y / gcd(x, y))
constexpr auto divgcd(int64_t x, int64_t y) noexcept
  -> std::array<int64_t, 2> {
  int64_t g = gcd(x, y);
  if (g <= 1) return {x, y};
  return {x / g, y / g};
}

} // namespace buckingham::math
