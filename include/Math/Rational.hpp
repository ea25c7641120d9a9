#pragma once

#include "Math/GreatestCommonDivisor.hpp"
#include "Utilities/Invariant.hpp"
#include <array>
#include <compare>
#include <cstdint>
#include <limits>
#include <llvm/Support/raw_ostream.h>
#include <optional>

namespace buckingham::math {

/// Fixed width exact rational.
///
/// Invariants: `denominator > 0`, `gcd(numerator, denominator) == 1`, and
/// neither field is `INT64_MIN`, so negation never overflows.
/// Arithmetic is carried out on 128 bit intermediates and reduced before it
/// is narrowed back, so a result fails only if its lowest terms don't fit.
/// The `safe*` methods return an empty optional on overflow; the in-place
/// `fnmadd` and `div` return `true` on overflow. The plain operators treat
/// overflow as an invariant violation.
struct Rational {
  int64_t numerator{0};
  int64_t denominator{1};

  static constexpr auto representable(int64_t x) -> bool {
    return x != std::numeric_limits<int64_t>::min();
  }

  constexpr Rational() = default;
  constexpr Rational(int64_t coef) : numerator(coef) {
    utils::invariant(representable(coef));
  }
  constexpr Rational(int coef) : numerator(coef) {}
  /// `n/d` must already be in lowest terms; only the sign is normalized.
  constexpr Rational(int64_t n, int64_t d)
    : numerator(d > 0 ? n : -n), denominator(n ? (d > 0 ? d : -d) : 1) {
    utils::invariant(representable(n) && representable(d) && d != 0);
  }
  /// Reduces `n/d`; `d` must be nonzero.
  constexpr static auto create(int64_t n, int64_t d) -> Rational {
    utils::invariant(d != 0 && representable(n) && representable(d));
    if (d < 0) {
      n = -n;
      d = -d;
    }
    auto [rn, rd] = divgcd(n, d);
    return n ? Rational{rn, rd} : Rational{};
  }

private:
  using Wide = __int128_t;
  using UWide = unsigned __int128;

  static constexpr auto fits(Wide x) -> bool {
    return x > std::numeric_limits<int64_t>::min() &&
           x <= std::numeric_limits<int64_t>::max();
  }
  static constexpr auto wideGCD(UWide a, UWide b) -> UWide {
    while (b) {
      UWide r = a % b;
      a = b;
      b = r;
    }
    return a;
  }
  /// Reduces `n/d` and narrows it; `d` must be nonzero.
  static constexpr auto fromWide(Wide n, Wide d) -> std::optional<Rational> {
    if (n == 0) return Rational{};
    if (d < 0) {
      n = -n;
      d = -d;
    }
    Wide g = Wide(wideGCD(UWide(n < 0 ? -n : n), UWide(d)));
    n /= g;
    d /= g;
    if (!fits(n) || !fits(d)) return {};
    Rational r;
    r.numerator = int64_t(n);
    r.denominator = int64_t(d);
    return r;
  }
  [[nodiscard]] constexpr auto cross(Rational y) const
    -> std::array<Wide, 2> {
    return {Wide(numerator) * y.denominator, Wide(y.numerator) * denominator};
  }

public:
  [[nodiscard]] constexpr auto safeAdd(Rational y) const
    -> std::optional<Rational> {
    auto [a, b] = cross(y);
    return fromWide(a + b, Wide(denominator) * y.denominator);
  }
  [[nodiscard]] constexpr auto safeSub(Rational y) const
    -> std::optional<Rational> {
    auto [a, b] = cross(y);
    return fromWide(a - b, Wide(denominator) * y.denominator);
  }
  [[nodiscard]] constexpr auto safeMul(int64_t y) const
    -> std::optional<Rational> {
    return fromWide(Wide(numerator) * y, denominator);
  }
  [[nodiscard]] constexpr auto safeMul(Rational y) const
    -> std::optional<Rational> {
    return fromWide(Wide(numerator) * y.numerator,
                    Wide(denominator) * y.denominator);
  }
  /// `y` must be nonzero.
  [[nodiscard]] constexpr auto safeDiv(Rational y) const
    -> std::optional<Rational> {
    utils::invariant(y.numerator != 0);
    return fromWide(Wide(numerator) * y.denominator,
                    Wide(denominator) * y.numerator);
  }

  constexpr auto operator+(Rational y) const -> Rational {
    std::optional<Rational> a = safeAdd(y);
    utils::invariant(a.has_value());
    return *a;
  }
  constexpr auto operator-(Rational y) const -> Rational {
    std::optional<Rational> a = safeSub(y);
    utils::invariant(a.has_value());
    return *a;
  }
  constexpr auto operator*(Rational y) const -> Rational {
    std::optional<Rational> a = safeMul(y);
    utils::invariant(a.has_value());
    return *a;
  }
  constexpr auto operator/(Rational y) const -> Rational {
    std::optional<Rational> a = safeDiv(y);
    utils::invariant(a.has_value());
    return *a;
  }
  constexpr auto operator-() const -> Rational {
    Rational r = *this;
    r.numerator = -numerator;
    return r;
  }
  constexpr auto operator+=(Rational y) -> Rational & {
    return *this = *this + y;
  }
  constexpr auto operator-=(Rational y) -> Rational & {
    return *this = *this - y;
  }
  constexpr auto operator*=(Rational y) -> Rational & {
    return *this = *this * y;
  }
  /// *this -= a*b
  constexpr auto fnmadd(Rational a, Rational b) -> bool {
    std::optional<Rational> ab = a.safeMul(b);
    if (!ab) return true;
    std::optional<Rational> c = safeSub(*ab);
    if (!c) return true;
    *this = *c;
    return false;
  }
  constexpr auto div(Rational a) -> bool {
    std::optional<Rational> d = safeDiv(a);
    if (!d) return true;
    *this = *d;
    return false;
  }
  explicit constexpr operator double() const {
    return double(numerator) / double(denominator);
  }
  constexpr explicit operator bool() const { return numerator != 0; }

  constexpr auto operator==(const Rational &) const -> bool = default;
  friend constexpr auto operator<=>(Rational x, Rational y)
    -> std::strong_ordering {
    auto [a, b] = x.cross(y);
    if (a < b) return std::strong_ordering::less;
    if (b < a) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
  }
  friend constexpr auto isZero(Rational x) -> bool { return x.numerator == 0; }
  friend constexpr auto isOne(Rational x) -> bool {
    return x.numerator == 1 && x.denominator == 1;
  }
  [[nodiscard]] constexpr auto isInteger() const -> bool {
    return denominator == 1;
  }

  friend inline auto operator<<(llvm::raw_ostream &os, const Rational &x)
    -> llvm::raw_ostream & {
    os << x.numerator;
    if (x.denominator != 1) os << " // " << x.denominator;
    return os;
  }
  void dump() const { llvm::errs() << *this << "\n"; }
};

/// |x| < |y|
constexpr auto absLess(Rational x, Rational y) -> bool {
  __int128_t a = __int128_t(x.numerator) * y.denominator;
  __int128_t b = __int128_t(y.numerator) * x.denominator;
  return (a < 0 ? -a : a) < (b < 0 ? -b : b);
}

} // namespace buckingham::math
