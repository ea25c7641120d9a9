#pragma once

#include "Math/Rational.hpp"
#include <cmath>
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <gmpxx.h>
#include <limits>
#include <optional>
#include <type_traits>

namespace buckingham::math {

/// Scalar domains the elimination routines are written against.
///
/// A domain provides `T{0}`, `T{1}`, and through `DomainTraits<T>`:
/// - `absLess(a, b)`: `|a| < |b|`, used to pick pivots;
/// - `isNegligible(x, minDim)`: whether `x` is effectively zero for an
///   elimination over a matrix with `min(rows, cols) == minDim`;
/// - `fnmadd(acc, a, b)`: `acc -= a * b`;
/// - `divInPlace(x, d)`: `x /= d`.
/// The two arithmetic primitives return `true` if the result does not fit the
/// domain, leaving `acc`/`x` unspecified. Only fixed-width exact domains can
/// overflow.
template <class T> struct DomainTraits {};

template <> struct DomainTraits<Rational> {
  static constexpr bool exact = true;
  static constexpr auto absLess(Rational a, Rational b) -> bool {
    return math::absLess(a, b);
  }
  static constexpr auto isNegligible(Rational x, size_t) -> bool {
    return isZero(x);
  }
  static constexpr auto fnmadd(Rational &acc, Rational a, Rational b) -> bool {
    return acc.fnmadd(a, b);
  }
  static constexpr auto divInPlace(Rational &x, Rational d) -> bool {
    return x.div(d);
  }
};

template <> struct DomainTraits<mpq_class> {
  static constexpr bool exact = true;
  static auto absLess(const mpq_class &a, const mpq_class &b) -> bool {
    return mpq_class(abs(a)) < mpq_class(abs(b));
  }
  static auto isNegligible(const mpq_class &x, size_t) -> bool {
    return sgn(x) == 0;
  }
  static auto fnmadd(mpq_class &acc, const mpq_class &a, const mpq_class &b)
    -> bool {
    acc -= a * b;
    return false;
  }
  static auto divInPlace(mpq_class &x, const mpq_class &d) -> bool {
    x /= d;
    return false;
  }
};

/// Floating point domains: the tolerance grows with the problem size,
/// `minDim * eps`.
template <std::floating_point T> struct DomainTraits<T> {
  static constexpr bool exact = false;
  static constexpr auto tolerance(size_t minDim) -> T {
    return T(minDim) * std::numeric_limits<T>::epsilon();
  }
  static auto absLess(T a, T b) -> bool { return std::abs(a) < std::abs(b); }
  static auto isNegligible(T x, size_t minDim) -> bool {
    return !(std::abs(x) > tolerance(minDim));
  }
  static constexpr auto fnmadd(T &acc, T a, T b) -> bool {
    acc -= a * b;
    return false;
  }
  static constexpr auto divInPlace(T &x, T d) -> bool {
    x /= d;
    return false;
  }
};

template <std::floating_point T> struct DomainTraits<std::complex<T>> {
  static constexpr bool exact = false;
  static constexpr auto tolerance(size_t minDim) -> T {
    return DomainTraits<T>::tolerance(minDim);
  }
  static auto absLess(const std::complex<T> &a, const std::complex<T> &b)
    -> bool {
    return std::abs(a) < std::abs(b);
  }
  static auto isNegligible(const std::complex<T> &x, size_t minDim) -> bool {
    return !(std::abs(x) > tolerance(minDim));
  }
  static auto fnmadd(std::complex<T> &acc, const std::complex<T> &a,
                     const std::complex<T> &b) -> bool {
    acc -= a * b;
    return false;
  }
  static auto divInPlace(std::complex<T> &x, const std::complex<T> &d)
    -> bool {
    x /= d;
    return false;
  }
};

template <typename T>
concept NumericDomain =
  std::copyable<T> && requires(T &acc, const T &x, size_t n) {
    { T{0} };
    { T{1} };
    { -x } -> std::convertible_to<T>;
    { DomainTraits<T>::absLess(x, x) } -> std::same_as<bool>;
    { DomainTraits<T>::isNegligible(x, n) } -> std::same_as<bool>;
    { DomainTraits<T>::fnmadd(acc, x, x) } -> std::same_as<bool>;
    { DomainTraits<T>::divInPlace(acc, x) } -> std::same_as<bool>;
  };

static_assert(NumericDomain<Rational>);
static_assert(NumericDomain<mpq_class>);
static_assert(NumericDomain<double>);
static_assert(NumericDomain<std::complex<double>>);

/// Integer inputs are factorized over their floating point promotion, since
/// division isn't closed over the integers.
template <class T> struct Promote {
  using type = T;
};
template <std::integral T> struct Promote<T> {
  using type = double;
};
template <std::integral T> struct Promote<std::complex<T>> {
  using type = std::complex<double>;
};
template <class T> using promote_t = typename Promote<T>::type;

static_assert(std::same_as<promote_t<int64_t>, double>);
static_assert(std::same_as<promote_t<std::complex<int64_t>>, std::complex<double>>);
static_assert(std::same_as<promote_t<Rational>, Rational>);

/// Exact conversions between the two rational domains.
inline auto toMPQ(Rational x) -> mpq_class {
  mpq_class r{mpz_class(static_cast<long>(x.numerator)),
              mpz_class(static_cast<long>(x.denominator))};
  r.canonicalize();
  return r;
}
/// Empty if numerator or denominator doesn't fit in `int64_t`.
inline auto toRational(const mpq_class &x) -> std::optional<Rational> {
  const mpz_class &n = x.get_num();
  const mpz_class &d = x.get_den();
  if (!n.fits_slong_p() || !d.fits_slong_p()) return {};
  long nl = n.get_si(), dl = d.get_si();
  if (!Rational::representable(nl) || !Rational::representable(dl)) return {};
  return Rational{nl, dl};
}

} // namespace buckingham::math
