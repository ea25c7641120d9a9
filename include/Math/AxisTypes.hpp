#pragma once
#include <compare>
#include <cstddef>
#include <llvm/Support/raw_ostream.h>
#include <type_traits>

/// buckingham::math
///
/// Dense linear algebra over exact and approximate scalar domains.
/// Semantics:
/// Matrices own their elements and are stored row major. Sizes are passed as
/// strongly typed `Row` and `Col` so that a row count can't silently be used
/// where a column count is expected.
/// Operations that can fail because of fixed-width overflow return an empty
/// `std::optional` (or `true` for in-place updates) instead of wrapping.
namespace buckingham::math {

enum class Axis { Row, Col };

/// A row or column count. Converts to `size_t` only explicitly, and compares
/// only against counts along the same axis or plain indices.
template <Axis A> struct Extent {
  size_t value{0};
  constexpr Extent() = default;
  constexpr Extent(size_t v) : value(v) {}
  explicit constexpr operator size_t() const { return value; }
  explicit constexpr operator bool() const { return value != 0; }

  constexpr auto operator==(const Extent &) const -> bool = default;
  constexpr auto operator<=>(const Extent &) const = default;

  /// index < extent, the common loop bound
  friend constexpr auto operator<(size_t i, Extent e) -> bool {
    return i < e.value;
  }
  friend auto operator<<(llvm::raw_ostream &os, Extent e)
    -> llvm::raw_ostream & {
    return os << (A == Axis::Row ? "Row{" : "Col{") << e.value << "}";
  }
};

using Row = Extent<Axis::Row>;
using Col = Extent<Axis::Col>;

static_assert(std::is_trivially_copyable_v<Row>);
static_assert(sizeof(Col) == sizeof(size_t));

/// number of elements of an `m` by `n` matrix
constexpr auto operator*(Row m, Col n) -> size_t {
  return size_t(m) * size_t(n);
}

} // namespace buckingham::math
