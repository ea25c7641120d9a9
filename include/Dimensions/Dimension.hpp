#pragma once

#include "Math/Rational.hpp"
#include <cstddef>
#include <initializer_list>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>
#include <optional>
#include <string>

namespace buckingham::dims {
using math::Rational;

/// An independent physical axis. `index` fixes the canonical order in which
/// a `DimensionVector` lists its powers.
struct BaseDimension {
  llvm::StringRef name;
  llvm::StringRef abbr;
  unsigned index;
};

/// Length, Mass, Time, Current, Temperature, Amount, Luminosity.
auto baseDimensions() -> llvm::ArrayRef<BaseDimension>;
/// Matches either the abbreviation (`L`) or the name (`Length`).
auto lookupDimension(llvm::StringRef nameOrAbbr)
  -> std::optional<BaseDimension>;

struct DimensionPower {
  BaseDimension dimension;
  Rational exponent;
};

/// Product of base dimension powers, e.g. `L T^-2`.
/// Powers are kept in canonical order without zero exponents, so equal
/// dimensions compare equal elementwise. The empty vector is dimensionless.
class DimensionVector {
  llvm::SmallVector<DimensionPower, 4> powers;

public:
  DimensionVector() = default;
  /// Each dimension at most once.
  DimensionVector(std::initializer_list<std::pair<llvm::StringRef, Rational>>);

  /// `*this *= d^e`. Returns `true` on overflow, leaving `*this` unchanged.
  [[nodiscard]] auto mulPow(BaseDimension d, Rational e) -> bool;
  /// `*this *= other^e`. Returns `true` on overflow, leaving `*this`
  /// unchanged.
  [[nodiscard]] auto mulPow(const DimensionVector &other, Rational e) -> bool;

  /// Exponent of `abbr`, zero if absent.
  [[nodiscard]] auto exponentOf(llvm::StringRef abbr) const -> Rational;
  [[nodiscard]] auto isDimensionless() const -> bool { return powers.empty(); }
  [[nodiscard]] auto size() const -> size_t { return powers.size(); }
  [[nodiscard]] auto begin() const { return powers.begin(); }
  [[nodiscard]] auto end() const { return powers.end(); }

  friend auto operator==(const DimensionVector &x, const DimensionVector &y)
    -> bool;
  friend auto operator<<(llvm::raw_ostream &os, const DimensionVector &d)
    -> llvm::raw_ostream &;
  void dump() const;
};

/// Writes `e` as a power suffix: nothing for 1, `^-2`, `^(1//2)`.
void printPower(llvm::raw_ostream &os, Rational e);

} // namespace buckingham::dims
