#pragma once

#include "Dimensions/Dimension.hpp"
#include "Math/Rational.hpp"
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <string>

namespace buckingham::dims {

/// A known unit: its dimensions and its size in SI base units.
struct UnitInfo {
  llvm::StringRef symbol;
  double scale;
  DimensionVector dims;
};

/// The built-in table: SI base units, common multiples and derived units, and
/// `NoDims`.
auto unitTable() -> llvm::ArrayRef<UnitInfo>;
auto lookupUnit(llvm::StringRef symbol) -> const UnitInfo *;

/// `symbol^exponent` as written in a unit or dimension expression.
struct PowerFactor {
  std::string symbol;
  Rational exponent;
};

/// Parses a product of powers such as `m/s^2`, `kg*m^-3`, `L T^(-1//2)` or
/// `1/s`. Factors are separated by `*`, `/` or blanks, and `/` inverts only
/// the factor that follows it. Exponents are integers, `(n//d)` or `(n/d)`.
/// Repeated symbols are combined. Fails with `MalformedExpression`.
auto parsePowerProduct(llvm::StringRef text)
  -> llvm::Expected<llvm::SmallVector<PowerFactor, 4>>;

/// A unit expression resolved against the unit table.
class UnitExpr {
  llvm::SmallVector<PowerFactor, 4> factors;
  double scaleToSI{1.0};
  DimensionVector dims;

public:
  UnitExpr() = default;
  /// Fails with `MalformedExpression`, `UnknownUnit` or `ArithmeticOverflow`.
  static auto parse(llvm::StringRef text) -> llvm::Expected<UnitExpr>;

  [[nodiscard]] auto dimensions() const -> const DimensionVector & {
    return dims;
  }
  [[nodiscard]] auto scale() const -> double { return scaleToSI; }
  [[nodiscard]] auto getFactors() const -> llvm::ArrayRef<PowerFactor> {
    return factors;
  }
  friend auto operator<<(llvm::raw_ostream &os, const UnitExpr &u)
    -> llvm::raw_ostream &;
};

/// Parses a bare dimension expression over base dimension abbreviations or
/// names, e.g. `L*T^-2` or `Mass Length^-3`.
auto parseDimensions(llvm::StringRef text) -> llvm::Expected<DimensionVector>;

} // namespace buckingham::dims
