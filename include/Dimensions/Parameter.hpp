#pragma once

#include "Dimensions/Dimension.hpp"
#include "Dimensions/Units.hpp"
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <variant>

namespace buckingham::dims {

/// A value with a unit, e.g. `9.8 m/s^2`.
struct Quantity {
  double value;
  UnitExpr unit;
};
/// A unit on its own, e.g. `kg`.
struct Unit {
  UnitExpr unit;
};
/// Only the dimensions of a parameter, e.g. `L*T^-1`.
struct BareDimension {
  DimensionVector dims;
};
/// A dimensionless number.
struct PlainNumber {
  double value;
};

/// A physical parameter. The closed set of kinds is fixed by `Value`; other
/// kinds can't be constructed, and `parse` rejects them by name.
class Parameter {
public:
  using Value = std::variant<Quantity, Unit, BareDimension, PlainNumber>;

private:
  Value value;

public:
  Parameter(Quantity q) : value(std::move(q)) {}
  Parameter(Unit u) : value(std::move(u)) {}
  Parameter(BareDimension d) : value(std::move(d)) {}
  Parameter(PlainNumber x) : value(x) {}

  /// Parses `<kind>:<payload>` where `kind` is one of
  /// - `quantity`, payload `<number> <unit expression>`, e.g. `9.8 m/s^2`;
  /// - `unit`, payload a unit expression, e.g. `kg*m^-3`;
  /// - `dimension`, payload a dimension expression, e.g. `L T^-2`;
  /// - `number`, payload a number.
  /// Any other kind fails with `UnsupportedParameterKind`; a bad payload with
  /// `MalformedExpression`, `UnknownUnit` or `ArithmeticOverflow`.
  static auto parse(llvm::StringRef text) -> llvm::Expected<Parameter>;

  [[nodiscard]] auto getValue() const -> const Value & { return value; }
  /// Base dimension exponents of this parameter.
  [[nodiscard]] auto dimensions() const -> DimensionVector;
  /// Size in SI base units; 1 for a bare dimension.
  [[nodiscard]] auto magnitude() const -> double;
  [[nodiscard]] auto isDimensionless() const -> bool {
    return dimensions().isDimensionless();
  }

  friend auto operator<<(llvm::raw_ostream &os, const Parameter &p)
    -> llvm::raw_ostream &;
  void dump() const;
};

} // namespace buckingham::dims
