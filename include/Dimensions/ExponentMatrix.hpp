#pragma once

#include "Dimensions/Dimension.hpp"
#include "Dimensions/Registry.hpp"
#include "Math/Matrix.hpp"
#include "Math/Rational.hpp"
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

namespace buckingham::dims {

/// `A(i, j)` is the exponent of `dimensions[i]` in parameter `j`.
struct ExponentMatrix {
  math::DenseMatrix<Rational> A;
  /// Row labels, base dimension abbreviations.
  llvm::SmallVector<llvm::StringRef, 7> dimensions;

  friend auto operator<<(llvm::raw_ostream &os, const ExponentMatrix &E)
    -> llvm::raw_ostream &;
  void dump() const;
};

/// One column per entry of `columns`. Rows are the dimensions in order of
/// first appearance; a dimension a column lacks has exponent zero, so a
/// dimensionless column is all zeros.
auto buildExponentMatrix(llvm::ArrayRef<DimensionVector> columns)
  -> ExponentMatrix;
/// Columns in registration order.
auto buildExponentMatrix(const ParameterRegistry &registry) -> ExponentMatrix;

} // namespace buckingham::dims
