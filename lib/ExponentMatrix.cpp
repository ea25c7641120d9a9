#include "Dimensions/ExponentMatrix.hpp"
#include <cstddef>
#include <llvm/ADT/STLExtras.h>

namespace buckingham::dims {

auto buildExponentMatrix(llvm::ArrayRef<DimensionVector> columns)
  -> ExponentMatrix {
  ExponentMatrix E;
  for (const DimensionVector &d : columns)
    for (const DimensionPower &p : d)
      if (!llvm::is_contained(E.dimensions, p.dimension.abbr))
        E.dimensions.push_back(p.dimension.abbr);
  E.A = math::DenseMatrix<Rational>(math::Row{E.dimensions.size()},
                                    math::Col{columns.size()});
  for (size_t j = 0; j < columns.size(); ++j)
    for (const DimensionPower &p : columns[j]) {
      const auto *it = llvm::find(E.dimensions, p.dimension.abbr);
      E.A(size_t(it - E.dimensions.begin()), j) = p.exponent;
    }
  return E;
}

auto buildExponentMatrix(const ParameterRegistry &registry) -> ExponentMatrix {
  llvm::SmallVector<DimensionVector, 8> columns;
  for (const NamedParameter &p : registry)
    columns.push_back(p.parameter.dimensions());
  return buildExponentMatrix(columns);
}

auto operator<<(llvm::raw_ostream &os, const ExponentMatrix &E)
  -> llvm::raw_ostream & {
  os << "dimensions = [";
  for (size_t i = 0; i < E.dimensions.size(); ++i)
    os << (i ? ", " : "") << E.dimensions[i];
  return os << "]\nA = \n" << E.A << "\n";
}

void ExponentMatrix::dump() const { llvm::errs() << *this; }

} // namespace buckingham::dims
