#pragma once

#include "Dimensions/Dimension.hpp"
#include "Dimensions/Expression.hpp"
#include "Dimensions/Registry.hpp"
#include "Math/Matrix.hpp"
#include "Math/NumericDomain.hpp"
#include "Math/Rational.hpp"
#include <cstddef>
#include <gmpxx.h>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace buckingham::dims {

/// Scalar domain the exponent matrix is factorized in.
enum class RationalDomain {
  /// `math::Rational`; fails with `ArithmeticOverflow` if an intermediate
  /// doesn't fit in 64 bits.
  Fixed,
  /// `mpq_class`; never overflows.
  Arbitrary,
};

struct PiOptions {
  RationalDomain domain{RationalDomain::Fixed};
  /// If set, the exponent matrix and its factorization are written here.
  llvm::raw_ostream *trace{nullptr};
};

enum class OutputForm {
  String,
  Expr,
};
/// `string`/`String` or `expr`/`Expr`; anything else fails with
/// `UnknownOutputForm`.
auto parseOutputForm(llvm::StringRef form) -> llvm::Expected<OutputForm>;

namespace detail {
inline auto widen(Rational x) -> mpq_class { return math::toMPQ(x); }
inline auto widen(const mpq_class &x) -> const mpq_class & { return x; }
} // namespace detail

/// Reads each column of a null space basis as a group.
/// Row `i` of `basis` is the exponent of `symbols[q[i]]`; terms are listed in
/// that permuted order and exact zeros are dropped.
template <class T>
auto assembleGroups(const math::DenseMatrix<T> &basis,
                    llvm::ArrayRef<unsigned> q,
                    llvm::ArrayRef<std::string> symbols)
  -> llvm::SmallVector<Group, 4> {
  utils::invariant(size_t(basis.numRow()) == q.size());
  llvm::SmallVector<Group, 4> groups;
  for (size_t j = 0; j < basis.numCol(); ++j) {
    Group g;
    for (size_t i = 0; i < basis.numRow(); ++i) {
      mpq_class e = detail::widen(basis(i, j));
      if (sgn(e) != 0) g.push_back(Term{symbols[q[i]], std::move(e)});
    }
    groups.push_back(std::move(g));
  }
  return groups;
}

/// Dimensionless groups of the registered parameters, one per null space
/// basis vector of their exponent matrix. No parameters means no groups.
auto piGroups(const ParameterRegistry &registry, const PiOptions &options = {})
  -> llvm::Expected<llvm::SmallVector<Group, 4>>;

/// Expression trees of a set of groups, together with the context owning
/// them.
struct GroupExprs {
  std::unique_ptr<ExprContext> context;
  llvm::SmallVector<const ProductExpr *, 4> exprs;
};
using RenderedGroups =
  std::variant<llvm::SmallVector<std::string, 4>, GroupExprs>;

auto render(llvm::ArrayRef<Group> groups, OutputForm form) -> RenderedGroups;
/// `form` is checked before anything is computed.
auto piGroups(const ParameterRegistry &registry, llvm::StringRef form,
              const PiOptions &options = {}) -> llvm::Expected<RenderedGroups>;

/// Base dimensions of the product `group` describes. Dimensionless for every
/// group `piGroups` returns. Fails with `UnknownUnit` for a symbol that isn't
/// registered, and with `ArithmeticOverflow` if a resulting exponent doesn't
/// fit a `math::Rational`.
auto dimensionsOf(const Group &group, const ParameterRegistry &registry)
  -> llvm::Expected<DimensionVector>;

} // namespace buckingham::dims
