#pragma once
#include "Math/LinearAlgebra.hpp"
#include "Math/Matrix.hpp"
#include "Math/NumericDomain.hpp"
#include <cstddef>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <optional>

namespace buckingham::LU {

/// Kernel basis of a matrix `A`, in the column order of its factorization:
/// row `i` of `basis` is the coefficient of column `q[i]` of `A`.
template <NumericDomain T> struct NullSpace {
  DenseMatrix<T> basis;
  llvm::SmallVector<unsigned, 0> q;
  size_t rank{0};
};

/// Columns of the result span the null space of the factorized matrix, in the
/// factorization's permuted column order.
///
/// With `r = F.rank` and `U1 = U[0:r, 0:r]`, for each free column `f >= r`
/// we solve `U1 * x = -U[0:r, f]` and emit `[x; e_{f-r}]`. The result is
/// `m x (m - r)`; it has no columns if `A` has full column rank.
/// Empty iff back substitution overflowed.
template <NumericDomain T>
[[nodiscard]] auto nullSpace(const FactPQ<T> &F)
  -> std::optional<DenseMatrix<T>> {
  using Traits = DomainTraits<T>;
  const DenseMatrix<T> &U = F.U;
  size_t m = size_t(U.numCol()), r = F.rank;
  DenseMatrix<T> B(math::Row{m}, math::Col{m - r});
  for (size_t f = r; f < m; ++f) {
    size_t b = f - r;
    // U1 x = -U[0:r, f], backwards
    for (size_t i = r; i--;) {
      T x = -U(i, f);
      for (size_t k = i + 1; k < r; ++k)
        if (Traits::fnmadd(x, U(i, k), B(k, b))) return {};
      if (Traits::divInPlace(x, U(i, i))) return {};
      B(i, b) = std::move(x);
    }
    B(f, b) = T{1};
  }
  return B;
}

template <NumericDomain T>
[[nodiscard]] auto nullSpace(DenseMatrix<T> A) -> std::optional<NullSpace<T>> {
  std::optional<FactPQ<T>> F = factPQ(std::move(A));
  if (!F) return {};
  std::optional<DenseMatrix<T>> B = nullSpace(*F);
  if (!B) return {};
  return NullSpace<T>{std::move(*B), std::move(F->q), F->rank};
}

/// Maps a basis in permuted column order back to the original order, i.e.
/// `result(q[i], j) = basis(i, j)`.
template <class T>
[[nodiscard]] auto unpermute(const DenseMatrix<T> &basis,
                             llvm::ArrayRef<unsigned> q) -> DenseMatrix<T> {
  utils::invariant(q.size() == size_t(basis.numRow()));
  DenseMatrix<T> R(basis.numRow(), basis.numCol());
  for (size_t i = 0; i < q.size(); ++i)
    for (size_t j = 0; j < basis.numCol(); ++j) R(q[i], j) = basis(i, j);
  return R;
}

} // namespace buckingham::LU
