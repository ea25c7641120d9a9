#pragma once
#include "Math/Matrix.hpp"
#include "Math/NumericDomain.hpp"
#include "Utilities/Invariant.hpp"
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <optional>
#include <utility>

namespace buckingham::LU {
using math::DenseMatrix, math::DomainTraits, math::NumericDomain;

/// LU factorization with full pivoting, `L * U == A[p, q]`.
/// `L` is `n x n` unit lower triangular, `U` is `n x m` upper triangular, and
/// only the leading `rank` rows of `U` can be nonzero.
template <NumericDomain T> struct FactPQ {
  DenseMatrix<T> L;
  DenseMatrix<T> U;
  llvm::SmallVector<unsigned, 0> p;
  llvm::SmallVector<unsigned, 0> q;
  /// Number of elimination steps completed before the remaining block became
  /// negligible.
  size_t rank{0};

  [[nodiscard]] auto numRow() const -> math::Row { return U.numRow(); }
  [[nodiscard]] auto numCol() const -> math::Col { return U.numCol(); }

  friend auto operator<<(llvm::raw_ostream &os, const FactPQ &F)
    -> llvm::raw_ostream & {
    os << "LU fact:\nL = \n" << F.L << "\nU = \n" << F.U << "\np = [";
    for (size_t i = 0; i < F.p.size(); ++i) os << (i ? ", " : "") << F.p[i];
    os << "]\nq = [";
    for (size_t i = 0; i < F.q.size(); ++i) os << (i ? ", " : "") << F.q[i];
    return os << "]\nrank = " << F.rank << '\n';
  }
  void dump() const { llvm::errs() << *this; }
};

namespace detail {
/// Position of the largest magnitude entry of `U[k:, k:]`.
/// Scans column major and keeps the first of equal magnitude entries, so that
/// the returned basis is reproducible.
template <NumericDomain T>
auto findPivot(const DenseMatrix<T> &U, size_t k) -> std::pair<size_t, size_t> {
  size_t n = size_t(U.numRow()), m = size_t(U.numCol());
  size_t pi = k, pj = k;
  for (size_t j = k; j < m; ++j)
    for (size_t i = k; i < n; ++i)
      if (DomainTraits<T>::absLess(U(pi, pj), U(i, j))) {
        pi = i;
        pj = j;
      }
  return {pi, pj};
}
} // namespace detail

/// Gaussian elimination with full pivoting.
/// `A` is taken by value and eliminated in place to become `U`.
/// Returns an empty optional iff the domain's arithmetic overflowed; no
/// partially eliminated factorization is ever returned.
template <NumericDomain T>
[[nodiscard]] auto factPQ(DenseMatrix<T> A) -> std::optional<FactPQ<T>> {
  using Traits = DomainTraits<T>;
  size_t n = size_t(A.numRow()), m = size_t(A.numCol());
  size_t minDim = std::min(n, m);
  FactPQ<T> F{DenseMatrix<T>::identity(n), std::move(A), {}, {}, 0};
  DenseMatrix<T> &L = F.L, &U = F.U;
  for (unsigned i = 0; i < n; ++i) F.p.push_back(i);
  for (unsigned j = 0; j < m; ++j) F.q.push_back(j);
  for (size_t k = 0; k < minDim; ++k) {
    auto [i, j] = detail::findPivot(U, k);
    if (Traits::isNegligible(U(i, j), minDim)) break;
    if (i != k) {
      std::swap(F.p[k], F.p[i]);
      U.swapRows(k, i);
      L.swapRows(k, i, k);
    }
    if (j != k) {
      std::swap(F.q[k], F.q[j]);
      U.swapCols(k, j);
    }
    for (size_t r = k + 1; r < n; ++r) {
      T tau = U(r, k);
      if (Traits::divInPlace(tau, U(k, k))) return {};
      for (size_t c = k + 1; c < m; ++c)
        if (Traits::fnmadd(U(r, c), tau, U(k, c))) return {};
      U(r, k) = T{0};
      L(r, k) = std::move(tau);
    }
    F.rank = k + 1;
  }
  return F;
}
/// Integer matrices are factorized over `math::promote_t`.
template <std::integral I>
[[nodiscard]] auto factPQ(const DenseMatrix<I> &A)
  -> std::optional<FactPQ<math::promote_t<I>>> {
  return factPQ(A.template map<math::promote_t<I>>());
}
template <std::integral I>
[[nodiscard]] auto factPQ(const DenseMatrix<std::complex<I>> &A)
  -> std::optional<FactPQ<math::promote_t<std::complex<I>>>> {
  using C = math::promote_t<std::complex<I>>;
  using R = typename C::value_type;
  return factPQ(A.map([](const std::complex<I> &x) {
    return C(R(x.real()), R(x.imag()));
  }));
}

} // namespace buckingham::LU
