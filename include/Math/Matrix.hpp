#pragma once
#include "Math/AxisTypes.hpp"
#include "Utilities/Invariant.hpp"
#include <complex>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <gmpxx.h>
#include <initializer_list>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/raw_ostream.h>
#include <type_traits>
#include <utility>

namespace buckingham::math {

template <typename T>
concept Printable = requires(llvm::raw_ostream &os, const T &x) {
  { os << x } -> std::same_as<llvm::raw_ostream &>;
};
inline void printObj(llvm::raw_ostream &os, const Printable auto &x) {
  os << x;
}
template <std::floating_point T>
inline void printObj(llvm::raw_ostream &os, const std::complex<T> &x) {
  os << x.real() << (x.imag() < 0 ? " - " : " + ")
     << (x.imag() < 0 ? -x.imag() : x.imag()) << "im";
}
inline void printObj(llvm::raw_ostream &os, const mpq_class &x) {
  os << x.get_num().get_str();
  if (x.get_den() != 1) os << " // " << x.get_den().get_str();
}

/// Owning row-major matrix.
/// Unlike views over arena memory, elements need not be trivially
/// destructible, so `DenseMatrix<mpq_class>` is fine.
template <class T> class DenseMatrix {
  llvm::SmallVector<T, 0> mem;
  Row M{0};
  Col N{0};

public:
  using value_type = T;
  constexpr DenseMatrix() = default;
  DenseMatrix(Row m, Col n) : mem(m * n, T{0}), M(m), N(n) {}
  DenseMatrix(Row m, Col n, T x) : mem(m * n, x), M(m), N(n) {}
  /// Row by row.
  DenseMatrix(std::initializer_list<std::initializer_list<T>> rows)
    : M(rows.size()), N(rows.size() ? rows.begin()->size() : 0) {
    mem.reserve(M * N);
    for (auto &r : rows) {
      utils::invariant(r.size() == size_t(N));
      mem.append(r.begin(), r.end());
    }
  }
  DenseMatrix(llvm::SmallVector<T, 0> content, Row m, Col n)
    : mem(std::move(content)), M(m), N(n) {
    utils::invariant(mem.size() == m * n);
  }
  static auto identity(size_t n) -> DenseMatrix<T> {
    DenseMatrix<T> A(Row{n}, Col{n});
    for (size_t i = 0; i < n; ++i) A(i, i) = T{1};
    return A;
  }

  [[nodiscard]] constexpr auto numRow() const -> Row { return M; }
  [[nodiscard]] constexpr auto numCol() const -> Col { return N; }
  [[nodiscard]] constexpr auto isSquare() const -> bool {
    return size_t(M) == size_t(N);
  }

  auto operator()(size_t i, size_t j) -> T & {
    utils::invariant(i < M);
    utils::invariant(j < N);
    return mem[i * size_t(N) + j];
  }
  auto operator()(size_t i, size_t j) const -> const T & {
    utils::invariant(i < M);
    utils::invariant(j < N);
    return mem[i * size_t(N) + j];
  }
  [[nodiscard]] auto getRow(size_t i) const -> llvm::ArrayRef<T> {
    utils::invariant(i < M);
    return llvm::ArrayRef<T>(mem).slice(i * size_t(N), size_t(N));
  }
  [[nodiscard]] auto getCol(size_t j) const -> llvm::SmallVector<T, 0> {
    llvm::SmallVector<T, 0> c;
    c.reserve(size_t(M));
    for (size_t i = 0; i < M; ++i) c.push_back((*this)(i, j));
    return c;
  }
  auto begin() { return mem.begin(); }
  auto end() { return mem.end(); }
  [[nodiscard]] auto begin() const { return mem.begin(); }
  [[nodiscard]] auto end() const { return mem.end(); }

  /// Swaps rows `i` and `j`, restricted to the columns `[0, colEnd)`.
  void swapRows(size_t i, size_t j, size_t colEnd) {
    if (i == j) return;
    for (size_t c = 0; c < colEnd; ++c) std::swap((*this)(i, c), (*this)(j, c));
  }
  void swapRows(size_t i, size_t j) { swapRows(i, j, size_t(N)); }
  void swapCols(size_t i, size_t j) {
    if (i == j) return;
    for (size_t r = 0; r < M; ++r) std::swap((*this)(r, i), (*this)(r, j));
  }

  /// `A[p, q]`, i.e. `B(i, j) = A(p[i], q[j])`.
  [[nodiscard]] auto permuted(llvm::ArrayRef<unsigned> p,
                              llvm::ArrayRef<unsigned> q) const
    -> DenseMatrix<T> {
    utils::invariant(p.size() == size_t(M));
    utils::invariant(q.size() == size_t(N));
    DenseMatrix<T> B(M, N);
    for (size_t i = 0; i < M; ++i)
      for (size_t j = 0; j < N; ++j) B(i, j) = (*this)(p[i], q[j]);
    return B;
  }
  /// Elementwise conversion, e.g. `A.map<double>()`.
  template <class U> [[nodiscard]] auto map() const -> DenseMatrix<U> {
    DenseMatrix<U> B(M, N);
    auto o = B.begin();
    for (const T &x : mem) *(o++) = U(x);
    return B;
  }
  template <class F> [[nodiscard]] auto map(F &&f) const {
    using U = std::remove_cvref_t<decltype(f(std::declval<const T &>()))>;
    DenseMatrix<U> B(M, N);
    auto o = B.begin();
    for (const T &x : mem) *(o++) = f(x);
    return B;
  }

  friend auto operator==(const DenseMatrix &A, const DenseMatrix &B) -> bool {
    if ((A.M != B.M) || (A.N != B.N)) return false;
    for (size_t i = 0, L = A.mem.size(); i < L; ++i)
      if (!(A.mem[i] == B.mem[i])) return false;
    return true;
  }
  friend auto operator*(const DenseMatrix &A, const DenseMatrix &B)
    -> DenseMatrix {
    utils::invariant(size_t(A.N) == size_t(B.M));
    DenseMatrix C(A.M, B.N);
    for (size_t i = 0; i < A.M; ++i)
      for (size_t j = 0; j < B.N; ++j) {
        T s{0};
        for (size_t k = 0; k < A.N; ++k) s += A(i, k) * B(k, j);
        C(i, j) = s;
      }
    return C;
  }
  friend auto operator<<(llvm::raw_ostream &os, const DenseMatrix &A)
    -> llvm::raw_ostream & {
    os << "[ ";
    for (size_t i = 0; i < A.M; ++i) {
      if (i) os << "\n  ";
      for (size_t j = 0; j < A.N; ++j) {
        if (j) os << " ";
        printObj(os, A(i, j));
      }
    }
    return os << " ]";
  }
  void dump() const { llvm::errs() << *this << "\n"; }
};

} // namespace buckingham::math
