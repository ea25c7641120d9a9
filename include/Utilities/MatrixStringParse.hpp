#pragma once

#include "Math/Matrix.hpp"
#include "Math/Rational.hpp"
#include "Utilities/Invariant.hpp"
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <utility>

namespace buckingham::utils {

/// Parses a matrix literal such as `[a b; c d]`: `;` separates rows and
/// whitespace separates entries. `parseEntry` maps one entry token to a `T`.
/// Only meant for literals in tests and benchmarks, so malformed input is an
/// invariant violation rather than an error.
template <class T, class F>
auto parseMatrix(llvm::StringRef s, F &&parseEntry) -> math::DenseMatrix<T> {
  s = s.trim();
  invariant(s.consume_front("[") && s.consume_back("]"));
  llvm::SmallVector<T, 0> content;
  size_t numRows = 0, numCols = 0;
  llvm::SmallVector<llvm::StringRef, 8> rows, entries;
  s.split(rows, ';');
  for (llvm::StringRef row : rows) {
    entries.clear();
    row.split(entries, ' ', -1, /*KeepEmpty=*/false);
    if (numRows == 0) numCols = entries.size();
    invariant(entries.size() == numCols);
    for (llvm::StringRef e : entries) content.push_back(parseEntry(e));
    ++numRows;
  }
  return math::DenseMatrix<T>(std::move(content), math::Row{numRows},
                              math::Col{numCols});
}

inline auto parseInteger(llvm::StringRef e) -> int64_t {
  int64_t x = 0;
  invariant(!e.getAsInteger(10, x));
  return x;
}

} // namespace buckingham::utils

[[nodiscard]] inline auto operator"" _mat(const char *s, size_t n)
  -> buckingham::math::DenseMatrix<int64_t> {
  return buckingham::utils::parseMatrix<int64_t>(
    llvm::StringRef(s, n), buckingham::utils::parseInteger);
}

/// Entries are integers or `n//d`, e.g. `"[1 1//2; -3//4 0]"_rat`.
[[nodiscard]] inline auto operator"" _rat(const char *s, size_t n)
  -> buckingham::math::DenseMatrix<buckingham::math::Rational> {
  using buckingham::math::Rational, buckingham::utils::parseInteger;
  return buckingham::utils::parseMatrix<Rational>(
    llvm::StringRef(s, n), [](llvm::StringRef e) -> Rational {
      auto [num, den] = e.split("//");
      if (den.empty()) return parseInteger(num);
      return Rational::create(parseInteger(num), parseInteger(den));
    });
}
