#pragma once

#include "Dimensions/Parameter.hpp"
#include <cstddef>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <string>

namespace buckingham::dims {

struct NamedParameter {
  std::string symbol;
  Parameter parameter;
};

/// A textual registration, `symbol` and `<kind>:<payload>`.
struct ParameterSpec {
  std::string symbol;
  std::string spec;
};

/// Splits `sym=kind:payload`. Fails with `MalformedExpression` if there is no
/// `=` or the symbol is empty.
auto parseParameterSpec(llvm::StringRef text) -> llvm::Expected<ParameterSpec>;

/// Ordered, duplicate free list of named parameters.
/// Owned by the caller and passed to the computations that read it; there is
/// no global registry.
class ParameterRegistry {
  llvm::SmallVector<NamedParameter, 8> params;

  auto validate(llvm::ArrayRef<ParameterSpec> specs)
    -> llvm::Expected<llvm::SmallVector<NamedParameter, 8>>;

public:
  void clear() { params.clear(); }
  /// Appends `p` unless `symbol` is already registered.
  /// Returns `true` if it was appended.
  auto addParameter(llvm::StringRef symbol, Parameter p) -> bool;
  /// Appends the parameters whose symbols aren't registered yet.
  void addParameters(llvm::ArrayRef<NamedParameter> ps);
  /// Replaces the contents with `ps`.
  void setParameters(llvm::ArrayRef<NamedParameter> ps);
  /// Textual forms. Every spec is parsed before anything is registered, so on
  /// failure the registry is left unchanged.
  auto addParameters(llvm::ArrayRef<ParameterSpec> specs) -> llvm::Error;
  auto setParameters(llvm::ArrayRef<ParameterSpec> specs) -> llvm::Error;

  [[nodiscard]] auto lookup(llvm::StringRef symbol) const -> const Parameter *;
  [[nodiscard]] auto size() const -> size_t { return params.size(); }
  [[nodiscard]] auto empty() const -> bool { return params.empty(); }
  [[nodiscard]] auto begin() const { return params.begin(); }
  [[nodiscard]] auto end() const { return params.end(); }
  [[nodiscard]] auto operator[](size_t i) const -> const NamedParameter & {
    return params[i];
  }

  /// Writes `Parameter(s) registered:` and then ` sym = value` per line.
  void display(llvm::raw_ostream &os) const;
  void dump() const;
};

} // namespace buckingham::dims
