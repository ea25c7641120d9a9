#pragma once

#include "Dimensions/Registry.hpp"
#include <cstdint>
#include <gmpxx.h>
#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/STLFunctionalExtras.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Allocator.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <optional>
#include <string>

namespace buckingham::dims {

/// `symbol^exponent`, one factor of a group. Exponents are exact and
/// unbounded, whichever domain the basis was computed in.
struct Term {
  std::string symbol;
  mpq_class exponent;
};
/// A dimensionless monomial, its terms in the order the basis lists them.
using Group = llvm::SmallVector<Term, 4>;

/// `g^(1//2)*ℓ^(-1//2)*T^(1//1)`; exponents always carry a denominator.
auto renderString(const Group &g) -> std::string;

/// Expression trees for groups, with LLVM style RTTI (`isa`, `dyn_cast`).
/// Nodes are allocated by an `ExprContext` and live as long as it does.
class Expr {
public:
  enum ExprKind : uint8_t {
    EK_Symbol,
    EK_Rational,
    EK_Power,
    EK_Product,
  };

private:
  const ExprKind kind;

protected:
  constexpr Expr(ExprKind k) : kind(k) {}

public:
  [[nodiscard]] constexpr auto getKind() const -> ExprKind { return kind; }
  friend auto operator<<(llvm::raw_ostream &os, const Expr &e)
    -> llvm::raw_ostream &;
  void dump() const;
};

class SymbolExpr : public Expr {
  llvm::StringRef name;

public:
  constexpr SymbolExpr(llvm::StringRef n) : Expr(EK_Symbol), name(n) {}
  static constexpr auto classof(const Expr *e) -> bool {
    return e->getKind() == EK_Symbol;
  }
  [[nodiscard]] constexpr auto getName() const -> llvm::StringRef {
    return name;
  }
};

class RationalExpr : public Expr {
  const mpq_class *value;

public:
  constexpr RationalExpr(const mpq_class *x) : Expr(EK_Rational), value(x) {}
  static constexpr auto classof(const Expr *e) -> bool {
    return e->getKind() == EK_Rational;
  }
  [[nodiscard]] constexpr auto getValue() const -> const mpq_class & {
    return *value;
  }
};

class PowerExpr : public Expr {
  const Expr *base;
  const RationalExpr *exponent;

public:
  constexpr PowerExpr(const Expr *b, const RationalExpr *e)
    : Expr(EK_Power), base(b), exponent(e) {}
  static constexpr auto classof(const Expr *e) -> bool {
    return e->getKind() == EK_Power;
  }
  [[nodiscard]] constexpr auto getBase() const -> const Expr * { return base; }
  [[nodiscard]] constexpr auto getExponent() const -> const RationalExpr * {
    return exponent;
  }
};

class ProductExpr : public Expr {
  llvm::ArrayRef<const Expr *> factors;

public:
  constexpr ProductExpr(llvm::ArrayRef<const Expr *> f)
    : Expr(EK_Product), factors(f) {}
  static constexpr auto classof(const Expr *e) -> bool {
    return e->getKind() == EK_Product;
  }
  [[nodiscard]] constexpr auto getFactors() const
    -> llvm::ArrayRef<const Expr *> {
    return factors;
  }
};

/// Owns expression nodes. Nodes are trivially destructible, so they are
/// released together with `alloc`; the `mpq_class` values they point to are
/// destroyed with `values`.
class ExprContext {
  llvm::BumpPtrAllocator alloc;
  llvm::SpecificBumpPtrAllocator<mpq_class> values;

public:
  auto symbol(llvm::StringRef name) -> const SymbolExpr *;
  auto rational(const mpq_class &x) -> const RationalExpr *;
  auto power(const Expr *base, const mpq_class &exponent) -> const PowerExpr *;
  auto product(llvm::ArrayRef<const Expr *> factors) -> const ProductExpr *;
  /// Product of `symbol ^ exponent` over the terms of `g`, built from the
  /// terms directly.
  auto build(const Group &g) -> const ProductExpr *;
};

/// Numeric value of `e`, with `lookup` giving the value of each symbol.
/// Fails with `UnknownUnit` for a symbol `lookup` doesn't know.
auto evaluate(const Expr *e,
              llvm::function_ref<std::optional<double>(llvm::StringRef)> lookup)
  -> llvm::Expected<double>;
/// Symbols take the magnitude, in SI base units, of the registered parameter.
auto evaluate(const Expr *e, const ParameterRegistry &registry)
  -> llvm::Expected<double>;

} // namespace buckingham::dims
