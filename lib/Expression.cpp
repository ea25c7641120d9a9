#include "Dimensions/Expression.hpp"
#include "Support/Error.hpp"
#include <cmath>
#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/raw_ostream.h>

namespace buckingham::dims {

auto renderString(const Group &g) -> std::string {
  std::string s;
  llvm::raw_string_ostream os(s);
  bool first = true;
  for (const Term &t : g) {
    if (!first) os << "*";
    first = false;
    os << t.symbol << "^(" << t.exponent.get_num().get_str() << "//"
       << t.exponent.get_den().get_str() << ")";
  }
  return os.str();
}

auto operator<<(llvm::raw_ostream &os, const Expr &e) -> llvm::raw_ostream & {
  if (const auto *s = llvm::dyn_cast<SymbolExpr>(&e)) return os << s->getName();
  if (const auto *r = llvm::dyn_cast<RationalExpr>(&e)) {
    const mpq_class &x = r->getValue();
    return os << "(" << x.get_num().get_str() << " // "
              << x.get_den().get_str() << ")";
  }
  if (const auto *p = llvm::dyn_cast<PowerExpr>(&e))
    return os << *p->getBase() << " ^ " << *p->getExponent();
  const auto *m = llvm::cast<ProductExpr>(&e);
  bool first = true;
  for (const Expr *f : m->getFactors()) {
    if (!first) os << " * ";
    first = false;
    os << *f;
  }
  return os;
}

void Expr::dump() const { llvm::errs() << *this << "\n"; }

auto ExprContext::symbol(llvm::StringRef name) -> const SymbolExpr * {
  return new (alloc.Allocate<SymbolExpr>()) SymbolExpr(name.copy(alloc));
}
auto ExprContext::rational(const mpq_class &x) -> const RationalExpr * {
  const mpq_class *v = new (values.Allocate()) mpq_class(x);
  return new (alloc.Allocate<RationalExpr>()) RationalExpr(v);
}
auto ExprContext::power(const Expr *base, const mpq_class &exponent)
  -> const PowerExpr * {
  return new (alloc.Allocate<PowerExpr>()) PowerExpr(base, rational(exponent));
}
auto ExprContext::product(llvm::ArrayRef<const Expr *> factors)
  -> const ProductExpr * {
  const Expr **mem = alloc.Allocate<const Expr *>(factors.size());
  llvm::copy(factors, mem);
  return new (alloc.Allocate<ProductExpr>())
    ProductExpr(llvm::ArrayRef<const Expr *>(mem, factors.size()));
}
auto ExprContext::build(const Group &g) -> const ProductExpr * {
  llvm::SmallVector<const Expr *, 4> factors;
  for (const Term &t : g) factors.push_back(power(symbol(t.symbol), t.exponent));
  return product(factors);
}

auto evaluate(const Expr *e,
              llvm::function_ref<std::optional<double>(llvm::StringRef)> lookup)
  -> llvm::Expected<double> {
  switch (e->getKind()) {
  case Expr::EK_Symbol: {
    llvm::StringRef name = llvm::cast<SymbolExpr>(e)->getName();
    if (std::optional<double> x = lookup(name)) return *x;
    return makeError(ErrorCode::UnknownUnit,
                     "no value for symbol `" + llvm::Twine(name) + "`");
  }
  case Expr::EK_Rational:
    return llvm::cast<RationalExpr>(e)->getValue().get_d();
  case Expr::EK_Power: {
    const auto *p = llvm::cast<PowerExpr>(e);
    llvm::Expected<double> b = evaluate(p->getBase(), lookup);
    if (!b) return b.takeError();
    return std::pow(*b, p->getExponent()->getValue().get_d());
  }
  case Expr::EK_Product: {
    double x = 1.0;
    for (const Expr *f : llvm::cast<ProductExpr>(e)->getFactors()) {
      llvm::Expected<double> y = evaluate(f, lookup);
      if (!y) return y.takeError();
      x *= *y;
    }
    return x;
  }
  }
  llvm_unreachable("Unknown ExprKind");
}

auto evaluate(const Expr *e, const ParameterRegistry &registry)
  -> llvm::Expected<double> {
  return evaluate(e, [&](llvm::StringRef sym) -> std::optional<double> {
    if (const Parameter *p = registry.lookup(sym)) return p->magnitude();
    return {};
  });
}

} // namespace buckingham::dims
