#include "Dimensions/Dimension.hpp"
#include "Utilities/Invariant.hpp"
#include <array>
#include <llvm/ADT/STLExtras.h>

namespace buckingham::dims {

auto baseDimensions() -> llvm::ArrayRef<BaseDimension> {
  static const std::array<BaseDimension, 7> bases{{
    {"Length", "L", 0},
    {"Mass", "M", 1},
    {"Time", "T", 2},
    {"Current", "I", 3},
    {"Temperature", "Θ", 4},
    {"Amount", "N", 5},
    {"Luminosity", "J", 6},
  }};
  return bases;
}

auto lookupDimension(llvm::StringRef nameOrAbbr)
  -> std::optional<BaseDimension> {
  for (const BaseDimension &d : baseDimensions())
    if (d.abbr == nameOrAbbr || d.name == nameOrAbbr) return d;
  return {};
}

DimensionVector::DimensionVector(
  std::initializer_list<std::pair<llvm::StringRef, Rational>> init) {
  for (auto [abbr, e] : init) {
    std::optional<BaseDimension> d = lookupDimension(abbr);
    utils::invariant(d.has_value());
    utils::invariant(isZero(exponentOf(d->abbr)));
    bool overflow = mulPow(*d, e);
    utils::invariant(!overflow);
  }
}

auto DimensionVector::mulPow(BaseDimension d, Rational e) -> bool {
  if (isZero(e)) return false;
  auto *it = llvm::find_if(powers, [&](const DimensionPower &p) {
    return p.dimension.index >= d.index;
  });
  if (it == powers.end() || it->dimension.index != d.index) {
    powers.insert(it, DimensionPower{d, e});
    return false;
  }
  std::optional<Rational> s = it->exponent.safeAdd(e);
  if (!s) return true;
  if (isZero(*s)) powers.erase(it);
  else it->exponent = *s;
  return false;
}

auto DimensionVector::mulPow(const DimensionVector &other, Rational e)
  -> bool {
  DimensionVector r = *this;
  for (const DimensionPower &p : other) {
    std::optional<Rational> pe = p.exponent.safeMul(e);
    if (!pe || r.mulPow(p.dimension, *pe)) return true;
  }
  *this = std::move(r);
  return false;
}

auto DimensionVector::exponentOf(llvm::StringRef abbr) const -> Rational {
  for (const DimensionPower &p : powers)
    if (p.dimension.abbr == abbr) return p.exponent;
  return 0;
}

auto operator==(const DimensionVector &x, const DimensionVector &y) -> bool {
  if (x.size() != y.size()) return false;
  for (size_t i = 0; i < x.size(); ++i)
    if ((x.powers[i].dimension.index != y.powers[i].dimension.index) ||
        (x.powers[i].exponent != y.powers[i].exponent))
      return false;
  return true;
}

void printPower(llvm::raw_ostream &os, Rational e) {
  if (isOne(e)) return;
  if (e.isInteger()) os << "^" << e.numerator;
  else os << "^(" << e.numerator << "//" << e.denominator << ")";
}

auto operator<<(llvm::raw_ostream &os, const DimensionVector &d)
  -> llvm::raw_ostream & {
  if (d.isDimensionless()) return os << "NoDims";
  bool first = true;
  for (const DimensionPower &p : d) {
    if (!first) os << " ";
    first = false;
    os << p.dimension.abbr;
    printPower(os, p.exponent);
  }
  return os;
}

void DimensionVector::dump() const { llvm::errs() << *this << "\n"; }

} // namespace buckingham::dims
