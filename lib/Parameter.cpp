#include "Dimensions/Parameter.hpp"
#include "Support/Error.hpp"
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Format.h>
#include <utility>

namespace buckingham::dims {

namespace {
auto parseNumber(llvm::StringRef text) -> llvm::Expected<double> {
  double x;
  if (text.empty() || text.getAsDouble(x))
    return makeError(ErrorCode::MalformedExpression,
                     "expected a number, got `" + llvm::Twine(text) + "`");
  return x;
}
} // namespace

auto Parameter::parse(llvm::StringRef text) -> llvm::Expected<Parameter> {
  auto [kind, payload] = text.split(':');
  kind = kind.trim();
  payload = payload.trim();
  if (kind == "quantity") {
    auto [num, unit] = payload.split(' ');
    llvm::Expected<double> x = parseNumber(num);
    if (!x) return x.takeError();
    unit = unit.trim();
    if (unit.empty())
      return makeError(ErrorCode::MalformedExpression,
                       "quantity `" + llvm::Twine(payload) + "` has no unit");
    llvm::Expected<UnitExpr> u = UnitExpr::parse(unit);
    if (!u) return u.takeError();
    return Parameter{Quantity{*x, std::move(*u)}};
  }
  if (kind == "unit") {
    llvm::Expected<UnitExpr> u = UnitExpr::parse(payload);
    if (!u) return u.takeError();
    return Parameter{Unit{std::move(*u)}};
  }
  if (kind == "dimension") {
    llvm::Expected<DimensionVector> d = parseDimensions(payload);
    if (!d) return d.takeError();
    return Parameter{BareDimension{std::move(*d)}};
  }
  if (kind == "number") {
    llvm::Expected<double> x = parseNumber(payload);
    if (!x) return x.takeError();
    return Parameter{PlainNumber{*x}};
  }
  return makeError(ErrorCode::UnsupportedParameterKind,
                   "`" + llvm::Twine(kind) +
                     "` is not one of quantity, unit, dimension or number");
}

auto Parameter::dimensions() const -> DimensionVector {
  if (const auto *q = std::get_if<Quantity>(&value))
    return q->unit.dimensions();
  if (const auto *u = std::get_if<Unit>(&value)) return u->unit.dimensions();
  if (const auto *d = std::get_if<BareDimension>(&value)) return d->dims;
  return {};
}

auto Parameter::magnitude() const -> double {
  if (const auto *q = std::get_if<Quantity>(&value))
    return q->value * q->unit.scale();
  if (const auto *u = std::get_if<Unit>(&value)) return u->unit.scale();
  if (const auto *n = std::get_if<PlainNumber>(&value)) return n->value;
  return 1.0;
}

auto operator<<(llvm::raw_ostream &os, const Parameter &p)
  -> llvm::raw_ostream & {
  const Parameter::Value &v = p.getValue();
  if (const auto *q = std::get_if<Quantity>(&v))
    return os << llvm::format("%g", q->value) << " " << q->unit;
  if (const auto *u = std::get_if<Unit>(&v)) return os << u->unit;
  if (const auto *d = std::get_if<BareDimension>(&v)) return os << d->dims;
  return os << llvm::format("%g", std::get<PlainNumber>(v).value);
}

void Parameter::dump() const { llvm::errs() << *this << "\n"; }

} // namespace buckingham::dims
