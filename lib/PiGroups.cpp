#include "Dimensions/PiGroups.hpp"
#include "Dimensions/ExponentMatrix.hpp"
#include "Math/LinearAlgebra.hpp"
#include "Math/NullSpace.hpp"
#include "Support/Error.hpp"
#include <llvm/ADT/Twine.h>
#include <llvm/Support/ErrorHandling.h>
#include <optional>
#include <utility>

namespace buckingham::dims {

auto parseOutputForm(llvm::StringRef form) -> llvm::Expected<OutputForm> {
  if (form == "string" || form == "String") return OutputForm::String;
  if (form == "expr" || form == "Expr") return OutputForm::Expr;
  return makeError(ErrorCode::UnknownOutputForm,
                   "`" + llvm::Twine(form) +
                     "` is not one of `string` or `expr`");
}

namespace {

template <class T>
auto solve(math::DenseMatrix<T> A, llvm::ArrayRef<std::string> symbols,
           llvm::raw_ostream *trace)
  -> llvm::Expected<llvm::SmallVector<Group, 4>> {
  std::optional<LU::FactPQ<T>> F = LU::factPQ(std::move(A));
  if (!F)
    return makeError(ErrorCode::ArithmeticOverflow,
                     "factorizing the exponent matrix overflowed; retry with "
                     "arbitrary precision rationals");
  if (trace) *trace << *F;
  std::optional<math::DenseMatrix<T>> B = LU::nullSpace(*F);
  if (!B)
    return makeError(ErrorCode::ArithmeticOverflow,
                     "solving for the null space overflowed; retry with "
                     "arbitrary precision rationals");
  if (trace) *trace << "null space = \n" << *B << "\n";
  return assembleGroups(*B, F->q, symbols);
}

} // namespace

auto piGroups(const ParameterRegistry &registry, const PiOptions &options)
  -> llvm::Expected<llvm::SmallVector<Group, 4>> {
  ExponentMatrix E = buildExponentMatrix(registry);
  if (options.trace) *options.trace << E;
  llvm::SmallVector<std::string, 8> symbols;
  for (const NamedParameter &p : registry) symbols.push_back(p.symbol);
  switch (options.domain) {
  case RationalDomain::Fixed:
    return solve(std::move(E.A), symbols, options.trace);
  case RationalDomain::Arbitrary:
    return solve(E.A.map(math::toMPQ), symbols, options.trace);
  }
  llvm_unreachable("Unknown RationalDomain");
}

auto render(llvm::ArrayRef<Group> groups, OutputForm form) -> RenderedGroups {
  if (form == OutputForm::String) {
    llvm::SmallVector<std::string, 4> strs;
    for (const Group &g : groups) strs.push_back(renderString(g));
    return RenderedGroups{std::move(strs)};
  }
  GroupExprs exprs{std::make_unique<ExprContext>(), {}};
  for (const Group &g : groups) exprs.exprs.push_back(exprs.context->build(g));
  return RenderedGroups{std::move(exprs)};
}

auto piGroups(const ParameterRegistry &registry, llvm::StringRef form,
              const PiOptions &options) -> llvm::Expected<RenderedGroups> {
  llvm::Expected<OutputForm> f = parseOutputForm(form);
  if (!f) return f.takeError();
  llvm::Expected<llvm::SmallVector<Group, 4>> groups =
    piGroups(registry, options);
  if (!groups) return groups.takeError();
  return render(*groups, *f);
}

auto dimensionsOf(const Group &group, const ParameterRegistry &registry)
  -> llvm::Expected<DimensionVector> {
  llvm::ArrayRef<BaseDimension> bases = baseDimensions();
  // summed exactly, indexed by `BaseDimension::index`
  llvm::SmallVector<mpq_class, 8> sums(bases.size());
  for (const Term &t : group) {
    const Parameter *p = registry.lookup(t.symbol);
    if (!p)
      return makeError(ErrorCode::UnknownUnit, "`" + llvm::Twine(t.symbol) +
                                                 "` is not registered");
    for (const DimensionPower &dp : p->dimensions())
      sums[dp.dimension.index] += math::toMPQ(dp.exponent) * t.exponent;
  }
  DimensionVector d;
  for (const BaseDimension &b : bases) {
    if (sgn(sums[b.index]) == 0) continue;
    std::optional<Rational> e = math::toRational(sums[b.index]);
    if (!e || d.mulPow(b, *e))
      return makeError(ErrorCode::ArithmeticOverflow,
                       "exponent of `" + llvm::Twine(b.abbr) +
                         "` does not fit a 64 bit rational");
  }
  return d;
}

} // namespace buckingham::dims
