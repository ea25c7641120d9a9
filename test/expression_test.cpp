#include "Dimensions/Expression.hpp"
#include "Dimensions/Registry.hpp"
#include "Support/Error.hpp"
#include <cmath>
#include <gmpxx.h>
#include <gtest/gtest.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/raw_ostream.h>
#include <optional>
#include <string>

using namespace buckingham;
using dims::Group, dims::Term;

namespace {
auto str(const dims::Expr &e) -> std::string {
  std::string s;
  llvm::raw_string_ostream os(s);
  os << e;
  return os.str();
}
} // namespace

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(RenderStringTest, BasicAssertions) {
  Group g{Term{"g", mpq_class("1/2")}, Term{"ℓ", mpq_class("-1/2")},
          Term{"T", 1}};
  EXPECT_EQ(dims::renderString(g), "g^(1//2)*ℓ^(-1//2)*T^(1//1)");
  EXPECT_EQ(dims::renderString(Group{Term{"θ", 1}}), "θ^(1//1)");
  EXPECT_EQ(dims::renderString(Group{}), "");
  EXPECT_EQ(dims::renderString(
              Group{Term{"c", mpq_class("-1/100000000000000000000")}}),
            "c^(-1//100000000000000000000)");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(ExprTreeTest, BasicAssertions) {
  Group g{Term{"g", mpq_class("1/2")}, Term{"ℓ", mpq_class("-1/2")},
          Term{"τ", 1}};
  dims::ExprContext ctx;
  const dims::ProductExpr *e = ctx.build(g);
  EXPECT_EQ(str(*e), "g ^ (1 // 2) * ℓ ^ (-1 // 2) * τ ^ (1 // 1)");
  ASSERT_EQ(e->getFactors().size(), 3);
  const auto *p = llvm::dyn_cast<dims::PowerExpr>(e->getFactors()[1]);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->getExponent()->getValue(), (mpq_class("-1/2")));
  const auto *s = llvm::dyn_cast<dims::SymbolExpr>(p->getBase());
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->getName(), "ℓ");
  EXPECT_FALSE(llvm::isa<dims::RationalExpr>(p->getBase()));
  EXPECT_TRUE(llvm::isa<dims::ProductExpr>(static_cast<const dims::Expr *>(e)));

  auto x = dims::evaluate(e, [](llvm::StringRef sym) -> std::optional<double> {
    if (sym == "g") return 9.8;
    if (sym == "ℓ" || sym == "τ") return 1.0;
    return {};
  });
  ASSERT_TRUE(static_cast<bool>(x));
  EXPECT_DOUBLE_EQ(*x, std::sqrt(9.8));

  auto y = dims::evaluate(e, [](llvm::StringRef) -> std::optional<double> {
    return {};
  });
  EXPECT_EQ(errorCodeOf(y.takeError()), ErrorCode::UnknownUnit);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(EvaluateRegistryTest, BasicAssertions) {
  dims::ParameterRegistry reg;
  llvm::Error E = reg.setParameters(llvm::ArrayRef<dims::ParameterSpec>{
    {"v", "quantity:36 km/h"}, {"ℓ", "quantity:2 mm"}, {"ν", "unit:m^2/s"}});
  ASSERT_FALSE(static_cast<bool>(E));
  dims::ExprContext ctx;
  // Reynolds number from a kinematic viscosity, in SI base units
  auto x = dims::evaluate(
    ctx.build(Group{Term{"v", 1}, Term{"ℓ", 1}, Term{"ν", -1}}), reg);
  ASSERT_TRUE(static_cast<bool>(x));
  EXPECT_NEAR(*x, 10.0 * 2e-3, 1e-12);
  auto y = dims::evaluate(ctx.build(Group{Term{"w", 1}}), reg);
  EXPECT_EQ(errorCodeOf(y.takeError()), ErrorCode::UnknownUnit);
}
