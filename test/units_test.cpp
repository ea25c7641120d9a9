#include "Dimensions/Dimension.hpp"
#include "Dimensions/Units.hpp"
#include "Support/Error.hpp"
#include <gtest/gtest.h>
#include <llvm/Support/raw_ostream.h>
#include <string>

using namespace buckingham;
using dims::DimensionVector, dims::UnitExpr, math::Rational;

namespace {
template <class T> auto str(const T &x) -> std::string {
  std::string s;
  llvm::raw_string_ostream os(s);
  os << x;
  return os.str();
}
} // namespace

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DimensionVectorTest, BasicAssertions) {
  DimensionVector d{{"T", -2}, {"L", 1}};
  // canonical order regardless of insertion order
  EXPECT_EQ(str(d), "L T^-2");
  EXPECT_EQ(d.exponentOf("T"), -2);
  EXPECT_EQ(d.exponentOf("M"), 0);
  EXPECT_FALSE(d.mulPow(*dims::lookupDimension("Time"), 2));
  EXPECT_EQ(str(d), "L");
  EXPECT_FALSE(d.mulPow(d, -1));
  EXPECT_TRUE(d.isDimensionless());
  EXPECT_EQ(str(d), "NoDims");
  DimensionVector h{{"M", Rational{1, 2}}};
  EXPECT_EQ(str(h), "M^(1//2)");
  EXPECT_FALSE(dims::lookupDimension("Q").has_value());
  EXPECT_EQ(dims::lookupDimension("Θ")->name, "Temperature");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(UnitParseTest, BasicAssertions) {
  auto g = UnitExpr::parse("m/s^2");
  ASSERT_TRUE(static_cast<bool>(g));
  EXPECT_EQ(g->dimensions(), (DimensionVector{{"L", 1}, {"T", -2}}));
  EXPECT_DOUBLE_EQ(g->scale(), 1.0);
  EXPECT_EQ(str(*g), "m s^-2");

  auto mu = UnitExpr::parse("kg*m^-1*s^-1");
  ASSERT_TRUE(static_cast<bool>(mu));
  EXPECT_EQ(mu->dimensions(),
            (DimensionVector{{"L", -1}, {"M", 1}, {"T", -1}}));

  auto v = UnitExpr::parse("km / h");
  ASSERT_TRUE(static_cast<bool>(v));
  EXPECT_DOUBLE_EQ(v->scale(), 1000.0 / 3600.0);

  auto gram = UnitExpr::parse("g");
  ASSERT_TRUE(static_cast<bool>(gram));
  EXPECT_DOUBLE_EQ(gram->scale(), 1e-3);
  EXPECT_EQ(gram->dimensions(), (DimensionVector{{"M", 1}}));

  auto hz = UnitExpr::parse("1/s");
  ASSERT_TRUE(static_cast<bool>(hz));
  EXPECT_EQ(hz->dimensions(), (DimensionVector{{"T", -1}}));

  auto root = UnitExpr::parse("m^(1//2) m^(1/2)");
  ASSERT_TRUE(static_cast<bool>(root));
  EXPECT_EQ(root->dimensions(), (DimensionVector{{"L", 1}}));

  auto none = UnitExpr::parse("NoDims");
  ASSERT_TRUE(static_cast<bool>(none));
  EXPECT_TRUE(none->dimensions().isDimensionless());
  EXPECT_EQ(str(*none), "NoDims");

  auto pa = UnitExpr::parse("N/m^2");
  ASSERT_TRUE(static_cast<bool>(pa));
  EXPECT_EQ(pa->dimensions(), dims::lookupUnit("Pa")->dims);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(UnitParseErrorTest, BasicAssertions) {
  EXPECT_EQ(errorCodeOf(UnitExpr::parse("furlong").takeError()),
            ErrorCode::UnknownUnit);
  EXPECT_EQ(errorCodeOf(UnitExpr::parse("m/").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(UnitExpr::parse("").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(UnitExpr::parse("m^(1//0)").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(UnitExpr::parse("2 m").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(UnitExpr::parse("m % s").takeError()),
            ErrorCode::MalformedExpression);
  auto e = UnitExpr::parse("m^x");
  ASSERT_FALSE(static_cast<bool>(e));
  EXPECT_EQ(llvm::toString(e.takeError()),
            "malformed expression: expected an integer at offset 2 in `m^x`");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(DimensionParseTest, BasicAssertions) {
  auto rho = dims::parseDimensions("Mass Length^-3");
  ASSERT_TRUE(static_cast<bool>(rho));
  EXPECT_EQ(str(*rho), "L^-3 M");
  auto a = dims::parseDimensions("L*T^-2");
  ASSERT_TRUE(static_cast<bool>(a));
  EXPECT_EQ(*a, (DimensionVector{{"L", 1}, {"T", -2}}));
  auto t = dims::parseDimensions("T");
  ASSERT_TRUE(static_cast<bool>(t));
  EXPECT_EQ(*t, (DimensionVector{{"T", 1}}));
  EXPECT_EQ(errorCodeOf(dims::parseDimensions("m").takeError()),
            ErrorCode::UnknownUnit);
}
