#include "Dimensions/Parameter.hpp"
#include "Dimensions/Registry.hpp"
#include "Support/Error.hpp"
#include <gtest/gtest.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <variant>

using namespace buckingham;
using dims::DimensionVector, dims::Parameter, dims::ParameterRegistry,
  dims::ParameterSpec;

namespace {
auto display(const ParameterRegistry &r) -> std::string {
  std::string s;
  llvm::raw_string_ostream os(s);
  r.display(os);
  return os.str();
}
} // namespace

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(ParameterParseTest, BasicAssertions) {
  auto g = Parameter::parse("quantity:9.8 m/s^2");
  ASSERT_TRUE(static_cast<bool>(g));
  EXPECT_EQ(g->dimensions(), (DimensionVector{{"L", 1}, {"T", -2}}));
  EXPECT_DOUBLE_EQ(g->magnitude(), 9.8);
  EXPECT_TRUE(std::holds_alternative<dims::Quantity>(g->getValue()));

  auto m = Parameter::parse("unit:g");
  ASSERT_TRUE(static_cast<bool>(m));
  EXPECT_DOUBLE_EQ(m->magnitude(), 1e-3);

  auto T = Parameter::parse("dimension:T");
  ASSERT_TRUE(static_cast<bool>(T));
  EXPECT_EQ(T->dimensions(), (DimensionVector{{"T", 1}}));
  EXPECT_DOUBLE_EQ(T->magnitude(), 1.0);

  auto a = Parameter::parse("number: 2.5");
  ASSERT_TRUE(static_cast<bool>(a));
  EXPECT_TRUE(a->isDimensionless());
  EXPECT_DOUBLE_EQ(a->magnitude(), 2.5);

  EXPECT_EQ(errorCodeOf(Parameter::parse("vector:1 2").takeError()),
            ErrorCode::UnsupportedParameterKind);
  EXPECT_EQ(errorCodeOf(Parameter::parse("9.8").takeError()),
            ErrorCode::UnsupportedParameterKind);
  EXPECT_EQ(errorCodeOf(Parameter::parse("number:two").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(Parameter::parse("quantity:9.8").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(Parameter::parse("unit:parsec").takeError()),
            ErrorCode::UnknownUnit);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(RegistryTest, BasicAssertions) {
  ParameterRegistry reg;
  EXPECT_TRUE(reg.empty());
  llvm::Error E = reg.setParameters(llvm::ArrayRef<ParameterSpec>{
    {"ℓ", "unit:m"},
    {"g", "quantity:9.8 m/s^2"},
    {"m", "unit:g"},
    {"T", "dimension:T"},
    {"θ", "unit:NoDims"},
    {"α", "number:2"},
  });
  ASSERT_FALSE(static_cast<bool>(E));
  EXPECT_EQ(reg.size(), 6);
  EXPECT_EQ(display(reg), "Parameter(s) registered:\n"
                          " ℓ = m\n"
                          " g = 9.8 m s^-2\n"
                          " m = g\n"
                          " T = T\n"
                          " θ = NoDims\n"
                          " α = 2\n");
  EXPECT_EQ(reg[1].symbol, "g");
  ASSERT_NE(reg.lookup("g"), nullptr);
  EXPECT_DOUBLE_EQ(reg.lookup("g")->magnitude(), 9.8);
  EXPECT_EQ(reg.lookup("h"), nullptr);

  // appending an existing symbol is a no-op
  EXPECT_FALSE(
    reg.addParameter("g", llvm::cantFail(Parameter::parse("unit:kg"))));
  EXPECT_EQ(reg.size(), 6);
  EXPECT_DOUBLE_EQ(reg.lookup("g")->magnitude(), 9.8);
  llvm::Error F = reg.addParameters(llvm::ArrayRef<ParameterSpec>{
    {"g", "unit:kg"}, {"v", "unit:m/s"}});
  ASSERT_FALSE(static_cast<bool>(F));
  EXPECT_EQ(reg.size(), 7);
  EXPECT_EQ(reg[6].symbol, "v");
  EXPECT_EQ(reg.lookup("g")->dimensions(),
            (DimensionVector{{"L", 1}, {"T", -2}}));

  // replacing resets first
  llvm::Error G = reg.setParameters(
    llvm::ArrayRef<ParameterSpec>{{"ρ", "unit:kg*m^-3"}});
  ASSERT_FALSE(static_cast<bool>(G));
  EXPECT_EQ(reg.size(), 1);
  EXPECT_EQ(reg.lookup("g"), nullptr);
  reg.clear();
  EXPECT_TRUE(reg.empty());
  EXPECT_EQ(display(reg), "Parameter(s) registered:\n");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(RegistryAtomicTest, BasicAssertions) {
  ParameterRegistry reg;
  EXPECT_TRUE(
    reg.addParameter("ℓ", llvm::cantFail(Parameter::parse("unit:m"))));
  std::string before = display(reg);
  // the valid first entry must not be committed either
  EXPECT_EQ(errorCodeOf(reg.addParameters(llvm::ArrayRef<ParameterSpec>{
              {"u", "unit:m/s"}, {"x", "vector:1 2 3"}})),
            ErrorCode::UnsupportedParameterKind);
  EXPECT_EQ(display(reg), before);
  EXPECT_EQ(errorCodeOf(reg.setParameters(llvm::ArrayRef<ParameterSpec>{
              {"u", "unit:m/s"}, {"x", "unit:furlong"}})),
            ErrorCode::UnknownUnit);
  EXPECT_EQ(display(reg), before);
  llvm::Error E =
    reg.setParameters(llvm::ArrayRef<ParameterSpec>{{"x", "scalar:1"}});
  EXPECT_EQ(llvm::toString(std::move(E)),
            "unsupported parameter kind: parameter `x`: `scalar` is not one "
            "of quantity, unit, dimension or number");
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(ParameterSpecTest, BasicAssertions) {
  auto s = dims::parseParameterSpec("g=quantity:9.8 m/s^2");
  ASSERT_TRUE(static_cast<bool>(s));
  EXPECT_EQ(s->symbol, "g");
  EXPECT_EQ(s->spec, "quantity:9.8 m/s^2");
  EXPECT_EQ(errorCodeOf(dims::parseParameterSpec("g").takeError()),
            ErrorCode::MalformedExpression);
  EXPECT_EQ(errorCodeOf(dims::parseParameterSpec("=unit:m").takeError()),
            ErrorCode::MalformedExpression);
}
