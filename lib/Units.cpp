#include "Dimensions/Units.hpp"
#include "Support/Error.hpp"
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <llvm/ADT/STLExtras.h>
#include <optional>

namespace buckingham::dims {

auto unitTable() -> llvm::ArrayRef<UnitInfo> {
  static const llvm::SmallVector<UnitInfo, 0> table{
    {"m", 1.0, {{"L", 1}}},
    {"km", 1e3, {{"L", 1}}},
    {"cm", 1e-2, {{"L", 1}}},
    {"mm", 1e-3, {{"L", 1}}},
    {"s", 1.0, {{"T", 1}}},
    {"ms", 1e-3, {{"T", 1}}},
    {"min", 60.0, {{"T", 1}}},
    {"h", 3600.0, {{"T", 1}}},
    {"g", 1e-3, {{"M", 1}}},
    {"kg", 1.0, {{"M", 1}}},
    {"A", 1.0, {{"I", 1}}},
    {"K", 1.0, {{"Θ", 1}}},
    {"mol", 1.0, {{"N", 1}}},
    {"cd", 1.0, {{"J", 1}}},
    {"N", 1.0, {{"L", 1}, {"M", 1}, {"T", -2}}},
    {"J", 1.0, {{"L", 2}, {"M", 1}, {"T", -2}}},
    {"W", 1.0, {{"L", 2}, {"M", 1}, {"T", -3}}},
    {"Pa", 1.0, {{"L", -1}, {"M", 1}, {"T", -2}}},
    {"Hz", 1.0, {{"T", -1}}},
    {"C", 1.0, {{"T", 1}, {"I", 1}}},
    {"V", 1.0, {{"L", 2}, {"M", 1}, {"T", -3}, {"I", -1}}},
    {"NoDims", 1.0, {}},
  };
  return table;
}

auto lookupUnit(llvm::StringRef symbol) -> const UnitInfo * {
  llvm::ArrayRef<UnitInfo> table = unitTable();
  const auto *it = llvm::find_if(
    table, [&](const UnitInfo &u) { return u.symbol == symbol; });
  return it == table.end() ? nullptr : it;
}

namespace {

class PowerProductParser {
  llvm::StringRef s;
  size_t cur{0};

  static auto isIdentChar(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
  }
  static auto isDigit(char c) -> bool { return c >= '0' && c <= '9'; }
  void skipSpace() {
    while (cur < s.size() && s[cur] == ' ') ++cur;
  }
  auto peek() const -> char { return cur < s.size() ? s[cur] : '\0'; }
  auto malformed(const llvm::Twine &what) const -> llvm::Error {
    return makeError(ErrorCode::MalformedExpression,
                     what + " at offset " + llvm::Twine(cur) + " in `" + s +
                       "`");
  }
  auto parseInt() -> llvm::Expected<int64_t> {
    bool neg = false;
    if (peek() == '-' || peek() == '+') {
      neg = peek() == '-';
      ++cur;
    }
    if (!isDigit(peek())) return malformed("expected an integer");
    int64_t res = 0;
    while (isDigit(peek())) {
      if (__builtin_mul_overflow(res, 10, &res) ||
          __builtin_add_overflow(res, s[cur] - '0', &res))
        return malformed("integer out of range");
      ++cur;
    }
    return neg ? -res : res;
  }
  auto parseExponent() -> llvm::Expected<Rational> {
    skipSpace();
    if (peek() != '(') {
      llvm::Expected<int64_t> n = parseInt();
      if (!n) return n.takeError();
      return Rational{*n};
    }
    ++cur;
    skipSpace();
    llvm::Expected<int64_t> n = parseInt();
    if (!n) return n.takeError();
    skipSpace();
    int64_t d = 1;
    if (peek() == '/') {
      ++cur;
      if (peek() == '/') ++cur;
      skipSpace();
      llvm::Expected<int64_t> den = parseInt();
      if (!den) return den.takeError();
      if (*den == 0) return malformed("zero denominator");
      d = *den;
      skipSpace();
    }
    if (peek() != ')') return malformed("expected `)`");
    ++cur;
    return Rational::create(*n, d);
  }

public:
  explicit PowerProductParser(llvm::StringRef text) : s(text) {}

  auto parse() -> llvm::Expected<llvm::SmallVector<PowerFactor, 4>> {
    llvm::SmallVector<PowerFactor, 4> factors;
    bool expectFactor = true, invert = false, sawFactor = false;
    for (skipSpace(); cur < s.size(); skipSpace()) {
      char c = peek();
      if (c == '*' || c == '/') {
        if (expectFactor) return malformed("unexpected operator");
        invert = c == '/';
        expectFactor = true;
        ++cur;
        continue;
      }
      sawFactor = true;
      std::string symbol;
      if (isDigit(c)) {
        // only the unit literal `1`, as in `1/s`
        llvm::Expected<int64_t> one = parseInt();
        if (!one) return one.takeError();
        if (*one != 1) return malformed("unexpected number");
      } else {
        size_t start = cur;
        while (isIdentChar(peek())) ++cur;
        if (cur == start) return malformed("unexpected character");
        symbol = s.slice(start, cur).str();
      }
      Rational e = 1;
      skipSpace();
      if (peek() == '^') {
        ++cur;
        llvm::Expected<Rational> pe = parseExponent();
        if (!pe) return pe.takeError();
        e = *pe;
      }
      if (invert) e = -e;
      invert = false;
      expectFactor = false;
      if (symbol.empty()) continue;
      auto *it = llvm::find_if(
        factors, [&](const PowerFactor &f) { return f.symbol == symbol; });
      if (it == factors.end()) {
        factors.push_back(PowerFactor{std::move(symbol), e});
        continue;
      }
      std::optional<Rational> sum = it->exponent.safeAdd(e);
      if (!sum) return malformed("exponent out of range");
      it->exponent = *sum;
    }
    if (!sawFactor) return malformed("empty expression");
    if (expectFactor) return malformed("trailing operator");
    llvm::erase_if(factors,
                   [](const PowerFactor &f) { return isZero(f.exponent); });
    return factors;
  }
};

} // namespace

auto parsePowerProduct(llvm::StringRef text)
  -> llvm::Expected<llvm::SmallVector<PowerFactor, 4>> {
  return PowerProductParser{text}.parse();
}

auto UnitExpr::parse(llvm::StringRef text) -> llvm::Expected<UnitExpr> {
  llvm::Expected<llvm::SmallVector<PowerFactor, 4>> factors =
    parsePowerProduct(text);
  if (!factors) return factors.takeError();
  UnitExpr u;
  for (const PowerFactor &f : *factors) {
    const UnitInfo *info = lookupUnit(f.symbol);
    if (!info)
      return makeError(ErrorCode::UnknownUnit,
                       "unknown unit `" + llvm::Twine(f.symbol) + "` in `" + text +
                         "`");
    if (u.dims.mulPow(info->dims, f.exponent))
      return makeError(ErrorCode::ArithmeticOverflow,
                       "dimension exponent out of range in `" + llvm::Twine(text) +
                         "`");
    u.scaleToSI *= std::pow(info->scale, double(f.exponent));
  }
  // `NoDims` only contributes when it stands alone
  llvm::erase_if(*factors,
                 [](const PowerFactor &f) { return f.symbol == "NoDims"; });
  u.factors = std::move(*factors);
  return u;
}

auto operator<<(llvm::raw_ostream &os, const UnitExpr &u)
  -> llvm::raw_ostream & {
  if (u.factors.empty()) return os << "NoDims";
  bool first = true;
  for (const PowerFactor &f : u.factors) {
    if (!first) os << " ";
    first = false;
    os << f.symbol;
    printPower(os, f.exponent);
  }
  return os;
}

auto parseDimensions(llvm::StringRef text) -> llvm::Expected<DimensionVector> {
  llvm::Expected<llvm::SmallVector<PowerFactor, 4>> factors =
    parsePowerProduct(text);
  if (!factors) return factors.takeError();
  DimensionVector dims;
  for (const PowerFactor &f : *factors) {
    if (f.symbol == "NoDims") continue;
    std::optional<BaseDimension> d = lookupDimension(f.symbol);
    if (!d)
      return makeError(ErrorCode::UnknownUnit,
                       "unknown dimension `" + llvm::Twine(f.symbol) +
                         "` in `" + text + "`");
    if (dims.mulPow(*d, f.exponent))
      return makeError(ErrorCode::ArithmeticOverflow,
                       "dimension exponent out of range in `" + llvm::Twine(text) +
                         "`");
  }
  return dims;
}

} // namespace buckingham::dims
