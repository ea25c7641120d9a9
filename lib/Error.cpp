#include "Support/Error.hpp"
#include <llvm/Support/ErrorHandling.h>
#include <string>

namespace buckingham {

char PiError::ID = 0;

namespace {
class PiErrorCategory : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "buckingham-pi";
  }
  [[nodiscard]] auto message(int ev) const -> std::string override {
    return toString(static_cast<ErrorCode>(ev)).str();
  }
};
} // namespace

auto errorCategory() -> const std::error_category & {
  static PiErrorCategory category;
  return category;
}

auto toString(ErrorCode e) -> llvm::StringRef {
  switch (e) {
  case ErrorCode::UnsupportedParameterKind: return "unsupported parameter kind";
  case ErrorCode::UnknownOutputForm: return "unknown output form";
  case ErrorCode::ArithmeticOverflow: return "arithmetic overflow";
  case ErrorCode::MalformedExpression: return "malformed expression";
  case ErrorCode::UnknownUnit: return "unknown unit";
  }
  llvm_unreachable("Unknown ErrorCode");
}

auto errorCodeOf(llvm::Error E) -> std::optional<ErrorCode> {
  std::optional<ErrorCode> code;
  // every error raised by this library is a PiError
  llvm::cantFail(llvm::handleErrors(
    std::move(E), [&](const PiError &P) { code = P.getCode(); }));
  return code;
}

} // namespace buckingham
