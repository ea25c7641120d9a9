#pragma once

#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>
#include <optional>
#include <string>
#include <system_error>

namespace buckingham {

enum class ErrorCode {
  /// A parameter value that isn't a quantity, unit, dimension or number.
  UnsupportedParameterKind = 1,
  /// A rendering form other than `string` or `expr` was requested.
  UnknownOutputForm,
  /// Fixed width rational arithmetic overflowed.
  ArithmeticOverflow,
  /// A unit, dimension or number that doesn't parse.
  MalformedExpression,
  /// A well formed expression naming an unknown unit, dimension or symbol.
  UnknownUnit,
};

auto errorCategory() -> const std::error_category &;
inline auto make_error_code(ErrorCode e) -> std::error_code {
  return {static_cast<int>(e), errorCategory()};
}
auto toString(ErrorCode e) -> llvm::StringRef;

/// Error payload for every user facing failure.
class PiError : public llvm::ErrorInfo<PiError> {
  ErrorCode code;
  std::string msg;

public:
  static char ID;
  PiError(ErrorCode c, const llvm::Twine &m) : code(c), msg(m.str()) {}
  [[nodiscard]] auto getCode() const -> ErrorCode { return code; }
  [[nodiscard]] auto getMessage() const -> llvm::StringRef { return msg; }
  void log(llvm::raw_ostream &os) const override {
    os << toString(code) << ": " << msg;
  }
  [[nodiscard]] auto convertToErrorCode() const -> std::error_code override {
    return make_error_code(code);
  }
};

inline auto makeError(ErrorCode c, const llvm::Twine &msg) -> llvm::Error {
  return llvm::make_error<PiError>(c, msg);
}

/// Consumes `E`, returning the code of the `PiError` it holds, or empty for
/// success.
auto errorCodeOf(llvm::Error E) -> std::optional<ErrorCode>;

} // namespace buckingham
