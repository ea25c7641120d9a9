#pragma once

#include <source_location>

#ifndef NDEBUG
#include <cstdlib>
#include <llvm/Support/raw_ostream.h>
#endif

namespace buckingham::utils {

/// Internal consistency check. Debug builds report the violated location and
/// abort; release builds turn a violation into undefined behavior so the
/// optimizer may assume `condition`. Never use it to validate user input.
#ifndef NDEBUG
[[noreturn, gnu::cold]] inline void
invariantFailure(std::source_location loc) {
  llvm::errs() << "invariant violation at " << loc.file_name() << ":"
               << loc.line() << ":" << loc.column() << " in `"
               << loc.function_name() << "`\n";
  std::abort();
}
[[gnu::artificial]] constexpr inline void
invariant(bool condition,
          std::source_location loc = std::source_location::current()) {
  if (!condition) invariantFailure(loc);
}
#else
[[gnu::artificial]] constexpr inline void invariant(bool condition) {
  if (!condition) __builtin_unreachable();
}
#endif

} // namespace buckingham::utils
