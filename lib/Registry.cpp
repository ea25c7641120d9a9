#include "Dimensions/Registry.hpp"
#include "Support/Error.hpp"
#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/Twine.h>
#include <utility>

namespace buckingham::dims {

auto parseParameterSpec(llvm::StringRef text)
  -> llvm::Expected<ParameterSpec> {
  auto [sym, spec] = text.split('=');
  sym = sym.trim();
  if (sym.empty() || sym.size() == text.size())
    return makeError(ErrorCode::MalformedExpression,
                     "expected `symbol=kind:value`, got `" + llvm::Twine(text) +
                       "`");
  return ParameterSpec{sym.str(), spec.trim().str()};
}

auto ParameterRegistry::lookup(llvm::StringRef symbol) const
  -> const Parameter * {
  for (const NamedParameter &p : params)
    if (p.symbol == symbol) return &p.parameter;
  return nullptr;
}

auto ParameterRegistry::addParameter(llvm::StringRef symbol, Parameter p)
  -> bool {
  if (lookup(symbol)) return false;
  params.push_back(NamedParameter{symbol.str(), std::move(p)});
  return true;
}

void ParameterRegistry::addParameters(llvm::ArrayRef<NamedParameter> ps) {
  for (const NamedParameter &p : ps) addParameter(p.symbol, p.parameter);
}

void ParameterRegistry::setParameters(llvm::ArrayRef<NamedParameter> ps) {
  clear();
  addParameters(ps);
}

auto ParameterRegistry::validate(llvm::ArrayRef<ParameterSpec> specs)
  -> llvm::Expected<llvm::SmallVector<NamedParameter, 8>> {
  llvm::SmallVector<NamedParameter, 8> parsed;
  for (const ParameterSpec &s : specs) {
    llvm::Expected<Parameter> p = Parameter::parse(s.spec);
    if (!p)
      return llvm::handleErrors(p.takeError(), [&](const PiError &E) {
        return makeError(E.getCode(), "parameter `" + llvm::Twine(s.symbol) +
                                        "`: " + E.getMessage());
      });
    parsed.push_back(NamedParameter{s.symbol, std::move(*p)});
  }
  return parsed;
}

auto ParameterRegistry::addParameters(llvm::ArrayRef<ParameterSpec> specs)
  -> llvm::Error {
  llvm::Expected<llvm::SmallVector<NamedParameter, 8>> ps = validate(specs);
  if (!ps) return ps.takeError();
  addParameters(*ps);
  return llvm::Error::success();
}

auto ParameterRegistry::setParameters(llvm::ArrayRef<ParameterSpec> specs)
  -> llvm::Error {
  llvm::Expected<llvm::SmallVector<NamedParameter, 8>> ps = validate(specs);
  if (!ps) return ps.takeError();
  setParameters(*ps);
  return llvm::Error::success();
}

void ParameterRegistry::display(llvm::raw_ostream &os) const {
  os << "Parameter(s) registered:\n";
  for (const NamedParameter &p : params)
    os << " " << p.symbol << " = " << p.parameter << "\n";
}

void ParameterRegistry::dump() const { display(llvm::errs()); }

} // namespace buckingham::dims
