#include "Dimensions/Expression.hpp"
#include "Dimensions/PiGroups.hpp"
#include "Dimensions/Registry.hpp"
#include "Support/Error.hpp"
#include <cstddef>
#include <cstdlib>
#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/InitLLVM.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <utility>
#include <variant>

using namespace buckingham;
namespace cl = llvm::cl;

static cl::OptionCategory PiCategory("buckingham-pi options");

static cl::list<std::string>
  ParameterSpecs(cl::Positional, cl::desc("<symbol=kind:value>..."),
                 cl::OneOrMore, cl::cat(PiCategory));

static cl::opt<std::string>
  Form("form", cl::desc("Output form of each group: string or expr"),
       cl::init("string"), cl::cat(PiCategory));

static cl::opt<dims::RationalDomain> Domain(
  "rational", cl::desc("Rational arithmetic used for the factorization"),
  cl::values(clEnumValN(dims::RationalDomain::Fixed, "fixed",
                        "64 bit numerator and denominator"),
             clEnumValN(dims::RationalDomain::Arbitrary, "big",
                        "arbitrary precision (GMP)")),
  cl::init(dims::RationalDomain::Fixed), cl::cat(PiCategory));

static cl::opt<bool>
  Evaluate("evaluate",
           cl::desc("Also print each group's value, in SI base units"),
           cl::cat(PiCategory));

static cl::opt<bool>
  ShowMatrix("show-matrix",
             cl::desc("Dump the exponent matrix and its factorization"),
             cl::cat(PiCategory));

static auto run() -> llvm::Error {
  llvm::Expected<dims::OutputForm> form = dims::parseOutputForm(Form);
  if (!form) return form.takeError();
  llvm::SmallVector<dims::ParameterSpec, 8> specs;
  for (const std::string &s : ParameterSpecs) {
    llvm::Expected<dims::ParameterSpec> spec = dims::parseParameterSpec(s);
    if (!spec) return spec.takeError();
    specs.push_back(std::move(*spec));
  }
  dims::ParameterRegistry registry;
  if (llvm::Error E = registry.setParameters(specs)) return E;
  registry.display(llvm::outs());

  dims::PiOptions options;
  options.domain = Domain;
  if (ShowMatrix) options.trace = &llvm::errs();
  llvm::Expected<llvm::SmallVector<dims::Group, 4>> groups =
    dims::piGroups(registry, options);
  if (!groups) return groups.takeError();
  dims::RenderedGroups rendered = dims::render(*groups, *form);

  dims::ExprContext context;
  llvm::outs() << "Pi group(s):\n";
  for (size_t i = 0; i < groups->size(); ++i) {
    if (const auto *strs =
          std::get_if<llvm::SmallVector<std::string, 4>>(&rendered))
      llvm::outs() << " " << (*strs)[i];
    else llvm::outs() << " " << *std::get<dims::GroupExprs>(rendered).exprs[i];
    if (Evaluate) {
      llvm::Expected<double> x =
        dims::evaluate(context.build((*groups)[i]), registry);
      if (!x) return x.takeError();
      llvm::outs() << " = " << llvm::format("%g", *x);
    }
    llvm::outs() << "\n";
  }
  return llvm::Error::success();
}

auto main(int argc, char **argv) -> int {
  llvm::InitLLVM X(argc, argv);
  cl::HideUnrelatedOptions(PiCategory);
  cl::ParseCommandLineOptions(
    argc, argv,
    "Buckingham-Pi groups of a set of physical parameters\n\n"
    "  buckingham-pi 'l=unit:m' 'g=quantity:9.8 m/s^2' 'T=dimension:T'\n");
  if (llvm::Error E = run()) {
    llvm::logAllUnhandledErrors(std::move(E), llvm::errs(), "buckingham-pi: ");
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
