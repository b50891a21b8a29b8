#include "analyzers/PreconditionsExpensiveString.hpp"

#include "clang/AST/Expr.h"
#include "llvm/Support/Casting.h"

using namespace clang;

namespace refit {

static Matcher buildRule(const PreconditionsExpensiveString::Options& o) {
  auto check = [&](const char* member) {
    return calleeOf(referencesStaticMember(o.preconditionsClass, member));
  };

  Matcher formatWithoutPlaceholder = allOf(
      kindIs(Stmt::CallExprClass),
      calleeOf(referencesStaticMember(o.formatClass, o.formatMember)),
      argumentAt(0, literalTextExcludes(o.placeholderPattern)));

  return allOf(
      anyOf(check("checkNotNull"), check("checkState"), check("checkArgument")),
      argumentAt(1, formatWithoutPlaceholder));
}

// format() prints "%%" as "%"; the unwrapped literal must read the same
static std::string unescapePercent(const std::string& literal) {
  std::string out;
  out.reserve(literal.size());
  for (size_t i = 0; i < literal.size(); ++i) {
    out += literal[i];
    if (literal[i] == '%' && i + 1 < literal.size() && literal[i + 1] == '%') ++i;
  }
  return out;
}

PreconditionsExpensiveString::PreconditionsExpensiveString(Options opts)
  : Opts(std::move(opts)), Rule(buildRule(Opts)) {}

std::vector<Stmt::StmtClass> PreconditionsExpensiveString::nodeKinds() const {
  return {Stmt::CallExprClass};
}

std::optional<Description>
PreconditionsExpensiveString::match(const Stmt& node, const MatchContext& ctx) const {
  const auto* call = llvm::dyn_cast<CallExpr>(&node);
  if (!call || !Rule.matches(node, ctx)) return std::nullopt;

  Description d;
  std::string callee = Opts.preconditionsClass;
  if (auto ref = ctx.resolver().resolve(node)) callee += "::" + ref->member;
  d.message = "Second argument to " + callee + "() is a call to " + Opts.formatClass +
              "::" + Opts.formatMember + "(), which can be unwrapped";

  // Only a lone literal can be unwrapped without changing the message
  const auto* format = llvm::dyn_cast_or_null<CallExpr>(spelledExpr(call->getArg(1)));
  if (format && format->getNumArgs() == 1) {
    std::string literal = ctx.textOf(*spelledExpr(format->getArg(0)));
    if (!literal.empty()) d.fix = ctx.replace(*format, unescapePercent(literal));
  }
  return d;
}

} // namespace refit
