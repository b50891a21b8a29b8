#pragma once
#include "analyzers/Checker.hpp"
#include "matchers/Matcher.hpp"

#include <string>

namespace refit {

// Flags Preconditions checks whose error message is built eagerly with a
// Strings::format() call that has no placeholder, ie. a call that could
// have been a plain string literal:
//
//   Preconditions::checkArgument(ok, Strings::format("must be positive"));
//
// When the literal is the only format argument the fix unwraps it.
class PreconditionsExpensiveString final : public Checker {
public:
  struct Options {
    std::string preconditionsClass = "base::Preconditions";
    std::string formatClass = "base::Strings";
    std::string formatMember = "format";
    std::string placeholderPattern = "%s";
  };

  PreconditionsExpensiveString() : PreconditionsExpensiveString(Options()) {}
  explicit PreconditionsExpensiveString(Options opts);

  std::string name() const override { return "PreconditionsExpensiveString"; }
  std::vector<clang::Stmt::StmtClass> nodeKinds() const override;
  std::optional<Description> match(const clang::Stmt& node, const MatchContext& ctx) const override;

  // False when the options produce an unusable matcher (bad pattern).
  bool isValid(std::string* error = nullptr) const { return Rule.isValid(error); }

  const Matcher& rule() const { return Rule; }

private:
  Options Opts;
  Matcher Rule;
};

} // namespace refit
