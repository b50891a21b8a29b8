#pragma once
#include "matchers/MatchContext.hpp"

#include "clang/AST/Stmt.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace refit {

// A boolean predicate over (node, context). Matchers are immutable values;
// copies share the same configuration. Evaluation never fails: a null node,
// a kind mismatch or missing sub-structure all yield false.
class Matcher {
public:
  enum class Op {
    KindIs,
    LiteralTextExcludes,
    CalleeOf,
    ArgumentAt,
    ReferencesStaticMember,
    AllOf,
    AnyOf,
    Predicate,
  };

  using PredicateFn = std::function<bool(const clang::Stmt&, const MatchContext&)>;

  bool matches(const clang::Stmt* node, const MatchContext& ctx) const;
  bool matches(const clang::Stmt& node, const MatchContext& ctx) const { return matches(&node, ctx); }

  Op op() const;

  // False if any leaf was built from an invalid configuration (e.g. a
  // pattern that does not compile); the reason goes to *error.
  bool isValid(std::string* error = nullptr) const;

  // Human-readable form, e.g. allOf(kindIs(CallExpr), argumentAt(1, ...)).
  std::string describe() const;

  struct Node;

private:
  explicit Matcher(std::shared_ptr<const Node> node) : Impl(std::move(node)) {}

  std::shared_ptr<const Node> Impl;

  friend Matcher kindIs(clang::Stmt::StmtClass kind);
  friend Matcher literalTextExcludes(const std::string& pattern);
  friend Matcher calleeOf(Matcher inner);
  friend Matcher argumentAt(unsigned index, Matcher inner);
  friend Matcher referencesStaticMember(std::string owner, std::string member);
  friend Matcher allOf(std::vector<Matcher> operands);
  friend Matcher anyOf(std::vector<Matcher> operands);
  friend Matcher predicate(std::string label, PredicateFn fn);
};

Matcher kindIs(clang::Stmt::StmtClass kind);
Matcher literalTextExcludes(const std::string& pattern);
Matcher calleeOf(Matcher inner);
Matcher argumentAt(unsigned index, Matcher inner);
Matcher referencesStaticMember(std::string owner, std::string member);
Matcher allOf(std::vector<Matcher> operands);
Matcher anyOf(std::vector<Matcher> operands);
Matcher predicate(std::string label, Matcher::PredicateFn fn);

template <typename... Rest>
Matcher allOf(Matcher first, Rest... rest) {
  return allOf(std::vector<Matcher>{std::move(first), std::move(rest)...});
}

template <typename... Rest>
Matcher anyOf(Matcher first, Rest... rest) {
  return anyOf(std::vector<Matcher>{std::move(first), std::move(rest)...});
}

} // namespace refit
