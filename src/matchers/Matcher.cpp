#include "matchers/Matcher.hpp"

#include "clang/AST/Expr.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Regex.h"

using namespace clang;

namespace refit {

struct Matcher::Node {
  Op op = Op::Predicate;

  Stmt::StmtClass kind = Stmt::NoStmtClass;      // KindIs

  std::string patternText;                        // LiteralTextExcludes
  std::shared_ptr<llvm::Regex> pattern;
  std::string patternError;

  unsigned index = 0;                             // ArgumentAt

  std::string owner, member;                      // ReferencesStaticMember

  std::vector<Matcher> operands;                  // CalleeOf, ArgumentAt, AllOf, AnyOf

  std::string label;                              // Predicate
  PredicateFn fn;
};

namespace {

const char* kindName(Stmt::StmtClass kind) {
  switch (kind) {
#define STMT(CLASS, PARENT) case Stmt::CLASS##Class: return #CLASS;
#define ABSTRACT_STMT(STMT)
#include "clang/AST/StmtNodes.inc"
  default: return "<unknown>";
  }
}

const Expr* asSpelledExpr(const Stmt* node) {
  const auto* e = llvm::dyn_cast_or_null<Expr>(node);
  return spelledExpr(e);
}

llvm::StringRef literalValue(const StringLiteral& lit) {
  return lit.getCharByteWidth() == 1 ? lit.getString() : lit.getBytes();
}

} // namespace

bool Matcher::matches(const Stmt* node, const MatchContext& ctx) const {
  if (!node || !Impl) return false;
  const Node& n = *Impl;

  switch (n.op) {
  case Op::KindIs:
    return node->getStmtClass() == n.kind;

  case Op::LiteralTextExcludes: {
    if (!n.pattern) return false;
    const auto* lit = llvm::dyn_cast_or_null<StringLiteral>(asSpelledExpr(node));
    if (!lit) return false;
    return !n.pattern->match(literalValue(*lit));
  }

  case Op::CalleeOf: {
    const auto* call = llvm::dyn_cast<CallExpr>(node);
    if (!call) return false;
    return n.operands.front().matches(spelledExpr(call->getCallee()), ctx);
  }

  case Op::ArgumentAt: {
    const auto* call = llvm::dyn_cast<CallExpr>(node);
    if (!call || call->getNumArgs() <= n.index) return false;
    return n.operands.front().matches(spelledExpr(call->getArg(n.index)), ctx);
  }

  case Op::ReferencesStaticMember: {
    auto ref = ctx.resolver().resolve(*node);
    return ref && ref->owner == n.owner && ref->member == n.member;
  }

  case Op::AllOf:
    for (const auto& m : n.operands)
      if (!m.matches(node, ctx)) return false;
    return true;

  case Op::AnyOf:
    for (const auto& m : n.operands)
      if (m.matches(node, ctx)) return true;
    return false;

  case Op::Predicate:
    return n.fn && n.fn(*node, ctx);
  }
  return false;
}

Matcher::Op Matcher::op() const { return Impl->op; }

bool Matcher::isValid(std::string* error) const {
  if (!Impl->patternError.empty()) {
    if (error) *error = "invalid pattern '" + Impl->patternText + "': " + Impl->patternError;
    return false;
  }
  if (Impl->op == Op::Predicate && !Impl->fn) {
    if (error) *error = "predicate '" + Impl->label + "' has no function";
    return false;
  }
  for (const auto& m : Impl->operands)
    if (!m.isValid(error)) return false;
  return true;
}

std::string Matcher::describe() const {
  const Node& n = *Impl;
  auto joined = [&](const char* name) {
    std::string out = name;
    out += "(";
    for (size_t i = 0; i < n.operands.size(); ++i) {
      if (i) out += ", ";
      out += n.operands[i].describe();
    }
    return out + ")";
  };

  switch (n.op) {
  case Op::KindIs:                 return std::string("kindIs(") + kindName(n.kind) + ")";
  case Op::LiteralTextExcludes:    return "literalTextExcludes(/" + n.patternText + "/)";
  case Op::CalleeOf:               return "calleeOf(" + n.operands.front().describe() + ")";
  case Op::ArgumentAt:
    return "argumentAt(" + std::to_string(n.index) + ", " + n.operands.front().describe() + ")";
  case Op::ReferencesStaticMember: return "referencesStaticMember(" + n.owner + "::" + n.member + ")";
  case Op::AllOf:                  return joined("allOf");
  case Op::AnyOf:                  return joined("anyOf");
  case Op::Predicate:              return "predicate(" + n.label + ")";
  }
  return "<matcher>";
}

Matcher kindIs(Stmt::StmtClass kind) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::KindIs;
  n->kind = kind;
  return Matcher(std::move(n));
}

Matcher literalTextExcludes(const std::string& pattern) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::LiteralTextExcludes;
  n->patternText = pattern;
  auto re = std::make_shared<llvm::Regex>(pattern);
  std::string err;
  if (re->isValid(err)) n->pattern = std::move(re);
  else n->patternError = err.empty() ? "does not compile" : err;
  return Matcher(std::move(n));
}

Matcher calleeOf(Matcher inner) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::CalleeOf;
  n->operands.push_back(std::move(inner));
  return Matcher(std::move(n));
}

Matcher argumentAt(unsigned index, Matcher inner) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::ArgumentAt;
  n->index = index;
  n->operands.push_back(std::move(inner));
  return Matcher(std::move(n));
}

Matcher referencesStaticMember(std::string owner, std::string member) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::ReferencesStaticMember;
  n->owner = std::move(owner);
  n->member = std::move(member);
  return Matcher(std::move(n));
}

Matcher allOf(std::vector<Matcher> operands) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::AllOf;
  n->operands = std::move(operands);
  return Matcher(std::move(n));
}

Matcher anyOf(std::vector<Matcher> operands) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::AnyOf;
  n->operands = std::move(operands);
  return Matcher(std::move(n));
}

Matcher predicate(std::string label, Matcher::PredicateFn fn) {
  auto n = std::make_shared<Matcher::Node>();
  n->op = Matcher::Op::Predicate;
  n->label = std::move(label);
  n->fn = std::move(fn);
  return Matcher(std::move(n));
}

} // namespace refit
