#pragma once
#include "refactor/RefactorEdit.hpp"

#include "clang/AST/ASTContext.h"
#include "clang/AST/Stmt.h"

#include <optional>
#include <string>

namespace refit {

struct SourceSpan {
  unsigned begin = 0;
  unsigned end = 0;           // exclusive
};

// Owner/member pair a call-shaped node resolves to, e.g. {"base::Strings", "format"}.
struct MemberRef {
  std::string owner;
  std::string member;

  bool operator==(const MemberRef& o) const { return owner == o.owner && member == o.member; }
};

// Symbol resolution capability handed to matchers through MatchContext.
class SymbolResolver {
public:
  virtual ~SymbolResolver() = default;

  // std::nullopt when the node does not name a static member or free function.
  virtual std::optional<MemberRef> resolve(const clang::Stmt& node) const = 0;
};

// Resolves through clang's semantic information (direct callee, referenced decl).
class ClangSymbolResolver final : public SymbolResolver {
public:
  std::optional<MemberRef> resolve(const clang::Stmt& node) const override;
};

// Immutable per-call resolution context: everything a matcher may consult
// besides the node itself.
class MatchContext {
public:
  MatchContext(const clang::ASTContext& ast, const SymbolResolver& resolver, std::string unit)
    : Ast(ast), Resolver(resolver), Unit(std::move(unit)) {}

  const clang::ASTContext& ast() const { return Ast; }
  const SymbolResolver& resolver() const { return Resolver; }
  const std::string& unit() const { return Unit; }

  // Character span of the node in its unit; std::nullopt for nodes that come
  // from a macro expansion or another file.
  std::optional<SourceSpan> spanOf(const clang::Stmt& node) const;

  // Source text covered by spanOf(node), empty when there is no span.
  std::string textOf(const clang::Stmt& node) const;

  // Edit replacing the node's span with `text`.
  std::optional<RefactorEdit> replace(const clang::Stmt& node, const std::string& text) const;

private:
  const clang::ASTContext& Ast;
  const SymbolResolver& Resolver;
  std::string Unit;
};

// Strips implicit casts, temporaries and implicit constructor calls so that
// matchers see expressions as spelled in the source.
const clang::Expr* spelledExpr(const clang::Expr* e);

} // namespace refit
