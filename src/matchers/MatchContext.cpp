#include "matchers/MatchContext.hpp"

#include "clang/AST/Decl.h"
#include "clang/AST/DeclCXX.h"
#include "clang/AST/Expr.h"
#include "clang/Basic/SourceManager.h"
#include "clang/Lex/Lexer.h"
#include "llvm/Support/Casting.h"

using namespace clang;

namespace refit {

const Expr* spelledExpr(const Expr* e) {
  return e ? e->IgnoreUnlessSpelledInSource() : nullptr;
}

std::optional<MemberRef> ClangSymbolResolver::resolve(const Stmt& node) const {
  const Stmt* s = &node;
  if (const auto* e = llvm::dyn_cast<Expr>(s)) s = spelledExpr(e);

  const ValueDecl* decl = nullptr;
  if (const auto* call = llvm::dyn_cast<CallExpr>(s)) decl = call->getDirectCallee();
  else if (const auto* ref = llvm::dyn_cast<DeclRefExpr>(s)) decl = ref->getDecl();
  else if (const auto* mem = llvm::dyn_cast<MemberExpr>(s)) decl = mem->getMemberDecl();

  const auto* fn = llvm::dyn_cast_or_null<FunctionDecl>(decl);
  if (!fn) return std::nullopt;

  if (const auto* method = llvm::dyn_cast<CXXMethodDecl>(fn)) {
    if (!method->isStatic()) return std::nullopt;
    return MemberRef{method->getParent()->getQualifiedNameAsString(), method->getNameAsString()};
  }

  // Free functions: the owner is the enclosing namespace ("" for global scope)
  const DeclContext* dc = fn->getDeclContext()->getRedeclContext();
  if (const auto* ns = llvm::dyn_cast<NamespaceDecl>(dc))
    return MemberRef{ns->getQualifiedNameAsString(), fn->getNameAsString()};
  if (dc->isTranslationUnit())
    return MemberRef{"", fn->getNameAsString()};
  return std::nullopt;
}

std::optional<SourceSpan> MatchContext::spanOf(const Stmt& node) const {
  const SourceManager& SM = Ast.getSourceManager();
  SourceLocation b = node.getBeginLoc();
  SourceLocation e = node.getEndLoc();
  if (b.isInvalid() || e.isInvalid() || b.isMacroID() || e.isMacroID()) return std::nullopt;
  if (!SM.isWrittenInMainFile(b) || !SM.isWrittenInMainFile(e)) return std::nullopt;

  SourceSpan span;
  span.begin = SM.getFileOffset(b);
  span.end = SM.getFileOffset(e) + Lexer::MeasureTokenLength(e, SM, Ast.getLangOpts());
  if (span.end < span.begin) return std::nullopt;
  return span;
}

std::string MatchContext::textOf(const Stmt& node) const {
  auto span = spanOf(node);
  if (!span) return {};
  const SourceManager& SM = Ast.getSourceManager();
  bool invalid = false;
  llvm::StringRef buffer = SM.getBufferData(SM.getMainFileID(), &invalid);
  if (invalid || span->end > buffer.size()) return {};
  return buffer.slice(span->begin, span->end).str();
}

std::optional<RefactorEdit> MatchContext::replace(const Stmt& node, const std::string& text) const {
  auto span = spanOf(node);
  if (!span) return std::nullopt;
  RefactorEdit edit;
  edit.unit = Unit;
  edit.offset = span->begin;
  edit.length = span->end - span->begin;
  edit.replacement = text;
  return edit;
}

} // namespace refit
