#include "analyzers/Scanner.hpp"

#include "clang/AST/ASTContext.h"
#include "clang/AST/RecursiveASTVisitor.h"
#include "clang/Basic/SourceManager.h"
#include "llvm/ADT/DenseSet.h"

using namespace clang;

namespace refit {

namespace {

class DispatchVisitor : public RecursiveASTVisitor<DispatchVisitor> {
  const std::map<Stmt::StmtClass, std::vector<const Checker*>>& Dispatch;
  const MatchContext& Ctx;
  std::vector<Finding>& Out;
  llvm::DenseSet<const Stmt*> Seen;

public:
  DispatchVisitor(const std::map<Stmt::StmtClass, std::vector<const Checker*>>& d,
                  const MatchContext& ctx, std::vector<Finding>& out)
    : Dispatch(d), Ctx(ctx), Out(out) {}

  bool VisitStmt(Stmt* S) {
    auto it = Dispatch.find(S->getStmtClass());
    if (it == Dispatch.end()) return true;

    const auto& SM = Ctx.ast().getSourceManager();
    SourceLocation loc = SM.getExpansionLoc(S->getBeginLoc());
    if (loc.isInvalid() || !SM.isInMainFile(loc)) return true;
    if (!Seen.insert(S).second) return true;

    for (const Checker* checker : it->second) {
      auto desc = checker->match(*S, Ctx);
      if (!desc) continue;

      Finding f;
      f.checkName = checker->name();
      f.message = std::move(desc->message);
      f.unit = Ctx.unit();
      f.line = SM.getExpansionLineNumber(loc);
      f.column = SM.getExpansionColumnNumber(loc);
      f.fix = std::move(desc->fix);
      Out.push_back(std::move(f));
    }
    return true;
  }
};

} // namespace

Scanner::Scanner(const std::vector<const Checker*>& checkers) {
  for (const Checker* c : checkers) {
    if (!c) continue;
    for (auto kind : c->nodeKinds()) Dispatch[kind].push_back(c);
  }
}

std::vector<Finding> Scanner::scan(const ParsedUnit& unit, const SymbolResolver& resolver) const {
  std::vector<Finding> out;
  if (!unit.ast || Dispatch.empty()) return out;

  ASTContext& ast = unit.ast->getASTContext();
  MatchContext ctx(ast, resolver, unit.name);
  DispatchVisitor visitor(Dispatch, ctx, out);
  visitor.TraverseDecl(ast.getTranslationUnitDecl());
  return out;
}

} // namespace refit
