#include "frontend/StructureDump.hpp"

#include "clang/AST/Attr.h"
#include "clang/AST/Decl.h"
#include "clang/AST/DeclCXX.h"
#include "clang/AST/DeclTemplate.h"
#include "clang/AST/Expr.h"
#include "clang/AST/ExprCXX.h"
#include "clang/AST/Stmt.h"
#include "clang/Basic/SourceManager.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Casting.h"

using namespace clang;

namespace refit {

namespace {

const char* accessName(AccessSpecifier as) {
  switch (as) {
  case AS_public:    return "public";
  case AS_protected: return "protected";
  case AS_private:   return "private";
  case AS_none:      break;
  }
  return "";
}

class StructureDumper {
  const SourceManager& SM;
  std::string Out;

  void line(int depth, llvm::StringRef kind, const std::string& payload) {
    Out.append(static_cast<size_t>(depth) * 2, ' ');
    Out += kind.str();
    if (!payload.empty()) {
      Out += ' ';
      Out += payload;
    }
    Out += '\n';
  }

  // Specifiers written on the declaration: storage class, inline,
  // constexpr, virtual, explicit, defaulted or deleted, and attributes.
  static std::string declSpecifiers(const Decl* D) {
    std::string p;
    auto add = [&p](llvm::StringRef word) {
      if (word.empty()) return;
      p += ' ';
      p += word.str();
    };
    if (const auto* VD = llvm::dyn_cast<VarDecl>(D)) {
      add(VarDecl::getStorageClassSpecifierString(VD->getStorageClass()));
      if (VD->isInlineSpecified()) add("inline");
      if (VD->isConstexpr()) add("constexpr");
    }
    if (const auto* FD = llvm::dyn_cast<FunctionDecl>(D)) {
      add(VarDecl::getStorageClassSpecifierString(FD->getStorageClass()));
      if (FD->isInlineSpecified()) add("inline");
      if (FD->isConstexpr()) add("constexpr");
      if (FD->isDeletedAsWritten()) add("=delete");
      if (FD->isExplicitlyDefaulted()) add("=default");
    }
    if (const auto* MD = llvm::dyn_cast<CXXMethodDecl>(D))
      if (MD->isVirtualAsWritten()) add("virtual");
    if (const auto* Ctor = llvm::dyn_cast<CXXConstructorDecl>(D))
      if (Ctor->isExplicit()) add("explicit");
    if (const auto* Conv = llvm::dyn_cast<CXXConversionDecl>(D))
      if (Conv->isExplicit()) add("explicit");
    if (const auto* FD = llvm::dyn_cast<FieldDecl>(D))
      if (FD->isMutable()) add("mutable");
    if (const auto* TP = llvm::dyn_cast<TemplateTypeParmDecl>(D))
      if (TP->isParameterPack()) add("...");
    if (D->hasAttrs())
      for (const Attr* A : D->attrs())
        if (!A->isImplicit()) add(A->getSpelling());
    return p;
  }

  static std::string declPayload(const Decl* D) {
    std::string p;
    if (const auto* ND = llvm::dyn_cast<NamedDecl>(D)) p = ND->getNameAsString();
    if (const auto* TD = llvm::dyn_cast<TagDecl>(D)) p = std::string(TD->getKindName()) + " " + p;
    if (const auto* VD = llvm::dyn_cast<ValueDecl>(D)) p += " : " + VD->getType().getAsString();
    if (const auto* TN = llvm::dyn_cast<TypedefNameDecl>(D))
      p += " = " + TN->getUnderlyingType().getAsString();
    if (const auto* AS = llvm::dyn_cast<AccessSpecDecl>(D)) p = accessName(AS->getAccess());
    if (const auto* UD = llvm::dyn_cast<UsingDirectiveDecl>(D))
      if (const NamespaceDecl* NS = UD->getNominatedNamespace()) p = NS->getQualifiedNameAsString();
    return p + declSpecifiers(D);
  }

  static std::string stmtPayload(const Stmt* S) {
    if (const auto* I = llvm::dyn_cast<IntegerLiteral>(S)) {
      llvm::SmallString<32> v;
      I->getValue().toString(v, 10, /*Signed=*/false);
      return v.str().str();
    }
    if (const auto* F = llvm::dyn_cast<FloatingLiteral>(S)) {
      llvm::SmallString<32> v;
      F->getValue().toString(v, /*FormatPrecision=*/0, /*FormatMaxPadding=*/0);
      return v.str().str() + " : " + F->getType().getAsString();
    }
    if (const auto* Str = llvm::dyn_cast<StringLiteral>(S))
      return "\"" + Str->getBytes().str() + "\"";
    if (const auto* C = llvm::dyn_cast<CharacterLiteral>(S))
      return std::to_string(C->getValue());
    if (const auto* B = llvm::dyn_cast<CXXBoolLiteralExpr>(S))
      return B->getValue() ? "true" : "false";
    if (const auto* R = llvm::dyn_cast<DeclRefExpr>(S))
      return R->getDecl()->getQualifiedNameAsString();
    if (const auto* M = llvm::dyn_cast<MemberExpr>(S))
      return std::string(M->isArrow() ? "->" : ".") + M->getMemberDecl()->getNameAsString();
    if (const auto* O = llvm::dyn_cast<OverloadExpr>(S))
      return O->getName().getAsString();
    if (const auto* DM = llvm::dyn_cast<CXXDependentScopeMemberExpr>(S))
      return std::string(DM->isArrow() ? "->" : ".") + DM->getMember().getAsString();
    if (const auto* DR = llvm::dyn_cast<DependentScopeDeclRefExpr>(S))
      return DR->getDeclName().getAsString();
    if (const auto* UC = llvm::dyn_cast<CXXUnresolvedConstructExpr>(S))
      return UC->getTypeAsWritten().getAsString();
    if (const auto* BO = llvm::dyn_cast<BinaryOperator>(S))
      return BO->getOpcodeStr().str();
    if (const auto* UO = llvm::dyn_cast<UnaryOperator>(S))
      return UnaryOperator::getOpcodeStr(UO->getOpcode()).str();
    if (const auto* CE = llvm::dyn_cast<CastExpr>(S))
      return CE->getCastKindName();
    return {};
  }

  void dumpDeclContext(const DeclContext* DC, int depth) {
    for (const Decl* child : DC->decls()) dumpDecl(child, depth);
  }

public:
  explicit StructureDumper(const SourceManager& sm) : SM(sm) {}

  void dumpTranslationUnit(const TranslationUnitDecl* TU) {
    for (const Decl* D : TU->decls()) {
      SourceLocation loc = SM.getExpansionLoc(D->getLocation());
      if (loc.isInvalid() || !SM.isInMainFile(loc)) continue;
      dumpDecl(D, 0);
    }
  }

  void dumpDecl(const Decl* D, int depth) {
    if (!D || D->isImplicit()) return;
    line(depth, D->getDeclKindName(), declPayload(D));

    if (const auto* FD = llvm::dyn_cast<FunctionDecl>(D)) {
      for (const ParmVarDecl* P : FD->parameters()) dumpDecl(P, depth + 1);
      if (const auto* Ctor = llvm::dyn_cast<CXXConstructorDecl>(FD)) {
        for (const CXXCtorInitializer* Init : Ctor->inits()) {
          if (!Init->isWritten()) continue;
          std::string name;
          if (const FieldDecl* Member = Init->getMember()) name = Member->getNameAsString();
          line(depth + 1, "CtorInitializer", name);
          dumpStmt(Init->getInit(), depth + 2);
        }
      }
      if (FD->doesThisDeclarationHaveABody()) dumpStmt(FD->getBody(), depth + 1);
      return;
    }
    if (const auto* VD = llvm::dyn_cast<VarDecl>(D)) {
      if (VD->hasInit()) dumpStmt(VD->getInit(), depth + 1);
      return;
    }
    if (const auto* FD = llvm::dyn_cast<FieldDecl>(D)) {
      if (FD->hasInClassInitializer()) dumpStmt(FD->getInClassInitializer(), depth + 1);
      return;
    }
    if (const auto* EC = llvm::dyn_cast<EnumConstantDecl>(D)) {
      if (EC->getInitExpr()) dumpStmt(EC->getInitExpr(), depth + 1);
      return;
    }
    if (const auto* TD = llvm::dyn_cast<TemplateDecl>(D)) {
      if (const TemplateParameterList* Params = TD->getTemplateParameters())
        for (const NamedDecl* P : *Params) dumpDecl(P, depth + 1);
      dumpDecl(TD->getTemplatedDecl(), depth + 1);
      return;
    }
    if (const auto* TP = llvm::dyn_cast<TemplateTypeParmDecl>(D)) {
      if (TP->hasDefaultArgument())
        line(depth + 1, "Default", TP->getDefaultArgument().getAsString());
      return;
    }
    if (const auto* NP = llvm::dyn_cast<NonTypeTemplateParmDecl>(D)) {
      if (NP->hasDefaultArgument()) dumpStmt(NP->getDefaultArgument(), depth + 1);
      return;
    }
    if (const auto* RD = llvm::dyn_cast<CXXRecordDecl>(D)) {
      if (RD->hasDefinition() && RD->isThisDeclarationADefinition())
        for (const CXXBaseSpecifier& Base : RD->bases())
          line(depth + 1, "Base",
               std::string(Base.isVirtual() ? "virtual " : "") +
                   accessName(Base.getAccessSpecifierAsWritten()) + " " +
                   Base.getType().getAsString());
    }
    if (llvm::isa<NamespaceDecl>(D) || llvm::isa<LinkageSpecDecl>(D) || llvm::isa<TagDecl>(D))
      dumpDeclContext(llvm::cast<DeclContext>(D), depth + 1);
  }

  void dumpStmt(const Stmt* S, int depth) {
    if (!S) return;
    line(depth, S->getStmtClassName(), stmtPayload(S));

    if (const auto* DS = llvm::dyn_cast<DeclStmt>(S)) {
      for (const Decl* D : DS->decls()) dumpDecl(D, depth + 1);
      return;
    }
    for (const Stmt* child : S->children()) dumpStmt(child, depth + 1);
  }

  std::string take() { return std::move(Out); }
};

} // namespace

std::string dumpStructure(ASTContext& ast) {
  StructureDumper dumper(ast.getSourceManager());
  dumper.dumpTranslationUnit(ast.getTranslationUnitDecl());
  return dumper.take();
}

} // namespace refit
