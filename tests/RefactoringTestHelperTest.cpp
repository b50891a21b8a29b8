#include "harness/RefactoringTestHelper.hpp"

#include "clang/AST/Expr.h"
#include "clang/AST/Stmt.h"
#include "llvm/Support/Casting.h"

#include <gtest/gtest.h>

using namespace refit;
using clang::Stmt;

namespace {

// Replaces every return statement with `return nullptr`.
class ReturnNullRefactoring final : public Checker {
public:
  std::string name() const override { return "ReturnNullRefactoring"; }
  std::vector<Stmt::StmtClass> nodeKinds() const override { return {Stmt::ReturnStmtClass}; }
  std::optional<Description> match(const Stmt& node, const MatchContext& ctx) const override {
    return Description{"return replaced", ctx.replace(node, "return nullptr")};
  }
};

// Replaces calls to anything declared in namespace bar with 0.
class RemoveBarCallsRefactoring final : public Checker {
public:
  std::string name() const override { return "RemoveBarCallsRefactoring"; }
  std::vector<Stmt::StmtClass> nodeKinds() const override { return {Stmt::CallExprClass}; }
  std::optional<Description> match(const Stmt& node, const MatchContext& ctx) const override {
    auto ref = ctx.resolver().resolve(node);
    if (!ref || ref->owner.compare(0, 3, "bar") != 0) return std::nullopt;
    return Description{"call into bar", ctx.replace(node, "0")};
  }
};

// Reports every return, never offers a fix.
class ReportOnlyChecker final : public Checker {
public:
  std::string name() const override { return "ReportOnly"; }
  std::vector<Stmt::StmtClass> nodeKinds() const override { return {Stmt::ReturnStmtClass}; }
  std::optional<Description> match(const Stmt&, const MatchContext&) const override {
    return Description{"matched, no fix", std::nullopt};
  }
};

// Rewrites both a return statement and the literal inside it.
class ConflictingChecker final : public Checker {
public:
  std::string name() const override { return "Conflicting"; }
  std::vector<Stmt::StmtClass> nodeKinds() const override {
    return {Stmt::ReturnStmtClass, Stmt::IntegerLiteralClass};
  }
  std::optional<Description> match(const Stmt& node, const MatchContext& ctx) const override {
    return Description{"conflict", ctx.replace(node, llvm::isa<clang::ReturnStmt>(node) ? "return 2" : "3")};
  }
};

const std::vector<std::string> kReturnInput = {
    "class Test {",
    " public:",
    "  int* foo() {",
    "    int* i = 0;",
    "    return i;",
    "  }",
    "};",
};

} // namespace

class RefactoringTestHelperTest : public ::testing::Test {
protected:
  RefactoringTestHelper helper{std::make_shared<ReturnNullRefactoring>()};
};

TEST_F(RefactoringTestHelperTest, NoMatch) {
  Verdict v = helper.addInputLines("in/Test.cpp", {"class Test {};"})
                  .addOutputLines("out/Test.cpp", {"class Test {};"})
                  .doTest();
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, Replace) {
  Verdict v = helper.addInputLines("in/Test.cpp", kReturnInput)
                  .addOutputLines("out/Test.cpp", {
                      "class Test {",
                      " public:",
                      "  int* foo() {",
                      "    int* i = 0;",
                      "  return nullptr;",
                      "  }",
                      "};",
                  })
                  .doTest();
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, ReplaceFail) {
  Verdict v = helper.addInputLines("in/Test.cpp", kReturnInput)
                  .addOutputLines("out/Test.cpp", kReturnInput)
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
  EXPECT_EQ(v.unit, "out/Test.cpp");
  EXPECT_NE(v.actual.find("return nullptr;"), std::string::npos);
  EXPECT_NE(v.expected.find("return i;"), std::string::npos);
  EXPECT_NE(v.describe().find("--- expected"), std::string::npos);
}

TEST_F(RefactoringTestHelperTest, ReplaceTextMatch) {
  Verdict v = helper.addInputLines("in/Test.cpp", kReturnInput)
                  .addOutputLines("out/Test.cpp", {
                      "class Test {",
                      " public:",
                      "  int* foo() {",
                      "    int* i = 0;",
                      "    return nullptr;",
                      "  }",
                      "};",
                  })
                  .doTest(TestMode::TextMatch);
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, ReplaceTextMatchFail) {
  Verdict v = helper.addInputLines("in/Test.cpp", kReturnInput)
                  .addOutputLines("out/Test.cpp", {
                      "class Test {",
                      " public:",
                      "  int* foo() {",
                      "    int* i = 0;",
                      "  return nullptr;",
                      "  }",
                      "};",
                  })
                  .doTest(TestMode::TextMatch);
  ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
  EXPECT_NE(v.message.find("line 5"), std::string::npos) << v.message;
}

TEST_F(RefactoringTestHelperTest, CompilationErrorFail) {
  Verdict v = helper.addInputLines("syntax_error.cpp", {"public clazz Bar { ! this should fail }"})
                  .expectUnchanged()
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::CompileError) << v;
  EXPECT_EQ(v.unit, "syntax_error.cpp");
  EXPECT_EQ(v.location.rfind("syntax_error.cpp:1:", 0), 0u) << v.location;
  EXPECT_FALSE(v.message.empty());
}

TEST_F(RefactoringTestHelperTest, CompileErrorWinsOverTextMode) {
  Verdict v = helper.addInputLines("ok.cpp", {"class Ok {};"})
                  .expectUnchanged()
                  .addInputLines("broken.cpp", {"int f( {"})
                  .expectUnchanged()
                  .doTest(TestMode::TextMatch);
  ASSERT_EQ(v.kind, VerdictKind::CompileError) << v;
  EXPECT_EQ(v.unit, "broken.cpp");
}

TEST_F(RefactoringTestHelperTest, LayoutOnlyDifferencesDependOnMode) {
  const std::vector<std::string> input = {"class Test { int x = 1; };"};
  const std::vector<std::string> reformatted = {"class Test {", "    int x  =  1;", "};"};

  RefactoringTestHelper ast(std::make_shared<ReturnNullRefactoring>());
  Verdict structural = ast.addInputLines("in/Test.cpp", input)
                           .addOutputLines("out/Test.cpp", reformatted)
                           .doTest(TestMode::AstMatch);
  EXPECT_TRUE(structural.passed()) << structural;

  Verdict text = helper.addInputLines("in/Test.cpp", input)
                     .addOutputLines("out/Test.cpp", reformatted)
                     .doTest(TestMode::TextMatch);
  EXPECT_EQ(text.kind, VerdictKind::Mismatch) << text;
}

TEST_F(RefactoringTestHelperTest, StructuralDifferenceIsMismatch) {
  Verdict v = helper.addInputLines("in/Test.cpp", {"class Test { int x = 1; };"})
                  .addOutputLines("out/Test.cpp", {"class Test { int x = 2; };"})
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
  EXPECT_NE(v.message.find("syntax trees differ"), std::string::npos) << v.message;
}

// None of these inputs contain a return statement, so the checker leaves
// them alone and the verdict depends on the structure comparison alone.
class StructureComparisonTest : public ::testing::Test {
protected:
  Verdict compare(const std::string& input, const std::string& expected) {
    RefactoringTestHelper helper(std::make_shared<ReturnNullRefactoring>());
    return helper.addInputLines("in/Test.cpp", {input})
        .addOutputLines("out/Test.cpp", {expected})
        .doTest(TestMode::AstMatch);
  }

  void expectStructuralMismatch(const std::string& input, const std::string& expected) {
    Verdict v = compare(input, expected);
    ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
    EXPECT_NE(v.message.find("syntax trees differ"), std::string::npos) << v.message;
  }
};

TEST_F(StructureComparisonTest, FloatingLiteralsCompareExactly) {
  expectStructuralMismatch("double d = 1.0000001;", "double d = 1.0;");
  expectStructuralMismatch("float f = 0.5f;", "float f = 0.5;");
}

TEST_F(StructureComparisonTest, StorageClassIsStructural) {
  expectStructuralMismatch("static int x = 1;", "int x = 1;");
  expectStructuralMismatch("static void f();", "void f();");
  expectStructuralMismatch("inline void f() {}", "void f() {}");
  expectStructuralMismatch("constexpr int x = 1;", "const int x = 1;");
}

TEST_F(StructureComparisonTest, MemberSpecifiersAreStructural) {
  expectStructuralMismatch("struct S { virtual void f(); };", "struct S { void f(); };");
  expectStructuralMismatch("struct S { explicit S(int); };", "struct S { S(int); };");
  expectStructuralMismatch("struct S { S(const S&) = delete; };",
                           "struct S { S(const S&) = default; };");
  expectStructuralMismatch("struct B { virtual void f(); }; struct D : B { void f() override; };",
                           "struct B { virtual void f(); }; struct D : B { void f(); };");
  expectStructuralMismatch("struct S { mutable int n; };", "struct S { int n; };");
}

TEST_F(StructureComparisonTest, DependentNamesAreStructural) {
  expectStructuralMismatch("template <class T> void call(T t) { t.foo(); }",
                           "template <class T> void call(T t) { t.bar(); }");
  expectStructuralMismatch("template <class T> void call(T t) { T::foo(t); }",
                           "template <class T> void call(T t) { T::bar(t); }");
  expectStructuralMismatch("void foo(int); void bar(int);\n"
                           "template <class T> void call(T t) { foo(t); }",
                           "void foo(int); void bar(int);\n"
                           "template <class T> void call(T t) { bar(t); }");
}

TEST_F(StructureComparisonTest, TemplateParametersAreStructural) {
  expectStructuralMismatch("template <class T> struct A {};",
                           "template <class T, class U> struct A {};");
  expectStructuralMismatch("template <class T, int N = 1> struct A {};",
                           "template <class T, int N = 2> struct A {};");
  expectStructuralMismatch("template <class T = int> void f();",
                           "template <class T = long> void f();");
}

TEST_F(StructureComparisonTest, UsingDirectiveNamesItsNamespace) {
  expectStructuralMismatch("namespace a {} namespace b {} using namespace a;",
                           "namespace a {} namespace b {} using namespace b;");
}

TEST_F(StructureComparisonTest, SpecifiersSurviveReformatting) {
  Verdict v = compare("struct S { static  inline void f(int a) { int b = a; (void)b; } };",
                      "struct S {\n  static inline void f(int a) {\n    int b = a;\n    (void)b;\n  }\n};");
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, BrokenTransformIsMismatchNotCompileError) {
  // nullptr cannot be returned from an int function
  Verdict v = helper.addInputLines("in/Test.cpp", {"int f() { return 1; }"})
                  .addOutputLines("out/Test.cpp", {"int f() { return 1; }"})
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
  EXPECT_NE(v.message.find("does not compile"), std::string::npos) << v.message;
}

TEST_F(RefactoringTestHelperTest, BrokenExpectationIsCompileError) {
  Verdict v = helper.addInputLines("in/Test.cpp", {"class Test {};"})
                  .addOutputLines("out/Test.cpp", {"class Test {"})
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::CompileError) << v;
  EXPECT_NE(v.message.find("expected output"), std::string::npos) << v.message;
}

TEST_F(RefactoringTestHelperTest, PairingFollowsCallOrder) {
  Verdict v = helper.addInputLines("a.cpp", {"int* a(int* p) { return p; }"})
                  .addOutputLines("unrelated-name.cpp", {"int* a(int* p) { return nullptr; }"})
                  .addInputLines("b.cpp", {"class B {};"})
                  .expectUnchanged()
                  .doTest(TestMode::TextMatch);
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, OutputPairsWithMostRecentUnpairedInput) {
  Verdict v = helper.addInputLines("a.cpp", {"int* a(int* p) { return p; }"})
                  .addInputLines("b.cpp", {"class B {};"})
                  .addOutputLines("out/b.cpp", {"class B {};"})
                  .addOutputLines("out/a.cpp", {"int* a(int* p) { return nullptr; }"})
                  .doTest(TestMode::TextMatch);
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, MismatchNamesPositionalPartner) {
  Verdict v = helper.addInputLines("a.cpp", {"class A {};"})
                  .expectUnchanged()
                  .addInputLines("b.cpp", {"int* b(int* p) { return p; }"})
                  .addOutputLines("out/b.cpp", {"int* b(int* p) { return p; }"})
                  .doTest(TestMode::TextMatch);
  ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
  EXPECT_EQ(v.unit, "out/b.cpp");
}

TEST_F(RefactoringTestHelperTest, UnpairedInputIsUsageError) {
  // Checked before parsing, so the broken fixture is never looked at
  Verdict v = helper.addInputLines("a.cpp", {"class A {};"})
                  .expectUnchanged()
                  .addInputLines("b.cpp", {"this does not parse"})
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::UsageError) << v;
  EXPECT_NE(v.message.find("b.cpp"), std::string::npos) << v.message;
}

TEST_F(RefactoringTestHelperTest, ExtraOutputIsUsageError) {
  Verdict v = helper.addInputLines("a.cpp", {"class A {};"})
                  .expectUnchanged()
                  .addOutputLines("out/extra.cpp", {"class A {};"})
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::UsageError) << v;
  EXPECT_NE(v.message.find("out/extra.cpp"), std::string::npos) << v.message;
}

TEST_F(RefactoringTestHelperTest, ExpectUnchangedWithoutInputIsUsageError) {
  Verdict v = helper.expectUnchanged().doTest();
  EXPECT_EQ(v.kind, VerdictKind::UsageError) << v;
}

TEST_F(RefactoringTestHelperTest, NoInputsIsUsageError) {
  Verdict v = helper.doTest();
  EXPECT_EQ(v.kind, VerdictKind::UsageError) << v;
}

TEST_F(RefactoringTestHelperTest, DuplicateInputNameIsUsageError) {
  Verdict v = helper.addInputLines("a.cpp", {"class A {};"})
                  .expectUnchanged()
                  .addInputLines("a.cpp", {"class A {};"})
                  .expectUnchanged()
                  .doTest();
  EXPECT_EQ(v.kind, VerdictKind::UsageError) << v;
}

TEST_F(RefactoringTestHelperTest, SecondRunIsUsageError) {
  helper.addInputLines("a.cpp", {"class A {};"}).expectUnchanged();
  EXPECT_TRUE(helper.doTest().passed());
  EXPECT_EQ(helper.doTest().kind, VerdictKind::UsageError);
}

TEST_F(RefactoringTestHelperTest, MatchWithoutFixLeavesInputUnchanged) {
  RefactoringTestHelper reportOnly(std::make_shared<ReportOnlyChecker>());
  Verdict v = reportOnly.addInputLines("in/Test.cpp", kReturnInput)
                  .expectUnchanged()
                  .doTest(TestMode::TextMatch);
  EXPECT_TRUE(v.passed()) << v;
}

TEST_F(RefactoringTestHelperTest, ConflictingEditsAreReported) {
  RefactoringTestHelper conflicting(std::make_shared<ConflictingChecker>());
  Verdict v = conflicting.addInputLines("in/Test.cpp", {"int f() { return 1; }"})
                  .expectUnchanged()
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::UsageError) << v;
  EXPECT_NE(v.message.find("Overlapping"), std::string::npos) << v.message;
}

TEST(RefactoringTestHelperCrossUnitTest, ReferencesResolveAcrossUnits) {
  RefactoringTestHelper helper(std::make_shared<RemoveBarCallsRefactoring>());
  Verdict v = helper
                  .addInputLines("bar/Foo.h", {"#pragma once", "namespace bar {",
                                               "inline int answer() { return 42; }", "}"})
                  .expectUnchanged()
                  .addInputLines("foo/Bar.cpp", {"#include \"bar/Foo.h\"",
                                                 "int value() { return bar::answer(); }"})
                  .addOutputLines("out/foo/Bar.cpp", {"#include \"bar/Foo.h\"",
                                                      "int value() { return 0; }"})
                  .doTest(TestMode::TextMatch);
  EXPECT_TRUE(v.passed()) << v;
}

TEST(RefactoringTestHelperCrossUnitTest, BrokenIncludedUnitIsTheOneBlamed) {
  RefactoringTestHelper helper(std::make_shared<ReturnNullRefactoring>());
  // The header becomes "return nullptr" in an int function; main.cpp, parsed
  // first, fails inside the header it includes.
  Verdict v = helper.addInputLines("main.cpp", {"#include \"util.h\"", "int x = g();"})
                  .expectUnchanged()
                  .addInputLines("util.h", {"#pragma once", "inline int g() { return 1; }"})
                  .addOutputLines("out/util.h", {"#pragma once", "inline int g() { return 1; }"})
                  .doTest();
  ASSERT_EQ(v.kind, VerdictKind::Mismatch) << v;
  EXPECT_EQ(v.unit, "out/util.h");
  EXPECT_NE(v.message.find("does not compile"), std::string::npos) << v.message;
}
