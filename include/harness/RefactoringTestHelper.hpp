#pragma once
#include "analyzers/Checker.hpp"
#include "frontend/Frontend.hpp"
#include "refactor/SourceDocument.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace refit {

enum class TestMode {
  TextMatch,   // exact, whitespace-sensitive string equality
  AstMatch,    // re-parse both sides and compare tree structure
};

enum class VerdictKind { Pass, Mismatch, CompileError, UsageError };

struct Verdict {
  VerdictKind kind = VerdictKind::Pass;
  std::string unit;           // Mismatch / CompileError: the unit concerned
  std::string actual;         // Mismatch
  std::string expected;       // Mismatch
  std::string location;       // CompileError: "name:line:col"
  std::string message;        // CompileError / UsageError reason, Mismatch detail

  bool passed() const { return kind == VerdictKind::Pass; }
  std::string describe() const;

  static Verdict pass() { return Verdict(); }
  static Verdict mismatch(std::string unit, std::string actual, std::string expected,
                          std::string detail);
  static Verdict compileError(const CompileFailure& failure);
  static Verdict usageError(std::string reason);
};

const char* toString(VerdictKind kind);
std::ostream& operator<<(std::ostream& os, const Verdict& v);

// Verifies a checker's fixes: register inputs and their expected outputs in
// call order, then run doTest().
//
//   RefactoringTestHelper(checker)
//       .addInputLines("in/Test.cpp", {"int f(int i) { return i; }"})
//       .addOutputLines("out/Test.cpp", {"int f(int i) { return 0; }"})
//       .doTest();
//
// addOutputLines/expectUnchanged pair with the most recent input that has no
// expectation yet. Pairing mistakes surface as a UsageError from doTest().
class RefactoringTestHelper {
public:
  explicit RefactoringTestHelper(std::shared_ptr<const Checker> checker,
                                 FrontendOptions opts = FrontendOptions());

  RefactoringTestHelper& addInputLines(const std::string& name, const std::vector<std::string>& lines);
  RefactoringTestHelper& addOutputLines(const std::string& name, const std::vector<std::string>& lines);
  RefactoringTestHelper& expectUnchanged();

  Verdict doTest(TestMode mode = TestMode::AstMatch);

private:
  enum class State { Building, Executing, Comparing, Done };

  struct Entry {
    SourceUnit input;
    std::optional<SourceUnit> expected;
  };

  Entry* lastUnpaired();
  std::optional<Verdict> checkUsage() const;
  Verdict compareText(const std::vector<SourceUnit>& actual) const;
  Verdict compareStructure(const std::vector<SourceUnit>& actual) const;

  std::shared_ptr<const Checker> Check;
  FrontendOptions Opts;
  State St = State::Building;
  std::vector<Entry> Entries;
  std::vector<std::string> UsageProblems;
};

} // namespace refit
