#include "harness/RefactoringTestHelper.hpp"
#include "analyzers/Scanner.hpp"
#include "frontend/StructureDump.hpp"
#include "refactor/RefactorEngine.hpp"

#include <algorithm>
#include <ostream>
#include <set>

namespace refit {

namespace {

std::vector<std::string> splitLines(const std::string& text) {
  return SourceUnit{"", text}.lines();
}

// "line N: expected `a` but was `b`" for the first line that differs.
std::string firstDifference(const std::string& expected, const std::string& actual) {
  auto e = splitLines(expected);
  auto a = splitLines(actual);
  size_t n = std::max(e.size(), a.size());
  for (size_t i = 0; i < n; ++i) {
    std::string el = i < e.size() ? e[i] : "<end of text>";
    std::string al = i < a.size() ? a[i] : "<end of text>";
    if (el != al)
      return "line " + std::to_string(i + 1) + ": expected `" + el + "` but was `" + al + "`";
  }
  return "texts differ in line endings";
}

} // namespace

const char* toString(VerdictKind kind) {
  switch (kind) {
  case VerdictKind::Pass:         return "Pass";
  case VerdictKind::Mismatch:     return "Mismatch";
  case VerdictKind::CompileError: return "CompileError";
  case VerdictKind::UsageError:   return "UsageError";
  }
  return "?";
}

Verdict Verdict::mismatch(std::string unit, std::string actual, std::string expected,
                          std::string detail) {
  Verdict v;
  v.kind = VerdictKind::Mismatch;
  v.unit = std::move(unit);
  v.actual = std::move(actual);
  v.expected = std::move(expected);
  v.message = std::move(detail);
  return v;
}

Verdict Verdict::compileError(const CompileFailure& failure) {
  Verdict v;
  v.kind = VerdictKind::CompileError;
  v.unit = failure.unit;
  v.location = failure.location;
  v.message = failure.message;
  return v;
}

Verdict Verdict::usageError(std::string reason) {
  Verdict v;
  v.kind = VerdictKind::UsageError;
  v.message = std::move(reason);
  return v;
}

std::string Verdict::describe() const {
  switch (kind) {
  case VerdictKind::Pass:
    return "Pass";
  case VerdictKind::Mismatch:
    return "Mismatch in " + unit + ": " + message + "\n--- expected\n" + expected +
           "--- actual\n" + actual;
  case VerdictKind::CompileError:
    return "CompileError: " + CompileFailure{unit, location, message}.describe();
  case VerdictKind::UsageError:
    return "UsageError: " + message;
  }
  return toString(kind);
}

std::ostream& operator<<(std::ostream& os, const Verdict& v) {
  return os << v.describe();
}

RefactoringTestHelper::RefactoringTestHelper(std::shared_ptr<const Checker> checker,
                                             FrontendOptions opts)
  : Check(std::move(checker)), Opts(std::move(opts)) {}

RefactoringTestHelper::Entry* RefactoringTestHelper::lastUnpaired() {
  for (auto it = Entries.rbegin(); it != Entries.rend(); ++it)
    if (!it->expected) return &*it;
  return nullptr;
}

RefactoringTestHelper&
RefactoringTestHelper::addInputLines(const std::string& name, const std::vector<std::string>& lines) {
  if (St != State::Building) {
    UsageProblems.push_back("addInputLines(\"" + name + "\") called after doTest()");
    return *this;
  }
  Entries.push_back(Entry{SourceUnit::fromLines(name, lines), std::nullopt});
  return *this;
}

RefactoringTestHelper&
RefactoringTestHelper::addOutputLines(const std::string& name, const std::vector<std::string>& lines) {
  Entry* e = lastUnpaired();
  if (St != State::Building || !e) {
    UsageProblems.push_back("addOutputLines(\"" + name + "\") has no input to pair with");
    return *this;
  }
  e->expected = SourceUnit::fromLines(name, lines);
  return *this;
}

RefactoringTestHelper& RefactoringTestHelper::expectUnchanged() {
  Entry* e = lastUnpaired();
  if (St != State::Building || !e) {
    UsageProblems.push_back("expectUnchanged() has no input to pair with");
    return *this;
  }
  e->expected = e->input;
  return *this;
}

std::optional<Verdict> RefactoringTestHelper::checkUsage() const {
  if (!Check) return Verdict::usageError("no checker given");
  if (!UsageProblems.empty()) return Verdict::usageError(UsageProblems.front());
  if (Entries.empty()) return Verdict::usageError("no input units; call addInputLines() first");

  std::set<std::string> names;
  for (const auto& e : Entries) {
    if (!names.insert(e.input.name).second)
      return Verdict::usageError("input unit \"" + e.input.name + "\" added twice");
    if (!e.expected)
      return Verdict::usageError("input unit \"" + e.input.name +
                                 "\" has no expected output; call addOutputLines() or expectUnchanged()");
  }
  return std::nullopt;
}

Verdict RefactoringTestHelper::doTest(TestMode mode) {
  if (St != State::Building) return Verdict::usageError("doTest() already ran");
  if (auto problem = checkUsage()) {
    St = State::Done;
    return *problem;
  }

  St = State::Executing;
  std::vector<SourceUnit> inputs;
  for (const auto& e : Entries) inputs.push_back(e.input);

  std::vector<SourceUnit> actual;
  {
    ParsedUnits parsed;
    CompileFailure failure;
    if (!parseUnits(inputs, Opts, parsed, &failure)) {
      St = State::Done;
      return Verdict::compileError(failure);
    }

    std::vector<const Checker*> checkers{Check.get()};
    Scanner scanner(checkers);
    ClangSymbolResolver resolver;
    DocumentSet docs = toDocumentSet(inputs);
    for (const auto& unit : parsed) {
      auto edits = collectEdits(scanner.scan(unit, resolver));
      std::string error;
      if (!RefactorEngine::applyEdits(edits, docs, &error)) {
        St = State::Done;
        return Verdict::usageError(Check->name() + " produced conflicting edits: " + error);
      }
    }
    for (const auto& in : inputs) actual.push_back(SourceUnit{in.name, docs[in.name]});
  }

  St = State::Comparing;
  Verdict v = mode == TestMode::TextMatch ? compareText(actual) : compareStructure(actual);
  St = State::Done;
  return v;
}

Verdict RefactoringTestHelper::compareText(const std::vector<SourceUnit>& actual) const {
  for (size_t i = 0; i < Entries.size(); ++i) {
    const auto& expected = *Entries[i].expected;
    if (actual[i].text != expected.text)
      return Verdict::mismatch(expected.name, actual[i].text, expected.text,
                               firstDifference(expected.text, actual[i].text));
  }
  return Verdict::pass();
}

Verdict RefactoringTestHelper::compareStructure(const std::vector<SourceUnit>& actual) const {
  // Expected texts are parsed under the input names so includes resolve alike
  std::vector<SourceUnit> expected;
  for (const auto& e : Entries) expected.push_back(SourceUnit{e.input.name, e.expected->text});

  ParsedUnits expectedTrees;
  CompileFailure failure;
  if (!parseUnits(expected, Opts, expectedTrees, &failure)) {
    failure.message = "expected output does not compile: " + failure.message;
    return Verdict::compileError(failure);
  }

  ParsedUnits actualTrees;
  if (!parseUnits(actual, Opts, actualTrees, &failure)) {
    // The error may sit in a unit the failing one includes
    size_t bad = actualTrees.size();
    for (size_t i = 0; i < actual.size(); ++i)
      if (actual[i].name == failure.unit) bad = i;
    return Verdict::mismatch(Entries[bad].expected->name, actual[bad].text, expected[bad].text,
                             "transformed output does not compile: " + failure.describe());
  }

  for (size_t i = 0; i < Entries.size(); ++i) {
    std::string a = dumpStructure(actualTrees[i].ast->getASTContext());
    std::string e = dumpStructure(expectedTrees[i].ast->getASTContext());
    if (a != e)
      return Verdict::mismatch(Entries[i].expected->name, actual[i].text, expected[i].text,
                               "syntax trees differ, " + firstDifference(e, a));
  }
  return Verdict::pass();
}

} // namespace refit
