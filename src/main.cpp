#include "analyzers/PreconditionsExpensiveString.hpp"
#include "analyzers/Scanner.hpp"
#include "frontend/Frontend.hpp"
#include "refactor/RefactorEngine.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace refit;

static llvm::cl::OptionCategory ToolCat("refit options");

static llvm::cl::list<std::string> Paths(
  "paths", llvm::cl::desc("Source files or directories to check (recursive)"),
  llvm::cl::OneOrMore, llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Fix(
  "fix", llvm::cl::desc("Apply available fixes"), llvm::cl::init(false),
  llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> NoBackup(
  "no-backup", llvm::cl::desc("Do not write .bak backups when applying fixes"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::list<std::string> ExtraArgs(
  "extra-arg", llvm::cl::desc("Additional argument to pass to the compiler"),
  llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Standard(
  "std", llvm::cl::desc("Language standard of the checked sources"),
  llvm::cl::init("c++17"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> PreconditionsClass(
  "preconditions-class", llvm::cl::desc("Qualified name of the Preconditions class"),
  llvm::cl::init("base::Preconditions"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> FormatClass(
  "format-class", llvm::cl::desc("Qualified name of the class providing format()"),
  llvm::cl::init("base::Strings"), llvm::cl::cat(ToolCat));

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream ss; ss << ifs.rdbuf(); out = ss.str();
  return true;
}

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "Syntax-tree checks with automated fixes\n");

  FrontendOptions fopts;
  fopts.languageStandard = Standard;
  fopts.extraArgs.assign(ExtraArgs.begin(), ExtraArgs.end());

  PreconditionsExpensiveString::Options copts;
  copts.preconditionsClass = PreconditionsClass;
  copts.formatClass = FormatClass;
  PreconditionsExpensiveString checker(copts);
  std::string err;
  if (!checker.isValid(&err)) {
    llvm::errs() << "Invalid checker configuration: " << err << "\n";
    return 1;
  }

  std::vector<std::string> files;

  // Expand directories recursively
  auto addPath = [&](const std::string& p){
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::file_status st = fs::status(p, ec);
    if (ec) {
      llvm::errs() << "Skipping " << p << ": " << ec.message() << "\n";
      return;
    }
    if (fs::is_directory(st)) {
      for (auto& e : fs::recursive_directory_iterator(p, fs::directory_options::follow_directory_symlink)) {
        const auto& path = e.path();
        auto ext = path.extension().string();
        if (ext == ".cpp" || ext == ".cc" || ext == ".cxx" ||
            ext == ".hpp" || ext == ".hh" || ext == ".h")
          files.push_back(path.string());
      }
    } else {
      files.push_back(p);
    }
  };
  for (const auto& p : Paths) addPath(p);

  std::vector<SourceUnit> units;
  for (const auto& f : files) {
    SourceUnit u;
    u.name = f;
    if (!readFile(f, u.text)) {
      llvm::errs() << "Failed to read " << f << "\n";
      return 1;
    }
    units.push_back(std::move(u));
  }

  ParsedUnits parsed;
  CompileFailure failure;
  if (!parseUnits(units, fopts, parsed, &failure)) {
    llvm::errs() << failure.describe() << "\n";
    return 1;
  }

  std::vector<const Checker*> checkers{&checker};
  Scanner scanner(checkers);
  ClangSymbolResolver resolver;
  std::vector<Finding> findings;
  for (const auto& unit : parsed) {
    auto found = scanner.scan(unit, resolver);
    findings.insert(findings.end(), found.begin(), found.end());
  }

  // Pretty-print results
  for (const auto& f : findings) {
    llvm::outs() << f.unit << ":" << f.line << ":" << f.column
                 << " [" << f.checkName << "] " << f.message << "\n";
    if (f.fix) {
      llvm::outs() << "  fix: replace with '" << f.fix->replacement << "' (offset "
                   << f.fix->offset << ", len " << f.fix->length << ")\n";
    }
  }

  if (Fix) {
    if (!RefactorEngine::applyFixes(collectEdits(findings), !NoBackup, &err)) {
      llvm::errs() << "Apply failed: " << err << "\n";
      return 1;
    }
    llvm::outs() << "\nApplied fixes where available.\n";
  }
  return 0;
}
