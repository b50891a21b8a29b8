#include "frontend/Frontend.hpp"

#include "clang/Basic/SourceManager.h"
#include "clang/Tooling/ArgumentsAdjusters.h"
#include "clang/Tooling/Tooling.h"
#include "llvm/ADT/SmallString.h"

#include <cstdlib>
#include <optional>

using namespace clang;
using namespace clang::tooling;

namespace refit {

namespace {

std::string virtualPath(const FrontendOptions& opts, const std::string& name) {
  return opts.virtualRoot + "/" + name;
}

std::string logicalName(const FrontendOptions& opts, llvm::StringRef path) {
  std::string prefix = opts.virtualRoot + "/";
  if (path.substr(0, prefix.size()) == prefix) return path.drop_front(prefix.size()).str();
  return path.str();
}

// Keeps the first error; everything below Error level is dropped.
class FirstErrorConsumer : public DiagnosticConsumer {
  const FrontendOptions& Opts;
public:
  explicit FirstErrorConsumer(const FrontendOptions& o) : Opts(o) {}

  void HandleDiagnostic(DiagnosticsEngine::Level level, const Diagnostic& info) override {
    DiagnosticConsumer::HandleDiagnostic(level, info);
    if (level < DiagnosticsEngine::Error || first) return;

    llvm::SmallString<256> text;
    info.FormatDiagnostic(text);

    CompileFailure f;
    f.message = text.str().str();
    if (info.hasSourceManager() && info.getLocation().isValid()) {
      auto PL = info.getSourceManager().getPresumedLoc(info.getLocation());
      if (PL.isValid()) {
        f.unit = logicalName(Opts, PL.getFilename());
        f.location = f.unit + ":" + std::to_string(PL.getLine()) + ":" + std::to_string(PL.getColumn());
      }
    }
    first = std::move(f);
  }

  std::optional<CompileFailure> first;
};

std::vector<std::string> compilerArgs(const FrontendOptions& opts) {
  std::vector<std::string> args;
  // Units may be named *.h; parse everything as C++
  args.push_back("-x");
  args.push_back("c++");
  args.push_back("-std=" + opts.languageStandard);
  args.push_back("-I" + opts.virtualRoot);

  std::string resDir = opts.resourceDir;
  if (resDir.empty()) {
    if (const char* rd = std::getenv("CLANG_RESOURCE_DIR")) resDir = rd;
  }
  if (!resDir.empty()) {
    args.push_back("-resource-dir");
    args.push_back(resDir);
  }

  args.insert(args.end(), opts.extraArgs.begin(), opts.extraArgs.end());
  return args;
}

} // namespace

std::string CompileFailure::describe() const {
  std::string out = location.empty() ? unit : location;
  if (!out.empty()) out += ": ";
  return out + "error: " + message;
}

bool parseUnits(const std::vector<SourceUnit>& units,
                const FrontendOptions& opts,
                ParsedUnits& out,
                CompileFailure* failure) {
  const auto args = compilerArgs(opts);

  for (const auto& unit : units) {
    FileContentMappings mapped;
    for (const auto& other : units) {
      if (other.name == unit.name) continue;
      mapped.emplace_back(virtualPath(opts, other.name), other.text);
    }

    ParsedUnit parsed;
    parsed.name = unit.name;
    auto consumer = std::make_unique<FirstErrorConsumer>(opts);
    FirstErrorConsumer* diags = consumer.get();
    parsed.diagnostics = std::move(consumer);

    parsed.ast = buildASTFromCodeWithArgs(unit.text, args, virtualPath(opts, unit.name), "refit",
                                          std::make_shared<PCHContainerOperations>(),
                                          getClangStripDependencyFileAdjuster(), mapped, diags);

    if (!parsed.ast || diags->first || parsed.ast->getDiagnostics().hasErrorOccurred()) {
      if (failure) {
        if (diags->first) {
          *failure = *diags->first;
        } else {
          failure->unit = unit.name;
          failure->location = unit.name;
          failure->message = "failed to build syntax tree";
        }
      }
      return false;
    }
    out.push_back(std::move(parsed));
  }
  return true;
}

} // namespace refit
