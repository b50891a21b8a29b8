#pragma once
#include "refactor/SourceDocument.hpp"

#include "clang/Basic/Diagnostic.h"
#include "clang/Frontend/ASTUnit.h"

#include <memory>
#include <string>
#include <vector>

namespace refit {

struct FrontendOptions {
  std::string languageStandard = "c++17";
  std::vector<std::string> extraArgs;      // appended to every clang invocation
  std::string virtualRoot = "/refit";      // units are mapped below this directory
  std::string resourceDir;                 // empty: $CLANG_RESOURCE_DIR, else clang's default
};

struct CompileFailure {
  std::string unit;           // unit the error points into (may be empty)
  std::string location;       // "name:line:col"
  std::string message;

  std::string describe() const;
};

struct ParsedUnit {
  std::string name;
  // Declared before `ast`: the unit's DiagnosticsEngine refers to it.
  std::unique_ptr<clang::DiagnosticConsumer> diagnostics;
  std::unique_ptr<clang::ASTUnit> ast;
};

using ParsedUnits = std::vector<ParsedUnit>;

// Parses every unit as its own translation unit while all other units are
// visible as virtual files, so `#include "Foo.h"` resolves across units.
// Stops at the first unit that has an error and reports it in *failure.
bool parseUnits(const std::vector<SourceUnit>& units,
                const FrontendOptions& opts,
                ParsedUnits& out,
                CompileFailure* failure);

} // namespace refit
