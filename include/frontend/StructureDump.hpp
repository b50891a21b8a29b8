#pragma once
#include "clang/AST/ASTContext.h"

#include <string>

namespace refit {

// Renders the main-file declarations and statements of a translation unit
// as indented "Kind payload" lines. No source locations are included, so two
// texts that differ only in layout render identically.
std::string dumpStructure(clang::ASTContext& ast);

} // namespace refit
