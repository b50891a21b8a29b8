#pragma once
#include "analyzers/Checker.hpp"
#include "analyzers/Finding.hpp"
#include "frontend/Frontend.hpp"
#include "matchers/MatchContext.hpp"

#include <map>
#include <vector>

namespace refit {

// Walks a parsed unit and hands every main-file statement to the checkers
// registered for its kind. Checkers are not owned.
class Scanner {
public:
  explicit Scanner(const std::vector<const Checker*>& checkers);

  std::vector<Finding> scan(const ParsedUnit& unit, const SymbolResolver& resolver) const;

private:
  std::map<clang::Stmt::StmtClass, std::vector<const Checker*>> Dispatch;
};

} // namespace refit
