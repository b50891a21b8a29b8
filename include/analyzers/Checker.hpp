#pragma once
#include "analyzers/Finding.hpp"
#include "matchers/MatchContext.hpp"

#include "clang/AST/Stmt.h"

#include <optional>
#include <string>
#include <vector>

namespace refit {

// A detection rule. The scanner calls match() exactly once for every node
// whose kind is listed in nodeKinds().
class Checker {
public:
  virtual ~Checker() = default;

  virtual std::string name() const = 0;
  virtual std::vector<clang::Stmt::StmtClass> nodeKinds() const = 0;

  // std::nullopt when the node does not match.
  virtual std::optional<Description> match(const clang::Stmt& node,
                                           const MatchContext& ctx) const = 0;
};

} // namespace refit
