#pragma once
#include "refactor/RefactorEdit.hpp"
#include <optional>
#include <string>
#include <vector>

namespace refit {

// What a checker reports for one matched node.
struct Description {
  std::string message;
  std::optional<RefactorEdit> fix;   // empty: matched, but no fix available
};

struct Finding {
  std::string checkName;      // eg. "PreconditionsExpensiveString"
  std::string message;
  std::string unit;
  unsigned    line = 0;
  unsigned    column = 0;
  std::optional<RefactorEdit> fix;
};

// Edits of every finding that carries a fix, in finding order.
inline std::vector<RefactorEdit> collectEdits(const std::vector<Finding>& findings) {
  std::vector<RefactorEdit> edits;
  for (const auto& f : findings)
    if (f.fix) edits.push_back(*f.fix);
  return edits;
}

} // namespace refit
