#pragma once
#include <cstddef>
#include <string>

namespace refit {

// One textual replacement. Offsets are byte offsets into the original text
// of the named unit; length 0 is an insertion.
struct RefactorEdit {
  std::string unit;           // logical unit name (or file path on disk)
  unsigned    offset = 0;
  unsigned    length = 0;
  std::string replacement;

  std::size_t end() const { return static_cast<std::size_t>(offset) + length; }
};

} // namespace refit
