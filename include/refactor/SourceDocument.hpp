#pragma once
#include <map>
#include <string>
#include <vector>

namespace refit {

// One named source text, eg. {"in/Test.cpp", "class Test {};\n"}.
struct SourceUnit {
  std::string name;
  std::string text;

  // Joins lines with '\n' and terminates the last one.
  static SourceUnit fromLines(std::string name, const std::vector<std::string>& lines);

  std::vector<std::string> lines() const;
};

// Logical unit name -> text. Edits are applied to one of these.
using DocumentSet = std::map<std::string, std::string>;

DocumentSet toDocumentSet(const std::vector<SourceUnit>& units);

} // namespace refit
