#include "refactor/SourceDocument.hpp"

namespace refit {

SourceUnit SourceUnit::fromLines(std::string name, const std::vector<std::string>& lines) {
  SourceUnit unit;
  unit.name = std::move(name);
  for (const auto& l : lines) {
    unit.text += l;
    unit.text += '\n';
  }
  return unit;
}

std::vector<std::string> SourceUnit::lines() const {
  std::vector<std::string> out;
  std::string::size_type start = 0;
  while (start < text.size()) {
    auto nl = text.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

DocumentSet toDocumentSet(const std::vector<SourceUnit>& units) {
  DocumentSet docs;
  for (const auto& u : units) docs[u.name] = u.text;
  return docs;
}

} // namespace refit
