#pragma once
#include "refactor/RefactorEdit.hpp"
#include "refactor/SourceDocument.hpp"
#include <string>
#include <vector>

namespace refit {

// Applies edits. Offsets/lengths are byte-based in the original content,
// so edits never shift each other. Overlapping edits are rejected.
class RefactorEngine {
public:
  // Applies edits to one text. All edits must target the same document.
  static bool applyToText(const std::string& text, std::vector<RefactorEdit> edits,
                          std::string& out, std::string* error);

  // Groups edits by unit and rewrites the matching entries of `docs`.
  // On failure `docs` is left untouched.
  static bool applyEdits(const std::vector<RefactorEdit>& edits, DocumentSet& docs,
                         std::string* error);

  // Same as applyEdits with RefactorEdit::unit naming a file on disk.
  // Writes <file>.bak first when `backup` is set.
  static bool applyFixes(const std::vector<RefactorEdit>& fixes, bool backup, std::string* error);
};

} // namespace refit
