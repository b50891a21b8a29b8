#include "refactor/RefactorEngine.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace fs = std::filesystem;
namespace refit {

static bool readFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream ss; ss << ifs.rdbuf(); out = ss.str();
  return true;
}

static bool writeFile(const std::string& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) return false;
  ofs << data;
  return !ofs.fail();
}

static std::string rangeText(const RefactorEdit& e) {
  return "[" + std::to_string(e.offset) + ", " + std::to_string(e.end()) + ")";
}

static std::unordered_map<std::string, std::vector<RefactorEdit>>
groupByUnit(const std::vector<RefactorEdit>& edits) {
  std::unordered_map<std::string, std::vector<RefactorEdit>> byUnit;
  for (const auto& e : edits) byUnit[e.unit].push_back(e);
  return byUnit;
}

bool RefactorEngine::applyToText(const std::string& text, std::vector<RefactorEdit> edits,
                                 std::string& out, std::string* error) {
  std::sort(edits.begin(), edits.end(), [](const RefactorEdit& a, const RefactorEdit& b) {
    return a.offset != b.offset ? a.offset < b.offset : a.length < b.length;
  });

  for (size_t i = 0; i < edits.size(); ++i) {
    const auto& e = edits[i];
    if (e.offset > text.size() || e.length > text.size() - e.offset) {
      if (error) *error = "Out-of-range edit " + rangeText(e) + " in " + e.unit;
      return false;
    }
    if (i == 0) continue;
    const auto& prev = edits[i - 1];
    bool sameInsertion = prev.length == 0 && e.length == 0 && prev.offset == e.offset;
    if (e.offset < prev.end() || sameInsertion) {
      if (error) *error = "Overlapping edits " + rangeText(prev) + " and " + rangeText(e) +
                          " in " + e.unit;
      return false;
    }
  }

  // apply from highest offset -> lowest to keep offsets valid
  out = text;
  for (auto it = edits.rbegin(); it != edits.rend(); ++it)
    out.replace(it->offset, it->length, it->replacement);
  return true;
}

bool RefactorEngine::applyEdits(const std::vector<RefactorEdit>& edits, DocumentSet& docs,
                                std::string* error) {
  DocumentSet updated;
  for (auto& [unit, vec] : groupByUnit(edits)) {
    auto doc = docs.find(unit);
    if (doc == docs.end()) {
      if (error) *error = "Edit targets unknown unit " + unit;
      return false;
    }
    std::string content;
    if (!applyToText(doc->second, std::move(vec), content, error)) return false;
    updated[unit] = std::move(content);
  }

  for (auto& [unit, content] : updated) docs[unit] = std::move(content);
  return true;
}

bool RefactorEngine::applyFixes(const std::vector<RefactorEdit>& fixes, bool backup, std::string* error) {
  for (auto& [file, vec] : groupByUnit(fixes)) {
    std::string content;
    if (!readFile(file, content)) {
      if (error) *error = "Failed to read " + file;
      return false;
    }

    std::string edited;
    if (!applyToText(content, std::move(vec), edited, error)) return false;

    if (backup) {
      std::error_code ec;
      fs::copy_file(file, file + ".bak", fs::copy_options::overwrite_existing, ec);
      if (ec) {
        if (error) *error = "Failed to back up " + file + ": " + ec.message();
        return false;
      }
    }

    if (!writeFile(file, edited)) {
      if (error) *error = "Failed to write " + file;
      return false;
    }
  }
  return true;
}

} // namespace refit
