#ifndef SMARTCMD_CORE_FUZZY_SEARCH_H_
#define SMARTCMD_CORE_FUZZY_SEARCH_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/command_spec.h"

namespace smartcmd {

enum class MatchField {
  kName,
  kDescription,
  kExample,
};

std::string_view MatchFieldName(MatchField field);

struct SearchResult {
  std::vector<std::string> path;  // Command path of the matched node, e.g. {"git", "checkout"}.
  MatchField field = MatchField::kName;
  int score = 0;
  std::string display;
  std::string invocation;  // Text to run or edit: the command path, or the example's command.
};

// Ordered-subsequence score of `query` against `target`, case-insensitive for ASCII.
// Returns nullopt when `query` is empty or not a subsequence of `target`; otherwise a score >= 1
// that grows with contiguous runs, word-boundary hits and early matches, and shrinks with the
// total gap between matched characters.
std::optional<int> FuzzyScore(std::string_view query, std::string_view target);

/**
 * @brief Flattened, build-once view of a whole catalog for search mode.
 *
 * Holds one entry per command path, per description and per example. Descriptions and example
 * scenarios are resolved for the query language at search time, so a language switch does not
 * require a rebuild.
 */
class FuzzySearchIndex {
 public:
  explicit FuzzySearchIndex(std::shared_ptr<const Catalog> catalog);

  // Ranked results over names, descriptions and examples; at most `limit` entries.
  std::vector<SearchResult> Search(std::string_view query, std::string_view lang, size_t limit) const;

  // Same ranking restricted to example entries.
  std::vector<SearchResult> SearchExamples(std::string_view query, std::string_view lang, size_t limit) const;

  size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    std::vector<std::string> path;
    std::string path_text;  // Path joined with spaces.
    MatchField field;
    const CommandSpec* node;
    const ExampleSpec* example;  // Set for kExample entries only.
  };

  void AddNode(const CommandSpec& node, std::vector<std::string>& path);
  std::vector<SearchResult> Rank(std::string_view query, std::string_view lang, size_t limit,
                                 bool examples_only) const;

  std::shared_ptr<const Catalog> catalog_;
  std::vector<Entry> entries_;
};

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_FUZZY_SEARCH_H_
