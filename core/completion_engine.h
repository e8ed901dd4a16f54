#ifndef SMARTCMD_CORE_COMPLETION_ENGINE_H_
#define SMARTCMD_CORE_COMPLETION_ENGINE_H_

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "core/command_spec.h"
#include "core/fuzzy_search.h"

namespace smartcmd {

enum class SuggestionKind {
  kCommand,     // Root command name.
  kSubcommand,
  kLongFlag,
  kShortFlag,
  kFlagCombination,  // Short flags chained after one dash, e.g. "-am".
  kExample,
  kPath,
};

// Short label shown next to a candidate, e.g. "long flag".
std::string_view SuggestionKindName(SuggestionKind kind);

struct Suggestion {
  std::string text;
  std::string description;
  SuggestionKind kind = SuggestionKind::kSubcommand;
  // Byte offset in the line where `text` starts replacing the input up to the cursor.
  size_t replace_start = 0;
  bool append_space = true;
};

struct CompletionOptions {
  // Base for relative path completion. Empty means the process working directory at call time.
  std::string working_directory;
  size_t max_path_entries = 256;
};

/**
 * @brief Completes partial input lines against an immutable catalog snapshot.
 *
 * Descends the catalog with the completed tokens before the cursor, then proposes candidates
 * from the deepest node reached, one priority tier at a time: subcommands, flags, examples, and
 * finally filesystem entries for nodes that accept paths. The search index is built once here and
 * shared by every Search() call.
 */
class CompletionEngine {
 public:
  explicit CompletionEngine(std::shared_ptr<const Catalog> catalog, CompletionOptions options = {});

  CompletionEngine(const CompletionEngine&) = delete;
  CompletionEngine& operator=(const CompletionEngine&) = delete;

  // Never fails; returns an empty list when nothing matches.
  std::vector<Suggestion> Complete(std::string_view line, size_t cursor, std::string_view lang) const;

  std::vector<SearchResult> Search(std::string_view query, std::string_view lang, size_t limit) const {
    return search_index_.Search(query, lang, limit);
  }

  // Deepest node reached by exact matches of `tokens`, or nullptr for the catalog root.
  // `*consumed` receives the number of tokens matched.
  const CommandSpec* Descend(const std::vector<std::string>& tokens, size_t* consumed = nullptr) const;

  const Catalog& catalog() const { return *catalog_; }
  const FuzzySearchIndex& search_index() const { return search_index_; }

 private:
  std::vector<Suggestion> CompleteNames(const std::vector<CommandSpec>& candidates, std::string_view partial,
                                        size_t replace_start, SuggestionKind kind, std::string_view lang) const;
  std::vector<Suggestion> CompleteFlags(const CommandSpec& context, std::string_view partial, size_t replace_start,
                                        std::string_view lang) const;
  std::vector<Suggestion> CompleteExamples(const CommandSpec& context, std::string_view line, size_t cursor,
                                           std::string_view lang) const;
  std::vector<Suggestion> CompletePaths(std::string_view partial, size_t replace_start) const;

  std::shared_ptr<const Catalog> catalog_;
  CompletionOptions options_;
  FuzzySearchIndex search_index_;
};

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_COMPLETION_ENGINE_H_
