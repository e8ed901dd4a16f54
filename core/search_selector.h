#ifndef SMARTCMD_CORE_SEARCH_SELECTOR_H_
#define SMARTCMD_CORE_SEARCH_SELECTOR_H_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/fuzzy_search.h"

namespace smartcmd {

struct SelectionAction {
  enum class Kind {
    kExecute,  // Run `result->invocation`.
    kEdit,     // Load `result->invocation` into the input buffer without running it.
    kCancel,
    kRequery,  // Search again for `query`.
  };

  Kind kind = Kind::kCancel;
  std::optional<SearchResult> result;
  std::string query;
};

// Interprets a follow-up line typed while `results` are displayed (numbered from 1):
//   "N"  -> Execute(results[N]),  "eN" -> Edit(results[N]),  "" -> Cancel,
//   out-of-range N in either form -> Cancel,  anything else -> Requery with that text.
SelectionAction ResolveSelection(std::string_view input, const std::vector<SearchResult>& results);

/**
 * @brief Idle / ShowingResults state machine driving search mode.
 *
 * Execute, Edit and Cancel return the selector to Idle; Requery searches again and keeps showing
 * the new results.
 */
class SearchSelector {
 public:
  enum class State {
    kIdle,
    kShowingResults,
  };

  // `index` must outlive the selector.
  SearchSelector(const FuzzySearchIndex* index, size_t limit);

  // Runs `query` and enters ShowingResults.
  const std::vector<SearchResult>& Begin(std::string_view query, std::string_view lang);

  // Applies one follow-up input. In Idle any input starts a new search.
  SelectionAction HandleInput(std::string_view input, std::string_view lang);

  State state() const { return state_; }
  const std::vector<SearchResult>& results() const { return results_; }
  const std::string& query() const { return query_; }

 private:
  void Reset();

  const FuzzySearchIndex* index_;
  size_t limit_;
  State state_ = State::kIdle;
  std::string query_;
  std::vector<SearchResult> results_;
};

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_SEARCH_SELECTOR_H_
