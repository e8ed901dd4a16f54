#include "interface/completer.h"

#include <algorithm>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace smartcmd {

std::vector<ReadlineMatch> ToReadlineMatches(const std::vector<Suggestion>& suggestions, std::string_view line,
                                             size_t word_start) {
  std::vector<ReadlineMatch> matches;
  absl::flat_hash_set<std::string> seen;
  word_start = std::min(word_start, line.size());

  for (const auto& suggestion : suggestions) {
    std::string match;
    if (suggestion.replace_start == word_start) {
      match = suggestion.text;
    } else if (suggestion.replace_start < word_start) {
      std::string_view typed = line.substr(suggestion.replace_start, word_start - suggestion.replace_start);
      // Readline breaks words after an opening quote; the engine replaces from the quote.
      if (!typed.empty() && (typed.front() == '\'' || typed.front() == '"')) typed.remove_prefix(1);
      if (!absl::StartsWith(suggestion.text, typed)) continue;
      match = suggestion.text.substr(typed.size());
    } else {
      if (suggestion.replace_start > line.size()) continue;
      match = absl::StrCat(line.substr(word_start, suggestion.replace_start - word_start), suggestion.text);
    }
    if (seen.insert(match).second) {
      matches.push_back(
          {std::move(match), suggestion.description, std::string(SuggestionKindName(suggestion.kind))});
    }
  }
  return matches;
}

bool ShouldAppendSpace(const std::vector<Suggestion>& suggestions) {
  return suggestions.size() == 1 && suggestions.front().append_space;
}

}  // namespace smartcmd
