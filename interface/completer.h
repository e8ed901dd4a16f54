#ifndef SMARTCMD_INTERFACE_COMPLETER_H_
#define SMARTCMD_INTERFACE_COMPLETER_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/completion_engine.h"

namespace smartcmd {

struct ReadlineMatch {
  std::string text;
  std::string description;
  std::string kind;  // SuggestionKindName() of the source suggestion.
};

// Readline replaces only the word starting at `word_start`; this rewrites engine suggestions
// (which may start replacing earlier or later in `line`) as replacements for that word.
// Suggestions that cannot be expressed that way are dropped; duplicates keep their first position.
std::vector<ReadlineMatch> ToReadlineMatches(const std::vector<Suggestion>& suggestions, std::string_view line,
                                             size_t word_start);

// True when a lone completion should be followed by a space.
bool ShouldAppendSpace(const std::vector<Suggestion>& suggestions);

}  // namespace smartcmd

#endif  // SMARTCMD_INTERFACE_COMPLETER_H_
