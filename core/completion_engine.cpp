#include "core/completion_engine.h"

#include <filesystem>
#include <system_error>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"

#include "core/localization.h"
#include "core/path_completion.h"
#include "core/tokenizer.h"

namespace smartcmd {

namespace {

// "-abc": a single dash followed by at least one short flag character.
bool IsShortFlagChain(std::string_view partial) {
  return partial.size() >= 2 && partial[0] == '-' && partial[1] != '-';
}

}  // namespace

std::string_view SuggestionKindName(SuggestionKind kind) {
  switch (kind) {
    case SuggestionKind::kCommand:
      return "command";
    case SuggestionKind::kSubcommand:
      return "subcommand";
    case SuggestionKind::kLongFlag:
      return "long flag";
    case SuggestionKind::kShortFlag:
      return "short flag";
    case SuggestionKind::kFlagCombination:
      return "combo";
    case SuggestionKind::kExample:
      return "example";
    case SuggestionKind::kPath:
      return "path";
  }
  return "";
}

CompletionEngine::CompletionEngine(std::shared_ptr<const Catalog> catalog, CompletionOptions options)
    : catalog_(catalog != nullptr ? std::move(catalog) : Catalog::Empty()),
      options_(std::move(options)),
      search_index_(catalog_) {}

const CommandSpec* CompletionEngine::Descend(const std::vector<std::string>& tokens, size_t* consumed) const {
  const CommandSpec* node = nullptr;
  size_t matched = 0;
  for (const auto& token : tokens) {
    const CommandSpec* next = node == nullptr ? catalog_->FindRoot(token) : node->FindSubcommand(token);
    if (next == nullptr) break;
    node = next;
    ++matched;
  }
  if (consumed != nullptr) *consumed = matched;
  return node;
}

std::vector<Suggestion> CompletionEngine::Complete(std::string_view line, size_t cursor,
                                                   std::string_view lang) const {
  InputContext input = ResolveInputContext(line, cursor);
  size_t consumed = 0;
  const CommandSpec* context = Descend(input.completed, &consumed);
  VLOG(1) << "Completing '" << input.partial << "' after [" << absl::StrJoin(input.completed, " ") << "], "
          << consumed << " token(s) matched";

  if (context == nullptr) {
    return CompleteNames(catalog_->roots(), input.partial, input.partial_start, SuggestionKind::kCommand, lang);
  }

  std::vector<Suggestion> suggestions =
      CompleteNames(context->subcommands, input.partial, input.partial_start, SuggestionKind::kSubcommand, lang);
  if (!suggestions.empty()) return suggestions;

  suggestions = CompleteFlags(*context, input.partial, input.partial_start, lang);
  if (!suggestions.empty()) return suggestions;

  suggestions = CompleteExamples(*context, line, input.cursor, lang);
  if (!suggestions.empty()) return suggestions;

  if (context->path_completion) {
    return CompletePaths(input.partial, input.partial_start);
  }
  return {};
}

std::vector<Suggestion> CompletionEngine::CompleteNames(const std::vector<CommandSpec>& candidates,
                                                        std::string_view partial, size_t replace_start,
                                                        SuggestionKind kind, std::string_view lang) const {
  std::vector<Suggestion> out;
  for (const auto& spec : candidates) {
    if (!absl::StartsWithIgnoreCase(spec.name, partial)) continue;
    out.push_back({spec.name, ResolveText(spec.description, lang), kind, replace_start, true});
  }
  return out;
}

std::vector<Suggestion> CompletionEngine::CompleteFlags(const CommandSpec& context, std::string_view partial,
                                                        size_t replace_start, std::string_view lang) const {
  std::vector<Suggestion> out;
  if (!partial.empty() && partial[0] != '-') return out;

  for (const auto& flag : context.flags) {
    std::string form = flag.LongForm();
    if (form.empty() || !absl::StartsWithIgnoreCase(form, partial)) continue;
    out.push_back({std::move(form), ResolveText(flag.description, lang), SuggestionKind::kLongFlag, replace_start,
                   !flag.takes_value});
  }
  for (const auto& flag : context.flags) {
    std::string form = flag.ShortForm();
    if (form.empty() || !absl::StartsWithIgnoreCase(form, partial)) continue;
    out.push_back({std::move(form), ResolveText(flag.description, lang), SuggestionKind::kShortFlag, replace_start,
                   !flag.takes_value});
  }

  if (!IsShortFlagChain(partial)) return out;

  // Extend "-ab" with one more short flag, provided every flag already in the chain is known and
  // value-less; a value-taking flag ends a chain.
  absl::flat_hash_set<char> used;
  for (char c : partial.substr(1)) {
    const FlagSpec* flag = context.FindShortFlag(c);
    if (flag == nullptr || flag->takes_value) return out;
    used.insert(c);
  }
  for (const auto& flag : context.flags) {
    if (!flag.short_name.has_value() || used.contains(*flag.short_name)) continue;
    std::string combined(partial);
    combined.push_back(*flag.short_name);
    out.push_back({std::move(combined), ResolveText(flag.description, lang), SuggestionKind::kFlagCombination,
                   replace_start, !flag.takes_value});
  }
  return out;
}

std::vector<Suggestion> CompletionEngine::CompleteExamples(const CommandSpec& context, std::string_view line,
                                                           size_t cursor, std::string_view lang) const {
  std::vector<Suggestion> out;
  std::string_view typed = line.substr(0, cursor);
  size_t start = 0;
  while (start < typed.size() && absl::ascii_isspace(static_cast<unsigned char>(typed[start]))) ++start;
  typed.remove_prefix(start);
  if (typed.empty()) return out;

  for (const auto& example : context.examples) {
    if (example.cmd.size() <= typed.size() || !absl::StartsWith(example.cmd, typed)) continue;
    out.push_back({example.cmd, ResolveText(example.scenario, lang), SuggestionKind::kExample, start, false});
  }
  return out;
}

std::vector<Suggestion> CompletionEngine::CompletePaths(std::string_view partial, size_t replace_start) const {
  std::vector<Suggestion> out;
  std::filesystem::path base;
  if (options_.working_directory.empty()) {
    std::error_code ec;
    base = std::filesystem::current_path(ec);
    if (ec) {
      VLOG(1) << "No working directory for path completion: " << ec.message();
      return out;
    }
  } else {
    base = options_.working_directory;
  }

  for (auto& candidate : ListPathCandidates(partial, base, options_.max_path_entries)) {
    std::string description = candidate.is_directory ? "Dir" : "File";
    out.push_back({std::move(candidate.text), std::move(description), SuggestionKind::kPath, replace_start,
                   !candidate.is_directory});
  }
  return out;
}

}  // namespace smartcmd
