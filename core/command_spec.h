#ifndef SMARTCMD_CORE_COMMAND_SPEC_H_
#define SMARTCMD_CORE_COMMAND_SPEC_H_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace smartcmd {

// Per-language strings keyed by language code ("en", "zh", ...). Ordered so that the
// lexicographically-first entry is begin().
using LanguageMap = std::map<std::string, std::string>;

// A text value that is either a single string for every language or a per-language mapping.
// Resolved with ResolveText() (core/localization.h).
using LocalizedText = std::variant<std::string, LanguageMap>;

struct FlagSpec {
  std::optional<std::string> long_name;  // Without the leading "--".
  std::optional<char> short_name;        // Without the leading "-".
  LocalizedText description;
  // A value-taking flag may only be the last element of a combined short-flag chain.
  bool takes_value = false;

  // "--name", or empty when the flag has no long form.
  std::string LongForm() const;
  // "-c", or empty when the flag has no short form.
  std::string ShortForm() const;
};

struct ExampleSpec {
  std::string cmd;  // Literal invocation text, e.g. "git commit -am 'fix'".
  LocalizedText scenario;
};

struct CommandSpec {
  std::string name;
  LocalizedText description;
  std::vector<CommandSpec> subcommands;
  std::vector<FlagSpec> flags;
  std::vector<ExampleSpec> examples;
  // Offer filesystem entries when nothing structured matches at this node.
  bool path_completion = false;

  // Exact, case-sensitive lookup among direct children.
  const CommandSpec* FindSubcommand(std::string_view child) const;
  const FlagSpec* FindShortFlag(char c) const;
};

// Checks the load-time invariants of a spec tree: non-empty whitespace-free names, unique sibling
// names, and flags that carry at least one of a long or single-character short name.
absl::Status ValidateCommandSpec(const CommandSpec& spec);

/**
 * @brief Immutable forest of root command specifications.
 *
 * A catalog is built once and shared as a read-only snapshot; a new set of definitions means a new
 * Catalog, never an edit of an existing one.
 */
class Catalog {
 public:
  Catalog(const Catalog&) = delete;
  Catalog& operator=(const Catalog&) = delete;

  // Validates every root (and the uniqueness of root names) before taking ownership.
  static absl::StatusOr<std::shared_ptr<const Catalog>> Create(std::vector<CommandSpec> roots);
  static std::shared_ptr<const Catalog> Empty();

  // Roots in insertion order.
  const std::vector<CommandSpec>& roots() const { return roots_; }
  bool empty() const { return roots_.empty(); }

  const CommandSpec* FindRoot(std::string_view name) const;

  // Follows `path` from the roots by exact names; nullptr if any element is missing.
  const CommandSpec* Find(const std::vector<std::string>& path) const;

  // Total number of command nodes, roots included.
  size_t NodeCount() const;

 private:
  explicit Catalog(std::vector<CommandSpec> roots);

  std::vector<CommandSpec> roots_;
  absl::flat_hash_map<std::string, size_t> root_index_;
};

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_COMMAND_SPEC_H_
