#include "core/fuzzy_search.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "core/localization.h"

namespace smartcmd {

namespace {

constexpr int kMatchScore = 16;
constexpr int kConsecutiveBonus = 8;
constexpr int kBoundaryBonus = 8;
constexpr int kGapPenalty = 1;
constexpr int kMaxLeadingPenalty = 12;

constexpr int kNameWeight = 100;
constexpr int kDescriptionWeight = 0;
constexpr int kExampleWeight = -10;

constexpr int kImpossible = std::numeric_limits<int>::min() / 2;

// Code points of `s`, ASCII folded to lower case. Malformed bytes are kept as single units.
std::vector<char32_t> FoldCodePoints(std::string_view s) {
  std::vector<char32_t> out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    char32_t cp = lead;
    if (lead >= 0xF0 && lead < 0xF8) {
      len = 4;
      cp = lead & 0x07;
    } else if (lead >= 0xE0) {
      len = 3;
      cp = lead & 0x0F;
    } else if (lead >= 0xC0) {
      len = 2;
      cp = lead & 0x1F;
    }
    if (len > 1) {
      bool valid = i + len <= s.size();
      for (size_t k = 1; valid && k < len; ++k) {
        unsigned char cont = static_cast<unsigned char>(s[i + k]);
        if ((cont & 0xC0) != 0x80) {
          valid = false;
        } else {
          cp = (cp << 6) | (cont & 0x3F);
        }
      }
      if (!valid) {
        len = 1;
        cp = lead;
      }
    }
    if (cp >= 'A' && cp <= 'Z') cp = cp - 'A' + 'a';
    out.push_back(cp);
    i += len;
  }
  return out;
}

bool IsSeparator(char32_t c) {
  return c == ' ' || c == '-' || c == '_' || c == '/' || c == '.' || c == ':' || c == '=';
}

bool AtWordBoundary(const std::vector<char32_t>& target, size_t j) {
  return j == 0 || IsSeparator(target[j - 1]);
}

int FieldWeight(MatchField field) {
  switch (field) {
    case MatchField::kName:
      return kNameWeight;
    case MatchField::kDescription:
      return kDescriptionWeight;
    case MatchField::kExample:
      return kExampleWeight;
  }
  return 0;
}

}  // namespace

std::string_view MatchFieldName(MatchField field) {
  switch (field) {
    case MatchField::kName:
      return "Command";
    case MatchField::kDescription:
      return "Description";
    case MatchField::kExample:
      return "Example";
  }
  return "";
}

std::optional<int> FuzzyScore(std::string_view query, std::string_view target) {
  std::vector<char32_t> q = FoldCodePoints(query);
  std::vector<char32_t> t = FoldCodePoints(target);
  if (q.empty() || q.size() > t.size()) return std::nullopt;

  const size_t n = q.size();
  const size_t m = t.size();
  // best[j]: best score of the current query prefix with its last character matched at t[j].
  std::vector<int> prev(m, kImpossible);
  std::vector<int> best(m, kImpossible);

  for (size_t j = 0; j < m; ++j) {
    if (t[j] != q[0]) continue;
    int leading = std::min(static_cast<int>(j) * kGapPenalty, kMaxLeadingPenalty);
    best[j] = kMatchScore + (AtWordBoundary(t, j) ? kBoundaryBonus : 0) - leading;
  }

  for (size_t i = 1; i < n; ++i) {
    std::swap(prev, best);
    std::fill(best.begin(), best.end(), kImpossible);
    // Running max over k <= j - 2 of prev[k] + k * kGapPenalty; a gap from k to j costs
    // (j - k - 1) * kGapPenalty.
    int running = kImpossible;
    for (size_t j = i; j < m; ++j) {
      if (j >= 2 && prev[j - 2] != kImpossible) {
        running = std::max(running, prev[j - 2] + static_cast<int>(j - 2) * kGapPenalty);
      }
      if (t[j] != q[i]) continue;
      int from_gap = running == kImpossible ? kImpossible : running - static_cast<int>(j - 1) * kGapPenalty;
      int from_run = prev[j - 1] == kImpossible ? kImpossible : prev[j - 1] + kConsecutiveBonus;
      int base = std::max(from_gap, from_run);
      if (base == kImpossible) continue;
      best[j] = base + kMatchScore + (AtWordBoundary(t, j) ? kBoundaryBonus : 0);
    }
  }

  int result = *std::max_element(best.begin(), best.end());
  if (result == kImpossible) return std::nullopt;
  return std::max(result, 1);
}

FuzzySearchIndex::FuzzySearchIndex(std::shared_ptr<const Catalog> catalog) : catalog_(std::move(catalog)) {
  if (catalog_ == nullptr) catalog_ = Catalog::Empty();
  std::vector<std::string> path;
  for (const auto& root : catalog_->roots()) {
    AddNode(root, path);
  }
  VLOG(1) << "Search index built with " << entries_.size() << " entries";
}

void FuzzySearchIndex::AddNode(const CommandSpec& node, std::vector<std::string>& path) {
  path.push_back(node.name);
  std::string path_text = absl::StrJoin(path, " ");

  entries_.push_back({path, path_text, MatchField::kName, &node, nullptr});
  entries_.push_back({path, path_text, MatchField::kDescription, &node, nullptr});
  for (const auto& example : node.examples) {
    entries_.push_back({path, path_text, MatchField::kExample, &node, &example});
  }
  for (const auto& sub : node.subcommands) {
    AddNode(sub, path);
  }
  path.pop_back();
}

std::vector<SearchResult> FuzzySearchIndex::Search(std::string_view query, std::string_view lang,
                                                   size_t limit) const {
  return Rank(query, lang, limit, /*examples_only=*/false);
}

std::vector<SearchResult> FuzzySearchIndex::SearchExamples(std::string_view query, std::string_view lang,
                                                           size_t limit) const {
  return Rank(query, lang, limit, /*examples_only=*/true);
}

std::vector<SearchResult> FuzzySearchIndex::Rank(std::string_view query, std::string_view lang, size_t limit,
                                                 bool examples_only) const {
  std::vector<SearchResult> results;
  if (query.empty() || limit == 0) return results;

  // One result per invocation; a better-scoring duplicate takes over the earlier slot.
  absl::flat_hash_map<std::string, size_t> by_invocation;

  for (const auto& entry : entries_) {
    if (examples_only && entry.field != MatchField::kExample) continue;

    std::optional<int> score;
    SearchResult result;
    result.path = entry.path;
    result.field = entry.field;

    const std::string& description = ResolveText(entry.node->description, lang);
    switch (entry.field) {
      case MatchField::kName:
        score = FuzzyScore(query, entry.path_text);
        result.invocation = entry.path_text;
        result.display = description.empty() ? entry.path_text : absl::StrCat(entry.path_text, " - ", description);
        break;
      case MatchField::kDescription:
        score = FuzzyScore(query, description);
        result.invocation = entry.path_text;
        result.display = absl::StrCat(entry.path_text, " - ", description);
        break;
      case MatchField::kExample: {
        const std::string& scenario = ResolveText(entry.example->scenario, lang);
        std::optional<int> by_cmd = FuzzyScore(query, entry.example->cmd);
        std::optional<int> by_scenario = FuzzyScore(query, scenario);
        if (by_cmd.has_value() || by_scenario.has_value()) {
          score = std::max(by_cmd.value_or(0), by_scenario.value_or(0));
        }
        result.invocation = entry.example->cmd;
        result.display = scenario.empty() ? entry.example->cmd : absl::StrCat(scenario, " - ", entry.example->cmd);
        break;
      }
    }
    if (!score.has_value()) continue;
    result.score = std::max(*score + FieldWeight(entry.field), 1);

    auto [it, inserted] = by_invocation.try_emplace(result.invocation, results.size());
    if (inserted) {
      results.push_back(std::move(result));
    } else if (result.score > results[it->second].score) {
      results[it->second] = std::move(result);
    }
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const SearchResult& a, const SearchResult& b) { return a.score > b.score; });
  if (results.size() > limit) results.resize(limit);
  return results;
}

}  // namespace smartcmd
