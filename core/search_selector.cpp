#include "core/search_selector.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/strip.h"

namespace smartcmd {

namespace {

bool IsDigits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!absl::ascii_isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

// Index into `results` for a 1-based number, or nullopt when out of range.
std::optional<size_t> ToIndex(std::string_view digits, size_t count) {
  size_t n = 0;
  if (!absl::SimpleAtoi(digits, &n) || n == 0 || n > count) return std::nullopt;
  return n - 1;
}

SelectionAction Pick(SelectionAction::Kind kind, std::string_view digits, const std::vector<SearchResult>& results) {
  SelectionAction action;
  std::optional<size_t> index = ToIndex(digits, results.size());
  if (!index.has_value()) {
    action.kind = SelectionAction::Kind::kCancel;
    return action;
  }
  action.kind = kind;
  action.result = results[*index];
  return action;
}

}  // namespace

SelectionAction ResolveSelection(std::string_view input, const std::vector<SearchResult>& results) {
  std::string_view trimmed = absl::StripAsciiWhitespace(input);

  if (trimmed.empty()) {
    return SelectionAction{SelectionAction::Kind::kCancel, std::nullopt, ""};
  }
  if (IsDigits(trimmed)) {
    return Pick(SelectionAction::Kind::kExecute, trimmed, results);
  }
  if (trimmed.size() > 1 && trimmed[0] == 'e' && IsDigits(trimmed.substr(1))) {
    return Pick(SelectionAction::Kind::kEdit, trimmed.substr(1), results);
  }

  absl::ConsumePrefix(&trimmed, "/");
  return SelectionAction{SelectionAction::Kind::kRequery, std::nullopt, std::string(trimmed)};
}

SearchSelector::SearchSelector(const FuzzySearchIndex* index, size_t limit) : index_(index), limit_(limit) {}

const std::vector<SearchResult>& SearchSelector::Begin(std::string_view query, std::string_view lang) {
  query_ = std::string(query);
  results_ = index_ != nullptr ? index_->Search(query, lang, limit_) : std::vector<SearchResult>();
  state_ = State::kShowingResults;
  VLOG(1) << "Search '" << query_ << "' returned " << results_.size() << " result(s)";
  return results_;
}

SelectionAction SearchSelector::HandleInput(std::string_view input, std::string_view lang) {
  if (state_ == State::kIdle) {
    SelectionAction action;
    action.kind = SelectionAction::Kind::kRequery;
    std::string_view query = absl::StripAsciiWhitespace(input);
    absl::ConsumePrefix(&query, "/");
    action.query = std::string(query);
    Begin(action.query, lang);
    return action;
  }

  SelectionAction action = ResolveSelection(input, results_);
  if (action.kind == SelectionAction::Kind::kRequery) {
    Begin(action.query, lang);
  } else {
    Reset();
  }
  return action;
}

void SearchSelector::Reset() {
  state_ = State::kIdle;
  query_.clear();
  results_.clear();
}

}  // namespace smartcmd
