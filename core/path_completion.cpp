#include "core/path_completion.h"

#include <algorithm>
#include <cstdlib>
#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace smartcmd {

namespace {

// Bounds the work done on huge directories; completion runs once per keystroke.
constexpr size_t kMaxScannedEntries = 4096;

std::filesystem::path ResolveDirectory(std::string_view dir_part, const std::filesystem::path& working_directory) {
  if (dir_part.empty()) return working_directory;

  std::string expanded(dir_part);
  if (absl::StartsWith(dir_part, "~/")) {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
      expanded = absl::StrCat(home, dir_part.substr(1));
    }
  }
  std::filesystem::path dir(expanded);
  if (dir.is_absolute()) return dir;
  return working_directory / dir;
}

}  // namespace

std::vector<PathCandidate> ListPathCandidates(std::string_view partial, const std::filesystem::path& working_directory,
                                              size_t max_entries) {
  std::vector<PathCandidate> candidates;
  if (max_entries == 0) return candidates;

  std::string_view dir_part;
  std::string_view name_prefix = partial;
  if (partial == "~") {
    dir_part = "~/";
    name_prefix = "";
  } else if (size_t slash = partial.rfind('/'); slash != std::string_view::npos) {
    dir_part = partial.substr(0, slash + 1);
    name_prefix = partial.substr(slash + 1);
  }
  const bool show_hidden = absl::StartsWith(name_prefix, ".");

  std::error_code ec;
  std::filesystem::path dir = ResolveDirectory(dir_part, working_directory);
  std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    VLOG(1) << "Path completion skipped for " << dir.string() << ": " << ec.message();
    return candidates;
  }

  size_t scanned = 0;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec || ++scanned > kMaxScannedEntries) break;
    std::string name = it->path().filename().string();
    if (!show_hidden && absl::StartsWith(name, ".")) continue;
    if (!absl::StartsWith(name, name_prefix)) continue;

    std::error_code type_ec;
    bool is_directory = it->is_directory(type_ec);
    if (type_ec) is_directory = false;
    candidates.push_back({absl::StrCat(dir_part, name, is_directory ? "/" : ""), is_directory});
  }
  if (ec) {
    VLOG(1) << "Path completion stopped early in " << dir.string() << ": " << ec.message();
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const PathCandidate& a, const PathCandidate& b) { return a.text < b.text; });
  if (candidates.size() > max_entries) candidates.resize(max_entries);
  return candidates;
}

}  // namespace smartcmd
