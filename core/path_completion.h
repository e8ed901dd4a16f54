#ifndef SMARTCMD_CORE_PATH_COMPLETION_H_
#define SMARTCMD_CORE_PATH_COMPLETION_H_

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace smartcmd {

struct PathCandidate {
  std::string text;  // Replacement for the partial token; directories end in '/'.
  bool is_directory = false;
};

// Lists entries of the directory named by `partial` (relative to `working_directory`, absolute, or
// under "~/") whose names start with the last path component of `partial`. Hidden entries are
// listed only when that component starts with '.'. Results are sorted by name and capped at
// `max_entries`. Any filesystem error yields an empty or shortened list, never an exception.
std::vector<PathCandidate> ListPathCandidates(std::string_view partial, const std::filesystem::path& working_directory,
                                              size_t max_entries);

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_PATH_COMPLETION_H_
