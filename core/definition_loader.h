#ifndef SMARTCMD_CORE_DEFINITION_LOADER_H_
#define SMARTCMD_CORE_DEFINITION_LOADER_H_

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "core/command_spec.h"

namespace smartcmd {

// Parses one root command definition. `source_name` tags error messages.
absl::StatusOr<CommandSpec> ParseYamlDefinition(std::string_view text, std::string_view source_name);
absl::StatusOr<CommandSpec> ParseJsonDefinition(std::string_view text, std::string_view source_name);

// Reads and parses a .yaml/.yml (yaml-cpp) or .json (nlohmann/json) definition file, then
// validates it with ValidateCommandSpec().
absl::StatusOr<CommandSpec> LoadDefinitionFile(const std::filesystem::path& path);

// Definition directories in priority order: `override_dir` (when non-empty), ./definitions, the
// executable's directory, the user config directory, then the system-wide share directories.
std::vector<std::filesystem::path> DefaultDefinitionDirs(const std::string& override_dir = "");

struct SourceError {
  std::string source;
  absl::Status status;
};

struct LoadResult {
  std::shared_ptr<const Catalog> catalog;
  std::vector<std::string> loaded_files;
  std::vector<SourceError> errors;
};

/**
 * @brief Builds a catalog from every definition file in `dirs`.
 *
 * Directories are visited in the given (priority) order and files within a directory in filename
 * order. The first source that defines a root name wins wholesale: the same name from any later
 * source is skipped, never merged. `fallback` specs are added last, only for names no file
 * defined. Unreadable or invalid files are reported in `errors` and do not stop the load; a
 * catalog is always returned, possibly empty.
 */
LoadResult LoadCatalog(const std::vector<std::filesystem::path>& dirs, std::vector<CommandSpec> fallback = {});

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_DEFINITION_LOADER_H_
