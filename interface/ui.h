#ifndef SMARTCMD_INTERFACE_UI_H_
#define SMARTCMD_INTERFACE_UI_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"

#include "core/command_spec.h"
#include "core/fuzzy_search.h"
#include "interface/shell_session.h"

namespace smartcmd {

void SetupTerminal();

void ShowBanner();

// Routes readline's Tab completion through `session`'s engine. `session` must outlive readline use.
void InstallCompletion(ShellSession* session);

// Reads one line. `initial_text` is preloaded into the edit buffer. Returns nullopt on EOF.
std::optional<std::string> ReadLine(const std::string& prompt, const std::string& initial_text = "",
                                    bool add_to_history = true);

// "<cwd basename> ❯ ".
std::string BuildPrompt();

/**
 * @brief Prints search results numbered from 1, the way the selector expects them.
 */
void PrintSearchResults(const std::vector<SearchResult>& results);

void PrintExamples(const std::string& command_path, const CommandSpec& spec, const std::string& lang);

// One line per root command with its localized description.
void PrintCatalog(const Catalog& catalog, const std::string& lang);

void ShowHelp();

/**
 * @brief Logs an error status if it is not OK.
 *
 * @param status The status to handle.
 * @param context Optional context message to prepend to the error.
 */
void HandleStatus(const absl::Status& status, const std::string& context = "");

// Returns terminal width or 80 if detection fails.
size_t GetTerminalWidth();

}  // namespace smartcmd

#endif  // SMARTCMD_INTERFACE_UI_H_
