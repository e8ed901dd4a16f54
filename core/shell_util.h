#ifndef SMARTCMD_CORE_SHELL_UTIL_H_
#define SMARTCMD_CORE_SHELL_UTIL_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace smartcmd {

// Runs `command` through /bin/sh with the terminal's stdin/stdout/stderr and waits for it.
// Returns the exit code, or 128 + signal number when the child was killed by a signal.
// SIGINT and SIGQUIT are ignored by the caller while the child runs.
absl::StatusOr<int> RunInteractive(std::string_view command);

// Changes the process working directory. An empty target means $HOME; a leading "~/" is expanded.
absl::Status ChangeDirectory(std::string_view target);

// Expands a leading "~" or "~/" to $HOME. Other paths are returned unchanged.
std::string ExpandHome(std::string_view path);

}  // namespace smartcmd

#endif  // SMARTCMD_CORE_SHELL_UTIL_H_
