#ifndef SMARTCMD_INTERFACE_SHELL_SESSION_H_
#define SMARTCMD_INTERFACE_SHELL_SESSION_H_

#include <cstddef>
#include <memory>
#include <string>

#include "core/completion_engine.h"
#include "core/localization.h"

namespace smartcmd {

// Mutable per-session state. The engine (and the catalog snapshot it holds) is read-only; the
// active language is the only value that changes while the shell runs, and it is passed
// explicitly into every completion and search call.
struct ShellSession {
  std::unique_ptr<CompletionEngine> engine;
  std::string language = kDefaultLanguage;
  size_t search_limit = 10;
  // Text to preload into the next prompt (set by the "edit" search action).
  std::string pending_edit;
};

}  // namespace smartcmd

#endif  // SMARTCMD_INTERFACE_SHELL_SESSION_H_
