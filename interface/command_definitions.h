#ifndef SMARTCMD_INTERFACE_COMMAND_DEFINITIONS_H_
#define SMARTCMD_INTERFACE_COMMAND_DEFINITIONS_H_

#include <string>
#include <vector>

#include "core/command_spec.h"

namespace smartcmd {

// A command the shell handles itself instead of passing it to /bin/sh.
struct CommandDefinition {
  std::string name;
  std::vector<std::string> aliases;
  std::vector<std::string> help_lines;
};

const std::vector<CommandDefinition>& GetCommandDefinitions();

// Catalog entries for the built-ins and a few everyday commands. Loaded at the lowest priority,
// so definition files may replace any of them.
std::vector<CommandSpec> BuiltinCommandSpecs();

}  // namespace smartcmd

#endif  // SMARTCMD_INTERFACE_COMMAND_DEFINITIONS_H_
