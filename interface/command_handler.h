#ifndef SMARTCMD_INTERFACE_COMMAND_HANDLER_H_
#define SMARTCMD_INTERFACE_COMMAND_HANDLER_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"

#include "interface/shell_session.h"

namespace smartcmd {

/**
 * @brief Dispatches one submitted line: built-ins, search mode, or /bin/sh.
 */
class CommandHandler {
 public:
  enum class Result {
    HANDLED,   // Built-in ran (or the line was empty); read the next line.
    EXECUTED,  // Passed to the shell.
    EXIT,      // Leave the shell.
  };

  struct CommandArgs {
    std::vector<std::string> args;  // Tokens after the command name.
    std::string raw;                // The whole submitted line.
  };

  using CommandFunc = std::function<Result(CommandArgs&)>;

  virtual ~CommandHandler() = default;

  static absl::StatusOr<std::unique_ptr<CommandHandler>> Create(ShellSession* session) {
    if (session == nullptr || session->engine == nullptr) {
      return absl::InvalidArgumentError("Session with a completion engine is required");
    }
    return std::unique_ptr<CommandHandler>(new CommandHandler(session));
  }

  Result Handle(const std::string& input);

  // Built-in names and aliases, sorted.
  std::vector<std::string> GetCommandNames() const;

 protected:
  explicit CommandHandler(ShellSession* session);

  // Testing hook: reads the follow-up line while search results are shown.
  virtual std::string ReadSelection(const std::string& prompt);

  // Testing hook: runs a non-built-in line.
  virtual absl::StatusOr<int> ExecuteCommand(const std::string& command);

 private:
  void RegisterCommands();

  Result HandleHelp(CommandArgs& args);
  Result HandleExit(CommandArgs& args);
  Result HandleCd(CommandArgs& args);
  Result HandleConfig(CommandArgs& args);
  Result HandleExample(CommandArgs& args);
  // Built-in by first token, otherwise the shell. Never treats `line` as a search.
  Result Dispatch(const std::string& line);
  Result HandleSearch(const std::string& query);
  Result RunShell(const std::string& command);

  ShellSession* session_;
  absl::flat_hash_map<std::string, CommandFunc> commands_;
};

}  // namespace smartcmd

#endif  // SMARTCMD_INTERFACE_COMMAND_HANDLER_H_
