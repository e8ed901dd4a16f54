#include "interface/command_handler.h"

#include <algorithm>
#include <iostream>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"

#include "core/localization.h"
#include "core/search_selector.h"
#include "core/shell_util.h"
#include "core/tokenizer.h"
#include "interface/color.h"
#include "interface/command_definitions.h"
#include "interface/ui.h"

namespace smartcmd {

namespace {

constexpr char kSelectionPrompt[] = "select (N run, eN edit, Enter cancel)> ";

void CollectExamplePaths(const CommandSpec& node, std::vector<std::string>& path,
                         std::vector<std::string>& out) {
  path.push_back(node.name);
  if (!node.examples.empty()) out.push_back(absl::StrJoin(path, " "));
  for (const auto& child : node.subcommands) CollectExamplePaths(child, path, out);
  path.pop_back();
}

}  // namespace

CommandHandler::CommandHandler(ShellSession* session) : session_(session) { RegisterCommands(); }

void CommandHandler::RegisterCommands() {
  commands_["help"] = [this](CommandArgs& args) { return HandleHelp(args); };
  commands_["exit"] = [this](CommandArgs& args) { return HandleExit(args); };
  commands_["cd"] = [this](CommandArgs& args) { return HandleCd(args); };
  commands_["config"] = [this](CommandArgs& args) { return HandleConfig(args); };
  commands_["example"] = [this](CommandArgs& args) { return HandleExample(args); };

  for (const auto& def : GetCommandDefinitions()) {
    auto it = commands_.find(def.name);
    if (it != commands_.end()) {
      auto handler = it->second;
      for (const auto& alias : def.aliases) {
        commands_[alias] = handler;
      }
    }
  }
}

std::vector<std::string> CommandHandler::GetCommandNames() const {
  std::vector<std::string> names;
  for (const auto& [name, _] : commands_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

CommandHandler::Result CommandHandler::Handle(const std::string& input) {
  std::string line(absl::StripAsciiWhitespace(input));
  if (line.empty()) return Result::HANDLED;

  if (line[0] == '/') {
    return HandleSearch(line.substr(1));
  }
  return Dispatch(line);
}

CommandHandler::Result CommandHandler::Dispatch(const std::string& line) {
  std::vector<Token> tokens = Tokenize(line);
  if (tokens.empty()) return Result::HANDLED;
  auto it = commands_.find(tokens.front().text);
  if (it == commands_.end()) {
    return RunShell(line);
  }

  CommandArgs args;
  args.raw = line;
  for (size_t i = 1; i < tokens.size(); ++i) args.args.push_back(tokens[i].text);
  return it->second(args);
}

std::string CommandHandler::ReadSelection(const std::string& prompt) {
  std::optional<std::string> line = ReadLine(prompt, "", /*add_to_history=*/false);
  return line.value_or("");
}

absl::StatusOr<int> CommandHandler::ExecuteCommand(const std::string& command) {
  return RunInteractive(command);
}

CommandHandler::Result CommandHandler::HandleHelp([[maybe_unused]] CommandArgs& args) {
  ShowHelp();
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleExit([[maybe_unused]] CommandArgs& args) { return Result::EXIT; }

CommandHandler::Result CommandHandler::HandleCd(CommandArgs& args) {
  if (args.args.size() > 1) {
    HandleStatus(absl::InvalidArgumentError("too many arguments"), "cd");
    return Result::HANDLED;
  }
  HandleStatus(ChangeDirectory(args.args.empty() ? "" : args.args[0]), "cd");
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleConfig(CommandArgs& args) {
  if (args.args.empty()) {
    std::cout << Colorize("language     ", "", ansi::FieldLabel) << session_->language << "\n"
              << Colorize("search_limit ", "", ansi::FieldLabel) << session_->search_limit << "\n"
              << Colorize("commands     ", "", ansi::FieldLabel) << session_->engine->catalog().NodeCount()
              << std::endl;
    return Result::HANDLED;
  }

  if (args.args[0] == "set-lang") {
    if (args.args.size() != 2) {
      HandleStatus(absl::InvalidArgumentError("usage: config set-lang <code>"), "config");
      return Result::HANDLED;
    }
    session_->language = NormalizeLanguageCode(args.args[1]);
    std::cout << icons::Info << " Language set to " << session_->language << std::endl;
    LOG(INFO) << "Display language changed to " << session_->language;
    return Result::HANDLED;
  }

  HandleStatus(absl::InvalidArgumentError(absl::StrCat("unknown setting '", args.args[0], "'")), "config");
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleExample(CommandArgs& args) {
  const Catalog& catalog = session_->engine->catalog();

  if (args.args.empty()) {
    std::vector<std::string> paths;
    std::vector<std::string> scratch;
    for (const auto& root : catalog.roots()) CollectExamplePaths(root, scratch, paths);
    if (paths.empty()) {
      std::cout << icons::Info << " No examples defined." << std::endl;
      return Result::HANDLED;
    }
    std::cout << Colorize("Commands with examples:", ansi::Bold, ansi::Cyan) << "\n";
    for (const auto& path : paths) std::cout << "  " << path << "\n";
    std::cout << std::flush;
    return Result::HANDLED;
  }

  if (args.args[0] == "search") {
    std::vector<std::string> words(args.args.begin() + 1, args.args.end());
    std::string query = absl::StrJoin(words, " ");
    if (query.empty()) {
      HandleStatus(absl::InvalidArgumentError("usage: example search <query>"), "example");
      return Result::HANDLED;
    }
    std::vector<SearchResult> results =
        session_->engine->search_index().SearchExamples(query, session_->language, session_->search_limit);
    if (results.empty()) {
      std::cout << icons::Search << " No examples match '" << query << "'" << std::endl;
    } else {
      PrintSearchResults(results);
    }
    return Result::HANDLED;
  }

  std::string path_text = absl::StrJoin(args.args, " ");
  const CommandSpec* node = catalog.Find(args.args);
  if (node == nullptr) {
    HandleStatus(absl::NotFoundError(absl::StrCat("no definition for '", path_text, "'")), "example");
    return Result::HANDLED;
  }
  if (node->examples.empty()) {
    std::cout << icons::Info << " No examples for '" << path_text << "'" << std::endl;
    return Result::HANDLED;
  }
  PrintExamples(path_text, *node, session_->language);
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleSearch(const std::string& query) {
  if (absl::StripAsciiWhitespace(query).empty()) {
    std::cout << icons::Search << " Type a query after '/', e.g. /commit" << std::endl;
    return Result::HANDLED;
  }

  SearchSelector selector(&session_->engine->search_index(), session_->search_limit);
  selector.Begin(absl::StripAsciiWhitespace(query), session_->language);

  while (true) {
    if (selector.results().empty()) {
      std::cout << icons::Search << " No matches for '" << selector.query() << "'" << std::endl;
      return Result::HANDLED;
    }
    PrintSearchResults(selector.results());

    SelectionAction action = selector.HandleInput(ReadSelection(kSelectionPrompt), session_->language);
    switch (action.kind) {
      case SelectionAction::Kind::kExecute:
        std::cout << Colorize(action.result->invocation, "", ansi::Invocation) << std::endl;
        return Dispatch(action.result->invocation);
      case SelectionAction::Kind::kEdit:
        session_->pending_edit = action.result->invocation;
        return Result::HANDLED;
      case SelectionAction::Kind::kCancel:
        return Result::HANDLED;
      case SelectionAction::Kind::kRequery:
        VLOG(1) << "Search requery: " << action.query;
        break;
    }
  }
}

CommandHandler::Result CommandHandler::RunShell(const std::string& command) {
  absl::StatusOr<int> exit_code = ExecuteCommand(command);
  if (!exit_code.ok()) {
    HandleStatus(exit_code.status(), "exec");
  } else if (*exit_code != 0) {
    VLOG(1) << "'" << command << "' exited with " << *exit_code;
  }
  return Result::EXECUTED;
}

}  // namespace smartcmd
