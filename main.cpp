#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "core/completion_engine.h"
#include "core/definition_loader.h"
#include "core/localization.h"
#include "interface/color.h"
#include "interface/command_definitions.h"
#include "interface/command_handler.h"
#include "interface/shell_session.h"
#include "interface/ui.h"

ABSL_FLAG(std::string, lang, "", "Display language (overrides SMART_CMD_LANG and LANG)");
ABSL_FLAG(std::string, definitions, "",
          "Extra definitions directory searched first (overrides SMART_CMD_DEFINITIONS_DIR env var)");
ABSL_FLAG(std::string, log, "", "Log file path");
ABSL_FLAG(int, search_limit, 10, "Maximum number of results shown by /search");
ABSL_FLAG(std::string, command, "", "Run a single line (built-in, /search or shell command) and exit");

namespace {

constexpr char kUsage[] =
    "smart_command - an interactive shell with context-aware completion\n\n"
    "Usage:\n"
    "  smart_command [options]                 start the interactive shell\n"
    "  smart_command [options] list            list known root commands\n"
    "  smart_command [options] search <query>  fuzzy-search the command catalog\n\n"
    "Use --helpfull to see all available command-line flags.";

class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string& path) : stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
      std::cerr << "Failed to open log file: " << path << std::endl;
    }
  }
  ~FileLogSink() override = default;

  void Send(const absl::LogEntry& entry) override {
    if (stream_.is_open()) {
      std::lock_guard<std::mutex> lock(mu_);
      stream_ << entry.text_message_with_prefix() << "\n";
    }
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
};

std::string ResolveLanguage() {
  std::string flag_lang = absl::GetFlag(FLAGS_lang);
  if (!flag_lang.empty()) return smartcmd::NormalizeLanguageCode(flag_lang);
  if (const char* env = std::getenv("SMART_CMD_LANG"); env != nullptr && *env != '\0') {
    return smartcmd::NormalizeLanguageCode(env);
  }
  if (const char* env = std::getenv("LANG"); env != nullptr && absl::StartsWith(env, "zh")) {
    return "zh";
  }
  return smartcmd::kDefaultLanguage;
}

std::string ResolveDefinitionsOverride() {
  std::string dir = absl::GetFlag(FLAGS_definitions);
  if (dir.empty()) {
    const char* env = std::getenv("SMART_CMD_DEFINITIONS_DIR");
    if (env != nullptr) dir = env;
  }
  return dir;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(kUsage);
  std::vector<char*> positional_args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string log_path = absl::GetFlag(FLAGS_log);
  std::unique_ptr<FileLogSink> log_sink;
  if (!log_path.empty()) {
    log_sink = std::make_unique<FileLogSink>(log_path);
    absl::AddLogSink(log_sink.get());
  }
  // Keep the interactive terminal quiet; the log file (when given) sees everything.
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kWarning);

  int search_limit = absl::GetFlag(FLAGS_search_limit);
  if (search_limit <= 0) {
    std::cerr << smartcmd::icons::Error << " --search_limit must be positive" << std::endl;
    return 2;
  }

  smartcmd::LoadResult loaded = smartcmd::LoadCatalog(smartcmd::DefaultDefinitionDirs(ResolveDefinitionsOverride()),
                                                      smartcmd::BuiltinCommandSpecs());
  for (const auto& error : loaded.errors) {
    smartcmd::HandleStatus(error.status, error.source);
  }
  LOG(INFO) << "Loaded " << loaded.catalog->roots().size() << " root commands from " << loaded.loaded_files.size()
            << " files";

  smartcmd::ShellSession session;
  session.engine = std::make_unique<smartcmd::CompletionEngine>(loaded.catalog);
  session.language = ResolveLanguage();
  session.search_limit = static_cast<size_t>(search_limit);

  if (positional_args.size() > 1) {
    std::string mode = positional_args[1];
    if (mode == "list") {
      smartcmd::PrintCatalog(session.engine->catalog(), session.language);
      return 0;
    }
    if (mode == "search") {
      std::vector<std::string> words(positional_args.begin() + 2, positional_args.end());
      std::string query = absl::StrJoin(words, " ");
      std::vector<smartcmd::SearchResult> results =
          session.engine->Search(query, session.language, session.search_limit);
      if (results.empty()) {
        std::cout << smartcmd::icons::Search << " No matches for '" << query << "'" << std::endl;
        return 1;
      }
      smartcmd::PrintSearchResults(results);
      return 0;
    }
    std::cerr << smartcmd::icons::Error << " Unknown mode '" << mode << "'\n\n" << kUsage << std::endl;
    return 2;
  }

  auto cmd_handler_or = smartcmd::CommandHandler::Create(&session);
  if (!cmd_handler_or.ok()) {
    LOG(ERROR) << "Failed to create command handler: " << cmd_handler_or.status().message();
    return 1;
  }
  auto& cmd_handler = **cmd_handler_or;

  std::string single_command = absl::GetFlag(FLAGS_command);
  if (!single_command.empty()) {
    cmd_handler.Handle(single_command);
    return 0;
  }

  smartcmd::ShowBanner();
  smartcmd::InstallCompletion(&session);

  while (true) {
    std::string preload;
    preload.swap(session.pending_edit);
    std::optional<std::string> line = smartcmd::ReadLine(smartcmd::BuildPrompt(), preload);
    if (!line.has_value()) {
      std::cout << std::endl;
      break;
    }
    if (cmd_handler.Handle(*line) == smartcmd::CommandHandler::Result::EXIT) break;
  }

  LOG(INFO) << "Shell exited.";
  return 0;
}
