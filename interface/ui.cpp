#include "interface/ui.h"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "core/localization.h"
#include "interface/color.h"
#include "interface/command_definitions.h"
#include "interface/completer.h"
#include "readline/history.h"
#include "readline/readline.h"

#include <sys/ioctl.h>
namespace smartcmd {

namespace {

ShellSession* g_session = nullptr;
std::vector<ReadlineMatch> g_matches;
std::string g_initial_text;

std::string PadRight(const std::string& s, size_t width) {
  size_t len = VisibleLength(s);
  return len >= width ? s : s + std::string(width - len, ' ');
}

char* MatchGenerator([[maybe_unused]] const char* text, int state) {
  static size_t match_index;
  if (!state) match_index = 0;
  if (match_index < g_matches.size()) {
    return strdup(g_matches[match_index++].text.c_str());
  }
  return nullptr;
}

char** CompletionProvider(const char* text, int start, [[maybe_unused]] int end) {
  rl_attempted_completion_over = 1;
  if (g_session == nullptr || g_session->engine == nullptr) return nullptr;

  std::string line(rl_line_buffer);
  // Search mode is resolved when the line is submitted, not on Tab.
  if (!line.empty() && line[0] == '/') return nullptr;

  std::vector<Suggestion> suggestions =
      g_session->engine->Complete(line, static_cast<size_t>(rl_point), g_session->language);
  g_matches = ToReadlineMatches(suggestions, line, static_cast<size_t>(start));
  rl_completion_append_character = ShouldAppendSpace(suggestions) ? ' ' : '\0';
  if (g_matches.empty()) return nullptr;
  return rl_completion_matches(text, MatchGenerator);
}

// Lists candidates with their descriptions instead of readline's bare columns.
void DisplayMatches(char** matches, int num_matches, [[maybe_unused]] int max_length) {
  size_t width = 0;
  for (int i = 1; i <= num_matches; ++i) width = std::max(width, VisibleLength(matches[i]));
  width += 2;

  std::cout << "\n";
  for (int i = 1; i <= num_matches; ++i) {
    const ReadlineMatch* found = nullptr;
    for (const auto& match : g_matches) {
      if (match.text == matches[i]) {
        found = &match;
        break;
      }
    }
    std::string label = found != nullptr ? absl::StrCat("[", found->kind, "]") : "";
    std::string description = found != nullptr ? found->description : "";
    std::cout << "  " << PadRight(matches[i], width) << Colorize(PadRight(label, 14), "", ansi::FieldLabel)
              << Colorize(description, "", ansi::Metadata) << "\n";
  }
  std::cout << std::flush;
  rl_on_new_line();
}

int InsertInitialText() {
  if (!g_initial_text.empty()) {
    rl_insert_text(g_initial_text.c_str());
    g_initial_text.clear();
  }
  return 0;
}

}  // namespace

size_t GetTerminalWidth() {
  struct winsize w;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0) {
    return w.ws_col > 0 ? w.ws_col : 80;
  }
  return 80;
}

void SetupTerminal() {
  // Leave Application Cursor Keys (DECCKM) and Keypad (DECPNM) modes so that arrow keys and mouse
  // scrolling reach readline as plain sequences.
  std::cout << "\033[?1l\033>" << std::flush;
}

void InstallCompletion(ShellSession* session) {
  g_session = session;
  rl_attempted_completion_function = CompletionProvider;
  rl_completion_display_matches_hook = DisplayMatches;
  rl_sort_completion_matches = 0;
  // '/' and '-' stay inside words so paths and flags complete as one token.
  rl_basic_word_break_characters = const_cast<char*>(" \t\n\"\\'`@$><=;|&{(");
}

void ShowBanner() {
  std::cout << Colorize(R"(  ___ _ __ ___   __ _ _ __| |_    ___ _ __ ___   __| |)", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"( / __| '_ ` _ \ / _` | '__| __|  / __| '_ ` _ \ / _` |)", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"( \__ \ | | | | | (_| | |  | |_  | (__| | | | | | (_| |)", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"( |___/_| |_| |_|\__,_|_|   \__|  \___|_| |_| |_|\__,_|)", "", ansi::Logo) << std::endl;
  std::cout << std::endl;
#ifdef SMARTCMD_VERSION
  std::cout << " smart_command version " << SMARTCMD_VERSION << std::endl;
#endif
  std::cout << " Press Tab to complete, type /<words> to search, 'help' for built-ins." << std::endl;
  std::cout << std::endl;
}

std::optional<std::string> ReadLine(const std::string& prompt, const std::string& initial_text, bool add_to_history) {
  SetupTerminal();
  g_initial_text = initial_text;
  rl_startup_hook = InsertInitialText;
  char* buf = readline(prompt.c_str());
  rl_startup_hook = nullptr;
  g_initial_text.clear();
  if (!buf) return std::nullopt;
  std::string line(buf);
  free(buf);
  if (add_to_history && !line.empty()) {
    add_history(line.c_str());
  }
  return line;
}

std::string BuildPrompt() {
  std::error_code ec;
  std::filesystem::path cwd = std::filesystem::current_path(ec);
  std::string where = ec ? "?" : cwd.filename().string();
  if (where.empty()) where = cwd.string();
  return absl::StrCat(Colorize(where, "", ansi::Cyan), " ", Colorize(icons::Prompt, "", ansi::Green), " ");
}

void PrintSearchResults(const std::vector<SearchResult>& results) {
  size_t width = GetTerminalWidth();
  for (size_t i = 0; i < results.size(); ++i) {
    const SearchResult& r = results[i];
    std::string index = absl::StrCat(i + 1, ".");
    std::string label = absl::StrCat("[", MatchFieldName(r.field), "]");
    std::string line = absl::StrCat(Colorize(PadRight(index, 4), "", ansi::Index), " ",
                                    Colorize(PadRight(label, 14), "", ansi::FieldLabel), r.display);
    if (VisibleLength(line) > width && width > 4) {
      // Cut on the raw display text only; colored prefixes stay intact.
      size_t keep = width > 24 ? width - 24 : 1;
      line = absl::StrCat(Colorize(PadRight(index, 4), "", ansi::Index), " ",
                          Colorize(PadRight(label, 14), "", ansi::FieldLabel), r.display.substr(0, keep), "...");
    }
    std::cout << line << "\n";
  }
  std::cout << std::flush;
}

void PrintExamples(const std::string& command_path, const CommandSpec& spec, const std::string& lang) {
  std::cout << icons::Example << " " << Colorize(command_path, ansi::Bold, ansi::Cyan) << "  "
            << Colorize(ResolveText(spec.description, lang), "", ansi::Metadata) << "\n";
  for (const auto& example : spec.examples) {
    std::cout << "  " << Colorize("# " + ResolveText(example.scenario, lang), "", ansi::Metadata) << "\n";
    std::cout << "  " << Colorize(example.cmd, "", ansi::Invocation) << "\n";
  }
  std::cout << std::flush;
}

void PrintCatalog(const Catalog& catalog, const std::string& lang) {
  size_t width = 0;
  for (const auto& root : catalog.roots()) width = std::max(width, root.name.size());
  width += 2;
  for (const auto& root : catalog.roots()) {
    std::cout << PadRight(root.name, width) << Colorize(ResolveText(root.description, lang), "", ansi::Metadata)
              << "\n";
  }
  std::cout << std::flush;
}

void ShowHelp() {
  std::cout << Colorize("Built-in commands", ansi::Bold, ansi::Cyan) << "\n";
  for (const auto& def : GetCommandDefinitions()) {
    for (const auto& line : def.help_lines) {
      std::cout << "  " << line << "\n";
    }
    if (!def.aliases.empty()) {
      std::cout << "  " << Colorize(absl::StrCat("  aliases: ", absl::StrJoin(def.aliases, ", ")), "", ansi::Metadata)
                << "\n";
    }
  }
  std::cout << std::flush;
}

void HandleStatus(const absl::Status& status, const std::string& context) {
  if (status.ok()) return;

  std::string msg(status.message());
  std::string log_msg = msg;
  if (size_t first_nl = log_msg.find('\n'); first_nl != std::string::npos) {
    log_msg = log_msg.substr(0, first_nl) + " (multi-line)...";
  }
  if (log_msg.length() > 100) {
    log_msg = log_msg.substr(0, 97) + "...";
  }

  if (!context.empty()) {
    std::cerr << icons::Error << " " << context << ": " << log_msg << std::endl;
    LOG(WARNING) << context << ": " << msg;
  } else {
    std::cerr << icons::Error << " " << log_msg << std::endl;
    LOG(WARNING) << msg;
  }
}

}  // namespace smartcmd
