#include "interface/command_definitions.h"

namespace smartcmd {

namespace {

LocalizedText Text(std::string en, std::string zh) {
  return LanguageMap{{"en", std::move(en)}, {"zh", std::move(zh)}};
}

FlagSpec Flag(std::string long_name, char short_name, LocalizedText description, bool takes_value = false) {
  FlagSpec flag;
  if (!long_name.empty()) flag.long_name = std::move(long_name);
  if (short_name != '\0') flag.short_name = short_name;
  flag.description = std::move(description);
  flag.takes_value = takes_value;
  return flag;
}

CommandSpec Command(std::string name, LocalizedText description) {
  CommandSpec spec;
  spec.name = std::move(name);
  spec.description = std::move(description);
  return spec;
}

}  // namespace

const std::vector<CommandDefinition>& GetCommandDefinitions() {
  static const std::vector<CommandDefinition> kDefinitions = {
      {"help", {}, {"help                      Show this help message"}},
      {"exit", {"quit"}, {"exit                      Leave the shell"}},
      {"cd", {}, {"cd [dir]                  Change directory (home when omitted)"}},
      {"config",
       {},
       {"config                    Show current settings",
        "config set-lang <code>    Switch the display language (e.g. en, zh)"}},
      {"example",
       {"examples", "ex"},
       {"example                   List commands that have examples",
        "example <command...>      Show examples for a command, e.g. 'example git commit'",
        "example search <query>    Fuzzy-search all examples"}},
      {"/",
       {},
       {"/<query>                  Fuzzy-search commands, descriptions and examples",
        "                          then: N run, eN edit, Enter cancel, text searches again"}},
  };
  return kDefinitions;
}

std::vector<CommandSpec> BuiltinCommandSpecs() {
  std::vector<CommandSpec> specs;

  CommandSpec ls = Command("ls", Text("List directory contents", "列出目录内容"));
  ls.flags.push_back(Flag("all", 'a', Text("Include entries starting with .", "显示以 . 开头的条目")));
  ls.flags.push_back(Flag("", 'l', Text("Use a long listing format", "使用长格式列出")));
  ls.flags.push_back(Flag("human-readable", 'h', Text("Print sizes like 1K 234M 2G", "以易读格式显示大小")));
  ls.path_completion = true;
  specs.push_back(std::move(ls));

  CommandSpec cd = Command("cd", Text("Change the shell working directory", "切换工作目录"));
  cd.path_completion = true;
  specs.push_back(std::move(cd));

  CommandSpec config = Command("config", Text("Shell configuration", "系统配置"));
  CommandSpec set_lang = Command("set-lang", Text("Set display language", "设置显示语言"));
  set_lang.subcommands.push_back(Command("en", Text("English", "英文")));
  set_lang.subcommands.push_back(Command("zh", Text("Chinese", "中文")));
  config.subcommands.push_back(std::move(set_lang));
  config.examples.push_back({"config set-lang zh", Text("Show descriptions in Chinese", "切换为中文显示")});
  specs.push_back(std::move(config));

  specs.push_back(Command("example", Text("Show usage examples for a command", "查看命令示例")));
  specs.push_back(Command("exit", Text("Exit the shell", "退出")));
  return specs;
}

}  // namespace smartcmd
