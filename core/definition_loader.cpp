#include "core/definition_loader.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

#include "core/status_macros.h"

using json = nlohmann::json;

namespace smartcmd {

namespace {

constexpr char kAppDirName[] = "smart-command";
constexpr char kDefinitionsDirName[] = "definitions";

absl::Status FieldError(std::string_view source, std::string_view field, std::string_view problem) {
  return absl::InvalidArgumentError(absl::StrCat(source, ": field '", field, "' ", problem));
}

// ---------- YAML ----------

absl::StatusOr<LocalizedText> TextFromYaml(const YAML::Node& node, std::string_view source, std::string_view field) {
  if (!node || node.IsNull()) return LocalizedText(std::string());
  if (node.IsScalar()) return LocalizedText(node.as<std::string>());
  if (node.IsMap()) {
    LanguageMap by_lang;
    for (const auto& kv : node) {
      if (!kv.second.IsScalar()) return FieldError(source, field, "must map language codes to strings");
      by_lang[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
    return LocalizedText(std::move(by_lang));
  }
  return FieldError(source, field, "must be a string or a language map");
}

absl::StatusOr<FlagSpec> FlagFromYaml(const YAML::Node& node, std::string_view source) {
  if (!node.IsMap()) return FieldError(source, "flags", "entries must be mappings");
  FlagSpec flag;
  if (auto n = node["long"]; n && !n.IsNull()) {
    flag.long_name = n.as<std::string>();
  }
  if (auto n = node["short"]; n && !n.IsNull()) {
    std::string s = n.as<std::string>();
    if (s.size() != 1) return FieldError(source, "short", absl::StrCat("must be one character, got '", s, "'"));
    flag.short_name = s[0];
  }
  SMARTCMD_ASSIGN_OR_RETURN(flag.description, TextFromYaml(node["description"], source, "description"));
  if (auto n = node["takes_value"]) flag.takes_value = n.as<bool>();
  return flag;
}

absl::StatusOr<CommandSpec> SpecFromYaml(const YAML::Node& node, std::string_view source) {
  if (!node.IsMap()) return absl::InvalidArgumentError(absl::StrCat(source, ": command must be a mapping"));
  CommandSpec spec;
  auto name = node["name"];
  if (!name || !name.IsScalar()) return FieldError(source, "name", "is required");
  spec.name = name.as<std::string>();
  SMARTCMD_ASSIGN_OR_RETURN(spec.description, TextFromYaml(node["description"], source, "description"));

  if (auto subs = node["subcommands"]; subs && !subs.IsNull()) {
    if (!subs.IsSequence()) return FieldError(source, "subcommands", "must be a list");
    for (const auto& sub : subs) {
      SMARTCMD_ASSIGN_OR_RETURN(CommandSpec child, SpecFromYaml(sub, source));
      spec.subcommands.push_back(std::move(child));
    }
  }
  if (auto flags = node["flags"]; flags && !flags.IsNull()) {
    if (!flags.IsSequence()) return FieldError(source, "flags", "must be a list");
    for (const auto& f : flags) {
      SMARTCMD_ASSIGN_OR_RETURN(FlagSpec flag, FlagFromYaml(f, source));
      spec.flags.push_back(std::move(flag));
    }
  }
  if (auto examples = node["examples"]; examples && !examples.IsNull()) {
    if (!examples.IsSequence()) return FieldError(source, "examples", "must be a list");
    for (const auto& e : examples) {
      auto cmd = e["cmd"];
      if (!cmd || !cmd.IsScalar()) return FieldError(source, "examples.cmd", "is required");
      ExampleSpec example;
      example.cmd = cmd.as<std::string>();
      SMARTCMD_ASSIGN_OR_RETURN(example.scenario, TextFromYaml(e["scenario"], source, "scenario"));
      spec.examples.push_back(std::move(example));
    }
  }
  if (auto n = node["path_completion"]) {
    spec.path_completion = n.as<bool>();
  } else if (auto legacy = node["is_path_completion"]) {
    spec.path_completion = legacy.as<bool>();
  }
  return spec;
}

// ---------- JSON ----------

absl::StatusOr<LocalizedText> TextFromJson(const json& obj, const char* key, std::string_view source) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return LocalizedText(std::string());
  if (it->is_string()) return LocalizedText(it->get<std::string>());
  if (it->is_object()) {
    LanguageMap by_lang;
    for (const auto& item : it->items()) {
      if (!item.value().is_string()) return FieldError(source, key, "must map language codes to strings");
      by_lang[item.key()] = item.value().get<std::string>();
    }
    return LocalizedText(std::move(by_lang));
  }
  return FieldError(source, key, "must be a string or a language map");
}

absl::StatusOr<CommandSpec> SpecFromJson(const json& obj, std::string_view source) {
  if (!obj.is_object()) return absl::InvalidArgumentError(absl::StrCat(source, ": command must be an object"));
  CommandSpec spec;
  if (!obj.contains("name") || !obj["name"].is_string()) return FieldError(source, "name", "is required");
  spec.name = obj["name"].get<std::string>();
  SMARTCMD_ASSIGN_OR_RETURN(spec.description, TextFromJson(obj, "description", source));

  if (obj.contains("subcommands")) {
    if (!obj["subcommands"].is_array()) return FieldError(source, "subcommands", "must be a list");
    for (const auto& sub : obj["subcommands"]) {
      SMARTCMD_ASSIGN_OR_RETURN(CommandSpec child, SpecFromJson(sub, source));
      spec.subcommands.push_back(std::move(child));
    }
  }
  if (obj.contains("flags")) {
    if (!obj["flags"].is_array()) return FieldError(source, "flags", "must be a list");
    for (const auto& f : obj["flags"]) {
      if (!f.is_object()) return FieldError(source, "flags", "entries must be objects");
      FlagSpec flag;
      if (f.contains("long") && !f["long"].is_null()) flag.long_name = f["long"].get<std::string>();
      if (f.contains("short") && !f["short"].is_null()) {
        std::string s = f["short"].get<std::string>();
        if (s.size() != 1) return FieldError(source, "short", absl::StrCat("must be one character, got '", s, "'"));
        flag.short_name = s[0];
      }
      SMARTCMD_ASSIGN_OR_RETURN(flag.description, TextFromJson(f, "description", source));
      flag.takes_value = f.value("takes_value", false);
      spec.flags.push_back(std::move(flag));
    }
  }
  if (obj.contains("examples")) {
    if (!obj["examples"].is_array()) return FieldError(source, "examples", "must be a list");
    for (const auto& e : obj["examples"]) {
      if (!e.is_object() || !e.contains("cmd") || !e["cmd"].is_string()) {
        return FieldError(source, "examples.cmd", "is required");
      }
      ExampleSpec example;
      example.cmd = e["cmd"].get<std::string>();
      SMARTCMD_ASSIGN_OR_RETURN(example.scenario, TextFromJson(e, "scenario", source));
      spec.examples.push_back(std::move(example));
    }
  }
  spec.path_completion = obj.value("path_completion", obj.value("is_path_completion", false));
  return spec;
}

absl::StatusOr<std::string> ReadFile(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f.is_open()) return absl::NotFoundError(absl::StrCat("Cannot open ", path.string()));
  std::stringstream buffer;
  buffer << f.rdbuf();
  if (f.bad()) return absl::InternalError(absl::StrCat("Failed to read ", path.string()));
  return buffer.str();
}

bool IsDefinitionFile(const std::filesystem::path& path) {
  std::string ext = absl::AsciiStrToLower(path.extension().string());
  return ext == ".yaml" || ext == ".yml" || ext == ".json";
}

std::vector<std::filesystem::path> ListDefinitionFiles(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG(WARNING) << "Cannot list definitions directory " << dir.string() << ": " << ec.message();
    return files;
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && IsDefinitionFile(it->path())) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace

absl::StatusOr<CommandSpec> ParseYamlDefinition(std::string_view text, std::string_view source_name) {
  absl::StatusOr<CommandSpec> spec;
  try {
    YAML::Node root = YAML::Load(std::string(text));
    spec = SpecFromYaml(root, source_name);
  } catch (const YAML::Exception& e) {
    return absl::InvalidArgumentError(absl::StrCat(source_name, ": ", e.what()));
  }
  if (!spec.ok()) return spec.status();
  if (absl::Status valid = ValidateCommandSpec(*spec); !valid.ok()) {
    return absl::InvalidArgumentError(absl::StrCat(source_name, ": ", valid.message()));
  }
  return spec;
}

absl::StatusOr<CommandSpec> ParseJsonDefinition(std::string_view text, std::string_view source_name) {
  json root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    return absl::InvalidArgumentError(absl::StrCat(source_name, ": malformed JSON"));
  }
  absl::StatusOr<CommandSpec> spec;
  try {
    spec = SpecFromJson(root, source_name);
  } catch (const json::exception& e) {
    return absl::InvalidArgumentError(absl::StrCat(source_name, ": ", e.what()));
  }
  if (!spec.ok()) return spec.status();
  if (absl::Status valid = ValidateCommandSpec(*spec); !valid.ok()) {
    return absl::InvalidArgumentError(absl::StrCat(source_name, ": ", valid.message()));
  }
  return spec;
}

absl::StatusOr<CommandSpec> LoadDefinitionFile(const std::filesystem::path& path) {
  SMARTCMD_ASSIGN_OR_RETURN(std::string content, ReadFile(path));
  std::string ext = absl::AsciiStrToLower(path.extension().string());
  if (ext == ".json") return ParseJsonDefinition(content, path.string());
  if (ext == ".yaml" || ext == ".yml") return ParseYamlDefinition(content, path.string());
  return absl::InvalidArgumentError(absl::StrCat(path.string(), ": unsupported definition format"));
}

std::vector<std::filesystem::path> DefaultDefinitionDirs(const std::string& override_dir) {
  std::vector<std::filesystem::path> dirs;
  if (!override_dir.empty()) dirs.emplace_back(override_dir);

  std::error_code ec;
  std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (!ec) dirs.push_back(cwd / kDefinitionsDirName);

  std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && exe.has_parent_path()) dirs.push_back(exe.parent_path() / kDefinitionsDirName);

  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  if (xdg != nullptr && xdg[0] != '\0') {
    dirs.push_back(std::filesystem::path(xdg) / kAppDirName / kDefinitionsDirName);
  } else if (home != nullptr && home[0] != '\0') {
    dirs.push_back(std::filesystem::path(home) / ".config" / kAppDirName / kDefinitionsDirName);
  }

  dirs.push_back(std::filesystem::path("/usr/share") / kAppDirName / kDefinitionsDirName);
  dirs.push_back(std::filesystem::path("/usr/local/share") / kAppDirName / kDefinitionsDirName);
  return dirs;
}

LoadResult LoadCatalog(const std::vector<std::filesystem::path>& dirs, std::vector<CommandSpec> fallback) {
  LoadResult result;
  std::vector<CommandSpec> roots;
  absl::flat_hash_set<std::string> names;
  absl::flat_hash_set<std::string> visited_dirs;

  for (const auto& dir : dirs) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) continue;
    std::filesystem::path canonical = std::filesystem::weakly_canonical(dir, ec);
    if (!visited_dirs.insert(ec ? dir.string() : canonical.string()).second) continue;

    for (const auto& file : ListDefinitionFiles(dir)) {
      absl::StatusOr<CommandSpec> spec = LoadDefinitionFile(file);
      if (!spec.ok()) {
        LOG(WARNING) << "Skipping definition " << file.string() << ": " << spec.status();
        result.errors.push_back({file.string(), spec.status()});
        continue;
      }
      if (!names.insert(spec->name).second) {
        LOG(INFO) << "Command '" << spec->name << "' from " << file.string()
                  << " is shadowed by a higher-priority definition";
        continue;
      }
      LOG(INFO) << "Loaded command '" << spec->name << "' from " << file.string();
      result.loaded_files.push_back(file.string());
      roots.push_back(*std::move(spec));
    }
  }

  for (auto& spec : fallback) {
    if (names.insert(spec.name).second) roots.push_back(std::move(spec));
  }

  auto catalog = Catalog::Create(std::move(roots));
  if (!catalog.ok()) {
    LOG(ERROR) << "Catalog rejected: " << catalog.status();
    result.errors.push_back({"catalog", catalog.status()});
    result.catalog = Catalog::Empty();
  } else {
    result.catalog = *std::move(catalog);
  }
  LOG(INFO) << "Catalog ready: " << result.catalog->roots().size() << " root command(s), "
            << result.catalog->NodeCount() << " node(s)";
  return result;
}

}  // namespace smartcmd
