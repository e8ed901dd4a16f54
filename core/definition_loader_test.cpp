#include "core/definition_loader.h"

#include <fstream>

#include <gtest/gtest.h>

#include "core/localization.h"

namespace smartcmd {

namespace {

constexpr char kGitYaml[] = R"(
name: git
description:
  en: Version control
  zh: 版本控制
subcommands:
  - name: commit
    description: Record changes
    flags:
      - long: all
        short: a
        description: Stage everything
      - long: message
        short: m
        takes_value: true
        description:
          en: Commit message
    examples:
      - cmd: git commit -am "wip"
        scenario:
          en: Quick commit
          zh: 快速提交
  - name: add
    is_path_completion: true
)";

constexpr char kDockerJson[] = R"({
  "name": "docker",
  "description": {"en": "Containers", "zh": "容器"},
  "subcommands": [
    {"name": "ps", "description": "List containers",
     "flags": [{"long": "all", "short": "a", "description": "Show all"}]},
    {"name": "build", "path_completion": true}
  ],
  "examples": [{"cmd": "docker ps -a", "scenario": "Every container"}]
})";

void WriteFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream out(path);
  out << content;
}

}  // namespace

TEST(DefinitionParseTest, ParsesYaml) {
  auto spec = ParseYamlDefinition(kGitYaml, "git.yaml");
  ASSERT_TRUE(spec.ok()) << spec.status();
  EXPECT_EQ(spec->name, "git");
  EXPECT_EQ(ResolveText(spec->description, "zh"), "版本控制");
  ASSERT_EQ(spec->subcommands.size(), 2u);

  const CommandSpec& commit = spec->subcommands[0];
  ASSERT_EQ(commit.flags.size(), 2u);
  EXPECT_EQ(commit.flags[0].LongForm(), "--all");
  EXPECT_EQ(commit.flags[0].ShortForm(), "-a");
  EXPECT_FALSE(commit.flags[0].takes_value);
  EXPECT_TRUE(commit.flags[1].takes_value);
  ASSERT_EQ(commit.examples.size(), 1u);
  EXPECT_EQ(commit.examples[0].cmd, "git commit -am \"wip\"");
  EXPECT_EQ(ResolveText(commit.examples[0].scenario, "zh"), "快速提交");

  EXPECT_TRUE(spec->subcommands[1].path_completion);
  EXPECT_FALSE(commit.path_completion);
}

TEST(DefinitionParseTest, ParsesJson) {
  auto spec = ParseJsonDefinition(kDockerJson, "docker.json");
  ASSERT_TRUE(spec.ok()) << spec.status();
  EXPECT_EQ(spec->name, "docker");
  EXPECT_EQ(ResolveText(spec->description, "zh"), "容器");
  ASSERT_EQ(spec->subcommands.size(), 2u);
  EXPECT_EQ(spec->subcommands[0].flags[0].ShortForm(), "-a");
  EXPECT_TRUE(spec->subcommands[1].path_completion);
  ASSERT_EQ(spec->examples.size(), 1u);
  EXPECT_EQ(spec->examples[0].cmd, "docker ps -a");
}

TEST(DefinitionParseTest, RejectsMalformedInput) {
  EXPECT_TRUE(absl::IsInvalidArgument(ParseYamlDefinition("name: [unclosed", "bad.yaml").status()));
  EXPECT_TRUE(absl::IsInvalidArgument(ParseJsonDefinition("{\"name\": ", "bad.json").status()));
  EXPECT_FALSE(ParseYamlDefinition("description: no name", "noname.yaml").ok());
  EXPECT_FALSE(ParseJsonDefinition("[1, 2]", "array.json").ok());
}

TEST(DefinitionParseTest, RejectsDuplicateSiblings) {
  auto spec = ParseYamlDefinition(R"(
name: git
subcommands:
  - name: commit
  - name: commit
)",
                                  "dup.yaml");
  EXPECT_TRUE(absl::IsInvalidArgument(spec.status()));
  EXPECT_NE(spec.status().message().find("dup.yaml"), std::string::npos);
}

TEST(DefinitionParseTest, RejectsLongShortFlag) {
  auto spec = ParseYamlDefinition(R"(
name: tool
flags:
  - short: ab
)",
                                  "flag.yaml");
  EXPECT_FALSE(spec.ok());
}

class LoadCatalogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = std::filesystem::path(::testing::TempDir()) /
            ("loader_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_ / "high");
    std::filesystem::create_directories(root_ / "low");
  }

  void TearDown() override { std::filesystem::remove_all(root_); }

  std::filesystem::path root_;
};

TEST_F(LoadCatalogTest, LoadsEveryFormat) {
  WriteFile(root_ / "high" / "git.yaml", kGitYaml);
  WriteFile(root_ / "high" / "docker.json", kDockerJson);
  WriteFile(root_ / "high" / "notes.txt", "ignored");

  LoadResult result = LoadCatalog({root_ / "high"});
  EXPECT_TRUE(result.errors.empty());
  EXPECT_EQ(result.loaded_files.size(), 2u);
  ASSERT_EQ(result.catalog->roots().size(), 2u);
  // Files load in name order.
  EXPECT_EQ(result.catalog->roots()[0].name, "docker");
  EXPECT_EQ(result.catalog->roots()[1].name, "git");
}

TEST_F(LoadCatalogTest, BadFileDoesNotStopLoad) {
  WriteFile(root_ / "high" / "a_broken.yaml", "name: [oops");
  WriteFile(root_ / "high" / "git.yaml", kGitYaml);

  LoadResult result = LoadCatalog({root_ / "high"});
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_NE(result.errors[0].source.find("a_broken.yaml"), std::string::npos);
  EXPECT_NE(result.catalog->FindRoot("git"), nullptr);
}

TEST_F(LoadCatalogTest, HigherPrioritySourceReplacesWholesale) {
  WriteFile(root_ / "high" / "git.yaml", R"(
name: git
description: Local git
subcommands:
  - name: commit
)");
  WriteFile(root_ / "low" / "git.yaml", kGitYaml);

  LoadResult result = LoadCatalog({root_ / "high", root_ / "low"});
  const CommandSpec* git = result.catalog->FindRoot("git");
  ASSERT_NE(git, nullptr);
  EXPECT_EQ(ResolveText(git->description, "en"), "Local git");
  // Nothing from the lower-priority file is merged in.
  ASSERT_EQ(git->subcommands.size(), 1u);
  EXPECT_TRUE(git->subcommands[0].flags.empty());
  EXPECT_EQ(result.catalog->Find({"git", "add"}), nullptr);
  EXPECT_EQ(result.loaded_files.size(), 1u);
}

TEST_F(LoadCatalogTest, FallbackOnlyFillsGaps) {
  WriteFile(root_ / "high" / "git.yaml", kGitYaml);

  CommandSpec fallback_git;
  fallback_git.name = "git";
  fallback_git.description = std::string("builtin");
  CommandSpec ls;
  ls.name = "ls";

  LoadResult result = LoadCatalog({root_ / "high"}, {fallback_git, ls});
  ASSERT_EQ(result.catalog->roots().size(), 2u);
  EXPECT_EQ(ResolveText(result.catalog->FindRoot("git")->description, "en"), "Version control");
  EXPECT_NE(result.catalog->FindRoot("ls"), nullptr);
}

TEST_F(LoadCatalogTest, MissingDirectoriesAreSkipped) {
  LoadResult result = LoadCatalog({root_ / "nope", root_ / "low"});
  EXPECT_TRUE(result.errors.empty());
  EXPECT_TRUE(result.catalog->empty());
}

TEST_F(LoadCatalogTest, SameDirectoryListedTwiceLoadsOnce) {
  WriteFile(root_ / "high" / "git.yaml", kGitYaml);
  LoadResult result = LoadCatalog({root_ / "high", root_ / "high" / ".." / "high"});
  EXPECT_EQ(result.loaded_files.size(), 1u);
  EXPECT_EQ(result.catalog->roots().size(), 1u);
}

TEST(DefaultDefinitionDirsTest, OverrideComesFirst) {
  auto dirs = DefaultDefinitionDirs("/opt/defs");
  ASSERT_FALSE(dirs.empty());
  EXPECT_EQ(dirs.front(), std::filesystem::path("/opt/defs"));
  EXPECT_EQ(dirs.back(), std::filesystem::path("/usr/local/share/smart-command/definitions"));

  auto defaults = DefaultDefinitionDirs();
  EXPECT_EQ(defaults.size() + 1, dirs.size());
}

}  // namespace smartcmd
