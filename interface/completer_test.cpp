#include "interface/completer.h"

#include <gtest/gtest.h>

namespace smartcmd {

namespace {

Suggestion Make(std::string text, size_t replace_start, bool append_space = true) {
  Suggestion s;
  s.text = std::move(text);
  s.description = "d";
  s.replace_start = replace_start;
  s.append_space = append_space;
  return s;
}

std::vector<std::string> Texts(const std::vector<ReadlineMatch>& matches) {
  std::vector<std::string> out;
  for (const auto& m : matches) out.push_back(m.text);
  return out;
}

}  // namespace

TEST(CompleterTest, SameStartPassesThrough) {
  auto matches = ToReadlineMatches({Make("commit", 4), Make("checkout", 4)}, "git c", 4);
  EXPECT_EQ(Texts(matches), (std::vector<std::string>{"commit", "checkout"}));
  EXPECT_EQ(matches[0].description, "d");
}

TEST(CompleterTest, EarlierStartIsCutToWord) {
  // An example replaces the whole line while readline only owns the last word.
  std::string line = "git commit -am";
  auto matches = ToReadlineMatches({Make("git commit -am \"fix\"", 0, false)}, line, 11);
  EXPECT_EQ(Texts(matches), (std::vector<std::string>{"-am \"fix\""}));
}

TEST(CompleterTest, EarlierStartThatDisagreesIsDropped) {
  auto matches = ToReadlineMatches({Make("docker ps", 0)}, "git commit", 4);
  EXPECT_TRUE(matches.empty());
}

TEST(CompleterTest, LaterStartKeepsTypedText) {
  // Readline's word begins at the quote; the engine replaces after it.
  auto matches = ToReadlineMatches({Make("src/", 4)}, "ls \"sr", 3);
  EXPECT_EQ(Texts(matches), (std::vector<std::string>{"\"src/"}));
}

TEST(CompleterTest, OpeningQuoteIsSkipped) {
  // The engine replaces from the quote; readline's word starts after it.
  auto matches = ToReadlineMatches({Make("main.cpp", 8, false), Make("make.sh", 8, false)}, "git add 'ma", 9);
  EXPECT_EQ(Texts(matches), (std::vector<std::string>{"main.cpp", "make.sh"}));

  matches = ToReadlineMatches({Make("src/", 3, false)}, "ls \"sr", 4);
  EXPECT_EQ(Texts(matches), (std::vector<std::string>{"src/"}));

  matches = ToReadlineMatches({Make("docs/", 3, false)}, "ls \"sr", 4);
  EXPECT_TRUE(matches.empty());
}

TEST(CompleterTest, MatchesCarryKindLabel) {
  Suggestion flag = Make("--amend", 11);
  flag.kind = SuggestionKind::kLongFlag;
  Suggestion combo = Make("-am", 11);
  combo.kind = SuggestionKind::kFlagCombination;
  auto matches = ToReadlineMatches({flag, combo}, "git commit -", 11);
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].kind, "long flag");
  EXPECT_EQ(matches[1].kind, "combo");
  EXPECT_EQ(SuggestionKindName(SuggestionKind::kPath), "path");
}

TEST(CompleterTest, DuplicatesKeepFirst) {
  auto matches = ToReadlineMatches({Make("-a", 11), Make("-a", 11), Make("-am", 11)}, "git commit -a", 11);
  EXPECT_EQ(Texts(matches), (std::vector<std::string>{"-a", "-am"}));
}

TEST(CompleterTest, AppendSpaceOnlyForSingleCandidate) {
  EXPECT_TRUE(ShouldAppendSpace({Make("commit", 4)}));
  EXPECT_FALSE(ShouldAppendSpace({Make("src/", 4, false)}));
  EXPECT_FALSE(ShouldAppendSpace({Make("commit", 4), Make("checkout", 4)}));
  EXPECT_FALSE(ShouldAppendSpace({}));
}

}  // namespace smartcmd
