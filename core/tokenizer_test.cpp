#include "core/tokenizer.h"

#include <gtest/gtest.h>

namespace smartcmd {

TEST(TokenizerTest, SplitsOnWhitespace) {
  auto tokens = Tokenize("  git   commit -m ");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0].text, "git");
  EXPECT_EQ(tokens[0].start, 2u);
  EXPECT_EQ(tokens[0].end, 5u);
  EXPECT_EQ(tokens[1].text, "commit");
  EXPECT_EQ(tokens[2].text, "-m");
}

TEST(TokenizerTest, QuotesGroupWhitespace) {
  auto tokens = Tokenize("git commit -m \"fix the bug\" 'a b'");
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[3].text, "fix the bug");
  EXPECT_EQ(tokens[4].text, "a b");
  EXPECT_FALSE(tokens[4].unterminated_quote);
}

TEST(TokenizerTest, UnterminatedQuoteRunsToEnd) {
  auto tokens = Tokenize("echo \"hello wor");
  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[1].text, "hello wor");
  EXPECT_TRUE(tokens[1].unterminated_quote);
  EXPECT_EQ(tokens[1].start, 5u);
  EXPECT_EQ(tokens[1].end, 15u);
}

TEST(TokenizerTest, EmptyInput) {
  EXPECT_TRUE(Tokenize("").empty());
  EXPECT_TRUE(Tokenize("   ").empty());
}

TEST(ContextResolverTest, PartialTokenAtCursor) {
  InputContext ctx = ResolveInputContext("git com", 7);
  ASSERT_EQ(ctx.completed.size(), 1u);
  EXPECT_EQ(ctx.completed[0], "git");
  EXPECT_EQ(ctx.partial, "com");
  EXPECT_EQ(ctx.partial_start, 4u);
}

TEST(ContextResolverTest, TrailingWhitespaceMeansEmptyPartial) {
  InputContext ctx = ResolveInputContext("git commit ", 11);
  ASSERT_EQ(ctx.completed.size(), 2u);
  EXPECT_EQ(ctx.partial, "");
  EXPECT_EQ(ctx.partial_start, 11u);
}

TEST(ContextResolverTest, TextAfterCursorIsIgnored) {
  InputContext ctx = ResolveInputContext("git commit --amend", 6);
  ASSERT_EQ(ctx.completed.size(), 1u);
  EXPECT_EQ(ctx.partial, "co");
  EXPECT_EQ(ctx.cursor, 6u);
}

TEST(ContextResolverTest, CursorIsClamped) {
  InputContext ctx = ResolveInputContext("git", 100);
  EXPECT_EQ(ctx.cursor, 3u);
  EXPECT_TRUE(ctx.completed.empty());
  EXPECT_EQ(ctx.partial, "git");
}

TEST(ContextResolverTest, UnterminatedQuoteIsPartial) {
  InputContext ctx = ResolveInputContext("git commit -m \"wip", 18);
  ASSERT_EQ(ctx.completed.size(), 3u);
  EXPECT_EQ(ctx.partial, "wip");
  EXPECT_EQ(ctx.partial_start, 14u);
}

}  // namespace smartcmd
