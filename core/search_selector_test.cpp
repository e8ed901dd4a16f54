#include "core/search_selector.h"

#include <gtest/gtest.h>

namespace smartcmd {

namespace {

std::vector<SearchResult> FiveResults() {
  std::vector<SearchResult> results;
  for (int i = 1; i <= 5; ++i) {
    SearchResult r;
    r.invocation = "cmd" + std::to_string(i);
    r.display = r.invocation;
    r.score = 100 - i;
    results.push_back(r);
  }
  return results;
}

std::shared_ptr<const Catalog> SelectorCatalog() {
  std::vector<CommandSpec> roots;
  for (const char* name : {"git", "grep", "gzip", "tar"}) {
    CommandSpec spec;
    spec.name = name;
    spec.description = std::string("tool");
    roots.push_back(spec);
  }
  auto catalog = Catalog::Create(roots);
  EXPECT_TRUE(catalog.ok());
  return *catalog;
}

}  // namespace

TEST(ResolveSelectionTest, NumberExecutes) {
  auto action = ResolveSelection("2", FiveResults());
  EXPECT_EQ(action.kind, SelectionAction::Kind::kExecute);
  ASSERT_TRUE(action.result.has_value());
  EXPECT_EQ(action.result->invocation, "cmd2");
}

TEST(ResolveSelectionTest, EditPrefixLoadsBuffer) {
  auto action = ResolveSelection("e1", FiveResults());
  EXPECT_EQ(action.kind, SelectionAction::Kind::kEdit);
  ASSERT_TRUE(action.result.has_value());
  EXPECT_EQ(action.result->invocation, "cmd1");
}

TEST(ResolveSelectionTest, EmptyCancels) {
  EXPECT_EQ(ResolveSelection("", FiveResults()).kind, SelectionAction::Kind::kCancel);
  EXPECT_EQ(ResolveSelection("   ", FiveResults()).kind, SelectionAction::Kind::kCancel);
}

TEST(ResolveSelectionTest, OutOfRangeCancels) {
  EXPECT_EQ(ResolveSelection("7", FiveResults()).kind, SelectionAction::Kind::kCancel);
  EXPECT_EQ(ResolveSelection("0", FiveResults()).kind, SelectionAction::Kind::kCancel);
  EXPECT_EQ(ResolveSelection("e6", FiveResults()).kind, SelectionAction::Kind::kCancel);
  EXPECT_FALSE(ResolveSelection("7", FiveResults()).result.has_value());
}

TEST(ResolveSelectionTest, OtherInputRequeries) {
  auto action = ResolveSelection(" docker ", FiveResults());
  EXPECT_EQ(action.kind, SelectionAction::Kind::kRequery);
  EXPECT_EQ(action.query, "docker");

  EXPECT_EQ(ResolveSelection("/tar", FiveResults()).query, "tar");
  EXPECT_EQ(ResolveSelection("e", FiveResults()).kind, SelectionAction::Kind::kRequery);
  EXPECT_EQ(ResolveSelection("e1x", FiveResults()).kind, SelectionAction::Kind::kRequery);
}

TEST(SearchSelectorTest, Transitions) {
  auto catalog = SelectorCatalog();
  FuzzySearchIndex index(catalog);
  SearchSelector selector(&index, 10);
  EXPECT_EQ(selector.state(), SearchSelector::State::kIdle);

  selector.Begin("g", "en");
  EXPECT_EQ(selector.state(), SearchSelector::State::kShowingResults);
  ASSERT_EQ(selector.results().size(), 3u);
  std::string second = selector.results()[1].invocation;

  SelectionAction action = selector.HandleInput("2", "en");
  EXPECT_EQ(action.kind, SelectionAction::Kind::kExecute);
  EXPECT_EQ(action.result->invocation, second);
  EXPECT_EQ(selector.state(), SearchSelector::State::kIdle);
  EXPECT_TRUE(selector.results().empty());
}

TEST(SearchSelectorTest, RequeryKeepsShowingResults) {
  auto catalog = SelectorCatalog();
  FuzzySearchIndex index(catalog);
  SearchSelector selector(&index, 10);
  selector.Begin("g", "en");

  SelectionAction action = selector.HandleInput("tar", "en");
  EXPECT_EQ(action.kind, SelectionAction::Kind::kRequery);
  EXPECT_EQ(selector.state(), SearchSelector::State::kShowingResults);
  EXPECT_EQ(selector.query(), "tar");
  ASSERT_FALSE(selector.results().empty());
  EXPECT_EQ(selector.results()[0].invocation, "tar");

  EXPECT_EQ(selector.HandleInput("", "en").kind, SelectionAction::Kind::kCancel);
  EXPECT_EQ(selector.state(), SearchSelector::State::kIdle);
}

TEST(SearchSelectorTest, IdleInputStartsSearch) {
  auto catalog = SelectorCatalog();
  FuzzySearchIndex index(catalog);
  SearchSelector selector(&index, 10);

  SelectionAction action = selector.HandleInput("/gz", "en");
  EXPECT_EQ(action.kind, SelectionAction::Kind::kRequery);
  EXPECT_EQ(action.query, "gz");
  EXPECT_EQ(selector.state(), SearchSelector::State::kShowingResults);
  ASSERT_EQ(selector.results().size(), 1u);
  EXPECT_EQ(selector.results()[0].invocation, "gzip");
}

TEST(SearchSelectorTest, EditReturnsToIdle) {
  auto catalog = SelectorCatalog();
  FuzzySearchIndex index(catalog);
  SearchSelector selector(&index, 10);
  selector.Begin("tar", "en");

  SelectionAction action = selector.HandleInput("e1", "en");
  EXPECT_EQ(action.kind, SelectionAction::Kind::kEdit);
  EXPECT_EQ(action.result->invocation, "tar");
  EXPECT_EQ(selector.state(), SearchSelector::State::kIdle);
}

}  // namespace smartcmd
