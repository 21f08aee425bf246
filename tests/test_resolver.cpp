#include <gtest/gtest.h>

#include "skill/resolver.hpp"

using namespace skillhub;
using namespace skillhub::skill;

class ResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ScanResult scan;
    add(scan, "gomock", "Mock generation for Go interfaces", {"mocking"}, {"go"});
    add(scan, "mockito", "Mockito mocks with Spring Boot integration", {"mocking"}, {"java", "kotlin"});
    add(scan, "mockk", "Idiomatic Kotlin mocking", {"mocking"}, {"kotlin"});
    add(scan, "pytest", "Pytest fixtures and parametrization", {"test-framework"}, {"python"});
    add(scan, "junit5", "JUnit 5 tests with Spring support", {"test-framework", "assertion"}, {"java"});
    add(scan, "test-data-builder", "Builder pattern for test data", {"test-data"}, {});
    snapshot_ = SkillRegistry::build(std::move(scan));
    snapshot_->generation = 7;
  }

  static void add(ScanResult &scan, const std::string &name, const std::string &description, std::vector<std::string> categories,
                  std::vector<std::string> languages) {
    SkillDescriptor skill;
    skill.name = name;
    skill.description = description;
    skill.categories = std::move(categories);
    skill.languages = std::move(languages);
    skill.source_path = "/tree/skills/" + name + "/SKILL.md";
    scan.skills.push_back(std::move(skill));
  }

  std::shared_ptr<Snapshot> snapshot_;
};

TEST_F(ResolverTest, OneSlotPerCategoryInOrder) {
  MatchRequest request{"java", {"test-framework", "mocking"}, {}};

  auto result = resolve(*snapshot_, request);

  ASSERT_EQ(result.slots.size(), 2u);
  EXPECT_EQ(result.slots[0].category, "test-framework");
  ASSERT_TRUE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].skill->name, "junit5");
  EXPECT_EQ(result.slots[1].category, "mocking");
  ASSERT_TRUE(result.slots[1].matched());
  EXPECT_EQ(result.slots[1].skill->name, "mockito");
  EXPECT_EQ(result.slots[1].score, kBaseScore);
  EXPECT_TRUE(result.complete());
  EXPECT_EQ(result.generation, 7u);
}

TEST_F(ResolverTest, LanguageFilter) {
  MatchRequest request{"go", {"test-framework"}, {}};

  auto result = resolve(*snapshot_, request);

  // pytest is python-only and junit5 is java-only: neither may be returned for go
  ASSERT_EQ(result.slots.size(), 1u);
  EXPECT_FALSE(result.slots[0].matched());
}

TEST_F(ResolverTest, AgnosticSkillMatchesAnyLanguage) {
  for (const char *language : {"go", "rust", "python", "COBOL"}) {
    auto result = resolve(*snapshot_, MatchRequest{language, {"test-data"}, {}});
    ASSERT_TRUE(result.slots[0].matched()) << language;
    EXPECT_EQ(result.slots[0].skill->name, "test-data-builder");
  }
}

TEST_F(ResolverTest, NoLanguageMeansNoFiltering) {
  auto ranked = rank(*snapshot_, MatchRequest{std::nullopt, {}, {}}, "mocking");

  ASSERT_EQ(ranked.size(), 3u);
  // Equal scores: ascending name
  EXPECT_EQ(ranked[0].skill->name, "gomock");
  EXPECT_EQ(ranked[1].skill->name, "mockito");
  EXPECT_EQ(ranked[2].skill->name, "mockk");
}

TEST_F(ResolverTest, KeywordsBreakTies) {
  MatchRequest request{"kotlin", {"mocking"}, {"idiomatic", "KOTLIN"}};

  auto result = resolve(*snapshot_, request);

  ASSERT_TRUE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].skill->name, "mockk");
  EXPECT_EQ(result.slots[0].score, kBaseScore + 2 * kKeywordBonus);

  auto spring = resolve(*snapshot_, MatchRequest{"kotlin", {"mocking"}, {"spring"}});
  EXPECT_EQ(spring.slots[0].skill->name, "mockito");
}

TEST_F(ResolverTest, KeywordsNeverFilter) {
  auto result = resolve(*snapshot_, MatchRequest{"python", {"test-framework"}, {"nonexistent-word"}});

  ASSERT_TRUE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].skill->name, "pytest");
  EXPECT_EQ(result.slots[0].score, kBaseScore);
}

TEST_F(ResolverTest, RepeatedKeywordCountsOnce) {
  const auto *skill = snapshot_->find("mockk");
  ASSERT_NE(skill, nullptr);

  EXPECT_EQ(score(*skill, {"kotlin", "Kotlin", ""}), kBaseScore + kKeywordBonus);
}

TEST_F(ResolverTest, EmptySlotForUnknownCategory) {
  MatchRequest request{"java", {"contract-testing", "assertion"}, {}};

  auto result = resolve(*snapshot_, request);

  ASSERT_EQ(result.slots.size(), 2u);
  EXPECT_EQ(result.slots[0].category, "contract-testing");
  EXPECT_FALSE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].score, 0);
  ASSERT_TRUE(result.slots[1].matched());
  EXPECT_EQ(result.slots[1].skill->name, "junit5");

  ASSERT_EQ(result.notes.size(), 1u);
  EXPECT_EQ(result.notes[0].kind, ErrorKind::NoMatchForCategory);
  EXPECT_NE(result.notes[0].message.find("contract-testing"), std::string::npos);
  EXPECT_FALSE(result.complete());
}

TEST_F(ResolverTest, NoFallbackToOtherCategory) {
  // mockk exists, but never fills an assertion slot
  auto result = resolve(*snapshot_, MatchRequest{"kotlin", {"assertion"}, {"kotlin"}});

  ASSERT_EQ(result.slots.size(), 1u);
  EXPECT_FALSE(result.slots[0].matched());
}

TEST_F(ResolverTest, EmptyCategoriesMeansAny) {
  auto result = resolve(*snapshot_, MatchRequest{"python", {}, {"fixtures"}});

  ASSERT_EQ(result.slots.size(), 1u);
  EXPECT_EQ(result.slots[0].category, kAnyCategory);
  ASSERT_TRUE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].skill->name, "pytest");
  EXPECT_EQ(result.slots[0].score, kBaseScore + kKeywordBonus);
}

TEST_F(ResolverTest, CategoryCaseInsensitive) {
  auto result = resolve(*snapshot_, MatchRequest{"Go", {"Mocking"}, {}});

  ASSERT_TRUE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].category, "Mocking");
  EXPECT_EQ(result.slots[0].skill->name, "gomock");
}

TEST_F(ResolverTest, CategorySurroundingWhitespaceIgnored) {
  auto result = resolve(*snapshot_, MatchRequest{" go ", {" mocking", "Test-Data\t", "  *  "}, {}});

  ASSERT_EQ(result.slots.size(), 3u);
  ASSERT_TRUE(result.slots[0].matched());
  EXPECT_EQ(result.slots[0].category, " mocking");
  EXPECT_EQ(result.slots[0].skill->name, "gomock");
  ASSERT_TRUE(result.slots[1].matched());
  EXPECT_EQ(result.slots[1].skill->name, "test-data-builder");
  EXPECT_TRUE(result.slots[2].matched());
  EXPECT_TRUE(result.notes.empty());
}

TEST_F(ResolverTest, Deterministic) {
  MatchRequest request{"kotlin", {"mocking", "test-data", "assertion"}, {"spring", "builder"}};

  auto first = resolve(*snapshot_, request);
  auto second = resolve(*snapshot_, request);

  EXPECT_TRUE(first == second);
}

TEST_F(ResolverTest, EmptySnapshot) {
  Snapshot empty;

  auto result = resolve(empty, MatchRequest{std::nullopt, {}, {}});

  ASSERT_EQ(result.slots.size(), 1u);
  EXPECT_FALSE(result.slots[0].matched());
  EXPECT_EQ(result.notes.size(), 1u);
}
