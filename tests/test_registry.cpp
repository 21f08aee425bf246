#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "skill/registry.hpp"

using namespace skillhub;
using namespace skillhub::skill;

namespace {

SkillDescriptor make_skill(const std::string &name, std::vector<std::string> categories, std::vector<std::string> languages = {},
                           const std::string &dir = "") {
  SkillDescriptor skill;
  skill.name = name;
  skill.description = "Skill " + name;
  skill.categories = std::move(categories);
  skill.languages = std::move(languages);
  skill.source_path = "/tree/skills/" + (dir.empty() ? name : dir) + "/SKILL.md";
  return skill;
}

}  // namespace

TEST(RegistryTest, BuildsIndices) {
  ScanResult scan;
  scan.skills.push_back(make_skill("junit5", {"test-framework", "assertion"}, {"java"}));
  scan.skills.push_back(make_skill("mockk", {"mocking"}, {"kotlin"}));
  scan.skills.push_back(make_skill("faker", {"test-data"}));

  auto snapshot = SkillRegistry::build(std::move(scan));

  ASSERT_EQ(snapshot->skills.size(), 3u);
  ASSERT_NE(snapshot->find("mockk"), nullptr);
  EXPECT_EQ(snapshot->find("mockk")->languages, (std::vector<std::string>{"kotlin"}));
  EXPECT_EQ(snapshot->find("missing"), nullptr);

  EXPECT_EQ(snapshot->by_category.at("assertion"), (std::vector<std::string>{"junit5"}));
  EXPECT_EQ(snapshot->by_category.at("test-framework"), (std::vector<std::string>{"junit5"}));
  EXPECT_EQ(snapshot->by_language.at("java"), (std::vector<std::string>{"junit5"}));
  EXPECT_EQ(snapshot->by_language.at(kAgnosticLanguage), (std::vector<std::string>{"faker"}));
  EXPECT_TRUE(snapshot->warnings.empty());
}

TEST(RegistryTest, DuplicateNameFirstWins) {
  ScanResult scan;
  scan.skills.push_back(make_skill("alpha", {"mocking"}, {}, "alpha"));
  scan.skills.push_back(make_skill("alpha", {"assertion"}, {}, "zz-alpha"));

  auto snapshot = SkillRegistry::build(std::move(scan));

  ASSERT_EQ(snapshot->skills.size(), 1u);
  EXPECT_EQ(snapshot->skills[0].source_path, "/tree/skills/alpha/SKILL.md");
  ASSERT_EQ(snapshot->warnings.size(), 1u);
  EXPECT_EQ(snapshot->warnings[0].kind, ErrorKind::DuplicateName);
  EXPECT_EQ(snapshot->warnings[0].path, "/tree/skills/zz-alpha/SKILL.md");
  EXPECT_EQ(snapshot->by_category.count("assertion"), 0u);
}

TEST(RegistryTest, DuplicateAgentFlagged) {
  ScanResult scan;
  AgentDescriptor a;
  a.name = "planner";
  a.source_path = "/tree/agents/planner.agent.md";
  scan.agents.push_back(a);
  a.source_path = "/other/agents/planner.agent.md";
  scan.agents.push_back(a);

  auto snapshot = SkillRegistry::build(std::move(scan));

  ASSERT_EQ(snapshot->agents.size(), 1u);
  ASSERT_NE(snapshot->find_agent("planner"), nullptr);
  ASSERT_EQ(snapshot->warnings.size(), 1u);
}

TEST(RegistryTest, SkillsInAndFor) {
  ScanResult scan;
  scan.skills.push_back(make_skill("gomock", {"mocking"}, {"go"}));
  scan.skills.push_back(make_skill("mockito", {"mocking"}, {"java"}));
  scan.skills.push_back(make_skill("stubs", {"mocking"}));

  auto snapshot = SkillRegistry::build(std::move(scan));

  EXPECT_EQ(snapshot->skills_in("Mocking").size(), 3u);
  EXPECT_TRUE(snapshot->skills_in("assertion").empty());

  auto go = snapshot->skills_for("go");
  ASSERT_EQ(go.size(), 2u);
  EXPECT_EQ(go[0]->name, "gomock");
  EXPECT_EQ(go[1]->name, "stubs");
}

TEST(RegistryTest, InitialSnapshotIsEmpty) {
  SkillRegistry registry;

  auto snapshot = registry.current();
  ASSERT_NE(snapshot, nullptr);
  EXPECT_TRUE(snapshot->skills.empty());
  EXPECT_EQ(snapshot->generation, 0u);
}

TEST(RegistryTest, ReplaceIncrementsGeneration) {
  SkillRegistry registry;
  auto held = registry.current();

  ScanResult scan;
  scan.skills.push_back(make_skill("junit5", {"test-framework"}));
  auto first = registry.replace(SkillRegistry::build(std::move(scan)));
  EXPECT_EQ(first->generation, 1u);
  EXPECT_EQ(registry.current(), first);

  auto second = registry.replace(SkillRegistry::build(ScanResult{}));
  EXPECT_EQ(second->generation, 2u);
  EXPECT_EQ(registry.generation(), 2u);
  EXPECT_TRUE(registry.current()->skills.empty());

  // Snapshots taken earlier remain intact
  EXPECT_EQ(first->skills.size(), 1u);
  EXPECT_EQ(held->generation, 0u);
}

TEST(RegistryTest, ConcurrentReadersSeeWholeSnapshots) {
  SkillRegistry registry;

  // Every snapshot of generation g holds exactly g skills, all tagged "g<g>"
  auto make_generation = [](size_t count) {
    ScanResult scan;
    for (size_t i = 0; i < count; ++i) {
      scan.skills.push_back(make_skill("skill-" + std::to_string(i), {"g" + std::to_string(count)}));
    }
    return SkillRegistry::build(std::move(scan));
  };

  std::atomic<bool> done{false};
  std::atomic<int> torn{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&]() {
      while (!done) {
        auto snap = registry.current();
        auto expected = static_cast<size_t>(snap->generation);
        if (snap->skills.size() != expected) ++torn;
        for (const auto &skill : snap->skills) {
          if (skill.categories.front() != "g" + std::to_string(expected)) ++torn;
        }
      }
    });
  }

  for (size_t g = 1; g <= 50; ++g) {
    registry.replace(make_generation(g));
  }
  done = true;
  for (auto &reader : readers) {
    reader.join();
  }

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(registry.generation(), 50u);
}
