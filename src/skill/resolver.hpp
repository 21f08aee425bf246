#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "skill/registry.hpp"

namespace skillhub::skill {

// Category used when a request names no categories; matches every skill
inline constexpr const char *kAnyCategory = "*";

inline constexpr int kBaseScore = 100;
inline constexpr int kKeywordBonus = 10;

struct MatchRequest {
  std::optional<std::string> language;  // Unset: no language filtering
  std::vector<std::string> categories;  // Empty: one slot for any category
  std::vector<std::string> keywords;    // Tie-breaking signal only
};

// One slot per requested category; skill is empty when nothing matched
struct MatchSlot {
  std::string category;
  std::optional<SkillDescriptor> skill;
  int score = 0;

  bool matched() const {
    return skill.has_value();
  }
};

struct MatchResult {
  std::vector<MatchSlot> slots;
  Diagnostics notes;  // NoMatchForCategory, one per empty slot
  uint64_t generation = 0;

  bool complete() const {
    return notes.empty();
  }

  bool operator==(const MatchResult &other) const;
};

struct ScoredSkill {
  const SkillDescriptor *skill = nullptr;
  int score = 0;
};

// Score: base + bonus per keyword found case-insensitively in the description
int score(const SkillDescriptor &skill, const std::vector<std::string> &keywords);

// All candidates for one category after language filtering, best first
std::vector<ScoredSkill> rank(const Snapshot &snapshot, const MatchRequest &request, const std::string &category);

// Pick the best skill per requested category. Pure and deterministic.
MatchResult resolve(const Snapshot &snapshot, const MatchRequest &request);

}  // namespace skillhub::skill
