#include "skill/resolver.hpp"

#include <algorithm>
#include <cctype>

namespace skillhub::skill {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Requested tags are normalized like declared ones: trimmed and lowercased
std::string normalize(const std::string &tag) {
  size_t start = tag.find_first_not_of(" \t\r\n");
  size_t end = tag.find_last_not_of(" \t\r\n");
  return start == std::string::npos ? "" : lower(tag.substr(start, end - start + 1));
}

bool same_skill(const std::optional<SkillDescriptor> &a, const std::optional<SkillDescriptor> &b) {
  if (a.has_value() != b.has_value()) return false;
  if (!a) return true;
  return a->name == b->name && a->source_path == b->source_path;
}

}  // namespace

bool MatchResult::operator==(const MatchResult &other) const {
  if (generation != other.generation || slots.size() != other.slots.size() || notes.size() != other.notes.size()) {
    return false;
  }
  for (size_t i = 0; i < slots.size(); ++i) {
    const auto &a = slots[i];
    const auto &b = other.slots[i];
    if (a.category != b.category || a.score != b.score || !same_skill(a.skill, b.skill)) return false;
  }
  for (size_t i = 0; i < notes.size(); ++i) {
    if (notes[i].kind != other.notes[i].kind || notes[i].message != other.notes[i].message) return false;
  }
  return true;
}

int score(const SkillDescriptor &skill, const std::vector<std::string> &keywords) {
  auto description = lower(skill.description);

  // Each distinct keyword counts once
  std::vector<std::string> seen;
  int total = kBaseScore;
  for (const auto &keyword : keywords) {
    auto k = lower(keyword);
    if (k.empty() || std::find(seen.begin(), seen.end(), k) != seen.end()) continue;
    seen.push_back(k);
    if (description.find(k) != std::string::npos) {
      total += kKeywordBonus;
    }
  }
  return total;
}

std::vector<ScoredSkill> rank(const Snapshot &snapshot, const MatchRequest &request, const std::string &category) {
  auto wanted = normalize(category);
  std::vector<const SkillDescriptor *> candidates;
  if (wanted == kAnyCategory) {
    for (const auto &skill : snapshot.skills) {
      candidates.push_back(&skill);
    }
  } else {
    candidates = snapshot.skills_in(wanted);
  }

  std::vector<ScoredSkill> ranked;
  for (const auto *skill : candidates) {
    if (request.language && !skill->supports_language(*request.language)) continue;
    ranked.push_back({skill, score(*skill, request.keywords)});
  }

  std::sort(ranked.begin(), ranked.end(), [](const ScoredSkill &a, const ScoredSkill &b) {
    if (a.score != b.score) return a.score > b.score;
    return a.skill->name < b.skill->name;
  });
  return ranked;
}

MatchResult resolve(const Snapshot &snapshot, const MatchRequest &request) {
  MatchResult result;
  result.generation = snapshot.generation;

  std::vector<std::string> categories = request.categories;
  if (categories.empty()) {
    categories.push_back(kAnyCategory);
  }

  for (const auto &requested : categories) {
    MatchSlot slot;
    slot.category = requested;

    auto ranked = rank(snapshot, request, requested);
    if (ranked.empty()) {
      std::string message = "no skill for category '" + requested + "'";
      if (request.language) message += " and language '" + *request.language + "'";
      result.notes.push_back({ErrorKind::NoMatchForCategory, {}, std::move(message)});
    } else {
      slot.skill = *ranked.front().skill;
      slot.score = ranked.front().score;
    }
    result.slots.push_back(std::move(slot));
  }
  return result;
}

}  // namespace skillhub::skill
