#include "skill/registry.hpp"

#include <spdlog/spdlog.h>

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

}  // namespace

// ============================================================================
// Snapshot
// ============================================================================

const SkillDescriptor *Snapshot::find(const std::string &name) const {
  auto it = by_name.find(name);
  return it == by_name.end() ? nullptr : &skills[it->second];
}

const AgentDescriptor *Snapshot::find_agent(const std::string &name) const {
  auto it = std::find_if(agents.begin(), agents.end(), [&](const AgentDescriptor &a) {
    return a.name == name;
  });
  return it == agents.end() ? nullptr : &*it;
}

std::vector<const SkillDescriptor *> Snapshot::skills_in(const std::string &category) const {
  std::vector<const SkillDescriptor *> out;
  auto it = by_category.find(lower(category));
  if (it == by_category.end()) return out;

  for (const auto &name : it->second) {
    if (auto *skill = find(name)) out.push_back(skill);
  }
  return out;
}

std::vector<const SkillDescriptor *> Snapshot::skills_for(const std::string &language) const {
  std::vector<const SkillDescriptor *> out;
  for (const auto &skill : skills) {
    if (skill.supports_language(language)) out.push_back(&skill);
  }
  return out;
}

// ============================================================================
// SkillRegistry
// ============================================================================

SkillRegistry::SkillRegistry() : snapshot_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<Snapshot> SkillRegistry::build(ScanResult scan) {
  auto snapshot = std::make_shared<Snapshot>();
  snapshot->root = std::move(scan.root);
  snapshot->errors = std::move(scan.errors);

  for (auto &skill : scan.skills) {
    // First-wins dedup: scan order is lexicographic by path
    if (auto *kept = snapshot->find(skill.name)) {
      spdlog::warn("[registry] Skill '{}' already registered (from {}), ignoring duplicate from {}", skill.name,
                   kept->source_path.string(), skill.source_path.string());
      snapshot->warnings.push_back({ErrorKind::DuplicateName, skill.source_path,
                                    "duplicate skill name '" + skill.name + "', first defined in " + kept->source_path.string()});
      continue;
    }

    size_t index = snapshot->skills.size();
    snapshot->by_name[skill.name] = index;
    for (const auto &category : skill.categories) {
      snapshot->by_category[category].push_back(skill.name);
    }
    if (skill.languages.empty()) {
      snapshot->by_language[kAgnosticLanguage].push_back(skill.name);
    }
    for (const auto &language : skill.languages) {
      snapshot->by_language[language].push_back(skill.name);
    }
    snapshot->skills.push_back(std::move(skill));
  }

  for (auto &agent : scan.agents) {
    if (auto *kept = snapshot->find_agent(agent.name)) {
      snapshot->warnings.push_back({ErrorKind::DuplicateName, agent.source_path,
                                    "duplicate agent name '" + agent.name + "', first defined in " + kept->source_path.string()});
      continue;
    }
    snapshot->agents.push_back(std::move(agent));
  }

  return snapshot;
}

SnapshotPtr SkillRegistry::current() const {
  return snapshot_.load(std::memory_order_acquire);
}

SnapshotPtr SkillRegistry::replace(std::shared_ptr<Snapshot> next) {
  std::lock_guard lock(write_mutex_);

  next->generation = snapshot_.load(std::memory_order_relaxed)->generation + 1;
  SnapshotPtr published = std::move(next);
  snapshot_.store(published, std::memory_order_release);

  if (published->skills.empty()) {
    spdlog::warn("[registry] Published generation {} with no skills", published->generation);
  } else {
    spdlog::info("[registry] Published generation {}: {} skills, {} agents", published->generation, published->skills.size(),
                 published->agents.size());
  }
  return published;
}

uint64_t SkillRegistry::generation() const {
  return current()->generation;
}

}  // namespace skillhub::skill
