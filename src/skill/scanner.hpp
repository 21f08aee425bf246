#pragma once

#include <filesystem>
#include <vector>

#include "core/types.hpp"
#include "skill/descriptor.hpp"

namespace skillhub::skill {

inline constexpr const char *kAgentsDir = "agents";
inline constexpr const char *kSkillsDir = "skills";
inline constexpr const char *kSkillFile = "SKILL.md";
inline constexpr const char *kAgentSuffix = ".agent.md";
inline constexpr const char *kResourcesDir = "resources";

struct ScanOptions {
  int parse_workers = 4;
};

// Output of one scan. Every list is sorted lexicographically by source path.
struct ScanResult {
  std::filesystem::path root;
  std::vector<SkillDescriptor> skills;
  std::vector<AgentDescriptor> agents;
  Diagnostics errors;  // Per-file failures; never abort the scan
};

// Scan <root>/agents/*.agent.md and <root>/skills/*/SKILL.md.
// Fails only when root itself is missing or unreadable.
Result<ScanResult> scan(const std::filesystem::path &root, const ScanOptions &options = {});

}  // namespace skillhub::skill
